#include "platform/titlebar_painter.hpp"

namespace platform {

// Sway has no per-window caption color.
std::unique_ptr<TitleBarPainter> make_titlebar_painter() {
    return std::make_unique<NoopTitleBarPainter>();
}

} // namespace platform
