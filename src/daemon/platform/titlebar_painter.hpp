#pragma once

#include "platform/window_manager.hpp"

#include <cstdint>
#include <memory>

class TitleBarPainter {
public:
    virtual ~TitleBarPainter() = default;
    // Best-effort; color is 0x00BBGGRR.
    virtual void paint(HostWindow& window, uint32_t color) = 0;
};

class NoopTitleBarPainter : public TitleBarPainter {
public:
    void paint(HostWindow& /*window*/, uint32_t /*color*/) override {}
};

namespace platform {

std::unique_ptr<TitleBarPainter> make_titlebar_painter();

} // namespace platform
