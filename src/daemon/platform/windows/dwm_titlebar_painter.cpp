#include "platform/windows/dwm_titlebar_painter.hpp"

#define WIN32_LEAN_AND_MEAN
#include <windows.h>
#include <dwmapi.h>

#ifndef DWMWA_CAPTION_COLOR
#define DWMWA_CAPTION_COLOR 35
#endif

void DwmTitleBarPainter::paint(HostWindow& window, uint32_t color) {
    auto hwnd = static_cast<HWND>(window.native_handle());
    if (!hwnd || !IsWindow(hwnd)) return;

    // Unsupported before Windows 11; the failure HRESULT is not actionable.
    const COLORREF caption = color;
    DwmSetWindowAttribute(hwnd, static_cast<DWMWINDOWATTRIBUTE>(DWMWA_CAPTION_COLOR),
                          &caption, sizeof(caption));
}

namespace platform {

std::unique_ptr<TitleBarPainter> make_titlebar_painter() {
    return std::make_unique<DwmTitleBarPainter>();
}

} // namespace platform
