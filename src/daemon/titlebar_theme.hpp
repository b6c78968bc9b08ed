#pragma once

#include <cstdint>

// COLORREF layout: 0x00BBGGRR
inline constexpr uint32_t kDarkTitleBarColor = 0x00343030;   // rgb(48, 48, 52)
inline constexpr uint32_t kLightTitleBarColor = 0x00FCFAFA;  // rgb(250, 250, 252)

constexpr uint32_t titlebar_color(bool is_dark) {
    return is_dark ? kDarkTitleBarColor : kLightTitleBarColor;
}
