#pragma once

#include "platform/titlebar_painter.hpp"

class DwmTitleBarPainter : public TitleBarPainter {
public:
    void paint(HostWindow& window, uint32_t color) override;
};
