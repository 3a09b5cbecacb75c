#pragma once

struct Rect {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    int center_x() const { return x + width / 2; }
    int center_y() const { return y + height / 2; }
    bool empty() const { return width <= 0 || height <= 0; }
    bool contains(int px, int py) const {
        return px >= x && py >= y && px < x + width && py < y + height;
    }
};
