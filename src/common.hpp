#pragma once
#include <cstdint>

namespace petsprites {

struct Vec2f {
    float x = 0.0f;
    float y = 0.0f;
};

// Straight (non-premultiplied) RGBA.
struct Color {
    uint8_t r = 255;
    uint8_t g = 255;
    uint8_t b = 255;
    uint8_t a = 255;
};

inline bool operator==(const Color& lhs, const Color& rhs) {
    return lhs.r == rhs.r && lhs.g == rhs.g && lhs.b == rhs.b && lhs.a == rhs.a;
}

inline bool operator!=(const Color& lhs, const Color& rhs) {
    return !(lhs == rhs);
}

inline int clampi(int v, int lo, int hi) {
    if (v < lo) return lo;
    if (v > hi) return hi;
    return v;
}

inline uint8_t clamp8(int v) {
    return static_cast<uint8_t>(clampi(v, 0, 255));
}

// Inclusive pixel-space bounding box (x1/y1 are the last covered column/row).
struct Box {
    int x0 = 0;
    int y0 = 0;
    int x1 = 0;
    int y1 = 0;
};

} // namespace petsprites
