#pragma once
#include "common.hpp"

#include <cstddef>
#include <vector>

namespace petsprites {

struct SpritePixels {
    int w = 0;
    int h = 0;
    std::vector<Color> px; // row-major, straight alpha

    Color& at(int x, int y) { return px[static_cast<size_t>(y * w + x)]; }
    const Color& at(int x, int y) const { return px[static_cast<size_t>(y * w + x)]; }
};

// Passing this as a fill or outline color skips that part of a shape.
inline constexpr Color NO_COLOR{0, 0, 0, 0};

// Transparent square canvas.
SpritePixels makeCanvas(int size);

// Straight-alpha source-over composite of src onto dst.
void blendOver(Color& dst, const Color& src);

// Shape primitives.
//
// Boxes are inclusive pixel coordinates. The shape spans the continuous
// rectangle [x0, x1 + 1] x [y0, y1 + 1] and a pixel is covered when its center
// falls inside. Outlines are `width` pixels thick, measured inward from the
// shape border, and are drawn over the fill. Everything composites with
// blendOver and clips to the canvas.
void drawRoundedRect(SpritePixels& s, const Box& box, int radius, Color fill, Color outline, int width);
void drawEllipse(SpritePixels& s, const Box& box, Color fill, Color outline, int width);

// Strokes the part of the ellipse ring inscribed in `box` whose angle lies in
// [startDeg, endDeg]. 0 degrees points along +x and angles grow clockwise
// (image y points down). If endDeg < startDeg the end is advanced by whole
// turns until it is not; sweeps of 360 or more draw the full ring.
void drawArc(SpritePixels& s, const Box& box, double startDeg, double endDeg, Color color, int width);

// Even-odd fill plus a one pixel outline along every edge.
// Polygon vertices address pixel centers.
void drawPolygon(SpritePixels& s, const std::vector<Vec2f>& points, Color fill, Color outline);

} // namespace petsprites
