#include "canvas.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <functional>

namespace petsprites {

namespace {

constexpr double PI = 3.14159265358979323846;

// Continuous-space extent of an inclusive pixel box.
struct Extent {
    double l = 0.0;
    double t = 0.0;
    double r = 0.0;
    double b = 0.0;

    bool empty() const { return r <= l || b <= t; }
};

Extent extentOf(const Box& box) {
    return { static_cast<double>(box.x0), static_cast<double>(box.y0),
             static_cast<double>(box.x1 + 1), static_cast<double>(box.y1 + 1) };
}

Extent inset(const Extent& e, double d) {
    return { e.l + d, e.t + d, e.r - d, e.b - d };
}

bool insideRoundedRect(const Extent& e, double radius, double px, double py) {
    if (e.empty()) return false;
    if (px < e.l || px > e.r || py < e.t || py > e.b) return false;
    radius = std::min(radius, std::min(e.r - e.l, e.b - e.t) * 0.5);
    if (radius <= 0.0) return true;

    // Distance to the nearest point of the rectangle shrunk by the radius.
    const double cx = std::clamp(px, e.l + radius, e.r - radius);
    const double cy = std::clamp(py, e.t + radius, e.b - radius);
    const double dx = px - cx;
    const double dy = py - cy;
    return dx * dx + dy * dy <= radius * radius;
}

bool insideEllipse(const Extent& e, double px, double py) {
    if (e.empty()) return false;
    const double ax = (e.r - e.l) * 0.5;
    const double ay = (e.b - e.t) * 0.5;
    const double nx = (px - (e.l + ax)) / ax;
    const double ny = (py - (e.t + ay)) / ay;
    return nx * nx + ny * ny <= 1.0;
}

// Angle of (px,py) around the ellipse center in degrees, [0, 360).
// Measured on the circle the ellipse is a stretched copy of.
double ellipseAngleDeg(const Extent& e, double px, double py) {
    const double ax = (e.r - e.l) * 0.5;
    const double ay = (e.b - e.t) * 0.5;
    const double nx = (px - (e.l + ax)) / ax;
    const double ny = (py - (e.t + ay)) / ay;
    double deg = std::atan2(ny, nx) * 180.0 / PI;
    if (deg < 0.0) deg += 360.0;
    return deg;
}

struct PixelRange {
    int x0 = 0;
    int y0 = 0;
    int x1 = -1;
    int y1 = -1;
};

PixelRange clipToCanvas(const SpritePixels& s, const Box& box) {
    return { std::max(0, box.x0), std::max(0, box.y0),
             std::min(s.w - 1, box.x1), std::min(s.h - 1, box.y1) };
}

template <typename Fn>
void forEachPixel(const PixelRange& r, Fn&& fn) {
    for (int y = r.y0; y <= r.y1; ++y) {
        for (int x = r.x0; x <= r.x1; ++x) {
            fn(x, y, static_cast<double>(x) + 0.5, static_cast<double>(y) + 0.5);
        }
    }
}

void bresenham(int x0, int y0, int x1, int y1, const std::function<void(int, int)>& plot) {
    int dx = std::abs(x1 - x0), sx = x0 < x1 ? 1 : -1;
    int dy = -std::abs(y1 - y0), sy = y0 < y1 ? 1 : -1;
    int err = dx + dy;
    while (true) {
        plot(x0, y0);
        if (x0 == x1 && y0 == y1) break;
        int e2 = 2 * err;
        if (e2 >= dy) { err += dy; x0 += sx; }
        if (e2 <= dx) { err += dx; y0 += sy; }
    }
}

} // namespace

SpritePixels makeCanvas(int size) {
    SpritePixels s;
    s.w = std::max(1, size);
    s.h = s.w;
    s.px.assign(static_cast<size_t>(s.w * s.h), NO_COLOR);
    return s;
}

void blendOver(Color& dst, const Color& src) {
    const int sa = static_cast<int>(src.a);
    if (sa <= 0) return;
    if (sa >= 255) {
        dst = src;
        return;
    }

    const int da = static_cast<int>(dst.a);
    const int inv = 255 - sa;

    // Computed via premultiplied intermediates, stored back as straight alpha.
    const int outA = sa + (da * inv + 127) / 255;

    const int outRp = static_cast<int>(src.r) * sa + (static_cast<int>(dst.r) * da * inv + 127) / 255;
    const int outGp = static_cast<int>(src.g) * sa + (static_cast<int>(dst.g) * da * inv + 127) / 255;
    const int outBp = static_cast<int>(src.b) * sa + (static_cast<int>(dst.b) * da * inv + 127) / 255;

    Color out = NO_COLOR;
    out.a = clamp8(outA);
    if (outA > 0) {
        out.r = clamp8((outRp + outA / 2) / outA);
        out.g = clamp8((outGp + outA / 2) / outA);
        out.b = clamp8((outBp + outA / 2) / outA);
    }
    dst = out;
}

void drawRoundedRect(SpritePixels& s, const Box& box, int radius, Color fill, Color outline, int width) {
    const Extent outer = extentOf(box);
    if (outer.empty()) return;

    const double maxRadius = std::min(outer.r - outer.l, outer.b - outer.t) * 0.5;
    const double r = std::clamp(static_cast<double>(radius), 0.0, maxRadius);
    const double w = (outline.a > 0) ? static_cast<double>(std::max(0, width)) : 0.0;
    const Extent inner = inset(outer, w);
    const double innerRadius = std::max(0.0, r - w);

    forEachPixel(clipToCanvas(s, box), [&](int x, int y, double px, double py) {
        if (!insideRoundedRect(outer, r, px, py)) return;
        if (insideRoundedRect(inner, innerRadius, px, py)) {
            blendOver(s.at(x, y), fill);
        } else {
            blendOver(s.at(x, y), outline);
        }
    });
}

void drawEllipse(SpritePixels& s, const Box& box, Color fill, Color outline, int width) {
    const Extent outer = extentOf(box);
    if (outer.empty()) return;

    const double w = (outline.a > 0) ? static_cast<double>(std::max(0, width)) : 0.0;
    const Extent inner = inset(outer, w);

    forEachPixel(clipToCanvas(s, box), [&](int x, int y, double px, double py) {
        if (!insideEllipse(outer, px, py)) return;
        if (insideEllipse(inner, px, py)) {
            blendOver(s.at(x, y), fill);
        } else {
            blendOver(s.at(x, y), outline);
        }
    });
}

void drawArc(SpritePixels& s, const Box& box, double startDeg, double endDeg, Color color, int width) {
    const Extent outer = extentOf(box);
    if (outer.empty() || color.a == 0 || width <= 0) return;
    const Extent inner = inset(outer, static_cast<double>(width));

    double sweep = endDeg - startDeg;
    while (sweep < 0.0) sweep += 360.0;
    const bool fullTurn = sweep >= 360.0;

    double start = std::fmod(startDeg, 360.0);
    if (start < 0.0) start += 360.0;

    forEachPixel(clipToCanvas(s, box), [&](int x, int y, double px, double py) {
        if (!insideEllipse(outer, px, py)) return;
        if (insideEllipse(inner, px, py)) return;
        if (!fullTurn) {
            double rel = ellipseAngleDeg(outer, px, py) - start;
            if (rel < 0.0) rel += 360.0;
            if (rel > sweep) return;
        }
        blendOver(s.at(x, y), color);
    });
}

void drawPolygon(SpritePixels& s, const std::vector<Vec2f>& points, Color fill, Color outline) {
    if (points.size() < 2 || s.w <= 0 || s.h <= 0) return;

    // 0 = untouched, 1 = fill, 2 = outline. Each pixel is composited once.
    std::vector<uint8_t> mask(static_cast<size_t>(s.w * s.h), 0);

    float minXf = points[0].x, maxXf = points[0].x;
    float minYf = points[0].y, maxYf = points[0].y;
    for (const Vec2f& p : points) {
        minXf = std::min(minXf, p.x);
        maxXf = std::max(maxXf, p.x);
        minYf = std::min(minYf, p.y);
        maxYf = std::max(maxYf, p.y);
    }

    if (fill.a > 0 && points.size() >= 3) {
        const Box bounds{ static_cast<int>(std::floor(minXf)), static_cast<int>(std::floor(minYf)),
                          static_cast<int>(std::ceil(maxXf)), static_cast<int>(std::ceil(maxYf)) };
        const PixelRange range = clipToCanvas(s, bounds);
        for (int y = range.y0; y <= range.y1; ++y) {
            for (int x = range.x0; x <= range.x1; ++x) {
                const double px = static_cast<double>(x);
                const double py = static_cast<double>(y);
                bool inside = false;
                for (size_t i = 0, j = points.size() - 1; i < points.size(); j = i++) {
                    const Vec2f& a = points[i];
                    const Vec2f& b = points[j];
                    if ((a.y > py) == (b.y > py)) continue;
                    const double xCross = a.x + (py - a.y) * (b.x - a.x) / (b.y - a.y);
                    if (px < xCross) inside = !inside;
                }
                if (inside) mask[static_cast<size_t>(y * s.w + x)] = 1;
            }
        }
    }

    if (outline.a > 0) {
        auto plot = [&](int x, int y) {
            if (x < 0 || y < 0 || x >= s.w || y >= s.h) return;
            mask[static_cast<size_t>(y * s.w + x)] = 2;
        };
        for (size_t i = 0; i < points.size(); ++i) {
            const Vec2f& a = points[i];
            const Vec2f& b = points[(i + 1) % points.size()];
            bresenham(static_cast<int>(std::lround(a.x)), static_cast<int>(std::lround(a.y)),
                      static_cast<int>(std::lround(b.x)), static_cast<int>(std::lround(b.y)), plot);
        }
    }

    for (int y = 0; y < s.h; ++y) {
        for (int x = 0; x < s.w; ++x) {
            const uint8_t m = mask[static_cast<size_t>(y * s.w + x)];
            if (m == 1) blendOver(s.at(x, y), fill);
            else if (m == 2) blendOver(s.at(x, y), outline);
        }
    }
}

} // namespace petsprites
