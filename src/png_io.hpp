#pragma once
#include "canvas.hpp"

#include <string>

namespace petsprites {

// Layout a PNG file stores, before any conversion on read.
struct PngHeader {
    int width = 0;
    int height = 0;
    bool color = false;
    bool alpha = false;
    bool linear = false;    // 16 bits per channel
    bool colormap = false;

    bool isRGBA8() const { return color && alpha && !linear && !colormap; }
};

// 8-bit straight-alpha RGBA PNG, via libpng's simplified API.
bool writePngRGBA(const std::string& path, const SpritePixels& sprite, std::string* err = nullptr);

// Decodes any PNG libpng understands, converted to 8-bit RGBA.
bool readPngRGBA(const std::string& path, SpritePixels& out, std::string* err = nullptr);

// Reads only the header.
bool readPngHeader(const std::string& path, PngHeader& out, std::string* err = nullptr);

} // namespace petsprites
