#include "png_io.hpp"

#include <png.h>

#include <cstring>
#include <utility>
#include <vector>

namespace petsprites {

namespace {

constexpr int BYTES_PER_PIXEL = PNG_IMAGE_SAMPLE_SIZE(PNG_FORMAT_RGBA);

void initImage(png_image& image) {
    std::memset(&image, 0, sizeof(image));
    image.version = PNG_IMAGE_VERSION;
}

void setError(std::string* err, const std::string& what, const std::string& path, const png_image& image) {
    if (!err) return;
    *err = what + " " + path;
    if (image.message[0] != '\0') {
        *err += ": ";
        *err += image.message;
    }
}

} // namespace

bool writePngRGBA(const std::string& path, const SpritePixels& sprite, std::string* err) {
    if (sprite.w <= 0 || sprite.h <= 0 ||
        sprite.px.size() != static_cast<size_t>(sprite.w * sprite.h)) {
        if (err) *err = "refusing to write malformed sprite to " + path;
        return false;
    }

    png_image image;
    initImage(image);
    image.format = PNG_FORMAT_RGBA;
    image.width = static_cast<png_uint_32>(sprite.w);
    image.height = static_cast<png_uint_32>(sprite.h);

    std::vector<png_byte> bytes(PNG_IMAGE_SIZE(image));
    size_t i = 0;
    for (const Color& c : sprite.px) {
        bytes[i++] = c.r;
        bytes[i++] = c.g;
        bytes[i++] = c.b;
        bytes[i++] = c.a;
    }

    if (!png_image_write_to_file(&image, path.c_str(), 0, bytes.data(), 0, nullptr)) {
        setError(err, "error writing", path, image);
        png_image_free(&image);
        return false;
    }
    return true;
}

bool readPngRGBA(const std::string& path, SpritePixels& out, std::string* err) {
    png_image image;
    initImage(image);

    if (!png_image_begin_read_from_file(&image, path.c_str())) {
        setError(err, "error reading", path, image);
        png_image_free(&image);
        return false;
    }

    image.format = PNG_FORMAT_RGBA;
    std::vector<png_byte> bytes(PNG_IMAGE_SIZE(image));
    if (!png_image_finish_read(&image, nullptr, bytes.data(), 0, nullptr)) {
        setError(err, "error decoding", path, image);
        png_image_free(&image);
        return false;
    }

    SpritePixels s;
    s.w = static_cast<int>(image.width);
    s.h = static_cast<int>(image.height);
    s.px.resize(static_cast<size_t>(s.w * s.h));
    for (size_t p = 0; p < s.px.size(); ++p) {
        const png_byte* b = bytes.data() + p * BYTES_PER_PIXEL;
        s.px[p] = { b[0], b[1], b[2], b[3] };
    }
    out = std::move(s);
    return true;
}

bool readPngHeader(const std::string& path, PngHeader& out, std::string* err) {
    png_image image;
    initImage(image);

    if (!png_image_begin_read_from_file(&image, path.c_str())) {
        setError(err, "error reading", path, image);
        png_image_free(&image);
        return false;
    }

    PngHeader h;
    h.width = static_cast<int>(image.width);
    h.height = static_cast<int>(image.height);
    h.color = (image.format & PNG_FORMAT_FLAG_COLOR) != 0;
    h.alpha = (image.format & PNG_FORMAT_FLAG_ALPHA) != 0;
    h.linear = (image.format & PNG_FORMAT_FLAG_LINEAR) != 0;
    h.colormap = (image.format & PNG_FORMAT_FLAG_COLORMAP) != 0;
    png_image_free(&image);

    out = h;
    return true;
}

} // namespace petsprites
