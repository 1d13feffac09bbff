#include "sprite_batch.hpp"
#include "pet_sprite.hpp"
#include "png_io.hpp"
#include "sdl.hpp"

#include <system_error>

namespace petsprites {

namespace {

std::filesystem::path projectRoot() {
#ifdef PETSPRITES_PROJECT_ROOT
    return std::filesystem::path(PETSPRITES_PROJECT_ROOT);
#else
    // Without CMake: assume the executable sits in <root>/build/.
    if (char* p = SDL_GetBasePath()) {
        std::filesystem::path exeDir(p);
        SDL_free(p);
        if (!exeDir.has_filename()) exeDir = exeDir.parent_path();
        return exeDir.parent_path();
    }
    std::error_code ec;
    std::filesystem::path cwd = std::filesystem::current_path(ec);
    return ec ? std::filesystem::path(".") : cwd;
#endif
}

} // namespace

std::string spriteFileName(Stage stage, Mood mood) {
    return std::string("pet-") + stageName(stage) + "-" + moodName(mood) + ".png";
}

std::string spriteAssetUrl(const std::string& baseUrl, Stage stage, Mood mood) {
    return baseUrl + "assets/sprites/" + spriteFileName(stage, mood);
}

std::string spriteAltText(Stage stage, Mood mood) {
    return std::string(stageName(stage)) + " " + moodName(mood) + " pet sprite";
}

std::filesystem::path defaultSpriteDir() {
    return projectRoot() / "public" / "assets" / "sprites";
}

bool generateAllSprites(const std::filesystem::path& outDir,
                        const SpriteWrittenFn& onWritten,
                        std::string* err) {
    std::error_code ec;
    std::filesystem::create_directories(outDir, ec);
    if (ec) {
        if (err) *err = "cannot create " + outDir.string() + ": " + ec.message();
        return false;
    }

    for (Stage stage : ALL_STAGES) {
        for (Mood mood : ALL_MOODS) {
            const SpritePixels sprite = renderPetSprite(stage, mood);
            const std::filesystem::path path = outDir / spriteFileName(stage, mood);
            if (!writePngRGBA(path.string(), sprite, err)) return false;
            if (onWritten) onWritten(path);
        }
    }
    return true;
}

bool generateAllSprites(const std::filesystem::path& outDir,
                        std::vector<std::filesystem::path>& written,
                        std::string* err) {
    return generateAllSprites(
        outDir, [&](const std::filesystem::path& path) { written.push_back(path); }, err);
}

} // namespace petsprites
