#pragma once

// Naming and batch output for the pet sprite set.

#include "profiles.hpp"

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace petsprites {

// "pet-<stage>-<mood>.png"
std::string spriteFileName(Stage stage, Mood mood);

// Web path the client loads a sprite from. baseUrl carries its own trailing
// slash ("/" or "/crypto-pet/").
std::string spriteAssetUrl(const std::string& baseUrl, Stage stage, Mood mood);

// "<stage> <mood> pet sprite"
std::string spriteAltText(Stage stage, Mood mood);

// <project root>/public/assets/sprites.
//
// The project root is PETSPRITES_PROJECT_ROOT, which the CMake build sets to
// the source directory. Builds that do not define it fall back to the parent
// of the directory holding the executable, then the current directory.
std::filesystem::path defaultSpriteDir();

using SpriteWrittenFn = std::function<void(const std::filesystem::path&)>;

// Renders every stage x mood pair in table order and writes each as a PNG
// into outDir (created if missing). Stops at the first failure.
// onWritten runs right after each file is on disk.
bool generateAllSprites(const std::filesystem::path& outDir,
                        const SpriteWrittenFn& onWritten,
                        std::string* err = nullptr);

// Same, collecting the paths written so far into `written`.
bool generateAllSprites(const std::filesystem::path& outDir,
                        std::vector<std::filesystem::path>& written,
                        std::string* err = nullptr);

} // namespace petsprites
