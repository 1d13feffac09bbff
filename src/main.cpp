#include <filesystem>
#include <iostream>
#include <string>

#include "sprite_batch.hpp"
#include "version.hpp"

static void printUsage(const char* exe) {
    std::cerr
        << PETSPRITES_APPNAME << " " << PETSPRITES_VERSION << "\n"
        << "Usage: " << (exe ? exe : "petsprites") << "\n\n"
        << "Draws every pet stage x mood sprite and writes them as PNG files to\n"
        << "  " << petsprites::defaultSpriteDir().string() << "\n"
        << "The command takes no arguments.\n";
}

int main(int argc, char** argv) {
    if (argc > 1) {
        printUsage(argv[0]);
        return 2;
    }

    const std::filesystem::path outDir = petsprites::defaultSpriteDir();

    std::string err;
    const bool ok = petsprites::generateAllSprites(
        outDir,
        [](const std::filesystem::path& path) { std::cout << "Wrote " << path.string() << std::endl; },
        &err);

    if (!ok) {
        std::cerr << "error: " << err << "\n";
        return 1;
    }
    return 0;
}
