#pragma once

// Procedural pet creature sprites.
//
// A sprite is five passes layered onto a transparent square canvas:
//   glow ring -> ears (or horns) -> body -> face -> star (legendary only)
// Later passes composite over earlier ones, so the order is part of the look.
// All geometry derives from the stage and mood records; there is no RNG and
// no clock, so the same inputs always give the same pixels.

#include "canvas.hpp"
#include "profiles.hpp"

#include <string>

namespace petsprites {

SpritePixels renderPetSprite(Stage stage, Mood mood);
SpritePixels renderPetSprite(const StageProfile& stage, const MoodProfile& mood);

// Name-keyed entry point. Returns false (and leaves `out` untouched) if either
// name is not a known stage or mood.
bool renderPetSprite(const std::string& stageKey, const std::string& moodKey,
                     SpritePixels& out, std::string* err = nullptr);

// Individual passes, drawn onto a canvas of side stage.size.
void drawGlowPass(SpritePixels& s, const StageProfile& stage);
void drawEarsPass(SpritePixels& s, const StageProfile& stage);
void drawBodyPass(SpritePixels& s, const StageProfile& stage);
void drawFacePass(SpritePixels& s, const StageProfile& stage, const MoodProfile& mood);
void drawStarPass(SpritePixels& s, const StageProfile& stage);

// Fill color of the legendary star.
Color starColor(const StageProfile& stage);

// Blush color for a mood, alpha = mood.cheekAlpha.
Color cheekColor(const MoodProfile& mood);

} // namespace petsprites
