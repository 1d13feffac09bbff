#pragma once

// Fixed growth-stage and mood tables for the pet sprites.
//
// Both tables are indexed by enum so iterating ALL_STAGES x ALL_MOODS is
// exhaustive at compile time. To add a stage or mood, append an enum value,
// a table row and a name.

#include "common.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace petsprites {

enum class Stage : uint8_t {
    Baby = 0,
    Adult,
    Legendary,
};

enum class Mood : uint8_t {
    Happy = 0,
    Neutral,
    Sad,
};

static constexpr int STAGE_COUNT = 3;
static constexpr int MOOD_COUNT = 3;

inline constexpr std::array<Stage, STAGE_COUNT> ALL_STAGES = {
    Stage::Baby, Stage::Adult, Stage::Legendary,
};

inline constexpr std::array<Mood, MOOD_COUNT> ALL_MOODS = {
    Mood::Happy, Mood::Neutral, Mood::Sad,
};

struct StageProfile {
    Stage stage = Stage::Baby;
    int size = 64; // square canvas side, pixels
    Color body;
    Color belly;
    Color outline;
    Color accent;
    Color glow;
};

struct MoodProfile {
    Mood mood = Mood::Neutral;
    double eyeHeight = 0.0;   // fraction of canvas height
    double mouthHeight = 0.0; // fraction of canvas height
    double mouthCurve = 0.0;  // more negative = broader smile sweep
    uint8_t cheekAlpha = 0;   // 0 = no blush
};

const StageProfile& stageProfile(Stage s);
const MoodProfile& moodProfile(Mood m);

const char* stageName(Stage s);
const char* moodName(Mood m);

std::optional<Stage> parseStage(const std::string& name);
std::optional<Mood> parseMood(const std::string& name);

// The web client numbers stages 1 (baby) .. 3 (legendary).
std::optional<Stage> stageFromEvolutionIndex(int index);
int evolutionIndex(Stage s);

// Blend each RGB channel toward white by `amount` (0..1). Alpha is untouched.
Color lighten(Color c, double amount);

} // namespace petsprites
