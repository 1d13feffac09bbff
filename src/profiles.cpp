#include "profiles.hpp"

namespace petsprites {

namespace {

const std::array<StageProfile, STAGE_COUNT> STAGE_TABLE = {{
    { Stage::Baby, 64,
      {253, 233, 196, 255}, {255, 248, 226, 255}, {92, 64, 56, 255},
      {255, 206, 150, 255}, {255, 255, 255, 60} },
    { Stage::Adult, 128,
      {196, 233, 253, 255}, {226, 246, 255, 255}, {37, 64, 92, 255},
      {120, 191, 245, 255}, {255, 255, 255, 50} },
    { Stage::Legendary, 192,
      {225, 207, 255, 255}, {242, 233, 255, 255}, {68, 45, 100, 255},
      {164, 132, 255, 255}, {255, 255, 255, 40} },
}};

const std::array<MoodProfile, MOOD_COUNT> MOOD_TABLE = {{
    { Mood::Happy,   0.35, 0.53, -8.0, 120 },
    { Mood::Neutral, 0.38, 0.58, -3.0, 0 },
    { Mood::Sad,     0.42, 0.63, -1.0, 0 },
}};

} // namespace

const StageProfile& stageProfile(Stage s) {
    return STAGE_TABLE[static_cast<size_t>(s)];
}

const MoodProfile& moodProfile(Mood m) {
    return MOOD_TABLE[static_cast<size_t>(m)];
}

const char* stageName(Stage s) {
    switch (s) {
        case Stage::Baby:      return "baby";
        case Stage::Adult:     return "adult";
        case Stage::Legendary: return "legendary";
    }
    return "";
}

const char* moodName(Mood m) {
    switch (m) {
        case Mood::Happy:   return "happy";
        case Mood::Neutral: return "neutral";
        case Mood::Sad:     return "sad";
    }
    return "";
}

std::optional<Stage> parseStage(const std::string& name) {
    for (Stage s : ALL_STAGES) {
        if (name == stageName(s)) return s;
    }
    return std::nullopt;
}

std::optional<Mood> parseMood(const std::string& name) {
    for (Mood m : ALL_MOODS) {
        if (name == moodName(m)) return m;
    }
    return std::nullopt;
}

std::optional<Stage> stageFromEvolutionIndex(int index) {
    if (index < 1 || index > STAGE_COUNT) return std::nullopt;
    return ALL_STAGES[static_cast<size_t>(index - 1)];
}

int evolutionIndex(Stage s) {
    return static_cast<int>(s) + 1;
}

Color lighten(Color c, double amount) {
    auto toWhite = [&](uint8_t v) -> uint8_t {
        return clamp8(static_cast<int>(v + (255 - v) * amount));
    };
    return { toWhite(c.r), toWhite(c.g), toWhite(c.b), c.a };
}

} // namespace petsprites
