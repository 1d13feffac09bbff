#include "pet_sprite.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace petsprites {

namespace {

constexpr double PI = 3.14159265358979323846;

inline int frac(int size, double f) {
    return static_cast<int>(size * f);
}

bool isLegendary(const StageProfile& st) {
    return st.stage == Stage::Legendary;
}

Box bodyBox(int size) {
    const int margin = size / 8;
    return { margin, frac(size, 0.18), size - margin, size - frac(size, 0.12) };
}

int bodyOutlineWidth(int size) {
    return std::max(2, size / 32);
}

} // namespace

Color starColor(const StageProfile& stage) {
    return lighten(stage.accent, 0.2);
}

Color cheekColor(const MoodProfile& mood) {
    return { 255, 153, 170, mood.cheekAlpha };
}

void drawGlowPass(SpritePixels& s, const StageProfile& stage) {
    const int size = stage.size;
    const int margin = size / 10;
    drawEllipse(s, { margin, margin, size - margin, size - margin },
                NO_COLOR, stage.glow, std::max(1, size / 64));
}

void drawEarsPass(SpritePixels& s, const StageProfile& stage) {
    const int size = stage.size;
    const int earW = size / 6;
    const int earH = size / 7;
    const int top = frac(size, 0.08);
    const int cx = size / 2;

    if (isLegendary(stage)) {
        const float hornH = static_cast<float>(size / 4);
        for (int offset : { -earW, earW }) {
            const float o = static_cast<float>(offset);
            const std::vector<Vec2f> horn = {
                { cx + o,        static_cast<float>(top) },
                { cx + o * 0.6f, top + hornH },
                { cx + o * 1.4f, top + hornH },
            };
            drawPolygon(s, horn, stage.accent, stage.outline);
        }
        return;
    }

    const int outlineW = std::max(2, size / 36);
    const int left = cx - earW - size / 12;
    const int right = cx + size / 12;
    for (int x : { left, right }) {
        drawRoundedRect(s, { x, top, x + earW, top + earH }, earW / 2,
                        stage.body, stage.outline, outlineW);
    }
}

void drawBodyPass(SpritePixels& s, const StageProfile& stage) {
    const int size = stage.size;
    const Box body = bodyBox(size);
    const int outlineW = bodyOutlineWidth(size);

    drawRoundedRect(s, body, size / 4, stage.body, stage.outline, outlineW);

    const int bellyMargin = size / 3;
    drawEllipse(s, { bellyMargin, frac(size, 0.42), size - bellyMargin, size - frac(size, 0.16) },
                stage.belly, NO_COLOR, 0);

    // Highlight along the top of the silhouette.
    drawArc(s, body, 200.0, 340.0, stage.accent, outlineW);
}

void drawFacePass(SpritePixels& s, const StageProfile& stage, const MoodProfile& mood) {
    const int size = stage.size;
    const int eyeW = std::max(4, size / 16);
    const int eyeH = std::max(6, size / 10);
    const int eyeSpacing = size / 8;
    const int cx = size / 2;
    const int eyeY = frac(size, mood.eyeHeight);

    for (int offset : { -eyeSpacing, eyeSpacing }) {
        const Box eye{ cx + offset - eyeW / 2, eyeY - eyeH / 2,
                       cx + offset + eyeW / 2, eyeY + eyeH / 2 };
        drawRoundedRect(s, eye, eyeW / 2, stage.outline, NO_COLOR, 0);
    }

    // Sweep 200..340 is the top half of the box (a frown); a negative curve
    // pushes both ends down and past each other into a smile.
    const int mouthW = size / 6;
    const int mouthY = frac(size, mood.mouthHeight);
    const double start = 200.0 - mood.mouthCurve * 20.0;
    const double end = 340.0 + mood.mouthCurve * 20.0;
    drawArc(s, { cx - mouthW, mouthY - mouthW / 2, cx + mouthW, mouthY + mouthW / 2 },
            start, end, stage.outline, std::max(2, size / 48));

    if (mood.cheekAlpha == 0) return;

    const Color blush = cheekColor(mood);
    const int r = size / 12;
    for (int offset : { -eyeSpacing, eyeSpacing }) {
        drawEllipse(s, { cx + offset - r, mouthY - r / 2, cx + offset + r, mouthY + r },
                    blush, NO_COLOR, 0);
    }
}

void drawStarPass(SpritePixels& s, const StageProfile& stage) {
    const int size = stage.size;
    const int outerR = size / 10;
    const float cx = static_cast<float>(frac(size, 0.78));
    const float cy = static_cast<float>(frac(size, 0.28));

    std::vector<Vec2f> star;
    star.reserve(10);
    for (int i = 0; i < 10; ++i) {
        const double angle = (i * 36) * PI / 180.0;
        const int r = (i % 2 == 0) ? outerR : outerR / 2;
        star.push_back({ cx + static_cast<float>(r * std::cos(angle)),
                         cy + static_cast<float>(r * std::sin(angle)) });
    }
    drawPolygon(s, star, starColor(stage), NO_COLOR);
}

SpritePixels renderPetSprite(const StageProfile& stage, const MoodProfile& mood) {
    SpritePixels s = makeCanvas(stage.size);

    drawGlowPass(s, stage);
    drawEarsPass(s, stage);
    drawBodyPass(s, stage);
    drawFacePass(s, stage, mood);
    if (isLegendary(stage)) drawStarPass(s, stage);

    return s;
}

SpritePixels renderPetSprite(Stage stage, Mood mood) {
    return renderPetSprite(stageProfile(stage), moodProfile(mood));
}

bool renderPetSprite(const std::string& stageKey, const std::string& moodKey,
                     SpritePixels& out, std::string* err) {
    const std::optional<Stage> stage = parseStage(stageKey);
    if (!stage) {
        if (err) *err = "unknown stage '" + stageKey + "'";
        return false;
    }
    const std::optional<Mood> mood = parseMood(moodKey);
    if (!mood) {
        if (err) *err = "unknown mood '" + moodKey + "'";
        return false;
    }
    out = renderPetSprite(*stage, *mood);
    return true;
}

} // namespace petsprites
