#pragma once

#include <array>

namespace SM::Style {

using Color = std::array<float, 4>;

struct Vec2 {
    float x = 0.0f;
    float y = 0.0f;

    auto operator==(Vec2 const&) const -> bool = default;
};

struct Vec3 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    auto operator==(Vec3 const&) const -> bool = default;
};

/**
 * StyleRecord: every interpolatable property of one element, fully populated.
 *
 * Records are values: merges and interpolation always produce a new record.
 * Layout weights use -1 as "not driven", matching what layout hosts expect.
 */
struct StyleRecord {
    // Visual
    Color background_color{0.0f, 0.0f, 0.0f, 0.0f};
    float radius  = 0.0f;
    float opacity = 1.0f;

    // Border
    float border_width = 0.0f;
    Color border_color{0.0f, 0.0f, 0.0f, 0.0f};

    // Shadow
    Color shadow_color{0.0f, 0.0f, 0.0f, 0.0f};
    Vec2  shadow_offset{};
    float shadow_softness = 1.0f;

    // Text
    Color text_color{0.0f, 0.0f, 0.0f, 1.0f};
    float font_size         = 14.0f;
    float character_spacing = 0.0f;

    // Transform
    Vec2 scale{1.0f, 1.0f};
    Vec3 rotation{};

    // Rect
    Vec2 anchored_position{};
    Vec2 size_delta{};
    Vec2 anchor_min{0.5f, 0.5f};
    Vec2 anchor_max{0.5f, 0.5f};
    Vec2 pivot{0.5f, 0.5f};

    // Layout
    float preferred_width  = -1.0f;
    float preferred_height = -1.0f;
    float flexible_width   = -1.0f;
    float flexible_height  = -1.0f;

    [[nodiscard]] static auto Default() -> StyleRecord {
        return StyleRecord{};
    }

    auto operator==(StyleRecord const&) const -> bool = default;
};

} // namespace SM::Style
