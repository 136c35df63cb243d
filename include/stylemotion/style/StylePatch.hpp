#pragma once

#include <stylemotion/style/StyleRecord.hpp>

#include <optional>
#include <string>

namespace SM::Style {

struct BorderPatch {
    std::optional<float>       width;
    std::optional<std::string> color;
};

struct ShadowPatch {
    std::optional<Vec2>        offset;
    std::optional<std::string> color;
    std::optional<float>       softness;
};

struct RectPatch {
    std::optional<Vec2> anchored_position;
    std::optional<Vec2> size_delta;
    std::optional<Vec2> anchor_min;
    std::optional<Vec2> anchor_max;
    std::optional<Vec2> pivot;
};

struct LayoutPatch {
    std::optional<float> preferred_width;
    std::optional<float> preferred_height;
    std::optional<float> flexible_width;
    std::optional<float> flexible_height;
};

/**
 * StylePatch: a sparse override over a StyleRecord.
 *
 * Colors stay textual ("#RRGGBB[AA]", "#RGB[A]" or a named color) until they are
 * merged; a color that does not parse behaves as if it were absent.
 */
struct StylePatch {
    std::optional<std::string> background_color;
    std::optional<float>       opacity;
    std::optional<float>       radius;
    std::optional<BorderPatch> border;
    std::optional<ShadowPatch> shadow;

    std::optional<std::string> text_color;
    std::optional<float>       font_size;
    std::optional<float>       character_spacing;

    std::optional<Vec2> scale;
    std::optional<Vec3> rotation;

    std::optional<RectPatch>   rect;
    std::optional<LayoutPatch> layout;

    [[nodiscard]] auto empty() const -> bool {
        return !background_color && !opacity && !radius && !border && !shadow && !text_color && !font_size
               && !character_spacing && !scale && !rotation && !rect && !layout;
    }
};

} // namespace SM::Style
