#pragma once

#include <stylemotion/style/StylePatch.hpp>
#include <stylemotion/style/StyleRecord.hpp>

#include <optional>
#include <string_view>

namespace SM::Style {

// Accepts "#RGB", "#RGBA", "#RRGGBB", "#RRGGBBAA" and the common HTML color names.
[[nodiscard]] auto ParseColor(std::string_view text) -> std::optional<Color>;

// Copy of `base` with every present field of `patch` written over it.
[[nodiscard]] auto Merge(StyleRecord const& base, StylePatch const& patch) -> StyleRecord;

// Field-wise interpolation. `t` is not clamped, so overshooting eases extrapolate.
[[nodiscard]] auto Lerp(StyleRecord const& a, StyleRecord const& b, float t) -> StyleRecord;

[[nodiscard]] auto LerpColor(Color const& a, Color const& b, float t) -> Color;
[[nodiscard]] auto LerpVec2(Vec2 const& a, Vec2 const& b, float t) -> Vec2;
[[nodiscard]] auto LerpVec3(Vec3 const& a, Vec3 const& b, float t) -> Vec3;

} // namespace SM::Style
