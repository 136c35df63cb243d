#include <stylemotion/style/StyleAlgebra.hpp>

#include "utils/StringUtils.hpp"

#include <array>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <optional>
#include <string_view>

namespace SM::Style {

namespace {

struct NamedColor {
    std::string_view name;
    Color            rgba;
};

constexpr std::array<NamedColor, 23> kNamedColors{{
    {"red", {1.0f, 0.0f, 0.0f, 1.0f}},
    {"cyan", {0.0f, 1.0f, 1.0f, 1.0f}},
    {"blue", {0.0f, 0.0f, 1.0f, 1.0f}},
    {"darkblue", {0.0f, 0.0f, 160.0f / 255.0f, 1.0f}},
    {"lightblue", {173.0f / 255.0f, 216.0f / 255.0f, 230.0f / 255.0f, 1.0f}},
    {"purple", {128.0f / 255.0f, 0.0f, 128.0f / 255.0f, 1.0f}},
    {"yellow", {1.0f, 1.0f, 0.0f, 1.0f}},
    {"lime", {0.0f, 1.0f, 0.0f, 1.0f}},
    {"fuchsia", {1.0f, 0.0f, 1.0f, 1.0f}},
    {"white", {1.0f, 1.0f, 1.0f, 1.0f}},
    {"silver", {192.0f / 255.0f, 192.0f / 255.0f, 192.0f / 255.0f, 1.0f}},
    {"grey", {128.0f / 255.0f, 128.0f / 255.0f, 128.0f / 255.0f, 1.0f}},
    {"gray", {128.0f / 255.0f, 128.0f / 255.0f, 128.0f / 255.0f, 1.0f}},
    {"black", {0.0f, 0.0f, 0.0f, 1.0f}},
    {"orange", {1.0f, 165.0f / 255.0f, 0.0f, 1.0f}},
    {"brown", {165.0f / 255.0f, 42.0f / 255.0f, 42.0f / 255.0f, 1.0f}},
    {"maroon", {128.0f / 255.0f, 0.0f, 0.0f, 1.0f}},
    {"green", {0.0f, 128.0f / 255.0f, 0.0f, 1.0f}},
    {"olive", {128.0f / 255.0f, 128.0f / 255.0f, 0.0f, 1.0f}},
    {"navy", {0.0f, 0.0f, 128.0f / 255.0f, 1.0f}},
    {"teal", {0.0f, 128.0f / 255.0f, 128.0f / 255.0f, 1.0f}},
    {"aqua", {0.0f, 1.0f, 1.0f, 1.0f}},
    {"magenta", {1.0f, 0.0f, 1.0f, 1.0f}},
}};

auto hex_value(char ch) -> int {
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    auto lower = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    if (lower >= 'a' && lower <= 'f') {
        return 10 + (lower - 'a');
    }
    return -1;
}

auto parse_hex(std::string_view digits) -> std::optional<Color> {
    bool const short_form = digits.size() == 3 || digits.size() == 4;
    bool const long_form  = digits.size() == 6 || digits.size() == 8;
    if (!short_form && !long_form) {
        return std::nullopt;
    }

    Color       out{0.0f, 0.0f, 0.0f, 1.0f};
    std::size_t channels = short_form ? digits.size() : digits.size() / 2;
    for (std::size_t channel = 0; channel < channels; ++channel) {
        int value = 0;
        if (short_form) {
            auto nibble = hex_value(digits[channel]);
            if (nibble < 0) {
                return std::nullopt;
            }
            value = nibble * 17;
        } else {
            auto high = hex_value(digits[channel * 2]);
            auto low  = hex_value(digits[channel * 2 + 1]);
            if (high < 0 || low < 0) {
                return std::nullopt;
            }
            value = high * 16 + low;
        }
        out[channel] = static_cast<float>(value) / 255.0f;
    }
    return out;
}

auto merge_color(Color& field, std::optional<std::string> const& text) -> void {
    if (!text) {
        return;
    }
    if (auto parsed = ParseColor(*text)) {
        field = *parsed;
    }
}

template <typename T>
auto merge_value(T& field, std::optional<T> const& value) -> void {
    if (value) {
        field = *value;
    }
}

} // namespace

auto ParseColor(std::string_view text) -> std::optional<Color> {
    if (text.empty()) {
        return std::nullopt;
    }
    if (text.front() == '#') {
        return parse_hex(text.substr(1));
    }
    for (auto const& named : kNamedColors) {
        if (equals_ignore_case(named.name, text)) {
            return named.rgba;
        }
    }
    return std::nullopt;
}

auto Merge(StyleRecord const& base, StylePatch const& patch) -> StyleRecord {
    StyleRecord out = base;

    merge_color(out.background_color, patch.background_color);
    merge_value(out.opacity, patch.opacity);
    merge_value(out.radius, patch.radius);

    if (patch.border) {
        merge_value(out.border_width, patch.border->width);
        merge_color(out.border_color, patch.border->color);
    }

    if (patch.shadow) {
        merge_color(out.shadow_color, patch.shadow->color);
        merge_value(out.shadow_offset, patch.shadow->offset);
        merge_value(out.shadow_softness, patch.shadow->softness);
    }

    merge_color(out.text_color, patch.text_color);
    merge_value(out.font_size, patch.font_size);
    merge_value(out.character_spacing, patch.character_spacing);

    merge_value(out.scale, patch.scale);
    merge_value(out.rotation, patch.rotation);

    if (patch.rect) {
        merge_value(out.anchored_position, patch.rect->anchored_position);
        merge_value(out.size_delta, patch.rect->size_delta);
        merge_value(out.anchor_min, patch.rect->anchor_min);
        merge_value(out.anchor_max, patch.rect->anchor_max);
        merge_value(out.pivot, patch.rect->pivot);
    }

    if (patch.layout) {
        merge_value(out.preferred_width, patch.layout->preferred_width);
        merge_value(out.preferred_height, patch.layout->preferred_height);
        merge_value(out.flexible_width, patch.layout->flexible_width);
        merge_value(out.flexible_height, patch.layout->flexible_height);
    }

    return out;
}

auto LerpColor(Color const& a, Color const& b, float t) -> Color {
    Color out{};
    for (std::size_t i = 0; i < out.size(); ++i) {
        out[i] = std::lerp(a[i], b[i], t);
    }
    return out;
}

auto LerpVec2(Vec2 const& a, Vec2 const& b, float t) -> Vec2 {
    return Vec2{std::lerp(a.x, b.x, t), std::lerp(a.y, b.y, t)};
}

auto LerpVec3(Vec3 const& a, Vec3 const& b, float t) -> Vec3 {
    return Vec3{std::lerp(a.x, b.x, t), std::lerp(a.y, b.y, t), std::lerp(a.z, b.z, t)};
}

auto Lerp(StyleRecord const& a, StyleRecord const& b, float t) -> StyleRecord {
    StyleRecord r;

    r.background_color = LerpColor(a.background_color, b.background_color, t);
    r.radius           = std::lerp(a.radius, b.radius, t);
    r.opacity          = std::lerp(a.opacity, b.opacity, t);

    r.border_width = std::lerp(a.border_width, b.border_width, t);
    r.border_color = LerpColor(a.border_color, b.border_color, t);

    r.shadow_color    = LerpColor(a.shadow_color, b.shadow_color, t);
    r.shadow_offset   = LerpVec2(a.shadow_offset, b.shadow_offset, t);
    r.shadow_softness = std::lerp(a.shadow_softness, b.shadow_softness, t);

    r.text_color        = LerpColor(a.text_color, b.text_color, t);
    r.font_size         = std::lerp(a.font_size, b.font_size, t);
    r.character_spacing = std::lerp(a.character_spacing, b.character_spacing, t);

    r.scale    = LerpVec2(a.scale, b.scale, t);
    r.rotation = LerpVec3(a.rotation, b.rotation, t);

    r.anchored_position = LerpVec2(a.anchored_position, b.anchored_position, t);
    r.size_delta        = LerpVec2(a.size_delta, b.size_delta, t);
    r.anchor_min        = LerpVec2(a.anchor_min, b.anchor_min, t);
    r.anchor_max        = LerpVec2(a.anchor_max, b.anchor_max, t);
    r.pivot             = LerpVec2(a.pivot, b.pivot, t);

    r.preferred_width  = std::lerp(a.preferred_width, b.preferred_width, t);
    r.preferred_height = std::lerp(a.preferred_height, b.preferred_height, t);
    r.flexible_width   = std::lerp(a.flexible_width, b.flexible_width, t);
    r.flexible_height  = std::lerp(a.flexible_height, b.flexible_height, t);

    return r;
}

} // namespace SM::Style
