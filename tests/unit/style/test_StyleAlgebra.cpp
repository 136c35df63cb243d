#include <doctest/doctest.h>

#include <stylemotion/style/ElementStyle.hpp>
#include <stylemotion/style/StyleAlgebra.hpp>

#include <algorithm>
#include <vector>

using namespace SM::Style;

namespace {

auto sample_record() -> StyleRecord {
    StyleRecord r;
    r.background_color  = {0.2f, 0.4f, 0.6f, 1.0f};
    r.radius            = 4.0f;
    r.opacity           = 0.5f;
    r.border_width      = 2.0f;
    r.border_color      = {1.0f, 0.0f, 0.0f, 1.0f};
    r.shadow_color      = {0.0f, 0.0f, 0.0f, 0.5f};
    r.shadow_offset     = {3.0f, -3.0f};
    r.shadow_softness   = 6.0f;
    r.text_color        = {1.0f, 1.0f, 1.0f, 1.0f};
    r.font_size         = 18.0f;
    r.character_spacing = 1.5f;
    r.scale             = {1.2f, 0.8f};
    r.rotation          = {0.0f, 0.0f, 45.0f};
    r.anchored_position = {10.0f, 20.0f};
    r.size_delta        = {200.0f, 48.0f};
    r.anchor_min        = {0.0f, 0.0f};
    r.anchor_max        = {1.0f, 1.0f};
    r.pivot             = {0.0f, 1.0f};
    r.preferred_width   = 120.0f;
    r.preferred_height  = 32.0f;
    r.flexible_width    = 1.0f;
    r.flexible_height   = 0.0f;
    return r;
}

auto scalar_fields(StyleRecord const& r) -> std::vector<float> {
    return {r.background_color[0], r.background_color[1], r.background_color[2], r.background_color[3],
            r.radius,              r.opacity,             r.border_width,        r.border_color[0],
            r.border_color[3],     r.shadow_color[3],     r.shadow_offset.x,     r.shadow_offset.y,
            r.shadow_softness,     r.text_color[0],       r.font_size,           r.character_spacing,
            r.scale.x,             r.scale.y,             r.rotation.z,          r.anchored_position.x,
            r.anchored_position.y, r.size_delta.x,        r.size_delta.y,        r.anchor_min.x,
            r.anchor_max.y,        r.pivot.y,             r.preferred_width,     r.preferred_height,
            r.flexible_width,      r.flexible_height};
}

} // namespace

TEST_SUITE("style.algebra") {

TEST_CASE("Default record carries the canonical values") {
    auto const d = StyleRecord::Default();
    CHECK(d.opacity == 1.0f);
    CHECK(d.font_size == 14.0f);
    CHECK(d.shadow_softness == 1.0f);
    CHECK(d.scale == Vec2{1.0f, 1.0f});
    CHECK(d.anchor_min == Vec2{0.5f, 0.5f});
    CHECK(d.pivot == Vec2{0.5f, 0.5f});
    CHECK(d.preferred_width == -1.0f);
    CHECK(d.flexible_height == -1.0f);
    CHECK(d.background_color == Color{0.0f, 0.0f, 0.0f, 0.0f});
    CHECK(d.text_color == Color{0.0f, 0.0f, 0.0f, 1.0f});
}

TEST_CASE("ParseColor accepts hex forms and names") {
    SUBCASE("long hex with and without alpha") {
        auto opaque = ParseColor("#FF0080");
        REQUIRE(opaque.has_value());
        CHECK((*opaque)[0] == 1.0f);
        CHECK((*opaque)[1] == 0.0f);
        CHECK((*opaque)[2] == doctest::Approx(128.0f / 255.0f));
        CHECK((*opaque)[3] == 1.0f);

        auto translucent = ParseColor("#00000080");
        REQUIRE(translucent.has_value());
        CHECK((*translucent)[3] == doctest::Approx(128.0f / 255.0f));
    }
    SUBCASE("short hex expands nibbles") {
        auto color = ParseColor("#f0a");
        REQUIRE(color.has_value());
        CHECK((*color)[0] == 1.0f);
        CHECK((*color)[1] == 0.0f);
        CHECK((*color)[2] == doctest::Approx(170.0f / 255.0f));

        auto with_alpha = ParseColor("#0008");
        REQUIRE(with_alpha.has_value());
        CHECK((*with_alpha)[3] == doctest::Approx(136.0f / 255.0f));
    }
    SUBCASE("names are case-insensitive") {
        auto red = ParseColor("Red");
        REQUIRE(red.has_value());
        CHECK(*red == Color{1.0f, 0.0f, 0.0f, 1.0f});
    }
    SUBCASE("garbage is rejected") {
        CHECK_FALSE(ParseColor("").has_value());
        CHECK_FALSE(ParseColor("#").has_value());
        CHECK_FALSE(ParseColor("#12345").has_value());
        CHECK_FALSE(ParseColor("#GGGGGG").has_value());
        CHECK_FALSE(ParseColor("notacolor").has_value());
    }
}

TEST_CASE("Merge with an empty patch is the identity") {
    auto const r = sample_record();
    CHECK(Merge(r, StylePatch{}) == r);
    CHECK(Merge(StyleRecord::Default(), StylePatch{}) == StyleRecord::Default());
}

TEST_CASE("Merge writes present fields and leaves absent ones") {
    auto const base = sample_record();

    StylePatch patch;
    patch.opacity          = 0.25f;
    patch.background_color = "#FFFFFF";
    patch.scale            = Vec2{2.0f, 2.0f};
    patch.layout           = LayoutPatch{.preferred_width = 64.0f};

    auto const merged = Merge(base, patch);
    CHECK(merged.opacity == 0.25f);
    CHECK(merged.background_color == Color{1.0f, 1.0f, 1.0f, 1.0f});
    CHECK(merged.scale == Vec2{2.0f, 2.0f});
    CHECK(merged.preferred_width == 64.0f);

    CHECK(merged.radius == base.radius);
    CHECK(merged.preferred_height == base.preferred_height);
    CHECK(merged.flexible_width == base.flexible_width);
    CHECK(merged.text_color == base.text_color);
    CHECK(merged.rotation == base.rotation);
}

TEST_CASE("Merge applies composite groups sub-field by sub-field") {
    auto const base = sample_record();

    SUBCASE("shadow softness alone") {
        StylePatch patch;
        patch.shadow = ShadowPatch{.softness = 12.0f};
        auto const merged = Merge(base, patch);
        CHECK(merged.shadow_softness == 12.0f);
        CHECK(merged.shadow_color == base.shadow_color);
        CHECK(merged.shadow_offset == base.shadow_offset);
    }
    SUBCASE("border color alone") {
        StylePatch patch;
        patch.border = BorderPatch{.color = "#00FF00"};
        auto const merged = Merge(base, patch);
        CHECK(merged.border_color == Color{0.0f, 1.0f, 0.0f, 1.0f});
        CHECK(merged.border_width == base.border_width);
    }
    SUBCASE("rect pivot alone") {
        StylePatch patch;
        patch.rect = RectPatch{.pivot = Vec2{0.5f, 0.5f}};
        auto const merged = Merge(base, patch);
        CHECK(merged.pivot == Vec2{0.5f, 0.5f});
        CHECK(merged.anchored_position == base.anchored_position);
        CHECK(merged.size_delta == base.size_delta);
        CHECK(merged.anchor_min == base.anchor_min);
    }
    SUBCASE("an empty group changes nothing") {
        StylePatch patch;
        patch.rect   = RectPatch{};
        patch.layout = LayoutPatch{};
        CHECK(Merge(base, patch) == base);
    }
}

TEST_CASE("Merge ignores colors that do not parse") {
    auto const base = sample_record();
    StylePatch patch;
    patch.background_color = "";
    patch.text_color       = "#zzz";
    patch.border           = BorderPatch{.width = 5.0f, .color = "chartreuse-ish"};

    auto const merged = Merge(base, patch);
    CHECK(merged.background_color == base.background_color);
    CHECK(merged.text_color == base.text_color);
    CHECK(merged.border_color == base.border_color);
    CHECK(merged.border_width == 5.0f);
}

TEST_CASE("Lerp endpoints are exact") {
    auto const a = sample_record();
    auto const b = StyleRecord::Default();
    CHECK(Lerp(a, b, 0.0f) == a);
    CHECK(Lerp(a, b, 1.0f) == b);
    CHECK(Lerp(b, a, 0.0f) == b);
    CHECK(Lerp(b, a, 1.0f) == a);
}

TEST_CASE("Lerp stays between the endpoints inside [0, 1]") {
    auto const a = sample_record();
    auto const b = StyleRecord::Default();
    auto const lhs = scalar_fields(a);
    auto const rhs = scalar_fields(b);

    for (float t : {0.1f, 0.25f, 0.5f, 0.75f, 0.9f}) {
        auto const mid = scalar_fields(Lerp(a, b, t));
        REQUIRE(mid.size() == lhs.size());
        for (std::size_t i = 0; i < mid.size(); ++i) {
            auto const lo = std::min(lhs[i], rhs[i]);
            auto const hi = std::max(lhs[i], rhs[i]);
            CHECK(mid[i] >= lo);
            CHECK(mid[i] <= hi);
        }
    }
}

TEST_CASE("Lerp extrapolates outside [0, 1]") {
    StyleRecord a;
    StyleRecord b;
    a.opacity = 0.0f;
    b.opacity = 1.0f;
    a.scale   = {1.0f, 1.0f};
    b.scale   = {2.0f, 3.0f};

    auto const over = Lerp(a, b, 1.5f);
    CHECK(over.opacity == doctest::Approx(1.5f));
    CHECK(over.scale.x == doctest::Approx(2.5f));
    CHECK(over.scale.y == doctest::Approx(4.0f));

    auto const under = Lerp(a, b, -0.5f);
    CHECK(under.opacity == doctest::Approx(-0.5f));
}

TEST_CASE("ElementStyle derives normal from its baseline") {
    auto baseline    = StyleRecord::Default();
    baseline.opacity = 0.8f;

    ElementStyle element{baseline};
    std::vector<float> applied;
    element.setSink([&](StyleRecord const& record) { applied.push_back(record.opacity); });

    StylePatch base_patch;
    base_patch.radius = 8.0f;
    element.applyDefinition(base_patch);

    CHECK(element.baseline() == baseline);
    CHECK(element.normal().radius == 8.0f);
    CHECK(element.normal().opacity == 0.8f);
    CHECK(element.current() == element.normal());
    REQUIRE(applied.size() == 1);
    CHECK(applied.front() == 0.8f);

    SUBCASE("reapplying replaces the previous base patch") {
        StylePatch reload;
        reload.opacity = 0.3f;
        element.applyDefinition(reload);
        CHECK(element.normal().radius == 0.0f);
        CHECK(element.normal().opacity == 0.3f);
        CHECK(element.applyCount() == 2);
    }
}

} // TEST_SUITE
