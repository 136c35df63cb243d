#include <doctest/doctest.h>

#include <stylemotion/animation/Ease.hpp>

#include <array>
#include <string>

using namespace SM::Animation;

namespace {

constexpr std::array kAllEases{
    Ease::Default,    Ease::Linear,     Ease::InSine,      Ease::OutSine,    Ease::InOutSine,  Ease::InQuad,
    Ease::OutQuad,    Ease::InOutQuad,  Ease::InCubic,     Ease::OutCubic,   Ease::InOutCubic, Ease::InQuart,
    Ease::OutQuart,   Ease::InOutQuart, Ease::InQuint,     Ease::OutQuint,   Ease::InOutQuint, Ease::InExpo,
    Ease::OutExpo,    Ease::InOutExpo,  Ease::InCirc,      Ease::OutCirc,    Ease::InOutCirc,  Ease::InElastic,
    Ease::OutElastic, Ease::InOutElastic, Ease::InBack,    Ease::OutBack,    Ease::InOutBack,  Ease::InBounce,
    Ease::OutBounce,  Ease::InOutBounce};

} // namespace

TEST_SUITE("animation.ease") {

TEST_CASE("Every ease maps the endpoints exactly") {
    for (auto ease : kAllEases) {
        auto const name = std::string(EaseName(ease));
        CAPTURE(name);
        CHECK(Evaluate(ease, 0.0f) == 0.0f);
        CHECK(Evaluate(ease, 1.0f) == 1.0f);
    }
}

TEST_CASE("Symmetric in-out eases pass through the midpoint") {
    for (auto ease : {Ease::Linear, Ease::InOutSine, Ease::InOutQuad, Ease::InOutCubic, Ease::InOutQuart,
                      Ease::InOutQuint, Ease::InOutCirc}) {
        auto const name = std::string(EaseName(ease));
        CAPTURE(name);
        CHECK(Evaluate(ease, 0.5f) == doctest::Approx(0.5f).epsilon(0.001));
    }
}

TEST_CASE("Curves have their expected shape") {
    CHECK(Evaluate(Ease::InQuad, 0.5f) == doctest::Approx(0.25f));
    CHECK(Evaluate(Ease::OutQuad, 0.5f) == doctest::Approx(0.75f));
    CHECK(Evaluate(Ease::Default, 0.5f) == Evaluate(Ease::OutQuad, 0.5f));
    CHECK(Evaluate(Ease::InCubic, 0.5f) == doctest::Approx(0.125f));
    CHECK(Evaluate(Ease::InBack, 0.2f) < 0.0f);
    CHECK(Evaluate(Ease::OutBack, 0.8f) > 1.0f);
    CHECK(Evaluate(Ease::OutBounce, 0.5f) == doctest::Approx(0.765625f));
}

TEST_CASE("ParseEase is case-insensitive and round-trips names") {
    CHECK(ParseEase("outquad") == Ease::OutQuad);
    CHECK(ParseEase("INOUTBACK") == Ease::InOutBack);
    CHECK(ParseEase("Linear") == Ease::Linear);
    CHECK_FALSE(ParseEase("").has_value());
    CHECK_FALSE(ParseEase("outquadratic").has_value());

    for (auto ease : kAllEases) {
        CHECK(ParseEase(EaseName(ease)) == ease);
    }
}

} // TEST_SUITE
