#include <stylemotion/animation/Ease.hpp>

#include "utils/StringUtils.hpp"

#include <array>
#include <cmath>
#include <numbers>
#include <utility>

namespace SM::Animation {

namespace {

constexpr float kPi = std::numbers::pi_v<float>;

constexpr float kBackC1 = 1.70158f;
constexpr float kBackC2 = kBackC1 * 1.525f;
constexpr float kBackC3 = kBackC1 + 1.0f;

constexpr float kElasticC4 = (2.0f * kPi) / 3.0f;
constexpr float kElasticC5 = (2.0f * kPi) / 4.5f;

auto out_bounce(float t) -> float {
    constexpr float n1 = 7.5625f;
    constexpr float d1 = 2.75f;
    if (t < 1.0f / d1) {
        return n1 * t * t;
    }
    if (t < 2.0f / d1) {
        t -= 1.5f / d1;
        return n1 * t * t + 0.75f;
    }
    if (t < 2.5f / d1) {
        t -= 2.25f / d1;
        return n1 * t * t + 0.9375f;
    }
    t -= 2.625f / d1;
    return n1 * t * t + 0.984375f;
}

auto evaluate_curve(Ease ease, float t) -> float {
    switch (ease) {
    case Ease::Linear:
        return t;
    case Ease::InSine:
        return 1.0f - std::cos((t * kPi) / 2.0f);
    case Ease::OutSine:
        return std::sin((t * kPi) / 2.0f);
    case Ease::InOutSine:
        return -(std::cos(kPi * t) - 1.0f) / 2.0f;
    case Ease::InQuad:
        return t * t;
    case Ease::Default:
    case Ease::OutQuad:
        return 1.0f - (1.0f - t) * (1.0f - t);
    case Ease::InOutQuad:
        return t < 0.5f ? 2.0f * t * t : 1.0f - std::pow(-2.0f * t + 2.0f, 2.0f) / 2.0f;
    case Ease::InCubic:
        return t * t * t;
    case Ease::OutCubic:
        return 1.0f - std::pow(1.0f - t, 3.0f);
    case Ease::InOutCubic:
        return t < 0.5f ? 4.0f * t * t * t : 1.0f - std::pow(-2.0f * t + 2.0f, 3.0f) / 2.0f;
    case Ease::InQuart:
        return t * t * t * t;
    case Ease::OutQuart:
        return 1.0f - std::pow(1.0f - t, 4.0f);
    case Ease::InOutQuart:
        return t < 0.5f ? 8.0f * t * t * t * t : 1.0f - std::pow(-2.0f * t + 2.0f, 4.0f) / 2.0f;
    case Ease::InQuint:
        return t * t * t * t * t;
    case Ease::OutQuint:
        return 1.0f - std::pow(1.0f - t, 5.0f);
    case Ease::InOutQuint:
        return t < 0.5f ? 16.0f * t * t * t * t * t : 1.0f - std::pow(-2.0f * t + 2.0f, 5.0f) / 2.0f;
    case Ease::InExpo:
        return std::pow(2.0f, 10.0f * t - 10.0f);
    case Ease::OutExpo:
        return 1.0f - std::pow(2.0f, -10.0f * t);
    case Ease::InOutExpo:
        return t < 0.5f ? std::pow(2.0f, 20.0f * t - 10.0f) / 2.0f
                        : (2.0f - std::pow(2.0f, -20.0f * t + 10.0f)) / 2.0f;
    case Ease::InCirc:
        return 1.0f - std::sqrt(1.0f - t * t);
    case Ease::OutCirc:
        return std::sqrt(1.0f - (t - 1.0f) * (t - 1.0f));
    case Ease::InOutCirc:
        return t < 0.5f ? (1.0f - std::sqrt(1.0f - std::pow(2.0f * t, 2.0f))) / 2.0f
                        : (std::sqrt(1.0f - std::pow(-2.0f * t + 2.0f, 2.0f)) + 1.0f) / 2.0f;
    case Ease::InElastic:
        return -std::pow(2.0f, 10.0f * t - 10.0f) * std::sin((t * 10.0f - 10.75f) * kElasticC4);
    case Ease::OutElastic:
        return std::pow(2.0f, -10.0f * t) * std::sin((t * 10.0f - 0.75f) * kElasticC4) + 1.0f;
    case Ease::InOutElastic:
        return t < 0.5f ? -(std::pow(2.0f, 20.0f * t - 10.0f) * std::sin((20.0f * t - 11.125f) * kElasticC5)) / 2.0f
                        : (std::pow(2.0f, -20.0f * t + 10.0f) * std::sin((20.0f * t - 11.125f) * kElasticC5)) / 2.0f
                              + 1.0f;
    case Ease::InBack:
        return kBackC3 * t * t * t - kBackC1 * t * t;
    case Ease::OutBack:
        return 1.0f + kBackC3 * std::pow(t - 1.0f, 3.0f) + kBackC1 * std::pow(t - 1.0f, 2.0f);
    case Ease::InOutBack:
        return t < 0.5f ? (std::pow(2.0f * t, 2.0f) * ((kBackC2 + 1.0f) * 2.0f * t - kBackC2)) / 2.0f
                        : (std::pow(2.0f * t - 2.0f, 2.0f) * ((kBackC2 + 1.0f) * (t * 2.0f - 2.0f) + kBackC2) + 2.0f)
                              / 2.0f;
    case Ease::InBounce:
        return 1.0f - out_bounce(1.0f - t);
    case Ease::OutBounce:
        return out_bounce(t);
    case Ease::InOutBounce:
        return t < 0.5f ? (1.0f - out_bounce(1.0f - 2.0f * t)) / 2.0f : (1.0f + out_bounce(2.0f * t - 1.0f)) / 2.0f;
    }
    return t;
}

constexpr std::array<std::pair<Ease, std::string_view>, 32> kEaseNames{{
    {Ease::Default, "Default"},
    {Ease::Linear, "Linear"},
    {Ease::InSine, "InSine"},
    {Ease::OutSine, "OutSine"},
    {Ease::InOutSine, "InOutSine"},
    {Ease::InQuad, "InQuad"},
    {Ease::OutQuad, "OutQuad"},
    {Ease::InOutQuad, "InOutQuad"},
    {Ease::InCubic, "InCubic"},
    {Ease::OutCubic, "OutCubic"},
    {Ease::InOutCubic, "InOutCubic"},
    {Ease::InQuart, "InQuart"},
    {Ease::OutQuart, "OutQuart"},
    {Ease::InOutQuart, "InOutQuart"},
    {Ease::InQuint, "InQuint"},
    {Ease::OutQuint, "OutQuint"},
    {Ease::InOutQuint, "InOutQuint"},
    {Ease::InExpo, "InExpo"},
    {Ease::OutExpo, "OutExpo"},
    {Ease::InOutExpo, "InOutExpo"},
    {Ease::InCirc, "InCirc"},
    {Ease::OutCirc, "OutCirc"},
    {Ease::InOutCirc, "InOutCirc"},
    {Ease::InElastic, "InElastic"},
    {Ease::OutElastic, "OutElastic"},
    {Ease::InOutElastic, "InOutElastic"},
    {Ease::InBack, "InBack"},
    {Ease::OutBack, "OutBack"},
    {Ease::InOutBack, "InOutBack"},
    {Ease::InBounce, "InBounce"},
    {Ease::OutBounce, "OutBounce"},
    {Ease::InOutBounce, "InOutBounce"},
}};

} // namespace

auto Evaluate(Ease ease, float t) -> float {
    // Endpoints are exact for every curve.
    if (t == 0.0f) {
        return 0.0f;
    }
    if (t == 1.0f) {
        return 1.0f;
    }
    return evaluate_curve(ease, t);
}

auto ParseEase(std::string_view name) -> std::optional<Ease> {
    for (auto const& [ease, label] : kEaseNames) {
        if (equals_ignore_case(label, name)) {
            return ease;
        }
    }
    return std::nullopt;
}

auto EaseName(Ease ease) -> std::string_view {
    for (auto const& [candidate, label] : kEaseNames) {
        if (candidate == ease) {
            return label;
        }
    }
    return "Linear";
}

} // namespace SM::Animation
