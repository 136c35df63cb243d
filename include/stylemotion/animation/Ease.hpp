#pragma once

#include <optional>
#include <string_view>

namespace SM::Animation {

enum class Ease {
    Default,
    Linear,
    InSine,
    OutSine,
    InOutSine,
    InQuad,
    OutQuad,
    InOutQuad,
    InCubic,
    OutCubic,
    InOutCubic,
    InQuart,
    OutQuart,
    InOutQuart,
    InQuint,
    OutQuint,
    InOutQuint,
    InExpo,
    OutExpo,
    InOutExpo,
    InCirc,
    OutCirc,
    InOutCirc,
    InElastic,
    OutElastic,
    InOutElastic,
    InBack,
    OutBack,
    InOutBack,
    InBounce,
    OutBounce,
    InOutBounce
};

// Maps normalized progress to eased progress. 0 and 1 map to themselves exactly;
// Back and Elastic leave [0, 1] in between.
[[nodiscard]] auto Evaluate(Ease ease, float t) -> float;

// Case-insensitive, e.g. "outquad" or "OutQuad".
[[nodiscard]] auto ParseEase(std::string_view name) -> std::optional<Ease>;

[[nodiscard]] auto EaseName(Ease ease) -> std::string_view;

} // namespace SM::Animation
