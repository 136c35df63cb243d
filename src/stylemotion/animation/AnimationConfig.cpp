#include <stylemotion/animation/AnimationConfig.hpp>

#include "utils/StringUtils.hpp"

#include <stylemotion/style/StyleAlgebra.hpp>

#include <array>
#include <utility>

namespace SM::Animation {

namespace {

constexpr std::array<std::pair<AnimationState, std::string_view>, 8> kStateNames{{
    {AnimationState::Normal, "normal"},
    {AnimationState::Enter, "enter"},
    {AnimationState::Exit, "exit"},
    {AnimationState::Initial, "initial"},
    {AnimationState::Animate, "animate"},
    {AnimationState::Hover, "hover"},
    {AnimationState::Press, "press"},
    {AnimationState::Check, "check"},
}};

constexpr std::array<std::pair<CycleMode, std::string_view>, 4> kCycleModeNames{{
    {CycleMode::Restart, "restart"},
    {CycleMode::Yoyo, "yoyo"},
    {CycleMode::Incremental, "incremental"},
    {CycleMode::Rewind, "rewind"},
}};

template <typename Config>
auto slot_for(Config& config, AnimationState state) -> decltype(&config.enter) {
    switch (state) {
    case AnimationState::Normal:
        return nullptr;
    case AnimationState::Enter:
        return &config.enter;
    case AnimationState::Exit:
        return &config.exit;
    case AnimationState::Initial:
        return &config.initial;
    case AnimationState::Animate:
        return &config.animate;
    case AnimationState::Hover:
        return &config.hover;
    case AnimationState::Press:
        return &config.press;
    case AnimationState::Check:
        return &config.check;
    }
    return nullptr;
}

} // namespace

auto AnimationConfig::definition(AnimationState state) const -> StateDefinition const* {
    auto const* slot = slot_for(*this, state);
    if (slot == nullptr || !slot->has_value()) {
        return nullptr;
    }
    return &slot->value();
}

auto AnimationConfig::definition(AnimationState state) -> std::optional<StateDefinition>* {
    return slot_for(*this, state);
}

auto AnimationConfig::hasState(AnimationState state) const -> bool {
    if (state == AnimationState::Normal) {
        return true;
    }
    return this->definition(state) != nullptr;
}

auto AnimationConfig::loops() const -> bool {
    return this->repeat.cycles != 0 && this->initial.has_value() && this->animate.has_value();
}

auto ParseAnimationState(std::string_view name) -> std::optional<AnimationState> {
    for (auto const& [state, label] : kStateNames) {
        if (equals_ignore_case(label, name)) {
            return state;
        }
    }
    return std::nullopt;
}

auto ParseInteractionKey(std::string_view key) -> std::optional<AnimationState> {
    auto state = ParseAnimationState(key);
    if (!state) {
        return std::nullopt;
    }
    switch (*state) {
    case AnimationState::Normal:
    case AnimationState::Hover:
    case AnimationState::Press:
    case AnimationState::Check:
        return state;
    case AnimationState::Enter:
    case AnimationState::Exit:
    case AnimationState::Initial:
    case AnimationState::Animate:
        return std::nullopt;
    }
    return std::nullopt;
}

auto AnimationStateName(AnimationState state) -> std::string_view {
    for (auto const& [candidate, label] : kStateNames) {
        if (candidate == state) {
            return label;
        }
    }
    return "normal";
}

auto ParseCycleMode(std::string_view name) -> std::optional<CycleMode> {
    for (auto const& [mode, label] : kCycleModeNames) {
        if (equals_ignore_case(label, name)) {
            return mode;
        }
    }
    return std::nullopt;
}

auto ResolveState(AnimationConfig const& config,
                  Style::StyleRecord const& normal,
                  AnimationState state) -> Style::StyleRecord {
    if (auto const* def = config.definition(state)) {
        return Style::Merge(normal, def->patch);
    }
    return normal;
}

auto ResolveTransition(AnimationConfig const& config, AnimationState state) -> Transition {
    if (auto const* def = config.definition(state); def != nullptr && def->transition) {
        return *def->transition;
    }
    return config.transition;
}

} // namespace SM::Animation
