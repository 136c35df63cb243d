#pragma once

#include <stylemotion/animation/Ease.hpp>
#include <stylemotion/style/StylePatch.hpp>
#include <stylemotion/style/StyleRecord.hpp>

#include <optional>
#include <string_view>

namespace SM::Animation {

enum class AnimationState {
    Normal,  // the element's own style, no animation override
    Enter,   // Show starts here and settles on Normal (or Initial when looping)
    Exit,    // Hide settles here
    Initial, // one end of the idle loop
    Animate, // the other end of the idle loop
    Hover,
    Press,
    Check
};

enum class CycleMode {
    Restart,
    Yoyo,
    Incremental,
    Rewind
};

struct Transition {
    float duration = 0.2f;
    float delay    = 0.0f;
    Ease  ease     = Ease::Linear;

    auto operator==(Transition const&) const -> bool = default;
};

struct Repeat {
    // -1 loops forever, 0 and 1 both play a single cycle.
    int       cycles     = 1;
    CycleMode cycle_mode = CycleMode::Restart;
};

struct StateDefinition {
    Style::StylePatch         patch;
    std::optional<Transition> transition;
};

struct AnimationConfig {
    Transition transition;
    Repeat     repeat;

    std::optional<StateDefinition> enter;
    std::optional<StateDefinition> exit;
    std::optional<StateDefinition> initial;
    std::optional<StateDefinition> animate;
    std::optional<StateDefinition> hover;
    std::optional<StateDefinition> press;
    std::optional<StateDefinition> check;

    [[nodiscard]] auto definition(AnimationState state) const -> StateDefinition const*;
    [[nodiscard]] auto definition(AnimationState state) -> std::optional<StateDefinition>*;

    // Normal is always available; every other state only when it is defined.
    [[nodiscard]] auto hasState(AnimationState state) const -> bool;

    // Show hands over to the idle loop when this holds.
    [[nodiscard]] auto loops() const -> bool;
};

// Every state name, case-insensitive.
[[nodiscard]] auto ParseAnimationState(std::string_view name) -> std::optional<AnimationState>;

// Only the keys an interaction may request: normal, hover, press, check.
[[nodiscard]] auto ParseInteractionKey(std::string_view key) -> std::optional<AnimationState>;

[[nodiscard]] auto AnimationStateName(AnimationState state) -> std::string_view;

[[nodiscard]] auto ParseCycleMode(std::string_view name) -> std::optional<CycleMode>;

[[nodiscard]] auto ResolveState(AnimationConfig const& config,
                                Style::StyleRecord const& normal,
                                AnimationState state) -> Style::StyleRecord;

[[nodiscard]] auto ResolveTransition(AnimationConfig const& config, AnimationState state) -> Transition;

} // namespace SM::Animation
