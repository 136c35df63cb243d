#pragma once

#include <stylemotion/animation/AnimationConfig.hpp>
#include <stylemotion/animation/Completion.hpp>
#include <stylemotion/animation/Tween.hpp>
#include <stylemotion/style/ElementStyle.hpp>

#include <optional>
#include <string_view>

namespace SM::Animation {

/**
 * AnimationEngine: drives one element's style through its animation states.
 *
 * Two tracks write into the element's live style:
 * - timeline:    Show, Hide, the idle Initial/Animate loop and the loop's return
 *                to Normal.
 * - interaction: Hover, Press, Check and the return to Normal.
 *
 * Everything runs on the caller's tick loop. update() advances the timeline
 * track before the interaction track, so when both write in the same step the
 * interaction value is the one left on the element.
 *
 * Every operation is defined for every input: without a configuration, or
 * for a state that is not configured, operations degrade to Normal or do nothing.
 */
class AnimationEngine {
public:
    explicit AnimationEngine(Style::ElementStyle& element);
    ~AnimationEngine();

    AnimationEngine(AnimationEngine const&)            = delete;
    AnimationEngine& operator=(AnimationEngine const&) = delete;

    // Replaces the configuration. Running tweens keep the records they resolved.
    auto setup(std::optional<AnimationConfig> config) -> void;

    // Cancels both tracks without settling anything as completed.
    auto stop() -> void;

    // Settles when the entrance does; when the element loops, that is once it
    // reaches Initial, with the loop left running.
    auto playShow() -> Completion;

    // Settles when the exit tween does, or immediately without an exit state.
    auto playHide() -> Completion;

    // Requests "normal", "hover", "press" or "check". Unknown keys, states that
    // are not configured, repeats of the active key and requests made while
    // Show or Hide is animating are ignored.
    auto playState(std::string_view key) -> void;

    auto update(float dt) -> void;

    [[nodiscard]] auto config() const -> AnimationConfig const* { return configuration ? &*configuration : nullptr; }
    [[nodiscard]] auto activeInteraction() const -> AnimationState { return currentInteraction; }
    [[nodiscard]] auto loopActive() const -> bool { return looping; }
    [[nodiscard]] auto timelineTrack() const -> TweenTrack const& { return timeline; }
    [[nodiscard]] auto interactionTrack() const -> TweenTrack const& { return interaction; }
    [[nodiscard]] auto element() const -> Style::ElementStyle const& { return style; }

private:
    // Everything the idle loop needs, resolved when Show starts.
    struct IdleLoop {
        Style::StyleRecord initial;
        Style::StyleRecord animate;
        TweenSettings      cycle;
        TweenSettings      tail;
    };

    static auto resolveIdleLoop(AnimationConfig const& config, Style::StyleRecord const& normal) -> IdleLoop;
    auto startIdleLoop(IdleLoop const& loop) -> void;
    auto runTimelineTween(Style::StyleRecord const& target, Transition const& transition) -> Completion;
    auto runInteractionTween(Style::StyleRecord const& target, Transition const& transition) -> Completion;
    auto runStyleTween(TweenTrack& track, Style::StyleRecord const& target, TweenSettings const& settings)
        -> Completion;

    Style::ElementStyle&           style;
    std::optional<AnimationConfig> configuration;
    TweenTrack                     timeline{"timeline"};
    TweenTrack                     interaction{"interaction"};
    AnimationState                 currentInteraction = AnimationState::Normal;
    bool                           looping            = false;
};

} // namespace SM::Animation
