#include <stylemotion/animation/AnimationEngine.hpp>

#include "utils/TaggedLogger.hpp"

#include <stylemotion/style/StyleAlgebra.hpp>

#include <string>
#include <utility>

namespace SM::Animation {

AnimationEngine::AnimationEngine(Style::ElementStyle& element)
    : style(element) {}

AnimationEngine::~AnimationEngine() {
    this->stop();
}

auto AnimationEngine::setup(std::optional<AnimationConfig> config) -> void {
    this->configuration = std::move(config);
}

auto AnimationEngine::stop() -> void {
    this->timeline.stop();
    this->interaction.stop();
    this->looping            = false;
    this->currentInteraction = AnimationState::Normal;
}

auto AnimationEngine::playShow() -> Completion {
    if (!this->configuration) {
        return Completion::Resolved();
    }
    this->stop();

    auto const& config = *this->configuration;
    auto const  normal = this->style.normal();

    if (config.enter) {
        this->style.apply(ResolveState(config, normal, AnimationState::Enter));
        auto const transition = ResolveTransition(config, AnimationState::Enter);

        if (config.loops()) {
            sm_log("Show: enter then loop", "AnimationEngine");
            // The loop starts from what was resolved now, whatever setup() does meanwhile.
            auto             loop = this->resolveIdleLoop(config, normal);
            CompletionSource settled;
            this->runTimelineTween(loop.initial, transition)
                .then([this, settled, loop = std::move(loop)](CompletionStatus status) mutable {
                    if (status != CompletionStatus::Completed) {
                        settled.cancel();
                        return;
                    }
                    this->startIdleLoop(loop);
                    settled.complete();
                });
            return settled.completion();
        }

        sm_log("Show: enter", "AnimationEngine");
        return this->runTimelineTween(normal, transition);
    }

    if (config.loops()) {
        sm_log("Show: snap to initial then loop", "AnimationEngine");
        auto const loop = this->resolveIdleLoop(config, normal);
        this->style.apply(loop.initial);
        this->startIdleLoop(loop);
        return Completion::Resolved();
    }

    sm_log("Show: snap to normal", "AnimationEngine");
    this->style.apply(normal);
    return Completion::Resolved();
}

auto AnimationEngine::playHide() -> Completion {
    if (!this->configuration || !this->configuration->exit) {
        return Completion::Resolved();
    }
    this->stop();

    auto const& config = *this->configuration;
    sm_log("Hide: exit", "AnimationEngine");
    return this->runTimelineTween(ResolveState(config, this->style.normal(), AnimationState::Exit),
                                  ResolveTransition(config, AnimationState::Exit));
}

auto AnimationEngine::playState(std::string_view key) -> void {
    if (!this->configuration) {
        return;
    }
    if (this->timeline.alive() && !this->looping) {
        sm_log("Ignored state '" + std::string(key) + "': timeline is animating", "AnimationEngine");
        return;
    }
    auto const requested = ParseInteractionKey(key);
    if (!requested) {
        sm_log("Ignored unknown state '" + std::string(key) + "'", "AnimationEngine");
        return;
    }

    auto const& config = *this->configuration;
    if (!config.hasState(*requested) || *requested == this->currentInteraction) {
        return;
    }

    // Leaving an interaction uses that interaction's own timing.
    auto const transition = *requested == AnimationState::Normal ? ResolveTransition(config, this->currentInteraction)
                                                                 : ResolveTransition(config, *requested);
    this->currentInteraction = *requested;
    sm_log("Interaction -> " + std::string(AnimationStateName(*requested)), "AnimationEngine");
    this->runInteractionTween(ResolveState(config, this->style.normal(), *requested), transition);
}

auto AnimationEngine::update(float dt) -> void {
    this->timeline.advance(dt);
    this->interaction.advance(dt);
}

auto AnimationEngine::resolveIdleLoop(AnimationConfig const& config, Style::StyleRecord const& normal) -> IdleLoop {
    IdleLoop loop;
    loop.initial = ResolveState(config, normal, AnimationState::Initial);
    loop.animate = ResolveState(config, normal, AnimationState::Animate);

    // The loop and its return to Normal take duration and ease only; neither waits.
    loop.cycle       = TweenSettings::From(config.transition, config.repeat);
    loop.cycle.delay = 0.0f;
    loop.tail        = TweenSettings::From(config.transition);
    loop.tail.delay  = 0.0f;
    return loop;
}

auto AnimationEngine::startIdleLoop(IdleLoop const& loop) -> void {
    this->looping = true;
    this->timeline
        .run(loop.cycle,
             [this, initial = loop.initial, animate = loop.animate](float t) {
                 this->style.apply(Style::Lerp(initial, animate, t));
             })
        .then([this, tail = loop.tail](CompletionStatus status) {
            if (status != CompletionStatus::Completed) {
                return;
            }
            sm_log("Idle loop finished, returning to normal", "AnimationEngine");
            this->looping = false;
            this->runStyleTween(this->timeline, this->style.normal(), tail);
        });
}

auto AnimationEngine::runTimelineTween(Style::StyleRecord const& target, Transition const& transition) -> Completion {
    return this->runStyleTween(this->timeline, target, TweenSettings::From(transition));
}

auto AnimationEngine::runInteractionTween(Style::StyleRecord const& target, Transition const& transition)
    -> Completion {
    return this->runStyleTween(this->interaction, target, TweenSettings::From(transition));
}

auto AnimationEngine::runStyleTween(TweenTrack& track,
                                    Style::StyleRecord const& target,
                                    TweenSettings const& settings) -> Completion {
    auto const start = this->style.current();
    return track.run(settings, [this, start, target](float t) {
        this->style.apply(Style::Lerp(start, target, t));
    });
}

} // namespace SM::Animation
