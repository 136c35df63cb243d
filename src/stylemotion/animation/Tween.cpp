#include <stylemotion/animation/Tween.hpp>

#include "utils/TaggedLogger.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace SM::Animation {

auto TweenSettings::From(Transition const& transition) -> TweenSettings {
    TweenSettings settings;
    settings.duration = transition.duration;
    settings.delay    = transition.delay;
    settings.ease     = transition.ease;
    return settings;
}

auto TweenSettings::From(Transition const& transition, Repeat const& repeat) -> TweenSettings {
    auto settings       = From(transition);
    settings.cycle_mode = repeat.cycle_mode;
    settings.cycles     = repeat.cycles;
    return settings;
}

Tween::Tween(TweenSettings settings, TickFn on_tick)
    : config(std::move(settings)), onTick(std::move(on_tick)) {
    this->config.duration = std::max(this->config.duration, 0.0f);
    this->config.delay    = std::max(this->config.delay, 0.0f);
    if (this->config.cycles == 0 || this->config.cycles < -1) {
        this->config.cycles = 1;
    }
}

auto Tween::valueAt(std::int64_t cycle, float progress) const -> float {
    auto const eased = Evaluate(this->config.ease, progress);
    bool const odd   = (cycle % 2) != 0;
    switch (this->config.cycle_mode) {
    case CycleMode::Restart:
        return eased;
    case CycleMode::Yoyo:
        return odd ? 1.0f - eased : eased;
    case CycleMode::Rewind:
        return odd ? Evaluate(this->config.ease, 1.0f - progress) : eased;
    case CycleMode::Incremental:
        return static_cast<float>(cycle) + eased;
    }
    return eased;
}

auto Tween::advance(float dt) -> bool {
    if (!this->running) {
        return false;
    }
    this->elapsedSeconds += std::max(dt, 0.0f);

    auto const active = this->elapsedSeconds - static_cast<double>(this->config.delay);
    if (active < 0.0) {
        return false;
    }

    bool const         infinite = this->config.cycles < 0;
    std::int64_t const total    = infinite ? 0 : this->config.cycles;
    auto const         duration = static_cast<double>(this->config.duration);

    if (duration <= 0.0) {
        if (infinite) {
            // A zero-length loop never ends; it holds the end value.
            if (this->onTick) {
                this->onTick(this->valueAt(0, 1.0f));
            }
            return false;
        }
        if (this->onTick) {
            this->onTick(this->valueAt(total - 1, 1.0f));
        }
        this->running = false;
        return true;
    }

    auto const cycle = static_cast<std::int64_t>(std::floor(active / duration));
    if (!infinite && cycle >= total) {
        if (this->onTick) {
            this->onTick(this->valueAt(total - 1, 1.0f));
        }
        this->running = false;
        return true;
    }

    auto const progress = static_cast<float>((active - static_cast<double>(cycle) * duration) / duration);
    if (this->onTick) {
        this->onTick(this->valueAt(cycle, std::clamp(progress, 0.0f, 1.0f)));
    }
    return false;
}

auto Tween::stop() -> void {
    this->running = false;
    this->source.cancel();
}

auto Tween::finish() -> void {
    this->running = false;
    this->source.complete();
}

TweenTrack::TweenTrack(std::string_view name)
    : label(name) {}

TweenTrack::~TweenTrack() {
    this->stop();
}

auto TweenTrack::run(TweenSettings const& settings, Tween::TickFn on_tick) -> Completion {
    this->stop();
    this->active = std::make_unique<Tween>(settings, std::move(on_tick));
    ++this->started;
    sm_log("Start tween on " + this->label + " track", "Tween");
    return this->active->completion();
}

auto TweenTrack::stop() -> void {
    if (!this->active) {
        return;
    }
    auto previous = std::move(this->active);
    sm_log("Stop tween on " + this->label + " track", "Tween");
    previous->stop();
}

auto TweenTrack::advance(float dt) -> void {
    if (!this->active) {
        return;
    }
    if (this->active->advance(dt)) {
        auto finished = std::move(this->active);
        sm_log("Tween finished on " + this->label + " track", "Tween");
        finished->finish();
    }
}

auto TweenTrack::alive() const -> bool {
    return this->active != nullptr && this->active->alive();
}

} // namespace SM::Animation
