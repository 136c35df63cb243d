#pragma once

#include <stylemotion/animation/AnimationConfig.hpp>
#include <stylemotion/animation/Completion.hpp>
#include <stylemotion/animation/Ease.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace SM::Animation {

struct TweenSettings {
    float     duration   = 0.2f;
    float     delay      = 0.0f;
    Ease      ease       = Ease::Linear;
    CycleMode cycle_mode = CycleMode::Restart;
    // -1 plays forever; 0 and 1 both play once.
    int       cycles     = 1;

    [[nodiscard]] static auto From(Transition const& transition) -> TweenSettings;
    [[nodiscard]] static auto From(Transition const& transition, Repeat const& repeat) -> TweenSettings;
};

/**
 * Tween: advances normalized progress over `duration` seconds and reports the
 * eased value of every step to its tick callback.
 *
 * The value handed to the callback depends on the cycle mode:
 * - Restart:     ease(p) on every cycle.
 * - Yoyo:        ease(p) on even cycles, 1 - ease(p) on odd ones.
 * - Rewind:      ease(p) on even cycles, ease(1 - p) on odd ones.
 * - Incremental: n + ease(p) on cycle n, so every cycle continues where the
 *                previous one ended.
 */
class Tween {
public:
    using TickFn = std::function<void(float)>;

    Tween(TweenSettings settings, TickFn on_tick);

    Tween(Tween const&)            = delete;
    Tween& operator=(Tween const&) = delete;

    // Returns true on the step that plays the final value.
    auto advance(float dt) -> bool;
    // Settles the completion as cancelled. No further ticks are delivered.
    auto stop() -> void;
    // Settles the completion as completed; called by the owner after advance() returned true.
    auto finish() -> void;

    [[nodiscard]] auto alive() const -> bool { return running; }
    [[nodiscard]] auto completion() const -> Completion { return source.completion(); }
    [[nodiscard]] auto settings() const -> TweenSettings const& { return config; }
    [[nodiscard]] auto elapsed() const -> double { return elapsedSeconds; }

    [[nodiscard]] auto valueAt(std::int64_t cycle, float progress) const -> float;

private:
    TweenSettings    config;
    TickFn           onTick;
    CompletionSource source;
    double           elapsedSeconds = 0.0;
    bool             running        = true;
};

/**
 * TweenTrack: owner of at most one live tween.
 *
 * Starting a tween stops the previous one first, which settles its completion as
 * cancelled. A tween that finishes is released before its continuations run, so
 * a continuation may start the next tween on the same track.
 */
class TweenTrack {
public:
    explicit TweenTrack(std::string_view name);
    ~TweenTrack();

    TweenTrack(TweenTrack const&)            = delete;
    TweenTrack& operator=(TweenTrack const&) = delete;

    auto run(TweenSettings const& settings, Tween::TickFn on_tick) -> Completion;
    auto stop() -> void;
    auto advance(float dt) -> void;

    [[nodiscard]] auto alive() const -> bool;
    [[nodiscard]] auto name() const -> std::string const& { return label; }
    [[nodiscard]] auto startCount() const -> std::uint64_t { return started; }

private:
    std::string            label;
    std::unique_ptr<Tween> active;
    std::uint64_t          started = 0;
};

} // namespace SM::Animation
