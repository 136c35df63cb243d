#pragma once

#include <functional>
#include <memory>
#include <vector>

namespace SM::Animation {

enum class CompletionStatus {
    Pending,
    Completed,
    Cancelled
};

/**
 * Completion: lightweight handle to the settlement of an animation.
 *
 * Notes:
 * - Handles share state with the CompletionSource that produced them and stay
 *   readable after the producer is gone.
 * - Animations run on the caller's tick loop, so there is no blocking wait;
 *   callers poll ready() or register a continuation with then().
 * - Continuations run exactly once, on the thread that settles the source, or
 *   immediately when registered on an already settled handle.
 */
class Completion {
public:
    using Continuation = std::function<void(CompletionStatus)>;

    Completion();

    // Handle that is already completed; used by operations with nothing to animate.
    static auto Resolved() -> Completion;

    [[nodiscard]] auto valid() const -> bool;
    [[nodiscard]] auto ready() const -> bool;
    [[nodiscard]] auto completed() const -> bool;
    [[nodiscard]] auto cancelled() const -> bool;
    [[nodiscard]] auto status() const -> CompletionStatus;

    auto then(Continuation continuation) const -> void;

private:
    friend class CompletionSource;

    struct State {
        CompletionStatus          status = CompletionStatus::Pending;
        std::vector<Continuation> continuations;
    };

    explicit Completion(std::shared_ptr<State> state);

    std::shared_ptr<State> state;
};

class CompletionSource {
public:
    CompletionSource();

    [[nodiscard]] auto completion() const -> Completion;

    // Settling is idempotent; the first outcome wins.
    auto complete() -> void;
    auto cancel() -> void;

    [[nodiscard]] auto settled() const -> bool;

private:
    auto settle(CompletionStatus status) -> void;

    std::shared_ptr<Completion::State> state;
};

} // namespace SM::Animation
