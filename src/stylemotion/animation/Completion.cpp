#include <stylemotion/animation/Completion.hpp>

#include <utility>

namespace SM::Animation {

Completion::Completion() = default;

Completion::Completion(std::shared_ptr<State> state)
    : state(std::move(state)) {}

auto Completion::Resolved() -> Completion {
    auto state    = std::make_shared<State>();
    state->status = CompletionStatus::Completed;
    return Completion{std::move(state)};
}

auto Completion::valid() const -> bool {
    return this->state != nullptr;
}

auto Completion::ready() const -> bool {
    return this->status() != CompletionStatus::Pending;
}

auto Completion::completed() const -> bool {
    return this->status() == CompletionStatus::Completed;
}

auto Completion::cancelled() const -> bool {
    return this->status() == CompletionStatus::Cancelled;
}

auto Completion::status() const -> CompletionStatus {
    if (!this->state) {
        return CompletionStatus::Pending;
    }
    return this->state->status;
}

auto Completion::then(Continuation continuation) const -> void {
    if (!this->state || !continuation) {
        return;
    }
    if (this->state->status != CompletionStatus::Pending) {
        continuation(this->state->status);
        return;
    }
    this->state->continuations.push_back(std::move(continuation));
}

CompletionSource::CompletionSource()
    : state(std::make_shared<Completion::State>()) {}

auto CompletionSource::completion() const -> Completion {
    return Completion{this->state};
}

auto CompletionSource::complete() -> void {
    this->settle(CompletionStatus::Completed);
}

auto CompletionSource::cancel() -> void {
    this->settle(CompletionStatus::Cancelled);
}

auto CompletionSource::settled() const -> bool {
    return this->state->status != CompletionStatus::Pending;
}

auto CompletionSource::settle(CompletionStatus status) -> void {
    if (this->state->status != CompletionStatus::Pending) {
        return;
    }
    // Continuations may start new animations that release the owner of this source.
    auto keep    = this->state;
    keep->status = status;
    auto pending = std::move(keep->continuations);
    keep->continuations.clear();
    for (auto& continuation : pending) {
        continuation(status);
    }
}

} // namespace SM::Animation
