#include "cancellation_token.hpp"

#include <optional>

namespace {

struct ForwardStop {
    std::stop_source target;
    void operator()() noexcept { target.request_stop(); }
};

} // namespace

// Member order matters: parent_link must deregister before parent is released.
struct CancellationToken::State {
    std::shared_ptr<State> parent;
    std::stop_source source;
    // Set for child tokens: propagates the parent's cancellation into source.
    std::optional<std::stop_callback<ForwardStop>> parent_link;
};

CancellationToken::CancellationToken()
    : state_(std::make_shared<State>()) {}

CancellationToken::CancellationToken(std::shared_ptr<State> state)
    : state_(std::move(state)) {}

bool CancellationToken::cancel() {
    return state_->source.request_stop();
}

bool CancellationToken::is_cancelled() const {
    return state_->source.stop_requested();
}

std::stop_token CancellationToken::stop_token() const {
    return state_->source.get_token();
}

CancellationToken CancellationToken::child() const {
    auto child_state = std::make_shared<State>();
    child_state->parent = state_;
    child_state->parent_link.emplace(state_->source.get_token(),
                                     ForwardStop{child_state->source});
    return CancellationToken(std::move(child_state));
}
