#pragma once

#include <memory>
#include <stop_token>

// Shared, set-once cancellation flag for one session.
//
// Copies share state. The orchestrator is the only writer; provider workers
// observe it through stop_token(), which also wakes condition_variable_any
// waits and fires std::stop_callback registrations (used for transport aborts).
// A child token is cancelled when its parent is, and can also be cancelled on
// its own without affecting the parent; provider attempts use a child so a
// per-attempt timeout never cancels the whole session.
class CancellationToken {
public:
    CancellationToken();

    // Returns true only for the call that actually flipped the flag.
    bool cancel();
    bool is_cancelled() const;

    std::stop_token stop_token() const;

    CancellationToken child() const;

private:
    struct State;
    explicit CancellationToken(std::shared_ptr<State> state);

    std::shared_ptr<State> state_;
};
