#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace devops {
    enum class CancelReason {
        none,
        cancelled,
        deadline_exceeded
    };

    // Cancellation token shared by every suspend-capable call.
    // A Context is a cheap handle: copies observe and cancel the same state,
    // and a derived context is done as soon as any of its ancestors is done.
    class Context {
    public:
        using clock = std::chrono::steady_clock;

        // Root context: never cancelled, no deadline.
        static Context background();

        static Context with_cancel(const Context &parent);

        // Done once `timeout` has elapsed. A non-positive timeout is done immediately.
        static Context with_timeout(const Context &parent, clock::duration timeout);

        // Idempotent: only the first call (on this context or an ancestor) sets the reason.
        void cancel() const;

        [[nodiscard]] bool done() const;

        [[nodiscard]] CancelReason reason() const;

        // "context canceled" | "context deadline exceeded" | "" while running
        [[nodiscard]] std::string reason_text() const;

        [[nodiscard]] std::optional<clock::time_point> deadline() const;

        // Suspend until the context is done or `d` elapses. Returns done().
        bool wait_for(clock::duration d) const;

    private:
        struct State;

        explicit Context(std::shared_ptr<State> s);

        std::shared_ptr<State> state;
    };
} // namespace devops
