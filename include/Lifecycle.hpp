#pragma once
#include "Context.hpp"
#include <atomic>
#include <csignal>
#include <thread>
#include <utility>
#include <vector>

namespace devops {
    /**
     * @brief Sole owner of OS signal handling for one CLI invocation.
     *
     * Derives a cancellable context from the base context and cancels it, once,
     * on SIGINT or SIGTERM (or the given signals). The listener also stops when
     * the context completes for any other reason. Only one controller may be
     * alive at a time. A failed construction leaves every disposition untouched.
     */
    class LifecycleController {
    public:
        explicit LifecycleController(const Context &base, const std::vector<int> &signals = {SIGINT, SIGTERM});

        /**
         * @brief Stop the listener and restore the previous signal dispositions.
         */
        ~LifecycleController();

        LifecycleController(const LifecycleController &) = delete;

        LifecycleController &operator=(const LifecycleController &) = delete;

        [[nodiscard]] const Context &context() const { return ctx; }

        /**
         * @brief Signal number that triggered the cancellation, 0 if none did.
         */
        [[nodiscard]] int signal_received() const { return received.load(); }

    private:
        void listen();

        // Only the handlers actually installed are restored.
        void restore_handlers();

        Context ctx;
        int wake_pipe[2] = {-1, -1};
        std::atomic<int> received{0};
        std::atomic<bool> stopping{false};
        std::vector<std::pair<int, struct sigaction> > previous; // handlers to restore, in install order
        std::thread listener;
    };
} // namespace devops
