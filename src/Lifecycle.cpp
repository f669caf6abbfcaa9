#include "../include/Lifecycle.hpp"
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

using namespace devops;

namespace {
    constexpr int LISTEN_POLL_MS = 20;

    // Write end of the active controller's self-pipe; -1 when none is installed.
    std::atomic<int> signal_fd{-1};

    void on_signal(const int sig) {
        const int saved = errno;
        if (const int fd = signal_fd.load(); fd >= 0) {
            ssize_t ignored = ::write(fd, &sig, sizeof(sig));
            (void) ignored;
        }
        errno = saved;
    }

    void install_handler(const int sig, void (*fn)(int), struct sigaction *previous) {
        struct sigaction action{};
        action.sa_handler = fn;
        sigemptyset(&action.sa_mask);
        action.sa_flags = SA_RESTART;
        if (sigaction(sig, &action, previous) != 0) {
            throw std::runtime_error("sigaction(" + std::to_string(sig) + "): " + std::strerror(errno));
        }
    }
}

LifecycleController::LifecycleController(const Context &base, const std::vector<int> &signals)
    : ctx(Context::with_cancel(base)) {
    if (::pipe2(wake_pipe, O_CLOEXEC | O_NONBLOCK) != 0) {
        throw std::runtime_error(std::string("pipe: ") + std::strerror(errno));
    }
    int expected = -1;
    if (!signal_fd.compare_exchange_strong(expected, wake_pipe[1])) {
        ::close(wake_pipe[0]);
        ::close(wake_pipe[1]);
        throw std::runtime_error("a lifecycle controller is already active");
    }
    try {
        previous.reserve(signals.size());
        for (const int sig: signals) {
            struct sigaction saved{};
            install_handler(sig, on_signal, &saved);
            previous.emplace_back(sig, saved);
        }
        listener = std::thread(&LifecycleController::listen, this);
    } catch (...) {
        restore_handlers();
        signal_fd.store(-1);
        ::close(wake_pipe[0]);
        ::close(wake_pipe[1]);
        throw;
    }
}

LifecycleController::~LifecycleController() {
    stopping.store(true);
    if (listener.joinable()) listener.join();
    restore_handlers();
    signal_fd.store(-1);
    ::close(wake_pipe[0]);
    ::close(wake_pipe[1]);
}

void LifecycleController::restore_handlers() {
    for (auto it = previous.rbegin(); it != previous.rend(); ++it) sigaction(it->first, &it->second, nullptr);
    previous.clear();
}

void LifecycleController::listen() {
    while (!stopping.load() && !ctx.done()) {
        pollfd pfd{wake_pipe[0], POLLIN, 0};
        if (::poll(&pfd, 1, LISTEN_POLL_MS) <= 0) continue;
        int sig = 0;
        if (::read(wake_pipe[0], &sig, sizeof(sig)) == static_cast<ssize_t>(sizeof(sig))) {
            received.store(sig);
            ctx.cancel();
            return;
        }
    }
}
