#include "../include/Context.hpp"
#include <algorithm>
#include <condition_variable>
#include <mutex>

using namespace devops;

namespace {
    constexpr auto WAIT_SLICE = std::chrono::milliseconds(10);
}

struct Context::State {
    std::mutex mu;
    std::condition_variable cv;
    CancelReason why = CancelReason::none;
    std::optional<clock::time_point> deadline;
    std::shared_ptr<State> parent;

    // Records the first reason only; returns the reason now in effect.
    CancelReason settle(const CancelReason r) {
        std::lock_guard lock(mu);
        if (why == CancelReason::none) {
            why = r;
            cv.notify_all();
        }
        return why;
    }

    CancelReason poll() {
        {
            std::lock_guard lock(mu);
            if (why != CancelReason::none) return why;
        }
        if (deadline && clock::now() >= *deadline) return settle(CancelReason::deadline_exceeded);
        if (parent) {
            if (const auto up = parent->poll(); up != CancelReason::none) return settle(up);
        }
        return CancelReason::none;
    }
};

Context::Context(std::shared_ptr<State> s) : state(std::move(s)) {
}

Context Context::background() {
    return Context(std::make_shared<State>());
}

Context Context::with_cancel(const Context &parent) {
    auto s = std::make_shared<State>();
    s->parent = parent.state;
    return Context(std::move(s));
}

Context Context::with_timeout(const Context &parent, const clock::duration timeout) {
    auto s = std::make_shared<State>();
    s->parent = parent.state;
    const auto now = clock::now();
    // saturate instead of overflowing the time_point
    if (timeout >= clock::time_point::max() - now) s->deadline = clock::time_point::max();
    else s->deadline = now + std::max(timeout, clock::duration::zero());
    // an inherited earlier deadline stays in force through the parent chain
    return Context(std::move(s));
}

void Context::cancel() const {
    state->settle(CancelReason::cancelled);
}

bool Context::done() const {
    return state->poll() != CancelReason::none;
}

CancelReason Context::reason() const {
    return state->poll();
}

std::string Context::reason_text() const {
    switch (reason()) {
        case CancelReason::cancelled:
            return "context canceled";
        case CancelReason::deadline_exceeded:
            return "context deadline exceeded";
        case CancelReason::none:
            break;
    }
    return "";
}

std::optional<Context::clock::time_point> Context::deadline() const {
    std::optional<clock::time_point> out;
    for (const State *s = state.get(); s != nullptr; s = s->parent.get()) {
        if (s->deadline && (!out || *s->deadline < *out)) out = s->deadline;
    }
    return out;
}

bool Context::wait_for(const clock::duration d) const {
    const auto until = clock::now() + d;
    while (!done()) {
        const auto now = clock::now();
        if (now >= until) return false;
        // ancestors do not notify our condition variable, so wait in slices
        const auto slice = std::min<clock::duration>(until - now, WAIT_SLICE);
        std::unique_lock lock(state->mu);
        state->cv.wait_for(lock, slice, [this] { return state->why != CancelReason::none; });
    }
    return true;
}
