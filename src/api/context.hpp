#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <system_error>
#include <utility>

namespace api {

class Context;
using ContextPtr = std::shared_ptr<Context>;
using CancelFunc = std::function<void()>;

// Cancellation and deadline handle passed down a call chain.
//
// A context is done once it has been cancelled (directly or through its
// parent) or once its deadline has passed. Err() reports which of the two
// happened first. Contexts are safe to share between threads.
class Context {
public:
    using Clock = std::chrono::steady_clock;
    using Callback = std::function<void()>;

    // Root context: never cancelled, no deadline.
    static ContextPtr Background();

    static std::pair<ContextPtr, CancelFunc> WithCancel(const ContextPtr& parent);
    static std::pair<ContextPtr, CancelFunc> WithDeadline(const ContextPtr& parent,
                                                          Clock::time_point deadline);
    static std::pair<ContextPtr, CancelFunc> WithTimeout(const ContextPtr& parent,
                                                         Clock::duration timeout);

    ~Context();

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    bool Done() const { return static_cast<bool>(Err()); }

    // Empty while live, then context_errc::canceled or
    // context_errc::deadline_exceeded.
    std::error_code Err() const;

    std::optional<Clock::time_point> Deadline() const { return deadline_; }

    // Registers a one-shot callback run when the context is cancelled.
    // Deadline expiry does not run callbacks; waiters observe it through
    // Deadline(). If the context is already cancelled the callback runs
    // immediately and 0 is returned.
    std::size_t Subscribe(Callback callback);
    void Unsubscribe(std::size_t id);

    // Blocks until the context is done.
    void Wait() const;

    // Blocks until the context is done or `timeout` elapses; returns Done().
    bool WaitFor(Clock::duration timeout) const;

private:
    Context(ContextPtr parent, std::optional<Clock::time_point> deadline, bool cancellable);

    static std::pair<ContextPtr, CancelFunc> make_child(const ContextPtr& parent,
                                                        std::optional<Clock::time_point> deadline);
    void cancel(std::error_code reason);
    bool deadline_passed() const;

    const ContextPtr parent_;
    const std::optional<Clock::time_point> deadline_;
    const bool cancellable_;

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::error_code err_;
    std::map<std::size_t, Callback> callbacks_;
    std::size_t next_id_ = 1;
    std::size_t parent_subscription_ = 0;
};

} // namespace api
