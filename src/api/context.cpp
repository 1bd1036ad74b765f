#include "context.hpp"
#include "error.hpp"

#include <algorithm>

namespace api {

Context::Context(ContextPtr parent, std::optional<Clock::time_point> deadline, bool cancellable)
    : parent_(std::move(parent)), deadline_(deadline), cancellable_(cancellable) {}

Context::~Context() {
    if (parent_ && parent_subscription_ != 0) {
        parent_->Unsubscribe(parent_subscription_);
    }
}

ContextPtr Context::Background() {
    static const ContextPtr background(new Context(nullptr, std::nullopt, false));
    return background;
}

std::pair<ContextPtr, CancelFunc> Context::WithCancel(const ContextPtr& parent) {
    return make_child(parent, std::nullopt);
}

std::pair<ContextPtr, CancelFunc> Context::WithDeadline(const ContextPtr& parent,
                                                        Clock::time_point deadline) {
    return make_child(parent, deadline);
}

std::pair<ContextPtr, CancelFunc> Context::WithTimeout(const ContextPtr& parent,
                                                       Clock::duration timeout) {
    return make_child(parent, Clock::now() + timeout);
}

std::pair<ContextPtr, CancelFunc> Context::make_child(const ContextPtr& parent,
                                                      std::optional<Clock::time_point> deadline) {
    ContextPtr base = parent ? parent : Background();

    auto parent_deadline = base->Deadline();
    if (parent_deadline && (!deadline || *parent_deadline < *deadline)) {
        deadline = parent_deadline;
    }

    ContextPtr child(new Context(base, deadline, true));

    std::weak_ptr<Context> weak = child;
    std::size_t id = base->Subscribe([weak] {
        if (auto c = weak.lock()) {
            c->cancel(c->parent_->Err());
        }
    });

    if (id != 0) {
        bool stale = false;
        {
            std::lock_guard<std::mutex> lock(child->mutex_);
            if (child->err_) {
                stale = true;
            } else {
                child->parent_subscription_ = id;
            }
        }
        if (stale) {
            base->Unsubscribe(id);
        }
    }

    CancelFunc cancel = [child] { child->cancel(make_error_code(context_errc::canceled)); };
    return {child, cancel};
}

void Context::cancel(std::error_code reason) {
    if (!cancellable_) return;

    if (reason == context_errc::canceled && deadline_passed()) {
        reason = make_error_code(context_errc::deadline_exceeded);
    }

    std::map<std::size_t, Callback> callbacks;
    std::size_t subscription = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (err_) return;
        err_ = reason;
        callbacks.swap(callbacks_);
        subscription = parent_subscription_;
        parent_subscription_ = 0;
    }
    cv_.notify_all();

    if (parent_ && subscription != 0) {
        parent_->Unsubscribe(subscription);
    }
    for (auto& entry : callbacks) {
        entry.second();
    }
}

bool Context::deadline_passed() const {
    return deadline_ && Clock::now() >= *deadline_;
}

std::error_code Context::Err() const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (err_) return err_;
    }
    if (deadline_passed()) {
        return make_error_code(context_errc::deadline_exceeded);
    }
    return {};
}

std::size_t Context::Subscribe(Callback callback) {
    if (!cancellable_) return 0;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!err_) {
            std::size_t id = next_id_++;
            callbacks_.emplace(id, std::move(callback));
            return id;
        }
    }
    callback();
    return 0;
}

void Context::Unsubscribe(std::size_t id) {
    if (id == 0) return;
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_.erase(id);
}

void Context::Wait() const {
    std::unique_lock<std::mutex> lock(mutex_);
    if (deadline_) {
        cv_.wait_until(lock, *deadline_, [this] { return static_cast<bool>(err_); });
    } else {
        cv_.wait(lock, [this] { return static_cast<bool>(err_); });
    }
}

bool Context::WaitFor(Clock::duration timeout) const {
    auto until = Clock::now() + timeout;
    if (deadline_) {
        until = std::min(until, *deadline_);
    }
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_until(lock, until, [this] { return static_cast<bool>(err_); });
    }
    return Done();
}

} // namespace api
