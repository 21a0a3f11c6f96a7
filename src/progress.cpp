#include "dlqueue/progress.hpp"

#include <algorithm>
#include <utility>

namespace dlqueue {

namespace {

double computeFraction(std::uint64_t expected, std::uint64_t received) {
    if (expected == 0) {
        return 0.0;
    }
    const double ratio = static_cast<double>(received) / static_cast<double>(expected);
    return std::min(1.0, ratio);
}

} // namespace

ProgressNode::ProgressNode(std::uint64_t expected, std::uint64_t received)
    : expected_(expected),
      received_(received),
      fraction_(computeFraction(expected, received)) {}

ProgressNode::ProgressNode(const std::vector<ProgressNodePtr>& children)
    : composite_(true) {
    addChildren(children);
}

ProgressNode::~ProgressNode() {
    for (auto& child : children_) {
        child.node->removeChangeHook(child.hook);
    }
}

bool ProgressNode::hasChild(const ProgressNodePtr& child) const {
    return std::any_of(children_.begin(), children_.end(),
                       [&child](const Child& c) { return c.node == child; });
}

void ProgressNode::setExpected(std::uint64_t value) {
    if (composite_ || expected_ == value) {
        return;
    }
    assign(value, received_);
}

void ProgressNode::setReceived(std::uint64_t value) {
    if (composite_ || received_ == value) {
        return;
    }
    assign(expected_, value);
}

void ProgressNode::addChild(const ProgressNodePtr& child) {
    addChildren({child});
}

void ProgressNode::addChildren(const std::vector<ProgressNodePtr>& children) {
    bool attached = false;
    for (const auto& child : children) {
        if (!child || child.get() == this || hasChild(child)) {
            continue;
        }
        const auto hook = child->addChangeHook([this] { recomputeFromChildren(); });
        children_.push_back({child, hook});
        attached = true;
    }
    if (attached) {
        composite_ = true;
    }
    if (composite_) {
        recomputeFromChildren();
    }
}

void ProgressNode::removeChild(const ProgressNodePtr& child) {
    removeChildren({child});
}

void ProgressNode::removeChildren(const std::vector<ProgressNodePtr>& children) {
    for (const auto& child : children) {
        const auto it = std::find_if(children_.begin(), children_.end(),
                                     [&child](const Child& c) { return c.node == child; });
        if (it == children_.end()) {
            continue;
        }
        it->node->removeChangeHook(it->hook);
        children_.erase(it);
    }
    if (composite_) {
        recomputeFromChildren();
    }
}

ProgressNode::SubscriptionId ProgressNode::observe(FractionCallback callback,
                                                   std::chrono::milliseconds min_interval) {
    const auto id = next_subscription_++;
    Observer observer;
    observer.callback = std::move(callback);
    observer.min_interval = std::max(min_interval, std::chrono::milliseconds::zero());
    observers_.emplace(id, std::move(observer));
    return id;
}

void ProgressNode::unobserve(SubscriptionId id) {
    observers_.erase(id);
}

void ProgressNode::flushPending() {
    std::vector<SubscriptionId> ids;
    ids.reserve(observers_.size());
    for (const auto& entry : observers_) {
        ids.push_back(entry.first);
    }

    const auto now = Clock::now();
    for (const auto id : ids) {
        const auto it = observers_.find(id);
        if (it == observers_.end() || !it->second.pending) {
            continue;
        }
        const double value = *it->second.pending;
        it->second.pending.reset();
        it->second.last_delivery = now;
        auto callback = it->second.callback;
        callback(value);
    }
}

ProgressNode::SubscriptionId ProgressNode::addChangeHook(std::function<void()> hook) {
    const auto id = next_subscription_++;
    change_hooks_.emplace(id, std::move(hook));
    return id;
}

void ProgressNode::removeChangeHook(SubscriptionId id) {
    change_hooks_.erase(id);
}

void ProgressNode::recomputeFromChildren() {
    std::uint64_t expected = 0;
    std::uint64_t received = 0;
    for (const auto& child : children_) {
        expected += child.node->expected();
        received += child.node->received();
    }
    if (expected == expected_ && received == received_) {
        return;
    }
    assign(expected, received);
}

void ProgressNode::assign(std::uint64_t expected, std::uint64_t received) {
    expected_ = expected;
    received_ = received;

    const double fraction = computeFraction(expected_, received_);
    const bool fraction_changed = fraction != fraction_;
    fraction_ = fraction;

    // Parents must see every counter change, even one that keeps the fraction.
    std::vector<SubscriptionId> ids;
    ids.reserve(change_hooks_.size());
    for (const auto& entry : change_hooks_) {
        ids.push_back(entry.first);
    }
    for (const auto id : ids) {
        const auto it = change_hooks_.find(id);
        if (it != change_hooks_.end()) {
            auto hook = it->second;
            hook();
        }
    }

    if (fraction_changed) {
        notifyObservers();
    }
}

void ProgressNode::notifyObservers() {
    std::vector<SubscriptionId> ids;
    ids.reserve(observers_.size());
    for (const auto& entry : observers_) {
        ids.push_back(entry.first);
    }

    const auto now = Clock::now();
    for (const auto id : ids) {
        const auto it = observers_.find(id);
        if (it == observers_.end()) {
            continue;
        }
        auto& observer = it->second;
        const bool throttled = observer.min_interval.count() > 0 &&
                               observer.last_delivery && now - *observer.last_delivery < observer.min_interval;
        if (throttled) {
            observer.pending = fraction_;
            continue;
        }
        observer.pending.reset();
        observer.last_delivery = now;
        auto callback = observer.callback;
        callback(fraction_);
    }
}

} // namespace dlqueue
