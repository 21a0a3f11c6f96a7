#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

namespace dlqueue {

class ProgressNode;
using ProgressNodePtr = std::shared_ptr<ProgressNode>;

// Node of a composable progress tree.
//
// A leaf carries its own expected/received byte counters. Once a node has had a
// child attached it becomes a composite and reports the sums of its children
// (0/0 when it has none); its own counters are no longer used.
//
// Parents own their children. A child knows nothing about its parents: it only
// fires change hooks, and each parent re-sums all of its children when one of
// them fires.
//
// Not thread-safe; all access is expected from one execution context.
class ProgressNode {
public:
    using FractionCallback = std::function<void(double)>;
    using SubscriptionId = std::uint64_t;

    explicit ProgressNode(std::uint64_t expected = 0, std::uint64_t received = 0);
    explicit ProgressNode(const std::vector<ProgressNodePtr>& children);
    ~ProgressNode();

    ProgressNode(const ProgressNode&) = delete;
    ProgressNode& operator=(const ProgressNode&) = delete;

    [[nodiscard]] std::uint64_t expected() const { return expected_; }
    [[nodiscard]] std::uint64_t received() const { return received_; }
    // received/expected clamped to [0, 1]; 0 when nothing is expected.
    [[nodiscard]] double fractionCompleted() const { return fraction_; }
    [[nodiscard]] bool isComposite() const { return composite_; }
    [[nodiscard]] std::size_t childCount() const { return children_.size(); }
    [[nodiscard]] bool hasChild(const ProgressNodePtr& child) const;

    // Leaf counters. Ignored on composites; no-ops when the value is unchanged.
    void setExpected(std::uint64_t value);
    void setReceived(std::uint64_t value);

    void addChild(const ProgressNodePtr& child);
    void addChildren(const std::vector<ProgressNodePtr>& children);
    void removeChild(const ProgressNodePtr& child);
    void removeChildren(const std::vector<ProgressNodePtr>& children);

    // Delivers the fraction each time it changes. With a non-zero interval,
    // changes arriving sooner than `min_interval` after the previous delivery are
    // held back (latest value wins) until the next change past the interval or
    // until flushPending().
    SubscriptionId observe(FractionCallback callback,
                           std::chrono::milliseconds min_interval = std::chrono::milliseconds::zero());
    void unobserve(SubscriptionId id);
    void flushPending();

private:
    using Clock = std::chrono::steady_clock;

    struct Observer {
        FractionCallback callback;
        std::chrono::milliseconds min_interval{0};
        // Unset until the first delivery, which is never held back.
        std::optional<Clock::time_point> last_delivery;
        std::optional<double> pending;
    };

    struct Child {
        ProgressNodePtr node;
        SubscriptionId hook{0};
    };

    SubscriptionId addChangeHook(std::function<void()> hook);
    void removeChangeHook(SubscriptionId id);

    void recomputeFromChildren();
    void assign(std::uint64_t expected, std::uint64_t received);
    void notifyObservers();

    std::uint64_t expected_{0};
    std::uint64_t received_{0};
    double fraction_{0.0};
    bool composite_{false};

    std::vector<Child> children_;
    std::unordered_map<SubscriptionId, std::function<void()>> change_hooks_;
    std::unordered_map<SubscriptionId, Observer> observers_;
    SubscriptionId next_subscription_{1};
};

} // namespace dlqueue
