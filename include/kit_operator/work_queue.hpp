// === Work Queue ==============================================================
//
// Keyed FIFO feeding the reconcile workers. Adds for a key that is already
// queued are coalesced, and a key added while a worker holds it is parked
// until done() is called, so one key is never processed by two workers at
// once. Delayed adds keep the earliest due time per key.

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <unordered_set>

#include "kit_operator/object.hpp"
#include "kit_operator/types.hpp"

namespace kit_operator {

class WorkQueue final {
  public:
    /** @brief Queue @p key unless it is already queued. */
    void add(const ObjectKey& key);
    /** @brief Queue @p key once @p delay has elapsed. */
    void add_after(const ObjectKey& key, Duration delay);

    /**
     * @brief Block until a key is ready or the queue shuts down.
     *
     * The returned key is owned by the caller until done() is called.
     * Returns nullopt once shut down.
     */
    [[nodiscard]] std::optional<ObjectKey> get();
    /** @brief Release @p key; re-queues it if it was added meanwhile. */
    void done(const ObjectKey& key);

    /** @brief Wake all waiters; further adds are ignored. */
    void shutdown();
    [[nodiscard]] bool shutting_down() const;

    /** @brief Keys ready to be handed out. */
    [[nodiscard]] std::size_t size() const;
    /** @brief Keys scheduled by add_after that are not due yet. */
    [[nodiscard]] std::size_t delayed_size() const;

  private:
    void add_locked(const ObjectKey& key);
    /** @brief Move due delayed keys onto the queue. Caller holds mutex_. */
    void promote_due_locked(TimePoint now);

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::deque<ObjectKey> queue_keys_;
    std::unordered_set<ObjectKey, ObjectKeyHash> set_dirty_;
    std::unordered_set<ObjectKey, ObjectKeyHash> set_processing_;
    std::multimap<TimePoint, ObjectKey> map_delayed_;
    std::unordered_map<ObjectKey, TimePoint, ObjectKeyHash> map_delayed_due_;
    bool flag_shutting_down_{false};
};

/** @brief Parameters of the per-key failure backoff. */
struct BackoffConfig final {
    Duration base_delay{Duration{0.005}};
    Duration max_delay{Duration{1000.0}};
};

/**
 * @brief Per-key exponential backoff: base * 2^failures, capped at max.
 */
class ExponentialBackoff final {
  public:
    explicit ExponentialBackoff(BackoffConfig config = {});

    /** @brief Record one more failure for @p key and return the delay to wait. */
    [[nodiscard]] Duration when(const ObjectKey& key);
    /** @brief Reset the failure count of @p key. */
    void forget(const ObjectKey& key);
    [[nodiscard]] std::size_t failures(const ObjectKey& key) const;

  private:
    BackoffConfig config_;
    mutable std::mutex mutex_;
    std::unordered_map<ObjectKey, std::size_t, ObjectKeyHash> map_failures_;
};

}  // namespace kit_operator
