#include "kit_operator/work_queue.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace kit_operator {

void WorkQueue::add(const ObjectKey& key) {
    {
        std::scoped_lock lock(mutex_);
        add_locked(key);
    }
    condition_.notify_one();
}

void WorkQueue::add_after(const ObjectKey& key, Duration delay) {
    if (delay.count() <= 0.0) {
        add(key);
        return;
    }
    {
        std::scoped_lock lock(mutex_);
        if (flag_shutting_down_) {
            return;
        }
        const TimePoint due = SteadyClock::now() + std::chrono::duration_cast<SteadyClock::duration>(delay);
        const auto iterator_due = map_delayed_due_.find(key);
        if (iterator_due != map_delayed_due_.end()) {
            if (iterator_due->second <= due) {
                return;
            }
            auto [first, last] = map_delayed_.equal_range(iterator_due->second);
            for (auto iterator_entry = first; iterator_entry != last; ++iterator_entry) {
                if (iterator_entry->second == key) {
                    map_delayed_.erase(iterator_entry);
                    break;
                }
            }
        }
        map_delayed_.emplace(due, key);
        map_delayed_due_[key] = due;
    }
    // A sleeping get() may need to wake earlier than it planned to.
    condition_.notify_all();
}

std::optional<ObjectKey> WorkQueue::get() {
    std::unique_lock lock(mutex_);
    while (true) {
        promote_due_locked(SteadyClock::now());
        if (!queue_keys_.empty()) {
            ObjectKey key = std::move(queue_keys_.front());
            queue_keys_.pop_front();
            set_dirty_.erase(key);
            set_processing_.insert(key);
            return key;
        }
        if (flag_shutting_down_) {
            return std::nullopt;
        }
        if (map_delayed_.empty()) {
            condition_.wait(lock);
        } else {
            condition_.wait_until(lock, map_delayed_.begin()->first);
        }
    }
}

void WorkQueue::done(const ObjectKey& key) {
    bool requeued = false;
    {
        std::scoped_lock lock(mutex_);
        set_processing_.erase(key);
        if (set_dirty_.contains(key)) {
            queue_keys_.push_back(key);
            requeued = true;
        }
    }
    if (requeued) {
        condition_.notify_one();
    }
}

void WorkQueue::shutdown() {
    {
        std::scoped_lock lock(mutex_);
        flag_shutting_down_ = true;
        map_delayed_.clear();
        map_delayed_due_.clear();
    }
    condition_.notify_all();
}

bool WorkQueue::shutting_down() const {
    std::scoped_lock lock(mutex_);
    return flag_shutting_down_;
}

std::size_t WorkQueue::size() const {
    std::scoped_lock lock(mutex_);
    return queue_keys_.size();
}

std::size_t WorkQueue::delayed_size() const {
    std::scoped_lock lock(mutex_);
    return map_delayed_.size();
}

void WorkQueue::add_locked(const ObjectKey& key) {
    if (flag_shutting_down_ || set_dirty_.contains(key)) {
        return;
    }
    set_dirty_.insert(key);
    if (set_processing_.contains(key)) {
        return;
    }
    queue_keys_.push_back(key);
}

void WorkQueue::promote_due_locked(TimePoint now) {
    while (!map_delayed_.empty() && map_delayed_.begin()->first <= now) {
        const ObjectKey key = map_delayed_.begin()->second;
        map_delayed_.erase(map_delayed_.begin());
        map_delayed_due_.erase(key);
        add_locked(key);
    }
}

ExponentialBackoff::ExponentialBackoff(BackoffConfig config)
    : config_(config) {
    if (config_.base_delay.count() <= 0.0 || config_.max_delay < config_.base_delay) {
        throw std::invalid_argument("Backoff requires 0 < base_delay <= max_delay");
    }
}

Duration ExponentialBackoff::when(const ObjectKey& key) {
    std::size_t exponent = 0;
    {
        std::scoped_lock lock(mutex_);
        exponent = map_failures_[key]++;
    }
    // Exponent capped to keep pow() finite.
    const double factor = std::pow(2.0, static_cast<double>(std::min<std::size_t>(exponent, 62)));
    const Duration delay{config_.base_delay.count() * factor};
    return std::min(delay, config_.max_delay);
}

void ExponentialBackoff::forget(const ObjectKey& key) {
    std::scoped_lock lock(mutex_);
    map_failures_.erase(key);
}

std::size_t ExponentialBackoff::failures(const ObjectKey& key) const {
    std::scoped_lock lock(mutex_);
    const auto iterator_failures = map_failures_.find(key);
    return iterator_failures == map_failures_.end() ? 0 : iterator_failures->second;
}

}  // namespace kit_operator
