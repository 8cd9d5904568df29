// === Object Store ============================================================
//
// Client interface for desired-state objects plus an in-memory store that
// stands in for the API server. The store owns the deletion semantics:
// request_deletion() only sets the deletion marker while finalizers remain,
// and an object is removed once it is marked and its last finalizer is gone.

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "kit_operator/object.hpp"

namespace kit_operator {

/** @brief Callback invoked with the key of every object that changed. */
using ObjectChangeHandler = std::function<void(const ObjectKey&)>;
using SubscriptionId = std::uint64_t;

/**
 * @brief Get/create/update/delete access to desired-state objects.
 */
class ObjectClient {
  public:
    virtual ~ObjectClient() = default;

    [[nodiscard]] virtual std::optional<Object> get(const ObjectKey& key) const = 0;
    [[nodiscard]] virtual std::vector<Object> list() const = 0;
    /** @brief Insert a new object; throws AlreadyExistsError. */
    virtual Object create(Object object) = 0;
    /**
     * @brief Replace metadata and spec; throws NotFoundError or ConflictError
     *        when @p object carries a stale resource version.
     */
    virtual Object update(Object object) = 0;
    /** @brief Replace the status block only; throws NotFoundError. */
    virtual void update_status(const ObjectKey& key, const ObjectStatus& status) = 0;
    /** @brief Mark for deletion, or remove outright when no finalizer is held. */
    virtual void request_deletion(const ObjectKey& key) = 0;
    virtual SubscriptionId subscribe(ObjectChangeHandler handler) = 0;
    /**
     * @brief Stop delivering to @p id. Once this returns the handler is not
     *        running and will not be called again.
     */
    virtual void unsubscribe(SubscriptionId id) = 0;
};

/** @brief Thread-safe in-process ObjectClient. */
class InMemoryObjectStore final : public ObjectClient {
  public:
    [[nodiscard]] std::optional<Object> get(const ObjectKey& key) const override;
    [[nodiscard]] std::vector<Object> list() const override;
    Object create(Object object) override;
    Object update(Object object) override;
    void update_status(const ObjectKey& key, const ObjectStatus& status) override;
    void request_deletion(const ObjectKey& key) override;
    SubscriptionId subscribe(ObjectChangeHandler handler) override;
    void unsubscribe(SubscriptionId id) override;

  private:
    /** @brief Handler plus the lock held while it runs. */
    struct Subscription final {
        SubscriptionId id{};
        ObjectChangeHandler handler{};
        std::recursive_mutex delivery_mutex{};
        bool active{true};
    };

    /** @brief Tell subscribers about @p key and, for children, about their owner. */
    void notify(const ObjectKey& key, const std::optional<ObjectKey>& owner) const;
    /** @brief Call every active handler with @p key, one subscription at a time. */
    void deliver(const ObjectKey& key) const;

    mutable std::mutex mutex_;
    std::unordered_map<ObjectKey, Object, ObjectKeyHash> map_objects_;
    std::uint64_t next_resource_version_{1};
    SubscriptionId next_subscription_id_{1};
    std::vector<std::shared_ptr<Subscription>> list_subscriptions_;
};

}  // namespace kit_operator
