#include "kit_operator/object_store.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <utility>

#include "kit_operator/errors.hpp"

namespace kit_operator {

std::optional<Object> InMemoryObjectStore::get(const ObjectKey& key) const {
    std::scoped_lock lock(mutex_);
    const auto iterator_object = map_objects_.find(key);
    if (iterator_object == map_objects_.end()) {
        return std::nullopt;
    }
    return iterator_object->second;
}

std::vector<Object> InMemoryObjectStore::list() const {
    std::scoped_lock lock(mutex_);
    std::vector<Object> list_objects;
    list_objects.reserve(map_objects_.size());
    for (const auto& [key, object] : map_objects_) {
        list_objects.push_back(object);
    }
    return list_objects;
}

Object InMemoryObjectStore::create(Object object) {
    const ObjectKey key = object.key();
    if (key.name.empty()) {
        throw std::invalid_argument("Object name cannot be empty");
    }
    {
        std::scoped_lock lock(mutex_);
        if (map_objects_.contains(key)) {
            throw AlreadyExistsError(to_string(key) + " already exists");
        }
        object.metadata.resource_version = next_resource_version_++;
        object.metadata.deletion_timestamp.reset();
        map_objects_.emplace(key, object);
    }
    notify(key, object.metadata.owner);
    return object;
}

Object InMemoryObjectStore::update(Object object) {
    const ObjectKey key = object.key();
    {
        std::scoped_lock lock(mutex_);
        const auto iterator_object = map_objects_.find(key);
        if (iterator_object == map_objects_.end()) {
            throw NotFoundError(to_string(key) + " not found");
        }
        Object& stored = iterator_object->second;
        if (object.metadata.resource_version != stored.metadata.resource_version) {
            throw ConflictError(to_string(key) + " was modified concurrently");
        }
        // Status has its own write path and the deletion marker is sticky.
        object.status = stored.status;
        object.metadata.deletion_timestamp = stored.metadata.deletion_timestamp;
        object.metadata.resource_version = next_resource_version_++;

        if (object.is_being_deleted() && object.metadata.finalizers.empty()) {
            map_objects_.erase(iterator_object);
        } else {
            stored = object;
        }
    }
    notify(key, object.metadata.owner);
    return object;
}

void InMemoryObjectStore::update_status(const ObjectKey& key, const ObjectStatus& status) {
    std::optional<ObjectKey> owner;
    {
        std::scoped_lock lock(mutex_);
        const auto iterator_object = map_objects_.find(key);
        if (iterator_object == map_objects_.end()) {
            throw NotFoundError(to_string(key) + " not found");
        }
        iterator_object->second.status = status;
        iterator_object->second.metadata.resource_version = next_resource_version_++;
        owner = iterator_object->second.metadata.owner;
    }
    // Status writes come from the object's own reconcile, so only the owner is
    // told about them.
    if (owner.has_value()) {
        deliver(owner.value());
    }
}

void InMemoryObjectStore::request_deletion(const ObjectKey& key) {
    std::optional<ObjectKey> owner;
    {
        std::scoped_lock lock(mutex_);
        const auto iterator_object = map_objects_.find(key);
        if (iterator_object == map_objects_.end()) {
            throw NotFoundError(to_string(key) + " not found");
        }
        Object& stored = iterator_object->second;
        owner = stored.metadata.owner;
        if (stored.metadata.finalizers.empty()) {
            map_objects_.erase(iterator_object);
        } else if (!stored.is_being_deleted()) {
            stored.metadata.deletion_timestamp = SteadyClock::now();
            stored.metadata.resource_version = next_resource_version_++;
        }
    }
    notify(key, owner);
}

SubscriptionId InMemoryObjectStore::subscribe(ObjectChangeHandler handler) {
    auto subscription = std::make_shared<Subscription>();
    subscription->handler = std::move(handler);
    std::scoped_lock lock(mutex_);
    subscription->id = next_subscription_id_++;
    list_subscriptions_.push_back(subscription);
    return subscription->id;
}

void InMemoryObjectStore::unsubscribe(SubscriptionId id) {
    std::shared_ptr<Subscription> removed;
    {
        std::scoped_lock lock(mutex_);
        const auto iterator_subscription = std::find_if(list_subscriptions_.begin(), list_subscriptions_.end(), [id](const auto& subscription) {
            return subscription->id == id;
        });
        if (iterator_subscription == list_subscriptions_.end()) {
            return;
        }
        removed = *iterator_subscription;
        list_subscriptions_.erase(iterator_subscription);
    }
    // Blocks until a delivery in progress on another thread has returned.
    std::scoped_lock delivery_lock(removed->delivery_mutex);
    removed->active = false;
}

void InMemoryObjectStore::notify(const ObjectKey& key, const std::optional<ObjectKey>& owner) const {
    deliver(key);
    if (owner.has_value()) {
        deliver(owner.value());
    }
}

void InMemoryObjectStore::deliver(const ObjectKey& key) const {
    std::vector<std::shared_ptr<Subscription>> list_subscriptions;
    {
        std::scoped_lock lock(mutex_);
        list_subscriptions = list_subscriptions_;
    }
    for (const std::shared_ptr<Subscription>& subscription : list_subscriptions) {
        std::scoped_lock delivery_lock(subscription->delivery_mutex);
        if (subscription->active) {
            subscription->handler(key);
        }
    }
}

}  // namespace kit_operator
