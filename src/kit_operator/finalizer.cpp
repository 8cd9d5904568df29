#include "kit_operator/finalizer.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <utility>

#include "kit_operator/errors.hpp"

namespace kit_operator {

namespace {
constexpr int k_max_conflict_retries{3};
}  // namespace

Object ensure_finalizer(ObjectClient& client, const Object& object) {
    const std::string token{k_finalizer_token};
    if (object.has_finalizer(token)) {
        return object;
    }
    Object updated = object;
    updated.metadata.finalizers.push_back(token);
    return client.update(std::move(updated));
}

void release_finalizer(ObjectClient& client, const ObjectKey& key) {
    const std::string token{k_finalizer_token};
    for (int attempt = 0;; ++attempt) {
        std::optional<Object> stored = client.get(key);
        if (!stored.has_value() || !stored->has_finalizer(token)) {
            return;
        }
        std::erase(stored->metadata.finalizers, token);
        try {
            static_cast<void>(client.update(std::move(stored.value())));
            return;
        } catch (const ConflictError&) {
            if (attempt + 1 >= k_max_conflict_retries) {
                throw;
            }
        } catch (const NotFoundError&) {
            return;
        }
    }
}

}  // namespace kit_operator
