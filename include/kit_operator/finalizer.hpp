// === Finalization Protocol ===================================================
//
// The operator's finalizer token keeps an object in the store until its
// external resource has been torn down. The token is added before the first
// reconcile and removed only after finalize reports success; removing the
// object itself is left to the store.

#pragma once

#include <string_view>

#include "kit_operator/object_store.hpp"

namespace kit_operator {

inline constexpr std::string_view k_finalizer_token{"kit.sh/finalizer"};

/**
 * @brief Add the finalizer token to @p object if it is missing.
 *
 * @return The object as stored after the call; unchanged when the token was
 *         already present.
 */
Object ensure_finalizer(ObjectClient& client, const Object& object);

/**
 * @brief Remove the finalizer token from the stored copy of @p key.
 *
 * A missing object or token counts as already released. Conflicts are
 * retried against the latest stored version.
 */
void release_finalizer(ObjectClient& client, const ObjectKey& key);

}  // namespace kit_operator
