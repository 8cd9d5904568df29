// === Error Taxonomy ==========================================================
//
// Exception types raised by the object store and the cloud adapters. Anything
// thrown out of a controller is treated as transient by the dispatcher and
// retried with backoff; dependency waits and structural inconsistencies are
// returned as ReconcileResult values instead (see status.hpp).

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace kit_operator {

/** @brief Root of every exception raised by operator components. */
class KitError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/** @brief The named object or external resource does not exist. */
class NotFoundError : public KitError {
  public:
    using KitError::KitError;
};

/** @brief A create raced with another writer that already created the entity. */
class AlreadyExistsError : public KitError {
  public:
    using KitError::KitError;
};

/** @brief Optimistic concurrency check failed on an object update. */
class ConflictError : public KitError {
  public:
    using KitError::KitError;
};

/** @brief The reconcile context was cancelled or its deadline passed. */
class CancelledError : public KitError {
  public:
    using KitError::KitError;
};

/** @brief Failure reported by the cloud provider (throttling, timeouts, validation). */
class ProviderError : public KitError {
  public:
    ProviderError(std::string code, const std::string& message)
        : KitError(code + ": " + message),
          str_code_(std::move(code)) {}

    /** @brief Provider error code, e.g. "Throttling". */
    [[nodiscard]] const std::string& code() const noexcept {
        return str_code_;
    }

  private:
    std::string str_code_;
};

}  // namespace kit_operator
