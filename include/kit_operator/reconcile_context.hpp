// === Reconcile Context =======================================================
//
// Per-invocation handle threaded through every controller and cloud call. It
// carries the engine's stop token, a deadline for the pass, and a logger
// scoped to the object being reconciled.

#pragma once

#include <memory>
#include <stop_token>
#include <string>

#include <spdlog/logger.h>

#include "kit_operator/types.hpp"

namespace kit_operator {

class ReconcileContext final {
  public:
    ReconcileContext(std::shared_ptr<spdlog::logger> logger, std::stop_token stop_token, TimePoint deadline);

    /** @brief Context with no deadline and a token that is never stopped. */
    [[nodiscard]] static ReconcileContext background(std::shared_ptr<spdlog::logger> logger);

    [[nodiscard]] spdlog::logger& logger() const noexcept;

    /**
     * @brief Throw CancelledError when the engine is stopping or the deadline
     *        passed. Called before every blocking operation.
     */
    void throw_if_cancelled(const std::string& operation) const;

  private:
    std::shared_ptr<spdlog::logger> logger_;
    std::stop_token stop_token_;
    TimePoint deadline_;
};

}  // namespace kit_operator
