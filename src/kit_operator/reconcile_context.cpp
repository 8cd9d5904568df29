#include "kit_operator/reconcile_context.hpp"

#include <stdexcept>
#include <utility>

#include "kit_operator/errors.hpp"

namespace kit_operator {

ReconcileContext::ReconcileContext(std::shared_ptr<spdlog::logger> logger, std::stop_token stop_token, TimePoint deadline)
    : logger_(std::move(logger)),
      stop_token_(std::move(stop_token)),
      deadline_(deadline) {
    if (!logger_) {
        throw std::invalid_argument("ReconcileContext requires a logger");
    }
}

ReconcileContext ReconcileContext::background(std::shared_ptr<spdlog::logger> logger) {
    return ReconcileContext{std::move(logger), std::stop_token{}, TimePoint::max()};
}

spdlog::logger& ReconcileContext::logger() const noexcept {
    return *logger_;
}

void ReconcileContext::throw_if_cancelled(const std::string& operation) const {
    if (stop_token_.stop_requested()) {
        throw CancelledError(operation + ": engine shutting down");
    }
    if (SteadyClock::now() >= deadline_) {
        throw CancelledError(operation + ": reconcile deadline exceeded");
    }
}

}  // namespace kit_operator
