// === Status Model ============================================================
//
// Outcome values attached to every reconciled object and the three-way result
// returned by controllers. The dispatcher decides requeue behaviour purely
// from ResultKind, never from error strings.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "kit_operator/types.hpp"

namespace kit_operator {

/**
 * @brief Last known outcome for a desired-state object.
 */
enum class ResourceStatus {
    Waiting,     /**< Dependency unmet or operation in flight; requeued. */
    Created,     /**< External resource matches desired state. */
    Terminated,  /**< External resource confirmed absent or deletion issued. */
    Error        /**< Non-retryable; surfaced to the operator. */
};

[[nodiscard]] std::string_view to_string(ResourceStatus status) noexcept;

/**
 * @brief Status block stored alongside each desired-state object.
 */
struct ObjectStatus final {
    ResourceStatus phase{ResourceStatus::Waiting};  /**< Last reported phase. */
    std::string reason{};                           /**< Human-readable detail for Waiting/Error or the last transient failure. */
    TimePoint last_transition_time{};               /**< When phase last changed. */
    std::uint32_t consecutive_failures{};           /**< Transient failures since the last successful pass. */
};

enum class ResultKind {
    Done,   /**< Pass finished; phase carries Created or Terminated. */
    Wait,   /**< Retry after the fixed short delay. */
    Fatal   /**< Stop retrying; operator intervention required. */
};

/** @brief Value returned by Reconciler::reconcile and Reconciler::finalize. */
class ReconcileResult final {
  public:
    [[nodiscard]] static ReconcileResult created();
    [[nodiscard]] static ReconcileResult terminated();
    [[nodiscard]] static ReconcileResult wait(std::string reason);
    [[nodiscard]] static ReconcileResult fatal(std::string reason);

    [[nodiscard]] ResultKind kind() const noexcept;
    /** @brief Status phase the dispatcher records for this result. */
    [[nodiscard]] ResourceStatus status() const noexcept;
    [[nodiscard]] const std::string& reason() const noexcept;

    [[nodiscard]] bool is_done() const noexcept {
        return kind_ == ResultKind::Done;
    }
    [[nodiscard]] bool is_wait() const noexcept {
        return kind_ == ResultKind::Wait;
    }
    [[nodiscard]] bool is_fatal() const noexcept {
        return kind_ == ResultKind::Fatal;
    }

  private:
    ReconcileResult(ResultKind kind, ResourceStatus status, std::string reason);

    ResultKind kind_;
    ResourceStatus status_;
    std::string str_reason_;
};

}  // namespace kit_operator
