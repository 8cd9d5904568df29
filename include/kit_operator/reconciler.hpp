// === Reconciler Contract =====================================================
//
// Interface every resource-kind controller implements, and the registry that
// maps each kind to its controller once at startup.

#pragma once

#include <array>
#include <memory>
#include <string>
#include <vector>

#include "kit_operator/object.hpp"
#include "kit_operator/reconcile_context.hpp"
#include "kit_operator/status.hpp"

namespace kit_operator {

/**
 * @brief Converges external state for one desired-state kind.
 *
 * Implementations keep no per-object state between calls: every pass
 * re-derives where the resource stands from the provider. Both operations
 * must be idempotent. Transient provider failures are thrown; unmet
 * dependencies are reported with ReconcileResult::wait and structural
 * inconsistencies with ReconcileResult::fatal.
 */
class Reconciler {
  public:
    virtual ~Reconciler() = default;

    /** @brief Stable identifier for logs. */
    [[nodiscard]] virtual std::string name() const = 0;
    /** @brief The kind of object this controller handles. */
    [[nodiscard]] virtual ResourceKind kind() const noexcept = 0;
    /** @brief Drive external state toward @p object. */
    virtual ReconcileResult reconcile(const ReconcileContext& ctx, const Object& object) = 0;
    /** @brief Drive the external resource for @p object to absent. */
    virtual ReconcileResult finalize(const ReconcileContext& ctx, const Object& object) = 0;
};

using ReconcilerPtr = std::unique_ptr<Reconciler>;
using ReconcilerList = std::vector<ReconcilerPtr>;

/** @brief Kind-indexed table of controllers; at most one per kind. */
class ControllerRegistry final {
  public:
    /** @brief Take ownership of @p reconciler; throws if its kind is taken. */
    void add(ReconcilerPtr reconciler);
    /** @brief Controller for @p kind, or nullptr when none is registered. */
    [[nodiscard]] Reconciler* find(ResourceKind kind) const noexcept;
    [[nodiscard]] std::size_t size() const noexcept;

  private:
    static constexpr std::size_t k_kind_count{std::variant_size_v<ObjectSpec>};

    std::array<ReconcilerPtr, k_kind_count> controllers_{};
    std::size_t count_{};
};

}  // namespace kit_operator
