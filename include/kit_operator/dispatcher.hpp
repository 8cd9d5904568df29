// === Dispatcher ==============================================================
//
// Processes a single triggered key: loads the object, routes it to reconcile
// or finalize on the controller registered for its kind, runs the finalizer
// protocol, records the outcome in the object's status, and tells the caller
// how to requeue.

#pragma once

#include "kit_operator/object_store.hpp"
#include "kit_operator/reconciler.hpp"
#include "kit_operator/types.hpp"

namespace kit_operator {

/** @brief What the worker should do with the key after a pass. */
struct DispatchOutcome final {
    enum class Action {
        Forget,       /**< Nothing more to do until the next trigger or resync. */
        RequeueAfter, /**< Retry after `delay` (dependency wait). */
        Backoff       /**< Transient failure; retry after the key's backoff delay. */
    };

    Action action{Action::Forget};
    Duration delay{};
};

class Dispatcher final {
  public:
    Dispatcher(ObjectClient& client, const ControllerRegistry& registry, Duration wait_requeue_delay);

    DispatchOutcome dispatch(const ReconcileContext& ctx, const ObjectKey& key);

  private:
    /** @brief Run the controller and map its result; exceptions propagate. */
    DispatchOutcome run(const ReconcileContext& ctx, Reconciler& reconciler, const Object& object);
    void record_result(const ReconcileContext& ctx, const Object& object, const ReconcileResult& result);
    void record_failure(const ReconcileContext& ctx, const ObjectKey& key, const std::string& message);
    void write_status(const ReconcileContext& ctx, const ObjectKey& key, const ObjectStatus& status);

    ObjectClient& client_;
    const ControllerRegistry& registry_;
    Duration wait_requeue_delay_;
};

}  // namespace kit_operator
