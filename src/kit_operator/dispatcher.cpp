#include "kit_operator/dispatcher.hpp"

#include <exception>
#include <optional>
#include <string>

#include "kit_operator/errors.hpp"
#include "kit_operator/finalizer.hpp"

namespace kit_operator {

Dispatcher::Dispatcher(ObjectClient& client, const ControllerRegistry& registry, Duration wait_requeue_delay)
    : client_(client),
      registry_(registry),
      wait_requeue_delay_(wait_requeue_delay) {}

DispatchOutcome Dispatcher::dispatch(const ReconcileContext& ctx, const ObjectKey& key) {
    std::optional<Object> object;
    try {
        object = client_.get(key);
    } catch (const std::exception& error) {
        ctx.logger().error("Unable to load {}: {}", to_string(key), error.what());
        return DispatchOutcome{DispatchOutcome::Action::Backoff, Duration{}};
    }
    if (!object.has_value()) {
        ctx.logger().debug("{} no longer exists", to_string(key));
        return DispatchOutcome{};
    }

    Reconciler* reconciler = registry_.find(key.kind);
    if (reconciler == nullptr) {
        ctx.logger().warn("No controller registered for {}", to_string(key.kind));
        return DispatchOutcome{};
    }

    try {
        return run(ctx, *reconciler, object.value());
    } catch (const CancelledError& error) {
        ctx.logger().warn("Reconcile of {} interrupted: {}", to_string(key), error.what());
        record_failure(ctx, key, error.what());
    } catch (const std::exception& error) {
        ctx.logger().error("Reconcile of {} failed: {}", to_string(key), error.what());
        record_failure(ctx, key, error.what());
    }
    return DispatchOutcome{DispatchOutcome::Action::Backoff, Duration{}};
}

DispatchOutcome Dispatcher::run(const ReconcileContext& ctx, Reconciler& reconciler, const Object& object) {
    const std::string token{k_finalizer_token};
    std::optional<ReconcileResult> result;

    if (object.is_being_deleted()) {
        if (!object.has_finalizer(token)) {
            ctx.logger().debug("{} is being deleted and holds no finalizer", to_string(object.key()));
            return DispatchOutcome{};
        }
        result = reconciler.finalize(ctx, object);
        record_result(ctx, object, result.value());
        if (result->is_done()) {
            release_finalizer(client_, object.key());
            ctx.logger().info("Finalized {}", to_string(object.key()));
        }
    } else {
        const Object current = ensure_finalizer(client_, object);
        result = reconciler.reconcile(ctx, current);
        record_result(ctx, current, result.value());
    }

    switch (result->kind()) {
        case ResultKind::Done:
        case ResultKind::Fatal:
            return DispatchOutcome{};
        case ResultKind::Wait:
            break;
    }
    return DispatchOutcome{DispatchOutcome::Action::RequeueAfter, wait_requeue_delay_};
}

void Dispatcher::record_result(const ReconcileContext& ctx, const Object& object, const ReconcileResult& result) {
    const ObjectStatus& previous = object.status;
    const bool changed = previous.phase != result.status() || previous.reason != result.reason();

    ObjectStatus status{};
    status.phase = result.status();
    status.reason = result.reason();
    status.last_transition_time = previous.phase != status.phase ? SteadyClock::now() : previous.last_transition_time;
    status.consecutive_failures = 0;

    switch (result.kind()) {
        case ResultKind::Fatal:
            ctx.logger().error("{} needs attention: {}", to_string(object.key()), result.reason());
            break;
        case ResultKind::Wait:
            if (changed) {
                ctx.logger().info("{} waiting: {}", to_string(object.key()), result.reason());
            } else {
                ctx.logger().debug("{} still waiting: {}", to_string(object.key()), result.reason());
            }
            break;
        case ResultKind::Done:
            if (changed) {
                ctx.logger().info("{} is {}", to_string(object.key()), to_string(status.phase));
            }
            break;
    }
    write_status(ctx, object.key(), status);
}

void Dispatcher::record_failure(const ReconcileContext& ctx, const ObjectKey& key, const std::string& message) {
    std::optional<Object> object;
    try {
        object = client_.get(key);
    } catch (const std::exception& error) {
        ctx.logger().warn("Unable to load {} to record failure: {}", to_string(key), error.what());
        return;
    }
    if (!object.has_value()) {
        return;
    }
    ObjectStatus status = object->status;
    status.reason = message;
    ++status.consecutive_failures;
    write_status(ctx, key, status);
}

void Dispatcher::write_status(const ReconcileContext& ctx, const ObjectKey& key, const ObjectStatus& status) {
    try {
        client_.update_status(key, status);
    } catch (const NotFoundError&) {
        ctx.logger().debug("{} removed before its status could be written", to_string(key));
    }
}

}  // namespace kit_operator
