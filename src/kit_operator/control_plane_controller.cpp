#include "kit_operator/control_plane_controller.hpp"

#include <array>
#include <optional>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "kit_operator/errors.hpp"

namespace kit_operator {

namespace {
constexpr std::array<ResourceKind, 2> k_child_kinds{ResourceKind::NatGateway, ResourceKind::AutoScalingGroup};
}  // namespace

ControlPlaneController::ControlPlaneController(ObjectClient& client)
    : client_(client),
      nat_gateway_projection_(client),
      auto_scaling_group_projection_(client) {}

std::string ControlPlaneController::name() const {
    return "control-plane";
}

ResourceKind ControlPlaneController::kind() const noexcept {
    return ResourceKind::ControlPlane;
}

ReconcileResult ControlPlaneController::reconcile(const ReconcileContext& ctx, const Object& object) {
    const auto& spec = std::get<ControlPlaneSpec>(object.spec);
    if (spec.cluster_name.empty()) {
        return ReconcileResult::fatal("control plane has no cluster name");
    }

    nat_gateway_projection_.create(ctx, object);
    auto_scaling_group_projection_.create(ctx, object);

    std::vector<std::string> list_pending;
    for (const ResourceKind child_kind : k_child_kinds) {
        const ObjectKey child_key = child_object_key(object, child_kind);
        const std::optional<Object> child = client_.get(child_key);
        if (!child.has_value()) {
            list_pending.push_back(fmt::format("{} (not yet visible)", child_key.name));
            continue;
        }
        switch (child->status.phase) {
            case ResourceStatus::Created:
                break;
            case ResourceStatus::Error:
                list_pending.push_back(fmt::format("{} (error: {})", child_key.name, child->status.reason));
                break;
            case ResourceStatus::Waiting:
            case ResourceStatus::Terminated:
                list_pending.push_back(child->status.reason.empty() ? child_key.name : fmt::format("{} ({})", child_key.name, child->status.reason));
                break;
        }
    }

    if (!list_pending.empty()) {
        return ReconcileResult::wait(fmt::format("waiting for {}", fmt::join(list_pending, ", ")));
    }
    ctx.logger().debug("All resources of control plane {} created", object.metadata.name);
    return ReconcileResult::created();
}

ReconcileResult ControlPlaneController::finalize(const ReconcileContext& ctx, const Object& object) {
    std::vector<std::string> list_remaining;
    for (const ResourceKind child_kind : k_child_kinds) {
        const ObjectKey child_key = child_object_key(object, child_kind);
        const std::optional<Object> child = client_.get(child_key);
        if (!child.has_value()) {
            continue;
        }
        if (!child->is_being_deleted()) {
            try {
                client_.request_deletion(child_key);
                ctx.logger().info("Requested deletion of {}", to_string(child_key));
            } catch (const NotFoundError&) {
                continue;
            }
        }
        // Removal without finalizers is immediate, so look again before waiting.
        if (client_.get(child_key).has_value()) {
            list_remaining.push_back(child_key.name);
        }
    }

    if (!list_remaining.empty()) {
        return ReconcileResult::wait(fmt::format("waiting for deletion of {}", fmt::join(list_remaining, ", ")));
    }
    return ReconcileResult::terminated();
}

}  // namespace kit_operator
