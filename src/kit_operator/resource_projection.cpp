#include "kit_operator/resource_projection.hpp"

#include <optional>
#include <stdexcept>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "kit_operator/errors.hpp"

namespace kit_operator {

namespace {

std::string_view child_suffix(ResourceKind kind) {
    switch (kind) {
        case ResourceKind::AutoScalingGroup:
            return "asg";
        case ResourceKind::NatGateway:
            return "nat-gateway";
        case ResourceKind::ControlPlane:
            break;
    }
    throw std::invalid_argument(fmt::format("{} is not a control plane child", to_string(kind)));
}

Object make_child(const Object& control_plane, ResourceKind kind, ObjectSpec spec) {
    Object child = make_object(
        control_plane.metadata.namespace_name,
        child_object_name(control_plane.metadata.name, kind),
        std::move(spec)
    );
    child.metadata.owner = control_plane.key();
    return child;
}

/** @brief Create @p child, tolerating a concurrent creator. */
void create_child(const ReconcileContext& ctx, ObjectClient& client, Object child) {
    const ObjectKey key = child.key();
    try {
        static_cast<void>(client.create(std::move(child)));
    } catch (const AlreadyExistsError&) {
        ctx.logger().debug("{} was created concurrently", to_string(key));
        return;
    }
    ctx.logger().debug("Created {} object", to_string(key));
}

}  // namespace

std::string child_object_name(const std::string& control_plane_name, ResourceKind kind) {
    return fmt::format("{}-{}", control_plane_name, child_suffix(kind));
}

ObjectKey child_object_key(const Object& control_plane, ResourceKind kind) {
    return ObjectKey{kind, control_plane.metadata.namespace_name, child_object_name(control_plane.metadata.name, kind)};
}

NatGatewayProjection::NatGatewayProjection(ObjectClient& client)
    : client_(client) {}

void NatGatewayProjection::create(const ReconcileContext& ctx, const Object& control_plane) {
    const auto& spec = std::get<ControlPlaneSpec>(control_plane.spec);
    const ObjectKey key = child_object_key(control_plane, ResourceKind::NatGateway);
    if (client_.get(key).has_value()) {
        return;
    }
    create_child(ctx, client_, make_child(control_plane, ResourceKind::NatGateway, NatGatewaySpec{spec.cluster_name}));
}

AutoScalingGroupProjection::AutoScalingGroupProjection(ObjectClient& client)
    : client_(client) {}

void AutoScalingGroupProjection::create(const ReconcileContext& ctx, const Object& control_plane) {
    const auto& spec = std::get<ControlPlaneSpec>(control_plane.spec);
    const ObjectKey key = child_object_key(control_plane, ResourceKind::AutoScalingGroup);

    AutoScalingGroupSpec desired{};
    desired.cluster_name = spec.cluster_name;
    desired.instance_count = spec.instance_count;

    std::optional<Object> existing = client_.get(key);
    if (!existing.has_value()) {
        create_child(ctx, client_, make_child(control_plane, ResourceKind::AutoScalingGroup, desired));
        return;
    }
    if (existing->is_being_deleted()) {
        return;
    }

    auto& current = std::get<AutoScalingGroupSpec>(existing->spec);
    if (current.cluster_name == desired.cluster_name && current.instance_count == desired.instance_count) {
        return;
    }
    const int previous_count = current.instance_count;
    current.cluster_name = desired.cluster_name;
    current.instance_count = desired.instance_count;
    static_cast<void>(client_.update(std::move(existing.value())));
    ctx.logger().info("Updated {} instance count from {} to {}", to_string(key), previous_count, desired.instance_count);
}

}  // namespace kit_operator
