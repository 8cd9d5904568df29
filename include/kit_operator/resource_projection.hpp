// === Resource Projection =====================================================
//
// Fan-out from a ControlPlane object to the child desired-state objects that
// describe its infrastructure. Each child is created once, owned by the
// control plane, and then reconciled against the cloud by its own
// controller.

#pragma once

#include <string>

#include "kit_operator/object_store.hpp"
#include "kit_operator/reconcile_context.hpp"

namespace kit_operator {

/** @brief Deterministic child name, e.g. "<control-plane>-asg". */
[[nodiscard]] std::string child_object_name(const std::string& control_plane_name, ResourceKind kind);

/** @brief Key of the @p kind child projected from @p control_plane. */
[[nodiscard]] ObjectKey child_object_key(const Object& control_plane, ResourceKind kind);

/**
 * @brief Projects the NAT gateway child object.
 *
 * An existing child is left as it is; its spec is not compared against the
 * control plane.
 */
class NatGatewayProjection final {
  public:
    explicit NatGatewayProjection(ObjectClient& client);

    void create(const ReconcileContext& ctx, const Object& control_plane);

  private:
    ObjectClient& client_;
};

/**
 * @brief Projects the autoscaling group child object and keeps its instance
 *        count in step with the control plane.
 */
class AutoScalingGroupProjection final {
  public:
    explicit AutoScalingGroupProjection(ObjectClient& client);

    void create(const ReconcileContext& ctx, const Object& control_plane);

  private:
    ObjectClient& client_;
};

}  // namespace kit_operator
