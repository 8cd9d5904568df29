// === ControlPlane Controller =================================================
//
// Projects a ControlPlane object into its child objects and rolls their
// phases up into the control plane's own status. Finalize deletes the
// children first and holds the control plane until they are gone.

#pragma once

#include <string>

#include "kit_operator/object_store.hpp"
#include "kit_operator/reconciler.hpp"
#include "kit_operator/resource_projection.hpp"

namespace kit_operator {

class ControlPlaneController final : public Reconciler {
  public:
    explicit ControlPlaneController(ObjectClient& client);

    [[nodiscard]] std::string name() const override;
    [[nodiscard]] ResourceKind kind() const noexcept override;

    ReconcileResult reconcile(const ReconcileContext& ctx, const Object& object) override;
    ReconcileResult finalize(const ReconcileContext& ctx, const Object& object) override;

  private:
    ObjectClient& client_;
    NatGatewayProjection nat_gateway_projection_;
    AutoScalingGroupProjection auto_scaling_group_projection_;
};

}  // namespace kit_operator
