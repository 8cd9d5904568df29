// === NatGateway Controller ===================================================
//
// Converges one NAT gateway per NatGateway object. The provider keeps deleted
// gateways visible for a while, so only live gateways count toward existence.

#pragma once

#include <optional>
#include <string>

#include "kit_operator/cloud_api.hpp"
#include "kit_operator/reconciler.hpp"

namespace kit_operator {

class NatGatewayController final : public Reconciler {
  public:
    explicit NatGatewayController(Ec2Api& ec2_api);

    [[nodiscard]] std::string name() const override;
    [[nodiscard]] ResourceKind kind() const noexcept override;

    ReconcileResult reconcile(const ReconcileContext& ctx, const Object& object) override;
    ReconcileResult finalize(const ReconcileContext& ctx, const Object& object) override;

  private:
    struct Lookup final {
        std::optional<NatGatewayDescription> gateway{};
        std::optional<std::string> inconsistency{};
    };

    Lookup lookup(const ReconcileContext& ctx, const std::string& gateway_name);

    Ec2Api& ec2_api_;
};

}  // namespace kit_operator
