#include "kit_operator/nat_gateway_controller.hpp"

#include <utility>
#include <vector>

#include <fmt/format.h>

#include "kit_operator/cloud_queries.hpp"
#include "kit_operator/errors.hpp"

namespace kit_operator {

NatGatewayController::NatGatewayController(Ec2Api& ec2_api)
    : ec2_api_(ec2_api) {}

std::string NatGatewayController::name() const {
    return "nat-gateway";
}

ResourceKind NatGatewayController::kind() const noexcept {
    return ResourceKind::NatGateway;
}

ReconcileResult NatGatewayController::reconcile(const ReconcileContext& ctx, const Object& object) {
    const auto& spec = std::get<NatGatewaySpec>(object.spec);
    const std::string& gateway_name = object.metadata.name;

    const Lookup existing = lookup(ctx, gateway_name);
    if (existing.inconsistency.has_value()) {
        return ReconcileResult::fatal(existing.inconsistency.value());
    }

    if (!existing.gateway.has_value()) {
        CreateNatGatewayRequest request{};
        request.name = gateway_name;
        request.cluster_name = spec.cluster_name;
        request.tags = resource_tags(gateway_name, spec.cluster_name);
        try {
            const std::string nat_gateway_id = ec2_api_.create_nat_gateway(ctx, request);
            ctx.logger().info("Created nat gateway {} ({}) for cluster {}", gateway_name, nat_gateway_id, spec.cluster_name);
        } catch (const AlreadyExistsError&) {
            ctx.logger().debug("Nat gateway {} already exists", gateway_name);
        }
        return ReconcileResult::wait(fmt::format("nat gateway {} pending", gateway_name));
    }

    const NatGatewayDescription& gateway = existing.gateway.value();
    switch (gateway.state) {
        case NatGatewayState::Available:
            ctx.logger().debug("Discovered nat gateway {} ({})", gateway_name, gateway.nat_gateway_id);
            return ReconcileResult::created();
        case NatGatewayState::Failed:
            return ReconcileResult::fatal(fmt::format("nat gateway {} ({}) failed to provision", gateway_name, gateway.nat_gateway_id));
        case NatGatewayState::Pending:
        case NatGatewayState::Deleting:
        case NatGatewayState::Deleted:
            break;
    }
    return ReconcileResult::wait(fmt::format("nat gateway {} is {}", gateway_name, to_string(gateway.state)));
}

ReconcileResult NatGatewayController::finalize(const ReconcileContext& ctx, const Object& object) {
    const std::string& gateway_name = object.metadata.name;
    const Lookup existing = lookup(ctx, gateway_name);
    if (existing.inconsistency.has_value()) {
        return ReconcileResult::fatal(existing.inconsistency.value());
    }
    if (!existing.gateway.has_value() || existing.gateway->state == NatGatewayState::Deleting) {
        return ReconcileResult::terminated();
    }

    try {
        ec2_api_.delete_nat_gateway(ctx, existing.gateway->nat_gateway_id);
    } catch (const NotFoundError&) {
        return ReconcileResult::terminated();
    }
    ctx.logger().info("Deleted nat gateway {} ({})", gateway_name, existing.gateway->nat_gateway_id);
    return ReconcileResult::terminated();
}

NatGatewayController::Lookup NatGatewayController::lookup(const ReconcileContext& ctx, const std::string& gateway_name) {
    std::vector<NatGatewayDescription> list_live;
    for (NatGatewayDescription& gateway : ec2_api_.describe_nat_gateways(ctx, gateway_name)) {
        if (gateway.state != NatGatewayState::Deleted) {
            list_live.push_back(std::move(gateway));
        }
    }

    Lookup result{};
    if (list_live.size() > 1) {
        result.inconsistency = fmt::format("expected one nat gateway named {}, found {}", gateway_name, list_live.size());
    } else if (list_live.size() == 1) {
        result.gateway = std::move(list_live.front());
    }
    return result;
}

}  // namespace kit_operator
