#include <stdexcept>
#include <string>

#include <catch2/catch.hpp>

#include "fakes/failing_object_client.hpp"
#include "logging_test_fixture.hpp"
#include "kit_operator/nat_gateway_controller.hpp"
#include "kit_operator/resource_projection.hpp"
#include "kit_operator/simulated_cloud.hpp"

using namespace kit_operator;

namespace {

Object make_control_plane() {
    return make_object("default", "cp", ControlPlaneSpec{"cluster-x", 1});
}

Object make_gateway_object() {
    return make_object("default", "cp-nat-gateway", NatGatewaySpec{"cluster-x"});
}

}  // namespace

TEST_CASE("NatGatewayProjection creates the child once") {
    test::FailingObjectClient client{};
    NatGatewayProjection projection{client};
    const ReconcileContext ctx = test::test_context();
    const Object control_plane = client.create(make_control_plane());

    projection.create(ctx, control_plane);
    const std::optional<Object> child = client.get(child_object_key(control_plane, ResourceKind::NatGateway));
    REQUIRE(child.has_value());
    REQUIRE(child->metadata.name == "cp-nat-gateway");
    REQUIRE(child->metadata.owner == control_plane.key());
    REQUIRE(std::get<NatGatewaySpec>(child->spec).cluster_name == "cluster-x");

    projection.create(ctx, control_plane);
    REQUIRE(client.create_calls() == 2);
}

TEST_CASE("NatGatewayProjection leaves an existing child untouched") {
    test::FailingObjectClient client{};
    NatGatewayProjection projection{client};
    const ReconcileContext ctx = test::test_context();
    const Object control_plane = client.create(make_control_plane());

    Object existing = make_gateway_object();
    std::get<NatGatewaySpec>(existing.spec).cluster_name = "cluster-old";
    existing = client.create(existing);

    projection.create(ctx, control_plane);
    const Object child = client.get(existing.key()).value();
    REQUIRE(child.metadata.resource_version == existing.metadata.resource_version);
    REQUIRE(std::get<NatGatewaySpec>(child.spec).cluster_name == "cluster-old");
}

TEST_CASE("NatGatewayProjection propagates read failures without creating") {
    test::FailingObjectClient client{};
    NatGatewayProjection projection{client};
    const ReconcileContext ctx = test::test_context();
    const Object control_plane = client.create(make_control_plane());

    client.set_fail_reads(true);
    REQUIRE_THROWS_AS(projection.create(ctx, control_plane), std::runtime_error);
    REQUIRE(client.create_calls() == 1);
}

TEST_CASE("NatGatewayController creates a gateway and waits until it is available") {
    SimulatedCloudConfig config{};
    config.provisioning_delay = Duration{60.0};
    SimulatedCloud cloud{config};
    NatGatewayController controller{cloud};
    const ReconcileContext ctx = test::test_context();
    const Object object = make_gateway_object();

    const ReconcileResult first = controller.reconcile(ctx, object);
    REQUIRE(first.is_wait());
    REQUIRE(first.reason() == "nat gateway cp-nat-gateway pending");
    REQUIRE(cloud.count_calls("create_nat_gateway") == 1);

    const ReconcileResult second = controller.reconcile(ctx, object);
    REQUIRE(second.reason() == "nat gateway cp-nat-gateway is pending");
    REQUIRE(cloud.count_calls("create_nat_gateway") == 1);

    SECTION("available") {
        cloud.set_nat_gateway_state("cp-nat-gateway", NatGatewayState::Available);
        const ReconcileResult result = controller.reconcile(ctx, object);
        REQUIRE(result.is_done());
        REQUIRE(result.status() == ResourceStatus::Created);
    }

    SECTION("failed") {
        cloud.set_nat_gateway_state("cp-nat-gateway", NatGatewayState::Failed);
        const ReconcileResult result = controller.reconcile(ctx, object);
        REQUIRE(result.is_fatal());
        REQUIRE(result.status() == ResourceStatus::Error);
    }
}

TEST_CASE("NatGatewayController finalize deletes the live gateway once") {
    SimulatedCloudConfig config{};
    config.deletion_delay = Duration{60.0};
    SimulatedCloud cloud{config};
    NatGatewayController controller{cloud};
    const ReconcileContext ctx = test::test_context();
    const Object object = make_gateway_object();

    REQUIRE(controller.finalize(ctx, object).status() == ResourceStatus::Terminated);
    REQUIRE(cloud.count_calls("delete_nat_gateway") == 0);

    static_cast<void>(controller.reconcile(ctx, object));
    REQUIRE(controller.finalize(ctx, object).status() == ResourceStatus::Terminated);
    REQUIRE(controller.finalize(ctx, object).status() == ResourceStatus::Terminated);
    REQUIRE(cloud.count_calls("delete_nat_gateway") == 1);
    REQUIRE(cloud.describe_nat_gateways(ctx, "cp-nat-gateway").front().state == NatGatewayState::Deleting);
}

TEST_CASE("NatGatewayController ignores deleted gateways when looking up") {
    SimulatedCloud cloud{};
    NatGatewayController controller{cloud};
    const ReconcileContext ctx = test::test_context();
    const Object object = make_gateway_object();

    static_cast<void>(controller.reconcile(ctx, object));
    REQUIRE(controller.finalize(ctx, object).status() == ResourceStatus::Terminated);
    REQUIRE(cloud.describe_nat_gateways(ctx, "cp-nat-gateway").front().state == NatGatewayState::Deleted);

    REQUIRE(controller.finalize(ctx, object).status() == ResourceStatus::Terminated);
    REQUIRE(cloud.count_calls("delete_nat_gateway") == 1);

    const ReconcileResult result = controller.reconcile(ctx, object);
    REQUIRE(result.is_wait());
    REQUIRE(cloud.count_calls("create_nat_gateway") == 2);
}
