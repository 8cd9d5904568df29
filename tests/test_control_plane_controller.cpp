#include <stdexcept>
#include <string>
#include <utility>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "kit_operator/control_plane_controller.hpp"
#include "kit_operator/finalizer.hpp"
#include "kit_operator/resource_projection.hpp"

using namespace kit_operator;

namespace {

void set_phase(InMemoryObjectStore& store, const ObjectKey& key, ResourceStatus phase, std::string reason = {}) {
    ObjectStatus status{};
    status.phase = phase;
    status.reason = std::move(reason);
    store.update_status(key, status);
}

}  // namespace

TEST_CASE("child_object_name derives names from the control plane") {
    REQUIRE(child_object_name("cp", ResourceKind::AutoScalingGroup) == "cp-asg");
    REQUIRE(child_object_name("cp", ResourceKind::NatGateway) == "cp-nat-gateway");
    REQUIRE_THROWS_AS(child_object_name("cp", ResourceKind::ControlPlane), std::invalid_argument);
}

TEST_CASE("ControlPlaneController projects owned children and rolls up their status") {
    InMemoryObjectStore store{};
    ControlPlaneController controller{store};
    const ReconcileContext ctx = test::test_context();
    const Object control_plane = store.create(make_object("default", "cp", ControlPlaneSpec{"cluster-x", 3}));
    const ObjectKey asg_key = child_object_key(control_plane, ResourceKind::AutoScalingGroup);
    const ObjectKey nat_key = child_object_key(control_plane, ResourceKind::NatGateway);

    const ReconcileResult first = controller.reconcile(ctx, control_plane);
    REQUIRE(first.is_wait());
    REQUIRE(first.reason() == "waiting for cp-nat-gateway, cp-asg");

    const Object asg = store.get(asg_key).value();
    REQUIRE(asg.metadata.owner == control_plane.key());
    REQUIRE(std::get<AutoScalingGroupSpec>(asg.spec).cluster_name == "cluster-x");
    REQUIRE(std::get<AutoScalingGroupSpec>(asg.spec).instance_count == 3);
    REQUIRE(store.get(nat_key)->metadata.owner == control_plane.key());

    SECTION("waiting children report their reason") {
        set_phase(store, nat_key, ResourceStatus::Created);
        set_phase(store, asg_key, ResourceStatus::Waiting, "waiting for target group cp-asg");
        REQUIRE(controller.reconcile(ctx, control_plane).reason() == "waiting for cp-asg (waiting for target group cp-asg)");
    }

    SECTION("failed children are surfaced") {
        set_phase(store, nat_key, ResourceStatus::Created);
        set_phase(store, asg_key, ResourceStatus::Error, "boom");
        REQUIRE(controller.reconcile(ctx, control_plane).reason() == "waiting for cp-asg (error: boom)");
    }

    SECTION("all children created") {
        set_phase(store, nat_key, ResourceStatus::Created);
        set_phase(store, asg_key, ResourceStatus::Created);
        const ReconcileResult result = controller.reconcile(ctx, control_plane);
        REQUIRE(result.is_done());
        REQUIRE(result.status() == ResourceStatus::Created);
    }

    SECTION("instance count changes flow to the autoscaling group child") {
        Object resized = store.get(control_plane.key()).value();
        std::get<ControlPlaneSpec>(resized.spec).instance_count = 2;
        resized = store.update(resized);
        static_cast<void>(controller.reconcile(ctx, resized));
        REQUIRE(std::get<AutoScalingGroupSpec>(store.get(asg_key)->spec).instance_count == 2);
    }
}

TEST_CASE("ControlPlaneController rejects a control plane without a cluster name") {
    InMemoryObjectStore store{};
    ControlPlaneController controller{store};
    const Object control_plane = store.create(make_object("default", "cp", ControlPlaneSpec{"", 1}));

    const ReconcileResult result = controller.reconcile(test::test_context(), control_plane);
    REQUIRE(result.is_fatal());
    REQUIRE(store.list().size() == 1);
}

TEST_CASE("ControlPlaneController finalize waits for its children to go away") {
    InMemoryObjectStore store{};
    ControlPlaneController controller{store};
    const ReconcileContext ctx = test::test_context();
    const Object control_plane = store.create(make_object("default", "cp", ControlPlaneSpec{"cluster-x", 1}));
    static_cast<void>(controller.reconcile(ctx, control_plane));
    const ObjectKey asg_key = child_object_key(control_plane, ResourceKind::AutoScalingGroup);
    const ObjectKey nat_key = child_object_key(control_plane, ResourceKind::NatGateway);

    SECTION("children without finalizers are removed at once") {
        REQUIRE(controller.finalize(ctx, control_plane).status() == ResourceStatus::Terminated);
        REQUIRE(store.list().size() == 1);
    }

    SECTION("children holding finalizers are marked and awaited") {
        static_cast<void>(ensure_finalizer(store, store.get(asg_key).value()));
        static_cast<void>(ensure_finalizer(store, store.get(nat_key).value()));

        const ReconcileResult pending = controller.finalize(ctx, control_plane);
        REQUIRE(pending.is_wait());
        REQUIRE(pending.reason() == "waiting for deletion of cp-nat-gateway, cp-asg");
        REQUIRE(store.get(asg_key)->is_being_deleted());
        REQUIRE(store.get(nat_key)->is_being_deleted());

        release_finalizer(store, nat_key);
        REQUIRE(controller.finalize(ctx, control_plane).reason() == "waiting for deletion of cp-asg");

        release_finalizer(store, asg_key);
        REQUIRE(controller.finalize(ctx, control_plane).status() == ResourceStatus::Terminated);
    }
}
