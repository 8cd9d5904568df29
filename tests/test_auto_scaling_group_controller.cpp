#include <chrono>
#include <exception>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "kit_operator/auto_scaling_group_controller.hpp"
#include "kit_operator/errors.hpp"
#include "kit_operator/simulated_cloud.hpp"

using namespace kit_operator;

namespace {

const std::string k_cluster{"cluster-x"};
const std::string k_group{"asg-for-cluster-x"};
const std::string k_target_group{"tg-x"};
const std::string k_arn_stale{"arn:aws:elasticloadbalancing:us-west-2:000000000000:targetgroup/tg-old/aaaa"};
const std::string k_arn_expected{"arn:aws:elasticloadbalancing:us-west-2:000000000000:targetgroup/tg-x/bbbb"};

Object make_group_object(int instance_count = 2) {
    AutoScalingGroupSpec spec{};
    spec.cluster_name = k_cluster;
    spec.instance_count = instance_count;
    spec.target_group_name = k_target_group;
    return make_object("default", k_group, spec);
}

void seed_subnets(SimulatedCloud& cloud) {
    cloud.add_subnet("sn-1", k_cluster, true);
    cloud.add_subnet("sn-2", k_cluster, true);
}

AutoScalingGroupDescription existing_group(int desired_capacity = 2) {
    AutoScalingGroupDescription group{};
    group.name = k_group;
    group.desired_capacity = desired_capacity;
    group.min_size = 1;
    group.max_size = 4;
    group.launch_template_name = k_group;
    group.subnet_ids = {"sn-1", "sn-2"};
    return group;
}

/** @brief Operations from the call log that mutate target group attachments. */
std::vector<std::string> attachment_calls(const SimulatedCloud& cloud) {
    std::vector<std::string> list_operations;
    for (const CloudCall& call : cloud.calls()) {
        if (call.operation == "attach_load_balancer_target_groups" || call.operation == "detach_load_balancer_target_groups") {
            list_operations.push_back(call.operation + " " + call.subject);
        }
    }
    return list_operations;
}

}  // namespace

TEST_CASE("AutoScalingGroupController waits for private subnets before creating") {
    SimulatedCloud cloud{};
    AutoScalingGroupController controller{cloud, cloud, cloud};
    const ReconcileContext ctx = test::test_context();
    const Object object = make_group_object();

    cloud.add_subnet("sn-public", k_cluster, false);
    const ReconcileResult first = controller.reconcile(ctx, object);
    REQUIRE(first.is_wait());
    REQUIRE(first.status() == ResourceStatus::Waiting);
    REQUIRE(first.reason().find("private subnets") != std::string::npos);
    REQUIRE(cloud.count_calls("create_auto_scaling_group") == 0);

    seed_subnets(cloud);
    static_cast<void>(controller.reconcile(ctx, object));
    REQUIRE(cloud.count_calls("create_auto_scaling_group") == 1);

    const auto list_groups = cloud.describe_auto_scaling_groups(ctx, k_group);
    REQUIRE(list_groups.size() == 1);
    REQUIRE(list_groups.front().desired_capacity == 2);
    REQUIRE(list_groups.front().min_size == 1);
    REQUIRE(list_groups.front().max_size == 4);
    REQUIRE(list_groups.front().subnet_ids == std::vector<std::string>{"sn-1", "sn-2"});
    REQUIRE(list_groups.front().tags.front() == Tag{"kit.sh/cluster-name", k_cluster});
}

TEST_CASE("AutoScalingGroupController reconcile is idempotent once converged") {
    SimulatedCloud cloud{};
    seed_subnets(cloud);
    cloud.add_target_group(k_target_group, k_arn_expected);
    AutoScalingGroupController controller{cloud, cloud, cloud};
    const ReconcileContext ctx = test::test_context();
    const Object object = make_group_object();

    const ReconcileResult first = controller.reconcile(ctx, object);
    REQUIRE(first.is_done());
    REQUIRE(first.status() == ResourceStatus::Created);
    REQUIRE(cloud.count_calls("create_auto_scaling_group") == 1);
    REQUIRE(cloud.count_calls("attach_load_balancer_target_groups") == 1);

    cloud.clear_calls();
    const ReconcileResult second = controller.reconcile(ctx, object);
    REQUIRE(second.status() == ResourceStatus::Created);
    REQUIRE(cloud.count_calls("create_auto_scaling_group") == 0);
    REQUIRE(cloud.count_calls("attach_load_balancer_target_groups") == 0);
    REQUIRE(cloud.count_calls("detach_load_balancer_target_groups") == 0);
    REQUIRE(cloud.count_calls("update_desired_capacity") == 0);
}

TEST_CASE("AutoScalingGroupController treats a racing create as success") {
    SimulatedCloudConfig config{};
    config.visibility_delay = Duration{0.2};
    SimulatedCloud cloud{config};
    seed_subnets(cloud);
    cloud.add_target_group(k_target_group, k_arn_expected);
    AutoScalingGroupController controller{cloud, cloud, cloud};
    const ReconcileContext ctx = test::test_context();
    const Object object = make_group_object();

    REQUIRE(controller.reconcile(ctx, object).status() == ResourceStatus::Created);
    // The group is not visible yet, so this pass tries to create it again.
    REQUIRE_NOTHROW(controller.reconcile(ctx, object));
    REQUIRE(cloud.count_calls("create_auto_scaling_group") == 2);

    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    REQUIRE(cloud.describe_auto_scaling_groups(ctx, k_group).size() == 1);
    REQUIRE(controller.reconcile(ctx, object).status() == ResourceStatus::Created);
    REQUIRE(cloud.count_calls("create_auto_scaling_group") == 2);
}

TEST_CASE("AutoScalingGroupController corrects a stale target group in two passes") {
    SimulatedCloud cloud{};
    cloud.add_auto_scaling_group(existing_group());
    cloud.seed_attachment(k_group, k_arn_stale);
    cloud.add_target_group(k_target_group, k_arn_expected);
    AutoScalingGroupController controller{cloud, cloud, cloud};
    const ReconcileContext ctx = test::test_context();
    const Object object = make_group_object();

    const ReconcileResult first = controller.reconcile(ctx, object);
    REQUIRE(first.is_wait());
    REQUIRE(attachment_calls(cloud) == std::vector<std::string>{
        "detach_load_balancer_target_groups " + k_group + ":" + k_arn_stale,
    });

    const ReconcileResult second = controller.reconcile(ctx, object);
    REQUIRE(second.status() == ResourceStatus::Created);
    REQUIRE(attachment_calls(cloud) == std::vector<std::string>{
        "detach_load_balancer_target_groups " + k_group + ":" + k_arn_stale,
        "attach_load_balancer_target_groups " + k_group + ":" + k_arn_expected,
    });

    const auto list_attachments = cloud.describe_load_balancer_target_groups(ctx, k_group);
    REQUIRE(list_attachments.size() == 1);
    REQUIRE(list_attachments.front().target_group_arn == k_arn_expected);
}

TEST_CASE("AutoScalingGroupController waits rather than detaching when the target group is missing") {
    SimulatedCloud cloud{};
    cloud.add_auto_scaling_group(existing_group());
    cloud.seed_attachment(k_group, k_arn_stale);
    AutoScalingGroupController controller{cloud, cloud, cloud};
    const ReconcileContext ctx = test::test_context();

    const ReconcileResult result = controller.reconcile(ctx, make_group_object());
    REQUIRE(result.is_wait());
    REQUIRE(result.reason() == "waiting for target group tg-x");
    REQUIRE(attachment_calls(cloud).empty());
}

TEST_CASE("AutoScalingGroupController defaults the target group to the group name") {
    SimulatedCloud cloud{};
    seed_subnets(cloud);
    cloud.add_target_group(k_group, k_arn_expected);
    AutoScalingGroupController controller{cloud, cloud, cloud};
    const ReconcileContext ctx = test::test_context();

    AutoScalingGroupSpec spec{};
    spec.cluster_name = k_cluster;
    spec.instance_count = 1;
    const ReconcileResult result = controller.reconcile(ctx, make_object("default", k_group, spec));
    REQUIRE(result.status() == ResourceStatus::Created);
    REQUIRE(cloud.describe_auto_scaling_groups(ctx, k_group).front().launch_template_name == k_group);
}

TEST_CASE("AutoScalingGroupController reports duplicate groups as fatal") {
    SimulatedCloud cloud{};
    seed_subnets(cloud);
    cloud.add_auto_scaling_group(existing_group());
    cloud.add_auto_scaling_group(existing_group());
    AutoScalingGroupController controller{cloud, cloud, cloud};
    const ReconcileContext ctx = test::test_context();

    SECTION("during reconcile") {
        const ReconcileResult result = controller.reconcile(ctx, make_group_object());
        REQUIRE(result.is_fatal());
        REQUIRE(result.status() == ResourceStatus::Error);
        REQUIRE(cloud.count_calls("create_auto_scaling_group") == 0);
    }

    SECTION("during finalize") {
        const ReconcileResult result = controller.finalize(ctx, make_group_object());
        REQUIRE(result.is_fatal());
        REQUIRE(cloud.count_calls("delete_auto_scaling_group") == 0);
    }
}

TEST_CASE("AutoScalingGroupController corrects desired capacity drift") {
    SimulatedCloud cloud{};
    cloud.add_auto_scaling_group(existing_group(1));
    cloud.seed_attachment(k_group, k_arn_expected);
    cloud.add_target_group(k_target_group, k_arn_expected);
    AutoScalingGroupController controller{cloud, cloud, cloud};
    const ReconcileContext ctx = test::test_context();

    REQUIRE(controller.reconcile(ctx, make_group_object(3)).status() == ResourceStatus::Created);
    REQUIRE(cloud.count_calls("update_desired_capacity") == 1);
    REQUIRE(cloud.describe_auto_scaling_groups(ctx, k_group).front().desired_capacity == 3);
}

TEST_CASE("AutoScalingGroupController rejects instance counts outside the size bounds") {
    SimulatedCloud cloud{};
    seed_subnets(cloud);
    AutoScalingGroupController controller{cloud, cloud, cloud, AutoScalingGroupBounds{1, 4}};
    const ReconcileContext ctx = test::test_context();

    const ReconcileResult result = controller.reconcile(ctx, make_group_object(9));
    REQUIRE(result.is_fatal());
    REQUIRE(cloud.calls().empty());
}

TEST_CASE("AutoScalingGroupController waits while a previous group is still being deleted") {
    SimulatedCloud cloud{};
    AutoScalingGroupDescription group = existing_group();
    group.status = std::string{k_asg_status_delete_in_progress};
    cloud.add_auto_scaling_group(group);
    AutoScalingGroupController controller{cloud, cloud, cloud};
    const ReconcileContext ctx = test::test_context();

    const ReconcileResult result = controller.reconcile(ctx, make_group_object());
    REQUIRE(result.is_wait());
    REQUIRE(cloud.count_calls("create_auto_scaling_group") == 0);
}

TEST_CASE("AutoScalingGroupController propagates transient provider errors") {
    SimulatedCloud cloud{};
    seed_subnets(cloud);
    cloud.fail_next("create_auto_scaling_group", std::make_exception_ptr(ProviderError("Throttling", "rate exceeded")));
    AutoScalingGroupController controller{cloud, cloud, cloud};
    const ReconcileContext ctx = test::test_context();

    REQUIRE_THROWS_AS(controller.reconcile(ctx, make_group_object()), ProviderError);
    REQUIRE(cloud.describe_auto_scaling_groups(ctx, k_group).empty());
}

TEST_CASE("AutoScalingGroupController stops at the first call once cancelled") {
    SimulatedCloud cloud{};
    seed_subnets(cloud);
    AutoScalingGroupController controller{cloud, cloud, cloud};
    std::stop_source stop_source{};
    stop_source.request_stop();
    const ReconcileContext ctx{test::ensure_logger_initialized(), stop_source.get_token(), TimePoint::max()};

    REQUIRE_THROWS_AS(controller.reconcile(ctx, make_group_object()), CancelledError);
    REQUIRE(cloud.calls().empty());
}

TEST_CASE("AutoScalingGroupController finalize is safe on absence and idempotent") {
    SimulatedCloudConfig config{};
    config.deletion_delay = Duration{60.0};
    SimulatedCloud cloud{config};
    AutoScalingGroupController controller{cloud, cloud, cloud};
    const ReconcileContext ctx = test::test_context();
    const Object object = make_group_object();

    SECTION("absent group") {
        const ReconcileResult result = controller.finalize(ctx, object);
        REQUIRE(result.status() == ResourceStatus::Terminated);
        REQUIRE(cloud.count_calls("delete_auto_scaling_group") == 0);
    }

    SECTION("existing group is deleted once") {
        cloud.add_auto_scaling_group(existing_group());
        REQUIRE(controller.finalize(ctx, object).status() == ResourceStatus::Terminated);
        REQUIRE(controller.finalize(ctx, object).status() == ResourceStatus::Terminated);
        REQUIRE(cloud.count_calls("delete_auto_scaling_group") == 1);
        REQUIRE(cloud.describe_auto_scaling_groups(ctx, k_group).front().status == k_asg_status_delete_in_progress);
    }
}

TEST_CASE("AutoScalingGroupController reattaches after its target group is replaced") {
    SimulatedCloud cloud{};
    seed_subnets(cloud);
    cloud.add_target_group(k_target_group, k_arn_stale);
    AutoScalingGroupController controller{cloud, cloud, cloud};
    const ReconcileContext ctx = test::test_context();
    const Object object = make_group_object();

    REQUIRE(controller.reconcile(ctx, object).status() == ResourceStatus::Created);
    cloud.clear_calls();

    // The provider keeps reporting the old attachment after the group is gone.
    cloud.remove_target_group(k_target_group);
    const ReconcileResult missing = controller.reconcile(ctx, object);
    REQUIRE(missing.is_wait());
    REQUIRE(missing.reason() == "waiting for target group tg-x");
    REQUIRE(attachment_calls(cloud).empty());

    cloud.add_target_group(k_target_group, k_arn_expected);
    const ReconcileResult detached = controller.reconcile(ctx, object);
    REQUIRE(detached.is_wait());
    REQUIRE(attachment_calls(cloud) == std::vector<std::string>{
        "detach_load_balancer_target_groups " + k_group + ":" + k_arn_stale,
    });

    const ReconcileResult attached = controller.reconcile(ctx, object);
    REQUIRE(attached.status() == ResourceStatus::Created);
    REQUIRE(attachment_calls(cloud) == std::vector<std::string>{
        "detach_load_balancer_target_groups " + k_group + ":" + k_arn_stale,
        "attach_load_balancer_target_groups " + k_group + ":" + k_arn_expected,
    });
    REQUIRE(cloud.describe_load_balancer_target_groups(ctx, k_group).front().target_group_arn == k_arn_expected);
}

TEST_CASE("AutoScalingGroupController stops once the reconcile deadline has passed") {
    SimulatedCloud cloud{};
    seed_subnets(cloud);
    AutoScalingGroupController controller{cloud, cloud, cloud};
    const ReconcileContext ctx{test::ensure_logger_initialized(), std::stop_token{}, SteadyClock::now()};

    REQUIRE_THROWS_AS(controller.reconcile(ctx, make_group_object()), CancelledError);
    REQUIRE(cloud.calls().empty());
}
