#include "kit_operator/auto_scaling_group_controller.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "kit_operator/cloud_queries.hpp"
#include "kit_operator/errors.hpp"

namespace kit_operator {

namespace {

const std::string& expected_target_group_name(const std::string& group_name, const AutoScalingGroupSpec& spec) {
    return spec.target_group_name.empty() ? group_name : spec.target_group_name;
}

const std::string& launch_template_name(const std::string& group_name, const AutoScalingGroupSpec& spec) {
    return spec.launch_template_name.empty() ? group_name : spec.launch_template_name;
}

bool is_deleting(const AutoScalingGroupDescription& group) {
    return group.status == k_asg_status_delete_in_progress;
}

}  // namespace

AutoScalingGroupController::AutoScalingGroupController(AutoScalingApi& autoscaling_api, Ec2Api& ec2_api, Elbv2Api& elbv2_api, AutoScalingGroupBounds bounds)
    : autoscaling_api_(autoscaling_api),
      ec2_api_(ec2_api),
      elbv2_api_(elbv2_api),
      bounds_(bounds) {
    if (bounds_.min_size < 0 || bounds_.min_size > bounds_.max_size) {
        throw std::invalid_argument(fmt::format("Invalid autoscaling group bounds [{}, {}]", bounds_.min_size, bounds_.max_size));
    }
}

std::string AutoScalingGroupController::name() const {
    return "auto-scaling-group";
}

ResourceKind AutoScalingGroupController::kind() const noexcept {
    return ResourceKind::AutoScalingGroup;
}

ReconcileResult AutoScalingGroupController::reconcile(const ReconcileContext& ctx, const Object& object) {
    const auto& spec = std::get<AutoScalingGroupSpec>(object.spec);
    const std::string& group_name = object.metadata.name;

    if (spec.instance_count < bounds_.min_size || spec.instance_count > bounds_.max_size) {
        return ReconcileResult::fatal(fmt::format(
            "instance count {} outside allowed range [{}, {}]",
            spec.instance_count,
            bounds_.min_size,
            bounds_.max_size
        ));
    }

    const Lookup existing = lookup(ctx, group_name);
    if (existing.inconsistency.has_value()) {
        return ReconcileResult::fatal(existing.inconsistency.value());
    }

    if (!existing.group.has_value()) {
        if (const std::optional<std::string> wait_reason = create(ctx, group_name, spec); wait_reason.has_value()) {
            return ReconcileResult::wait(wait_reason.value());
        }
    } else if (is_deleting(existing.group.value())) {
        return ReconcileResult::wait(fmt::format("autoscaling group {} is still being deleted", group_name));
    } else {
        ctx.logger().debug("Discovered autoscaling group {} for cluster {}", group_name, spec.cluster_name);
        if (existing.group->desired_capacity != spec.instance_count) {
            autoscaling_api_.update_desired_capacity(ctx, group_name, spec.instance_count);
            ctx.logger().info(
                "Corrected desired capacity of autoscaling group {} from {} to {}",
                group_name,
                existing.group->desired_capacity,
                spec.instance_count
            );
        }
    }

    return reconcile_attachment(ctx, group_name, spec);
}

ReconcileResult AutoScalingGroupController::finalize(const ReconcileContext& ctx, const Object& object) {
    const std::string& group_name = object.metadata.name;
    const Lookup existing = lookup(ctx, group_name);
    if (existing.inconsistency.has_value()) {
        return ReconcileResult::fatal(existing.inconsistency.value());
    }
    if (!existing.group.has_value()) {
        ctx.logger().debug("Autoscaling group {} already absent", group_name);
        return ReconcileResult::terminated();
    }
    if (is_deleting(existing.group.value())) {
        ctx.logger().debug("Autoscaling group {} deletion already in progress", group_name);
        return ReconcileResult::terminated();
    }

    try {
        autoscaling_api_.delete_auto_scaling_group(ctx, group_name, true);
    } catch (const NotFoundError&) {
        ctx.logger().debug("Autoscaling group {} vanished before delete", group_name);
        return ReconcileResult::terminated();
    }
    ctx.logger().info("Deleted autoscaling group {}", group_name);
    return ReconcileResult::terminated();
}

AutoScalingGroupController::Lookup AutoScalingGroupController::lookup(const ReconcileContext& ctx, const std::string& group_name) {
    std::vector<AutoScalingGroupDescription> list_groups;
    try {
        list_groups = autoscaling_api_.describe_auto_scaling_groups(ctx, group_name);
    } catch (const ProviderError& error) {
        throw ProviderError(error.code(), fmt::format("getting autoscaling group {}, {}", group_name, error.what()));
    }

    Lookup result{};
    if (list_groups.size() > 1) {
        result.inconsistency = fmt::format("expected one autoscaling group named {}, found {}", group_name, list_groups.size());
    } else if (list_groups.size() == 1) {
        result.group = std::move(list_groups.front());
    }
    return result;
}

std::optional<std::string> AutoScalingGroupController::create(const ReconcileContext& ctx, const std::string& group_name, const AutoScalingGroupSpec& spec) {
    std::vector<std::string> list_subnet_ids = private_subnet_ids(ctx, ec2_api_, spec.cluster_name);
    if (list_subnet_ids.empty()) {
        return fmt::format("waiting for private subnets of cluster {}", spec.cluster_name);
    }

    CreateAutoScalingGroupRequest request{};
    request.name = group_name;
    request.desired_capacity = spec.instance_count;
    request.min_size = bounds_.min_size;
    request.max_size = bounds_.max_size;
    request.launch_template_name = launch_template_name(group_name, spec);
    request.subnet_ids = std::move(list_subnet_ids);
    request.tags = resource_tags(group_name, spec.cluster_name);

    try {
        autoscaling_api_.create_auto_scaling_group(ctx, request);
    } catch (const AlreadyExistsError&) {
        // A previous pass created it but the describe has not caught up yet.
        ctx.logger().debug("Autoscaling group {} already exists", group_name);
        return std::nullopt;
    } catch (const ProviderError& error) {
        throw ProviderError(error.code(), fmt::format("creating autoscaling group {}, {}", group_name, error.what()));
    }
    ctx.logger().info("Created autoscaling group {} for cluster {}", group_name, spec.cluster_name);
    return std::nullopt;
}

ReconcileResult AutoScalingGroupController::reconcile_attachment(const ReconcileContext& ctx, const std::string& group_name, const AutoScalingGroupSpec& spec) {
    const std::vector<TargetGroupAttachment> list_attachments = autoscaling_api_.describe_load_balancer_target_groups(ctx, group_name);

    const std::string& target_group_name = expected_target_group_name(group_name, spec);
    const std::optional<TargetGroupDescription> target_group = find_target_group(ctx, elbv2_api_, target_group_name);
    // The provider keeps reporting an attachment after its target group is
    // deleted, so a missing target group is checked before any attachment.
    if (!target_group.has_value()) {
        return ReconcileResult::wait(fmt::format("waiting for target group {}", target_group_name));
    }

    std::vector<std::string> list_stale_arns;
    bool expected_attached = false;
    for (const TargetGroupAttachment& attachment : list_attachments) {
        if (attachment.target_group_arn == target_group->arn) {
            expected_attached = true;
        } else {
            list_stale_arns.push_back(attachment.target_group_arn);
        }
    }

    if (!list_stale_arns.empty()) {
        try {
            autoscaling_api_.detach_load_balancer_target_groups(ctx, group_name, list_stale_arns);
        } catch (const ProviderError& error) {
            throw ProviderError(error.code(), fmt::format("detaching stale target groups from {}, {}", group_name, error.what()));
        }
        ctx.logger().info("Detached stale target groups {} from autoscaling group {}", fmt::join(list_stale_arns, ","), group_name);
        return ReconcileResult::wait(fmt::format("detached stale target groups from {}", group_name));
    }

    if (expected_attached) {
        ctx.logger().debug("Autoscaling group {} attached to target group {}", group_name, target_group->arn);
        return ReconcileResult::created();
    }

    autoscaling_api_.attach_load_balancer_target_groups(ctx, group_name, {target_group->arn});
    ctx.logger().info("Attached autoscaling group {} to target group {}", group_name, target_group->arn);
    return ReconcileResult::created();
}

}  // namespace kit_operator
