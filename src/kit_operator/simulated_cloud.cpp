#include "kit_operator/simulated_cloud.hpp"

#include <algorithm>
#include <chrono>
#include <iterator>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "kit_operator/errors.hpp"

namespace kit_operator {

namespace {

SteadyClock::duration to_steady(Duration duration) {
    return std::chrono::duration_cast<SteadyClock::duration>(duration);
}

std::string join_arns(const std::vector<std::string>& list_arns) {
    return fmt::format("{}", fmt::join(list_arns, ","));
}

}  // namespace

SimulatedCloud::SimulatedCloud(SimulatedCloudConfig config)
    : config_(config) {}

std::vector<AutoScalingGroupDescription> SimulatedCloud::describe_auto_scaling_groups(const ReconcileContext& ctx, const std::string& name) {
    ctx.throw_if_cancelled("describe_auto_scaling_groups");
    std::scoped_lock lock(mutex_);
    begin_call("describe_auto_scaling_groups", name);
    const TimePoint now = SteadyClock::now();
    advance_lifecycles(now);

    std::vector<AutoScalingGroupDescription> list_groups;
    for (const AutoScalingGroupRecord& record : list_auto_scaling_groups_) {
        if (record.description.name == name && record.visible_at <= now) {
            list_groups.push_back(record.description);
        }
    }
    return list_groups;
}

void SimulatedCloud::create_auto_scaling_group(const ReconcileContext& ctx, const CreateAutoScalingGroupRequest& request) {
    ctx.throw_if_cancelled("create_auto_scaling_group");
    std::scoped_lock lock(mutex_);
    begin_call("create_auto_scaling_group", request.name);
    if (request.subnet_ids.empty()) {
        throw ProviderError("ValidationError", "at least one subnet is required");
    }
    if (request.min_size > request.desired_capacity || request.desired_capacity > request.max_size) {
        throw ProviderError("ValidationError", fmt::format("desired capacity {} outside [{}, {}]", request.desired_capacity, request.min_size, request.max_size));
    }
    const auto iterator_existing = std::find_if(list_auto_scaling_groups_.begin(), list_auto_scaling_groups_.end(), [&request](const AutoScalingGroupRecord& record) {
        return record.description.name == request.name;
    });
    if (iterator_existing != list_auto_scaling_groups_.end()) {
        throw AlreadyExistsError(fmt::format("AutoScalingGroup {} already exists", request.name));
    }

    AutoScalingGroupRecord record{};
    record.description.name = request.name;
    record.description.desired_capacity = request.desired_capacity;
    record.description.min_size = request.min_size;
    record.description.max_size = request.max_size;
    record.description.launch_template_name = request.launch_template_name;
    record.description.subnet_ids = request.subnet_ids;
    record.description.tags = request.tags;
    record.visible_at = SteadyClock::now() + to_steady(config_.visibility_delay);
    list_auto_scaling_groups_.push_back(std::move(record));
}

void SimulatedCloud::update_desired_capacity(const ReconcileContext& ctx, const std::string& name, int desired_capacity) {
    ctx.throw_if_cancelled("update_desired_capacity");
    std::scoped_lock lock(mutex_);
    begin_call("update_desired_capacity", name);
    for (AutoScalingGroupRecord& record : list_auto_scaling_groups_) {
        if (record.description.name != name) {
            continue;
        }
        if (desired_capacity < record.description.min_size || desired_capacity > record.description.max_size) {
            throw ProviderError("ValidationError", fmt::format("desired capacity {} outside [{}, {}]", desired_capacity, record.description.min_size, record.description.max_size));
        }
        record.description.desired_capacity = desired_capacity;
        return;
    }
    throw NotFoundError(fmt::format("AutoScalingGroup {} not found", name));
}

void SimulatedCloud::delete_auto_scaling_group(const ReconcileContext& ctx, const std::string& name, bool force_delete) {
    ctx.throw_if_cancelled("delete_auto_scaling_group");
    std::scoped_lock lock(mutex_);
    begin_call("delete_auto_scaling_group", name);
    const TimePoint now = SteadyClock::now();
    advance_lifecycles(now);
    for (AutoScalingGroupRecord& record : list_auto_scaling_groups_) {
        if (record.description.name != name) {
            continue;
        }
        if (!force_delete && record.description.desired_capacity > 0) {
            throw ProviderError("ResourceInUse", fmt::format("AutoScalingGroup {} still has instances", name));
        }
        if (!record.deleted_at.has_value()) {
            record.description.status = std::string{k_asg_status_delete_in_progress};
            record.deleted_at = now + to_steady(config_.deletion_delay);
        }
        advance_lifecycles(now);
        return;
    }
    throw NotFoundError(fmt::format("AutoScalingGroup {} not found", name));
}

std::vector<TargetGroupAttachment> SimulatedCloud::describe_load_balancer_target_groups(const ReconcileContext& ctx, const std::string& group_name) {
    ctx.throw_if_cancelled("describe_load_balancer_target_groups");
    std::scoped_lock lock(mutex_);
    begin_call("describe_load_balancer_target_groups", group_name);
    std::vector<TargetGroupAttachment> list_attachments;
    const auto iterator_group = map_attachments_.find(group_name);
    if (iterator_group == map_attachments_.end()) {
        return list_attachments;
    }
    for (const std::string& arn : iterator_group->second) {
        list_attachments.push_back(TargetGroupAttachment{arn, "InService"});
    }
    return list_attachments;
}

void SimulatedCloud::attach_load_balancer_target_groups(const ReconcileContext& ctx, const std::string& group_name, const std::vector<std::string>& target_group_arns) {
    ctx.throw_if_cancelled("attach_load_balancer_target_groups");
    std::scoped_lock lock(mutex_);
    begin_call("attach_load_balancer_target_groups", fmt::format("{}:{}", group_name, join_arns(target_group_arns)));
    const bool group_exists = std::any_of(list_auto_scaling_groups_.begin(), list_auto_scaling_groups_.end(), [&group_name](const AutoScalingGroupRecord& record) {
        return record.description.name == group_name;
    });
    if (!group_exists) {
        throw ProviderError("ValidationError", fmt::format("AutoScalingGroup {} not found", group_name));
    }
    std::vector<std::string>& list_attached = map_attachments_[group_name];
    for (const std::string& arn : target_group_arns) {
        if (std::find(list_attached.begin(), list_attached.end(), arn) == list_attached.end()) {
            list_attached.push_back(arn);
        }
    }
}

void SimulatedCloud::detach_load_balancer_target_groups(const ReconcileContext& ctx, const std::string& group_name, const std::vector<std::string>& target_group_arns) {
    ctx.throw_if_cancelled("detach_load_balancer_target_groups");
    std::scoped_lock lock(mutex_);
    begin_call("detach_load_balancer_target_groups", fmt::format("{}:{}", group_name, join_arns(target_group_arns)));
    const auto iterator_group = map_attachments_.find(group_name);
    if (iterator_group == map_attachments_.end()) {
        return;
    }
    std::vector<std::string>& list_attached = iterator_group->second;
    std::erase_if(list_attached, [&target_group_arns](const std::string& arn) {
        return std::find(target_group_arns.begin(), target_group_arns.end(), arn) != target_group_arns.end();
    });
}

std::vector<SubnetDescription> SimulatedCloud::describe_subnets(const ReconcileContext& ctx, const std::string& cluster_name) {
    ctx.throw_if_cancelled("describe_subnets");
    std::scoped_lock lock(mutex_);
    begin_call("describe_subnets", cluster_name);
    std::vector<SubnetDescription> list_subnets;
    std::copy_if(list_subnets_.begin(), list_subnets_.end(), std::back_inserter(list_subnets), [&cluster_name](const SubnetDescription& subnet) {
        return subnet.cluster_name == cluster_name;
    });
    return list_subnets;
}

std::vector<NatGatewayDescription> SimulatedCloud::describe_nat_gateways(const ReconcileContext& ctx, const std::string& name) {
    ctx.throw_if_cancelled("describe_nat_gateways");
    std::scoped_lock lock(mutex_);
    begin_call("describe_nat_gateways", name);
    const TimePoint now = SteadyClock::now();
    advance_lifecycles(now);
    std::vector<NatGatewayDescription> list_gateways;
    for (const NatGatewayRecord& record : list_nat_gateways_) {
        if (record.description.name == name && record.visible_at <= now) {
            list_gateways.push_back(record.description);
        }
    }
    return list_gateways;
}

std::string SimulatedCloud::create_nat_gateway(const ReconcileContext& ctx, const CreateNatGatewayRequest& request) {
    ctx.throw_if_cancelled("create_nat_gateway");
    std::scoped_lock lock(mutex_);
    begin_call("create_nat_gateway", request.name);
    const TimePoint now = SteadyClock::now();
    advance_lifecycles(now);
    const bool live_gateway_exists = std::any_of(list_nat_gateways_.begin(), list_nat_gateways_.end(), [&request](const NatGatewayRecord& record) {
        return record.description.name == request.name && record.description.state != NatGatewayState::Deleted;
    });
    if (live_gateway_exists) {
        throw AlreadyExistsError(fmt::format("NatGateway {} already exists", request.name));
    }

    NatGatewayRecord record{};
    record.description.nat_gateway_id = fmt::format("nat-{:017x}", next_nat_gateway_index_++);
    record.description.name = request.name;
    record.description.cluster_name = request.cluster_name;
    record.description.state = NatGatewayState::Pending;
    record.visible_at = now + to_steady(config_.visibility_delay);
    record.available_at = now + to_steady(config_.provisioning_delay);
    const std::string str_identifier = record.description.nat_gateway_id;
    list_nat_gateways_.push_back(std::move(record));
    advance_lifecycles(now);
    return str_identifier;
}

void SimulatedCloud::delete_nat_gateway(const ReconcileContext& ctx, const std::string& nat_gateway_id) {
    ctx.throw_if_cancelled("delete_nat_gateway");
    std::scoped_lock lock(mutex_);
    begin_call("delete_nat_gateway", nat_gateway_id);
    const TimePoint now = SteadyClock::now();
    for (NatGatewayRecord& record : list_nat_gateways_) {
        if (record.description.nat_gateway_id != nat_gateway_id) {
            continue;
        }
        if (record.description.state == NatGatewayState::Deleted) {
            throw NotFoundError(fmt::format("NatGateway {} already deleted", nat_gateway_id));
        }
        if (!record.deleted_at.has_value()) {
            record.description.state = NatGatewayState::Deleting;
            record.deleted_at = now + to_steady(config_.deletion_delay);
        }
        advance_lifecycles(now);
        return;
    }
    throw NotFoundError(fmt::format("NatGateway {} not found", nat_gateway_id));
}

std::vector<TargetGroupDescription> SimulatedCloud::describe_target_groups(const ReconcileContext& ctx, const std::string& name) {
    ctx.throw_if_cancelled("describe_target_groups");
    std::scoped_lock lock(mutex_);
    begin_call("describe_target_groups", name);
    const TimePoint now = SteadyClock::now();
    std::vector<TargetGroupDescription> list_groups;
    for (const TargetGroupRecord& record : list_target_groups_) {
        if (record.description.name == name && record.visible_at <= now) {
            list_groups.push_back(record.description);
        }
    }
    if (list_groups.empty()) {
        throw NotFoundError(fmt::format("TargetGroupNotFound: {}", name));
    }
    return list_groups;
}

void SimulatedCloud::add_subnet(const std::string& subnet_id, const std::string& cluster_name, bool is_private) {
    std::scoped_lock lock(mutex_);
    list_subnets_.push_back(SubnetDescription{subnet_id, cluster_name, is_private});
}

void SimulatedCloud::add_target_group(const std::string& name, const std::string& arn, Duration visible_after) {
    std::scoped_lock lock(mutex_);
    list_target_groups_.push_back(TargetGroupRecord{TargetGroupDescription{name, arn}, SteadyClock::now() + to_steady(visible_after)});
}

void SimulatedCloud::remove_target_group(const std::string& name) {
    std::scoped_lock lock(mutex_);
    std::erase_if(list_target_groups_, [&name](const TargetGroupRecord& record) {
        return record.description.name == name;
    });
}

void SimulatedCloud::add_auto_scaling_group(AutoScalingGroupDescription description) {
    std::scoped_lock lock(mutex_);
    AutoScalingGroupRecord record{};
    record.description = std::move(description);
    record.visible_at = SteadyClock::now();
    list_auto_scaling_groups_.push_back(std::move(record));
}

void SimulatedCloud::seed_attachment(const std::string& group_name, const std::string& arn) {
    std::scoped_lock lock(mutex_);
    map_attachments_[group_name].push_back(arn);
}

void SimulatedCloud::set_nat_gateway_state(const std::string& name, NatGatewayState state) {
    std::scoped_lock lock(mutex_);
    for (NatGatewayRecord& record : list_nat_gateways_) {
        if (record.description.name == name && record.description.state == NatGatewayState::Pending) {
            record.description.state = state;
        }
    }
}

void SimulatedCloud::fail_next(const std::string& operation, std::exception_ptr error) {
    std::scoped_lock lock(mutex_);
    map_injected_failures_[operation].push_back(std::move(error));
}

std::vector<CloudCall> SimulatedCloud::calls() const {
    std::scoped_lock lock(mutex_);
    return list_calls_;
}

std::size_t SimulatedCloud::count_calls(const std::string& operation) const {
    std::scoped_lock lock(mutex_);
    return static_cast<std::size_t>(std::count_if(list_calls_.begin(), list_calls_.end(), [&operation](const CloudCall& call) {
        return call.operation == operation;
    }));
}

void SimulatedCloud::clear_calls() {
    std::scoped_lock lock(mutex_);
    list_calls_.clear();
}

void SimulatedCloud::begin_call(const std::string& operation, const std::string& subject) {
    list_calls_.push_back(CloudCall{operation, subject});
    const auto iterator_failures = map_injected_failures_.find(operation);
    if (iterator_failures == map_injected_failures_.end() || iterator_failures->second.empty()) {
        return;
    }
    std::exception_ptr error = iterator_failures->second.front();
    iterator_failures->second.pop_front();
    std::rethrow_exception(error);
}

void SimulatedCloud::advance_lifecycles(TimePoint now) {
    std::vector<std::string> list_removed_groups;
    std::erase_if(list_auto_scaling_groups_, [now, &list_removed_groups](const AutoScalingGroupRecord& record) {
        if (record.deleted_at.has_value() && record.deleted_at.value() <= now) {
            list_removed_groups.push_back(record.description.name);
            return true;
        }
        return false;
    });
    for (const std::string& name : list_removed_groups) {
        map_attachments_.erase(name);
    }

    for (NatGatewayRecord& record : list_nat_gateways_) {
        if (record.deleted_at.has_value()) {
            if (record.deleted_at.value() <= now) {
                record.description.state = NatGatewayState::Deleted;
            }
            continue;
        }
        if (record.description.state == NatGatewayState::Pending && record.available_at <= now) {
            record.description.state = NatGatewayState::Available;
        }
    }
}

}  // namespace kit_operator
