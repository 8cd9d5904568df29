// === Cloud Resource API ======================================================
//
// Typed request/response interfaces for the provider calls the controllers
// make. Implementations translate provider failures into the exception types
// from errors.hpp and check the context for cancellation before each call.
// They carry no retry policy of their own.

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "kit_operator/reconcile_context.hpp"

namespace kit_operator {

struct Tag final {
    std::string key{};
    std::string value{};

    friend bool operator==(const Tag&, const Tag&) = default;
};

/** @brief Lifecycle status the provider reports while a group is being torn down. */
inline constexpr std::string_view k_asg_status_delete_in_progress{"Delete in progress"};

struct AutoScalingGroupDescription final {
    std::string name{};
    int desired_capacity{};
    int min_size{};
    int max_size{};
    std::string launch_template_name{};
    std::vector<std::string> subnet_ids{};
    std::vector<Tag> tags{};
    std::string status{};  /**< Empty while active. */
};

struct CreateAutoScalingGroupRequest final {
    std::string name{};
    int desired_capacity{};
    int min_size{};
    int max_size{};
    std::string launch_template_name{};
    std::vector<std::string> subnet_ids{};
    std::vector<Tag> tags{};
};

struct TargetGroupAttachment final {
    std::string target_group_arn{};
    std::string state{};
};

class AutoScalingApi {
  public:
    virtual ~AutoScalingApi() = default;

    /** @brief Groups whose name equals @p name; empty when none. */
    [[nodiscard]] virtual std::vector<AutoScalingGroupDescription> describe_auto_scaling_groups(const ReconcileContext& ctx, const std::string& name) = 0;
    /** @brief Throws AlreadyExistsError when the name is taken. */
    virtual void create_auto_scaling_group(const ReconcileContext& ctx, const CreateAutoScalingGroupRequest& request) = 0;
    virtual void update_desired_capacity(const ReconcileContext& ctx, const std::string& name, int desired_capacity) = 0;
    /** @brief Throws NotFoundError when the group does not exist. */
    virtual void delete_auto_scaling_group(const ReconcileContext& ctx, const std::string& name, bool force_delete) = 0;
    [[nodiscard]] virtual std::vector<TargetGroupAttachment> describe_load_balancer_target_groups(const ReconcileContext& ctx, const std::string& group_name) = 0;
    virtual void attach_load_balancer_target_groups(const ReconcileContext& ctx, const std::string& group_name, const std::vector<std::string>& target_group_arns) = 0;
    virtual void detach_load_balancer_target_groups(const ReconcileContext& ctx, const std::string& group_name, const std::vector<std::string>& target_group_arns) = 0;
};

struct SubnetDescription final {
    std::string subnet_id{};
    std::string cluster_name{};
    bool is_private{};
};

enum class NatGatewayState {
    Pending,
    Available,
    Deleting,
    Deleted,  /**< Reported for a while after deletion completes. */
    Failed
};

[[nodiscard]] std::string_view to_string(NatGatewayState state) noexcept;

struct NatGatewayDescription final {
    std::string nat_gateway_id{};
    std::string name{};
    std::string cluster_name{};
    NatGatewayState state{NatGatewayState::Pending};
};

struct CreateNatGatewayRequest final {
    std::string name{};
    std::string cluster_name{};
    std::vector<Tag> tags{};
};

class Ec2Api {
  public:
    virtual ~Ec2Api() = default;

    [[nodiscard]] virtual std::vector<SubnetDescription> describe_subnets(const ReconcileContext& ctx, const std::string& cluster_name) = 0;
    /** @brief NAT gateways tagged with @p name, including ones already deleted. */
    [[nodiscard]] virtual std::vector<NatGatewayDescription> describe_nat_gateways(const ReconcileContext& ctx, const std::string& name) = 0;
    /** @brief Returns the new gateway id; throws AlreadyExistsError on a name clash. */
    virtual std::string create_nat_gateway(const ReconcileContext& ctx, const CreateNatGatewayRequest& request) = 0;
    virtual void delete_nat_gateway(const ReconcileContext& ctx, const std::string& nat_gateway_id) = 0;
};

struct TargetGroupDescription final {
    std::string name{};
    std::string arn{};
};

class Elbv2Api {
  public:
    virtual ~Elbv2Api() = default;

    /** @brief Throws NotFoundError when no target group has @p name. */
    [[nodiscard]] virtual std::vector<TargetGroupDescription> describe_target_groups(const ReconcileContext& ctx, const std::string& name) = 0;
};

}  // namespace kit_operator
