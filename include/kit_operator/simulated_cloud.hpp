// === Simulated Cloud =========================================================
//
// In-memory provider implementing the autoscaling, EC2 and ELBv2 adapters.
// It models the behaviours the controllers have to survive: resources that
// only become visible after a lag, deletions that complete asynchronously,
// and calls that fail on demand. Every call is recorded in order so callers
// can assert on the exact sequence issued against the provider.

#pragma once

#include <cstddef>
#include <deque>
#include <exception>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "kit_operator/cloud_api.hpp"
#include "kit_operator/types.hpp"

namespace kit_operator {

/** @brief Timing knobs for the simulated provider. */
struct SimulatedCloudConfig final {
    Duration visibility_delay{Duration{0.0}};    /**< Lag between create and first describe that returns the resource. */
    Duration provisioning_delay{Duration{0.0}};  /**< Time a NAT gateway spends pending. */
    Duration deletion_delay{Duration{0.0}};      /**< Time a delete spends in progress before the resource is gone. */
};

/** @brief One provider call as recorded by SimulatedCloud. */
struct CloudCall final {
    std::string operation{};
    std::string subject{};
};

class SimulatedCloud final : public AutoScalingApi, public Ec2Api, public Elbv2Api {
  public:
    explicit SimulatedCloud(SimulatedCloudConfig config = {});

    // AutoScalingApi
    [[nodiscard]] std::vector<AutoScalingGroupDescription> describe_auto_scaling_groups(const ReconcileContext& ctx, const std::string& name) override;
    void create_auto_scaling_group(const ReconcileContext& ctx, const CreateAutoScalingGroupRequest& request) override;
    void update_desired_capacity(const ReconcileContext& ctx, const std::string& name, int desired_capacity) override;
    void delete_auto_scaling_group(const ReconcileContext& ctx, const std::string& name, bool force_delete) override;
    [[nodiscard]] std::vector<TargetGroupAttachment> describe_load_balancer_target_groups(const ReconcileContext& ctx, const std::string& group_name) override;
    void attach_load_balancer_target_groups(const ReconcileContext& ctx, const std::string& group_name, const std::vector<std::string>& target_group_arns) override;
    void detach_load_balancer_target_groups(const ReconcileContext& ctx, const std::string& group_name, const std::vector<std::string>& target_group_arns) override;

    // Ec2Api
    [[nodiscard]] std::vector<SubnetDescription> describe_subnets(const ReconcileContext& ctx, const std::string& cluster_name) override;
    [[nodiscard]] std::vector<NatGatewayDescription> describe_nat_gateways(const ReconcileContext& ctx, const std::string& name) override;
    std::string create_nat_gateway(const ReconcileContext& ctx, const CreateNatGatewayRequest& request) override;
    void delete_nat_gateway(const ReconcileContext& ctx, const std::string& nat_gateway_id) override;

    // Elbv2Api
    [[nodiscard]] std::vector<TargetGroupDescription> describe_target_groups(const ReconcileContext& ctx, const std::string& name) override;

    /** @brief Seed a subnet owned by @p cluster_name. */
    void add_subnet(const std::string& subnet_id, const std::string& cluster_name, bool is_private);
    /** @brief Seed a target group that becomes visible after @p visible_after. */
    void add_target_group(const std::string& name, const std::string& arn, Duration visible_after = Duration{0.0});
    void remove_target_group(const std::string& name);
    /** @brief Seed an autoscaling group directly, bypassing name uniqueness. */
    void add_auto_scaling_group(AutoScalingGroupDescription description);
    /** @brief Attach @p arn to @p group_name without recording a call. */
    void seed_attachment(const std::string& group_name, const std::string& arn);
    /** @brief Move every pending NAT gateway named @p name to @p state. */
    void set_nat_gateway_state(const std::string& name, NatGatewayState state);

    /** @brief Make the next call to @p operation throw @p error instead of running. */
    void fail_next(const std::string& operation, std::exception_ptr error);

    [[nodiscard]] std::vector<CloudCall> calls() const;
    [[nodiscard]] std::size_t count_calls(const std::string& operation) const;
    void clear_calls();

  private:
    struct AutoScalingGroupRecord final {
        AutoScalingGroupDescription description{};
        TimePoint visible_at{};
        std::optional<TimePoint> deleted_at{};
    };

    struct NatGatewayRecord final {
        NatGatewayDescription description{};
        TimePoint visible_at{};
        TimePoint available_at{};
        std::optional<TimePoint> deleted_at{};
    };

    struct TargetGroupRecord final {
        TargetGroupDescription description{};
        TimePoint visible_at{};
    };

    /** @brief Record the call and raise any injected failure. Caller holds mutex_. */
    void begin_call(const std::string& operation, const std::string& subject);
    /** @brief Apply the passage of time to pending lifecycles. Caller holds mutex_. */
    void advance_lifecycles(TimePoint now);

    SimulatedCloudConfig config_;
    mutable std::mutex mutex_;
    std::vector<AutoScalingGroupRecord> list_auto_scaling_groups_;
    std::unordered_map<std::string, std::vector<std::string>> map_attachments_;
    std::vector<SubnetDescription> list_subnets_;
    std::vector<NatGatewayRecord> list_nat_gateways_;
    std::vector<TargetGroupRecord> list_target_groups_;
    std::unordered_map<std::string, std::deque<std::exception_ptr>> map_injected_failures_;
    std::vector<CloudCall> list_calls_;
    std::size_t next_nat_gateway_index_{1};
};

}  // namespace kit_operator
