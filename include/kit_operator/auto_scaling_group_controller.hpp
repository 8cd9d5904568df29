// === AutoScalingGroup Controller =============================================
//
// Converges one autoscaling group per AutoScalingGroup object: create it once
// its private subnets exist, keep its desired capacity in line with the spec,
// and keep exactly the expected target group attached.

#pragma once

#include <optional>
#include <string>

#include "kit_operator/cloud_api.hpp"
#include "kit_operator/reconciler.hpp"

namespace kit_operator {

/** @brief Size bounds applied to every group the controller creates. */
struct AutoScalingGroupBounds final {
    int min_size{1};
    int max_size{4};
};

class AutoScalingGroupController final : public Reconciler {
  public:
    AutoScalingGroupController(AutoScalingApi& autoscaling_api, Ec2Api& ec2_api, Elbv2Api& elbv2_api, AutoScalingGroupBounds bounds = {});

    [[nodiscard]] std::string name() const override;
    [[nodiscard]] ResourceKind kind() const noexcept override;

    /**
     * @brief Absent -> Creating -> Attaching -> Converged, re-derived from the
     *        provider on every call.
     *
     * Detaching a stale target group and attaching the expected one happen
     * on separate passes.
     */
    ReconcileResult reconcile(const ReconcileContext& ctx, const Object& object) override;
    /** @brief Force-delete the group unless it is absent or already deleting. */
    ReconcileResult finalize(const ReconcileContext& ctx, const Object& object) override;

  private:
    /** @brief Describe result narrowed to zero or one group. */
    struct Lookup final {
        std::optional<AutoScalingGroupDescription> group{};
        std::optional<std::string> inconsistency{};
    };

    Lookup lookup(const ReconcileContext& ctx, const std::string& group_name);
    /** @brief Create the group; returns a wait reason when subnets are missing. */
    std::optional<std::string> create(const ReconcileContext& ctx, const std::string& group_name, const AutoScalingGroupSpec& spec);
    ReconcileResult reconcile_attachment(const ReconcileContext& ctx, const std::string& group_name, const AutoScalingGroupSpec& spec);

    AutoScalingApi& autoscaling_api_;
    Ec2Api& ec2_api_;
    Elbv2Api& elbv2_api_;
    AutoScalingGroupBounds bounds_;
};

}  // namespace kit_operator
