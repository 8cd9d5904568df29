// === Cloud Queries ===========================================================
//
// Typed lookups shared by several controllers, built on the raw adapters.

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "kit_operator/cloud_api.hpp"

namespace kit_operator {

inline constexpr char k_cluster_tag_key[] = "kit.sh/cluster-name";

/** @brief Ids of the private subnets tagged for @p cluster_name, sorted. */
[[nodiscard]] std::vector<std::string> private_subnet_ids(const ReconcileContext& ctx, Ec2Api& ec2, const std::string& cluster_name);

/** @brief The target group named @p name, or nullopt while it does not exist. */
[[nodiscard]] std::optional<TargetGroupDescription> find_target_group(const ReconcileContext& ctx, Elbv2Api& elbv2, const std::string& name);

/** @brief Tags applied to every resource the operator creates. */
[[nodiscard]] std::vector<Tag> resource_tags(const std::string& name, const std::string& cluster_name);

}  // namespace kit_operator
