#include "kit_operator/cloud_queries.hpp"

#include <algorithm>

#include "kit_operator/errors.hpp"

namespace kit_operator {

std::vector<std::string> private_subnet_ids(const ReconcileContext& ctx, Ec2Api& ec2, const std::string& cluster_name) {
    std::vector<std::string> list_subnet_ids;
    for (const SubnetDescription& subnet : ec2.describe_subnets(ctx, cluster_name)) {
        if (subnet.is_private && subnet.cluster_name == cluster_name) {
            list_subnet_ids.push_back(subnet.subnet_id);
        }
    }
    std::sort(list_subnet_ids.begin(), list_subnet_ids.end());
    return list_subnet_ids;
}

std::optional<TargetGroupDescription> find_target_group(const ReconcileContext& ctx, Elbv2Api& elbv2, const std::string& name) {
    try {
        const std::vector<TargetGroupDescription> list_groups = elbv2.describe_target_groups(ctx, name);
        if (list_groups.empty()) {
            return std::nullopt;
        }
        return list_groups.front();
    } catch (const NotFoundError&) {
        return std::nullopt;
    }
}

std::vector<Tag> resource_tags(const std::string& name, const std::string& cluster_name) {
    return {
        Tag{k_cluster_tag_key, cluster_name},
        Tag{"Name", name},
    };
}

}  // namespace kit_operator
