#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

#include "kit_operator/auto_scaling_group_controller.hpp"
#include "kit_operator/configuration.hpp"
#include "kit_operator/control_plane_controller.hpp"
#include "kit_operator/logging.hpp"
#include "kit_operator/manager.hpp"
#include "kit_operator/nat_gateway_controller.hpp"
#include "kit_operator/object_store.hpp"
#include "kit_operator/resource_projection.hpp"
#include "kit_operator/simulated_cloud.hpp"
#include "kit_operator/version.hpp"

namespace {
std::atomic<bool> should_terminate{false};

void handle_signal(int) {
    should_terminate.store(true);
}

constexpr kit_operator::Duration k_visibility_delay{2.0};       /**< Lag before created resources show up in describes. */
constexpr kit_operator::Duration k_provisioning_delay{4.0};     /**< Time NAT gateways spend pending. */
constexpr kit_operator::Duration k_deletion_delay{3.0};         /**< Time deletes spend in progress. */
constexpr kit_operator::Duration k_target_group_delay{10.0};    /**< Target group appears after the group exists. */

/**
 * @brief Seed the simulated provider with the network the demo cluster needs.
 */
void seed_cloud(kit_operator::SimulatedCloud& cloud, const kit_operator::SeedConfig& seed) {
    cloud.add_subnet("subnet-private-a", seed.cluster_name, true);
    cloud.add_subnet("subnet-private-b", seed.cluster_name, true);
    cloud.add_subnet("subnet-public-a", seed.cluster_name, false);
    const std::string target_group_name = kit_operator::child_object_name(seed.cluster_name, kit_operator::ResourceKind::AutoScalingGroup);
    cloud.add_target_group(
        target_group_name,
        "arn:aws:elasticloadbalancing:us-west-2:000000000000:targetgroup/" + target_group_name + "/0000000000000001",
        k_target_group_delay
    );
}
}  // namespace

int main() {
    using namespace kit_operator;

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    try {
        Configuration configuration = ConfigurationLoader::load();
        set_log_level(configuration.log_level);
        auto logger = get_logger();
        logger->info("kit_operator {} starting", k_version);

        SimulatedCloud cloud{SimulatedCloudConfig{k_visibility_delay, k_provisioning_delay, k_deletion_delay}};
        seed_cloud(cloud, configuration.seed);
        InMemoryObjectStore store{};

        Manager manager{configuration.manager, store, logger};
        ReconcilerList controllers{};
        controllers.push_back(std::make_unique<ControlPlaneController>(store));
        controllers.push_back(std::make_unique<AutoScalingGroupController>(cloud, cloud, cloud, configuration.asg_bounds));
        controllers.push_back(std::make_unique<NatGatewayController>(cloud));
        Runnable& runnable = manager.register_controllers(std::move(controllers));

        static_cast<void>(store.create(make_object(
            configuration.seed.namespace_name,
            configuration.seed.cluster_name,
            ControlPlaneSpec{configuration.seed.cluster_name, configuration.seed.instance_count}
        )));

        std::stop_source stop_source{};
        std::thread manager_thread([&runnable, token = stop_source.get_token()]() {
            try {
                runnable.start(token);
            } catch (const std::exception& exc) {
                get_logger()->critical("Manager failed: {}", exc.what());
                should_terminate.store(true);
            }
        });

        while (!should_terminate.load()) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }

        stop_source.request_stop();
        manager_thread.join();
    } catch (const std::exception& exc) {
        try {
            auto logger = get_logger();
            logger->critical("Fatal error: {}", exc.what());
        } catch (const std::exception&) {
            std::cerr << "Fatal error before logger initialization: " << exc.what() << '\n';
        }
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
