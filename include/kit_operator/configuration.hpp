// === Configuration ===========================================================
//
// Exposes the strongly-typed configuration consumed by the operator.
// `ConfigurationLoader` translates environment variables into these
// structures so downstream modules never touch `std::getenv` directly.

#pragma once

#include <string>

#include "kit_operator/auto_scaling_group_controller.hpp"
#include "kit_operator/manager.hpp"

namespace kit_operator {

/**
 * @brief Control plane seeded by the controller binary at startup.
 */
struct SeedConfig final {
    std::string namespace_name{};
    std::string cluster_name{};
    int instance_count{};
};

/**
 * @brief Immutable bundle of runtime knobs for the operator.
 *
 * Every field is populated by ConfigurationLoader; consumers should treat
 * the values as authoritative and avoid consulting environment variables
 * directly.
 */
struct Configuration final {
    std::string log_directory{};        /**< Destination directory for structured logs. */
    std::string log_level{};            /**< spdlog level name. */
    ManagerConfig manager{};            /**< Worker pool, requeue and backoff settings. */
    AutoScalingGroupBounds asg_bounds{};  /**< Size bounds for created autoscaling groups. */
    SeedConfig seed{};                  /**< Control plane created at startup. */
};

/**
 * @brief Hydrates Configuration from environment variables.
 */
class ConfigurationLoader final {
  public:
    /** @brief Load configuration; initializes the logger as a side effect. */
    static Configuration load();
};

}  // namespace kit_operator
