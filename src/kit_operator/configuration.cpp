// === Configuration Loader ====================================================
//
// Centralizes parsing and validation of environment-driven settings. Values
// that fail to parse or fall outside sane bounds are logged and replaced by
// their defaults, so a misconfigured variable never stops the operator from
// starting.

#include "kit_operator/configuration.hpp"

#include <cstdlib>
#include <exception>
#include <string>
#include <string_view>

#include "kit_operator/logging.hpp"

namespace kit_operator {

namespace {
constexpr std::string_view k_default_log_directory{"logs"};
constexpr std::string_view k_default_log_level{"info"};
constexpr std::string_view k_default_namespace{"default"};
constexpr std::string_view k_default_cluster_name{"demo"};
constexpr int k_default_workers{4};
constexpr double k_default_wait_requeue_s{5.0};
constexpr double k_default_backoff_base_ms{5.0};
constexpr double k_default_backoff_max_s{1000.0};
constexpr double k_default_resync_s{300.0};
constexpr double k_default_reconcile_timeout_s{30.0};
constexpr int k_default_asg_min_size{1};
constexpr int k_default_asg_max_size{4};
constexpr int k_default_instance_count{2};

double parse_double(const char* name, double fallback) {
    const char* raw_value = std::getenv(name);
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const double parsed_value = std::stod(raw_value);
        if (parsed_value <= 0.0) {
            get_logger()->warn("{} must be positive; using fallback {}", name, fallback);
            return fallback;
        }
        return parsed_value;
    } catch (const std::exception&) {
        get_logger()->warn("Failed to parse {} as a number; using fallback {}", name, fallback);
        return fallback;
    }
}

int parse_int(const char* name, int fallback, int minimum) {
    const char* raw_value = std::getenv(name);
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const int parsed_value = std::stoi(raw_value);
        if (parsed_value < minimum) {
            get_logger()->warn("{} must be at least {}; using fallback {}", name, minimum, fallback);
            return fallback;
        }
        return parsed_value;
    } catch (const std::exception&) {
        get_logger()->warn("Failed to parse {} as an integer; using fallback {}", name, fallback);
        return fallback;
    }
}

std::string parse_string(const char* name, std::string_view fallback) {
    const char* raw_value = std::getenv(name);
    if (raw_value == nullptr || std::string_view{raw_value}.empty()) {
        return std::string{fallback};
    }
    return std::string{raw_value};
}

}  // namespace

Configuration ConfigurationLoader::load() {
    Configuration config{};
    config.log_directory = parse_string("KIT_OPERATOR_LOG_DIR", k_default_log_directory);

    auto logger = initialize_logger(config.log_directory);
    logger->info("Loading configuration from environment");

    config.log_level = parse_string("KIT_OPERATOR_LOG_LEVEL", k_default_log_level);

    config.manager.worker_count = static_cast<std::size_t>(parse_int("KIT_OPERATOR_WORKERS", k_default_workers, 1));
    config.manager.wait_requeue_delay = Duration{parse_double("KIT_OPERATOR_WAIT_REQUEUE_S", k_default_wait_requeue_s)};
    config.manager.backoff.base_delay = Duration{parse_double("KIT_OPERATOR_BACKOFF_BASE_MS", k_default_backoff_base_ms) / 1000.0};
    config.manager.backoff.max_delay = Duration{parse_double("KIT_OPERATOR_BACKOFF_MAX_S", k_default_backoff_max_s)};
    if (config.manager.backoff.max_delay < config.manager.backoff.base_delay) {
        logger->warn("KIT_OPERATOR_BACKOFF_MAX_S is below the base delay; raising it to the base delay");
        config.manager.backoff.max_delay = config.manager.backoff.base_delay;
    }
    config.manager.resync_period = Duration{parse_double("KIT_OPERATOR_RESYNC_S", k_default_resync_s)};
    config.manager.reconcile_timeout = Duration{parse_double("KIT_OPERATOR_RECONCILE_TIMEOUT_S", k_default_reconcile_timeout_s)};

    config.asg_bounds.min_size = parse_int("KIT_OPERATOR_ASG_MIN_SIZE", k_default_asg_min_size, 0);
    config.asg_bounds.max_size = parse_int("KIT_OPERATOR_ASG_MAX_SIZE", k_default_asg_max_size, 1);
    if (config.asg_bounds.max_size < config.asg_bounds.min_size) {
        logger->warn(
            "Autoscaling group bounds [{}, {}] are inverted; using [{}, {}]",
            config.asg_bounds.min_size,
            config.asg_bounds.max_size,
            k_default_asg_min_size,
            k_default_asg_max_size
        );
        config.asg_bounds = AutoScalingGroupBounds{k_default_asg_min_size, k_default_asg_max_size};
    }

    config.seed.namespace_name = parse_string("KIT_OPERATOR_NAMESPACE", k_default_namespace);
    config.seed.cluster_name = parse_string("KIT_OPERATOR_CLUSTER_NAME", k_default_cluster_name);
    config.seed.instance_count = parse_int("KIT_OPERATOR_INSTANCE_COUNT", k_default_instance_count, 0);

    logger->info(
        "Configuration loaded: workers={} wait_requeue_s={} resync_s={} asg_bounds=[{}, {}] cluster={}",
        config.manager.worker_count,
        config.manager.wait_requeue_delay.count(),
        config.manager.resync_period.count(),
        config.asg_bounds.min_size,
        config.asg_bounds.max_size,
        config.seed.cluster_name
    );

    return config;
}

}  // namespace kit_operator
