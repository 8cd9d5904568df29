// === Core Types ==============================================================
//
// Collects shared type aliases and lightweight enums used throughout the
// operator (time primitives, resource kinds).

#pragma once

#include <chrono>
#include <string_view>

namespace kit_operator {

/**
 * @brief Alias for the steady clock used for deadlines and requeue timing.
 */
using SteadyClock = std::chrono::steady_clock;

/**
 * @brief Alias for timestamps captured from the steady clock.
 */
using TimePoint = std::chrono::time_point<SteadyClock>;

/**
 * @brief Alias for durations measured in seconds with double precision.
 */
using Duration = std::chrono::duration<double>;

/**
 * @brief Closed set of desired-state object kinds managed by the operator.
 */
enum class ResourceKind {
    ControlPlane,      /**< Parent object fanning out into child resources. */
    AutoScalingGroup,  /**< Autoscaling group running control plane instances. */
    NatGateway         /**< NAT gateway providing egress for private subnets. */
};

/** @brief Lower-case identifier for @p kind, used in logs and queue keys. */
[[nodiscard]] constexpr std::string_view to_string(ResourceKind kind) noexcept {
    switch (kind) {
        case ResourceKind::ControlPlane:
            return "control-plane";
        case ResourceKind::AutoScalingGroup:
            return "auto-scaling-group";
        case ResourceKind::NatGateway:
            return "nat-gateway";
    }
    return "unknown";
}

}  // namespace kit_operator
