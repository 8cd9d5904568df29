// === Desired-State Objects ===================================================
//
// Declarative records describing what an external resource should look like.
// The spec is a closed variant; its active alternative is the object's kind,
// so dispatch never inspects types at runtime.

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "kit_operator/status.hpp"
#include "kit_operator/types.hpp"

namespace kit_operator {

/** @brief Identity of a desired-state object: (kind, namespace, name). */
struct ObjectKey final {
    ResourceKind kind{ResourceKind::ControlPlane};
    std::string namespace_name{};
    std::string name{};

    friend bool operator==(const ObjectKey&, const ObjectKey&) = default;
};

/** @brief "kind/namespace/name" rendering for logs. */
[[nodiscard]] std::string to_string(const ObjectKey& key);

struct ObjectKeyHash final {
    std::size_t operator()(const ObjectKey& key) const noexcept;
};

/**
 * @brief Bookkeeping fields shared by every desired-state object.
 */
struct ObjectMeta final {
    std::string namespace_name{};              /**< Namespace the object lives in. */
    std::string name{};                        /**< Unique name; also the external resource name. */
    std::uint64_t resource_version{};          /**< Bumped by the store on every write. */
    std::optional<TimePoint> deletion_timestamp{};  /**< Deletion marker; set once, never unset. */
    std::vector<std::string> finalizers{};     /**< Non-empty while external cleanup is owed. */
    std::optional<ObjectKey> owner{};          /**< Parent object for projected children. */
};

struct ControlPlaneSpec final {
    std::string cluster_name{};
    int instance_count{};  /**< Desired master instance count. */

    friend bool operator==(const ControlPlaneSpec&, const ControlPlaneSpec&) = default;
};

struct AutoScalingGroupSpec final {
    std::string cluster_name{};
    int instance_count{};
    std::string target_group_name{};     /**< Expected target group; object name when empty. */
    std::string launch_template_name{};  /**< Launch template; object name when empty. */

    friend bool operator==(const AutoScalingGroupSpec&, const AutoScalingGroupSpec&) = default;
};

struct NatGatewaySpec final {
    std::string cluster_name{};

    friend bool operator==(const NatGatewaySpec&, const NatGatewaySpec&) = default;
};

/** @brief Alternatives are ordered to match ResourceKind. */
using ObjectSpec = std::variant<ControlPlaneSpec, AutoScalingGroupSpec, NatGatewaySpec>;

/**
 * @brief A desired-state object as held by the store.
 */
struct Object final {
    ObjectMeta metadata{};
    ObjectSpec spec{};
    ObjectStatus status{};

    [[nodiscard]] ResourceKind kind() const noexcept;
    [[nodiscard]] ObjectKey key() const;
    [[nodiscard]] bool is_being_deleted() const noexcept;
    [[nodiscard]] bool has_finalizer(const std::string& token) const;
};

/** @brief Build an object of the kind implied by @p spec. */
[[nodiscard]] Object make_object(std::string namespace_name, std::string name, ObjectSpec spec);

}  // namespace kit_operator
