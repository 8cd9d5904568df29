#include "kit_operator/object.hpp"

#include <algorithm>
#include <functional>
#include <type_traits>
#include <utility>

#include <fmt/format.h>

namespace kit_operator {

namespace {
static_assert(std::is_same_v<std::variant_alternative_t<static_cast<std::size_t>(ResourceKind::ControlPlane), ObjectSpec>, ControlPlaneSpec>);
static_assert(std::is_same_v<std::variant_alternative_t<static_cast<std::size_t>(ResourceKind::AutoScalingGroup), ObjectSpec>, AutoScalingGroupSpec>);
static_assert(std::is_same_v<std::variant_alternative_t<static_cast<std::size_t>(ResourceKind::NatGateway), ObjectSpec>, NatGatewaySpec>);
}  // namespace

std::string to_string(const ObjectKey& key) {
    return fmt::format("{}/{}/{}", to_string(key.kind), key.namespace_name, key.name);
}

std::size_t ObjectKeyHash::operator()(const ObjectKey& key) const noexcept {
    std::size_t seed = std::hash<int>{}(static_cast<int>(key.kind));
    const auto combine = [&seed](std::size_t value) {
        seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    };
    combine(std::hash<std::string>{}(key.namespace_name));
    combine(std::hash<std::string>{}(key.name));
    return seed;
}

ResourceKind Object::kind() const noexcept {
    return static_cast<ResourceKind>(spec.index());
}

ObjectKey Object::key() const {
    return ObjectKey{kind(), metadata.namespace_name, metadata.name};
}

bool Object::is_being_deleted() const noexcept {
    return metadata.deletion_timestamp.has_value();
}

bool Object::has_finalizer(const std::string& token) const {
    const auto& list_finalizers = metadata.finalizers;
    return std::find(list_finalizers.begin(), list_finalizers.end(), token) != list_finalizers.end();
}

Object make_object(std::string namespace_name, std::string name, ObjectSpec spec) {
    Object object{};
    object.metadata.namespace_name = std::move(namespace_name);
    object.metadata.name = std::move(name);
    object.spec = std::move(spec);
    return object;
}

}  // namespace kit_operator
