#include "kit_operator/reconciler.hpp"

#include <stdexcept>
#include <utility>

#include <fmt/format.h>

namespace kit_operator {

void ControllerRegistry::add(ReconcilerPtr reconciler) {
    if (reconciler == nullptr) {
        throw std::invalid_argument("Cannot register a null controller");
    }
    const auto index = static_cast<std::size_t>(reconciler->kind());
    if (index >= k_kind_count) {
        throw std::invalid_argument(fmt::format("Controller {} declares an unknown kind", reconciler->name()));
    }
    if (controllers_[index] != nullptr) {
        throw std::invalid_argument(fmt::format(
            "Controllers {} and {} both handle {}",
            controllers_[index]->name(),
            reconciler->name(),
            to_string(reconciler->kind())
        ));
    }
    controllers_[index] = std::move(reconciler);
    ++count_;
}

Reconciler* ControllerRegistry::find(ResourceKind kind) const noexcept {
    const auto index = static_cast<std::size_t>(kind);
    if (index >= k_kind_count) {
        return nullptr;
    }
    return controllers_[index].get();
}

std::size_t ControllerRegistry::size() const noexcept {
    return count_;
}

}  // namespace kit_operator
