#include "kit_operator/status.hpp"

#include <utility>

namespace kit_operator {

std::string_view to_string(ResourceStatus status) noexcept {
    switch (status) {
        case ResourceStatus::Waiting:
            return "Waiting";
        case ResourceStatus::Created:
            return "Created";
        case ResourceStatus::Terminated:
            return "Terminated";
        case ResourceStatus::Error:
            return "Error";
    }
    return "Unknown";
}

ReconcileResult::ReconcileResult(ResultKind kind, ResourceStatus status, std::string reason)
    : kind_(kind),
      status_(status),
      str_reason_(std::move(reason)) {}

ReconcileResult ReconcileResult::created() {
    return ReconcileResult{ResultKind::Done, ResourceStatus::Created, {}};
}

ReconcileResult ReconcileResult::terminated() {
    return ReconcileResult{ResultKind::Done, ResourceStatus::Terminated, {}};
}

ReconcileResult ReconcileResult::wait(std::string reason) {
    return ReconcileResult{ResultKind::Wait, ResourceStatus::Waiting, std::move(reason)};
}

ReconcileResult ReconcileResult::fatal(std::string reason) {
    return ReconcileResult{ResultKind::Fatal, ResourceStatus::Error, std::move(reason)};
}

ResultKind ReconcileResult::kind() const noexcept {
    return kind_;
}

ResourceStatus ReconcileResult::status() const noexcept {
    return status_;
}

const std::string& ReconcileResult::reason() const noexcept {
    return str_reason_;
}

}  // namespace kit_operator
