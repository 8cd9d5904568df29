#include "kit_operator/cloud_api.hpp"

namespace kit_operator {

std::string_view to_string(NatGatewayState state) noexcept {
    switch (state) {
        case NatGatewayState::Pending:
            return "pending";
        case NatGatewayState::Available:
            return "available";
        case NatGatewayState::Deleting:
            return "deleting";
        case NatGatewayState::Deleted:
            return "deleted";
        case NatGatewayState::Failed:
            return "failed";
    }
    return "unknown";
}

}  // namespace kit_operator
