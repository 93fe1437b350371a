#include "upload/conversion_state.hpp"

std::vector<std::string> ConversionState::transferIds() const {
    std::vector<std::string> ids;
    for (const auto& session : sessions) {
        if (!session.transferId.empty()) {
            ids.push_back(session.transferId);
        }
    }
    return ids;
}

std::vector<std::string> ConversionState::diskUuids() const {
    std::vector<std::string> ids;
    for (const auto& session : sessions) {
        ids.push_back(session.diskUuid);
    }
    return ids;
}

bool ConversionState::anyActive() const {
    for (const auto& session : sessions) {
        if (session.isActive()) {
            return true;
        }
    }
    return false;
}
