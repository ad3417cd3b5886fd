#include "bus/events.hpp"

#include "utils/common.hpp"

namespace aide::bus {

std::string InboundMessage::Body() const {
    if (text.has_value()) {
        const auto trimmed = aide::utils::Trim(*text);
        if (!trimmed.empty()) {
            return trimmed;
        }
    }
    if (caption.has_value()) {
        return aide::utils::Trim(*caption);
    }
    return {};
}

std::string InboundMessage::DisplayName() const {
    if (username.has_value() && !username->empty()) {
        return *username;
    }
    std::vector<std::string> parts;
    if (first_name.has_value() && !first_name->empty()) {
        parts.push_back(*first_name);
    }
    if (last_name.has_value() && !last_name->empty()) {
        parts.push_back(*last_name);
    }
    if (parts.empty()) {
        return "unknown";
    }
    return aide::utils::Join(parts, " ");
}

}  // namespace aide::bus
