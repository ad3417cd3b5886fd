#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace aide::bus {

// One inbound chat message, already normalised by the channel that received it.
// Attachments are paths relative to the working root and already exist on disk.
struct InboundMessage {
    std::int64_t chat_id = 0;
    std::int64_t user_id = 0;
    std::optional<std::int64_t> message_id;
    std::optional<std::string> username;
    std::optional<std::string> first_name;
    std::optional<std::string> last_name;
    std::optional<std::string> text;
    std::optional<std::string> caption;
    std::vector<std::string> attachments;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();

    // Text, else caption, trimmed.
    std::string Body() const;
    // Username, else "first last", else "unknown".
    std::string DisplayName() const;
};

}  // namespace aide::bus
