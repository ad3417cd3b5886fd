#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <tgbot/tgbot.h>

#include "channels/channel_base.hpp"
#include "config/config_schema.hpp"

namespace aide::channels {

class TelegramChannel : public ChannelBase {
public:
    static constexpr std::size_t kMaxMessageChars = 4096;
    static constexpr const char* kUpdateCursorKey = "last_update_id";

    TelegramChannel(const aide::config::Config& config,
                    aide::store::TaskStore& store,
                    aide::utils::Logger logger);
    ~TelegramChannel() override;

    void Start() override;
    void Stop() override;

    void SendText(std::int64_t chat_id, const std::string& text) override;
    void SendFile(std::int64_t chat_id,
                  const std::filesystem::path& path,
                  const std::string& caption) override;
    void SendChatAction(std::int64_t chat_id, const std::string& action) override;

private:
    void PollLoop();
    void HandleUpdate(const TgBot::Update::Ptr& update);
    aide::bus::InboundMessage ToInbound(const TgBot::Message::Ptr& message);
    std::vector<std::string> DownloadAttachments(const TgBot::Message::Ptr& message);
    std::string DownloadOne(const std::string& file_id,
                            const std::string& name_hint,
                            const std::string& stamp);

    aide::config::TelegramConfig config_;
    std::filesystem::path root_;
    std::unique_ptr<TgBot::HttpClient> http_client_;
    std::unique_ptr<TgBot::Bot> bot_;
    std::thread polling_thread_;
    std::atomic<bool> polling_{false};
};

}  // namespace aide::channels
