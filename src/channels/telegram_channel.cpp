#include "channels/telegram_channel.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <tgbot/net/CurlHttpClient.h>

#include "utils/common.hpp"

namespace aide::channels {
namespace {

std::string Slug(const std::string& text) {
    std::string slug;
    for (const auto ch : text) {
        const auto c = static_cast<unsigned char>(ch);
        if (c < 0x80 && std::isalnum(c)) {
            slug.push_back(static_cast<char>(std::tolower(c)));
        } else if (!slug.empty() && slug.back() != '-') {
            slug.push_back('-');
        }
    }
    while (!slug.empty() && slug.back() == '-') {
        slug.pop_back();
    }
    if (slug.size() > 64) {
        slug.resize(64);
    }
    return slug.empty() ? "file" : slug;
}

std::string MessageStamp(std::time_t unix_time) {
    std::tm utc_time{};
    gmtime_r(&unix_time, &utc_time);
    std::ostringstream oss;
    oss << std::put_time(&utc_time, "%Y%m%d-%H%M%S");
    return oss.str();
}

std::filesystem::path UniquePath(const std::filesystem::path& dir, const std::string& stem,
                                 const std::string& suffix) {
    auto candidate = dir / (stem + suffix);
    for (int index = 1; std::filesystem::exists(candidate) && index < 1000; ++index) {
        candidate = dir / (stem + "-" + std::to_string(index) + suffix);
    }
    if (std::filesystem::exists(candidate)) {
        throw ChannelError("cannot allocate a file name for " + stem + suffix);
    }
    return candidate;
}

template <typename T>
std::optional<std::string> NonEmpty(const T& value) {
    if (value.empty()) {
        return std::nullopt;
    }
    return std::string(value);
}

}  // namespace

TelegramChannel::TelegramChannel(const aide::config::Config& config,
                                 aide::store::TaskStore& store,
                                 aide::utils::Logger logger)
    : ChannelBase("telegram", store, config.telegram.allow_from, config.telegram.allow_chats,
                  std::move(logger))
    , config_(config.telegram)
    , root_(config.root) {
    const bool use_curl = std::getenv("AIDE_TELEGRAM_USE_CURL") != nullptr ||
                          std::getenv("HTTPS_PROXY") != nullptr ||
                          std::getenv("https_proxy") != nullptr ||
                          std::getenv("ALL_PROXY") != nullptr ||
                          std::getenv("all_proxy") != nullptr;
    if (use_curl) {
#ifdef HAVE_CURL
        http_client_ = std::make_unique<TgBot::CurlHttpClient>();
        bot_ = std::make_unique<TgBot::Bot>(config_.token, *http_client_);
        logger_.Info("bot initialized with CurlHttpClient (proxy-aware)");
#else
        bot_ = std::make_unique<TgBot::Bot>(config_.token);
        logger_.Warn("curl not available, using BoostHttpOnlySslClient");
#endif
    } else {
        bot_ = std::make_unique<TgBot::Bot>(config_.token);
    }
}

TelegramChannel::~TelegramChannel() {
    Stop();
}

void TelegramChannel::Start() {
    if (running_) {
        return;
    }
    running_ = true;
    polling_ = true;
    polling_thread_ = std::thread([this]() { PollLoop(); });
}

void TelegramChannel::Stop() {
    polling_ = false;
    if (polling_thread_.joinable()) {
        polling_thread_.join();
    }
    running_ = false;
}

void TelegramChannel::PollLoop() {
    long long cursor = 0;
    try {
        cursor = std::stoll(store_.GetMeta(kUpdateCursorKey, "0"));
    } catch (const std::logic_error&) {
        logger_.Warn("ignoring malformed update cursor");
    } catch (const aide::store::StoreError& ex) {
        logger_.Error(std::string("cannot read update cursor: ") + ex.what());
    }
    logger_.Info("polling from update_id=" + std::to_string(cursor + 1));
    while (polling_) {
        std::vector<TgBot::Update::Ptr> updates;
        try {
            updates = bot_->getApi().getUpdates(
                static_cast<std::int32_t>(cursor + 1), 100, config_.poll_timeout_s);
        } catch (const TgBot::TgException& ex) {
            logger_.Error(std::string("getUpdates failed: ") + ex.what());
            std::this_thread::sleep_for(std::chrono::seconds(3));
            continue;
        } catch (const std::exception& ex) {
            logger_.Error(std::string("polling error: ") + ex.what());
            std::this_thread::sleep_for(std::chrono::seconds(3));
            continue;
        }
        for (const auto& update : updates) {
            if (!update) {
                continue;
            }
            try {
                HandleUpdate(update);
            } catch (const std::exception& ex) {
                logger_.Error("update " + std::to_string(update->updateId) + " failed: " + ex.what());
            }
            cursor = std::max<long long>(cursor, update->updateId);
            try {
                store_.SetMeta(kUpdateCursorKey, std::to_string(cursor));
            } catch (const aide::store::StoreError& ex) {
                logger_.Error(std::string("cannot persist update cursor: ") + ex.what());
            }
        }
    }
    logger_.Info("polling stopped");
}

void TelegramChannel::HandleUpdate(const TgBot::Update::Ptr& update) {
    const auto& message = update->message;
    if (!message || !message->chat) {
        return;
    }
    auto inbound = ToInbound(message);
    if (!IsAllowed(inbound)) {
        HandleMessage(inbound);
        return;
    }
    inbound.attachments = DownloadAttachments(message);
    HandleMessage(inbound);
}

aide::bus::InboundMessage TelegramChannel::ToInbound(const TgBot::Message::Ptr& message) {
    aide::bus::InboundMessage inbound{};
    inbound.chat_id = message->chat->id;
    inbound.message_id = message->messageId;
    if (message->from) {
        inbound.user_id = message->from->id;
        inbound.username = NonEmpty(message->from->username);
        inbound.first_name = NonEmpty(message->from->firstName);
        inbound.last_name = NonEmpty(message->from->lastName);
    }
    inbound.text = NonEmpty(message->text);
    inbound.caption = NonEmpty(message->caption);
    inbound.timestamp = std::chrono::system_clock::from_time_t(static_cast<std::time_t>(message->date));
    return inbound;
}

std::vector<std::string> TelegramChannel::DownloadAttachments(const TgBot::Message::Ptr& message) {
    const auto stamp = MessageStamp(static_cast<std::time_t>(message->date));
    const auto id = std::to_string(message->messageId);
    std::vector<std::pair<std::string, std::string>> files;
    if (!message->photo.empty() && message->photo.back()) {
        files.emplace_back(message->photo.back()->fileId, "photo-" + id + ".jpg");
    }
    if (message->document) {
        const auto& name = message->document->fileName;
        files.emplace_back(message->document->fileId, name.empty() ? "document-" + id : name);
    }
    if (message->voice) {
        files.emplace_back(message->voice->fileId, "voice-" + id + ".ogg");
    }
    if (message->audio) {
        const auto& name = message->audio->fileName;
        files.emplace_back(message->audio->fileId, name.empty() ? "audio-" + id + ".mp3" : name);
    }

    std::vector<std::string> paths;
    for (const auto& [file_id, hint] : files) {
        try {
            paths.push_back(DownloadOne(file_id, hint, stamp));
        } catch (const TgBot::TgException& ex) {
            logger_.Warn("attachment download failed: " + std::string(ex.what()));
        } catch (const std::exception& ex) {
            logger_.Warn("attachment download error: " + std::string(ex.what()));
        }
    }
    return paths;
}

std::string TelegramChannel::DownloadOne(const std::string& file_id,
                                         const std::string& name_hint,
                                         const std::string& stamp) {
    const auto file = bot_->getApi().getFile(file_id);
    if (!file || file->filePath.empty()) {
        throw ChannelError("no download path for file " + file_id);
    }
    const std::filesystem::path hint(name_hint);
    auto suffix = std::filesystem::path(file->filePath).extension().string();
    if (suffix.empty()) {
        suffix = hint.extension().string();
    }
    if (suffix.empty()) {
        suffix = ".bin";
    }

    const auto dir = root_ / config_.attachments_dir;
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw ChannelError("cannot create " + dir.string() + ": " + ec.message());
    }
    const auto target = UniquePath(dir, stamp + "-" + Slug(hint.stem().string()), suffix);
    const auto content = bot_->getApi().downloadFile(file->filePath);
    std::ofstream output(target, std::ios::binary);
    output.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!output) {
        throw ChannelError("cannot write " + target.string());
    }
    return target.lexically_relative(root_).generic_string();
}

void TelegramChannel::SendText(std::int64_t chat_id, const std::string& text) {
    try {
        for (const auto& chunk : aide::utils::ChunkText(text, kMaxMessageChars)) {
            bot_->getApi().sendMessage(chat_id, chunk);
        }
    } catch (const TgBot::TgException& ex) {
        throw ChannelError(std::string("sendMessage failed: ") + ex.what());
    } catch (const std::exception& ex) {
        throw ChannelError(std::string("sendMessage error: ") + ex.what());
    }
}

void TelegramChannel::SendFile(std::int64_t chat_id,
                               const std::filesystem::path& path,
                               const std::string& caption) {
    try {
        auto input = TgBot::InputFile::fromFile(path.string(), "application/octet-stream");
        input->fileName = path.filename().string();
        bot_->getApi().sendDocument(chat_id, input, std::string(), caption);
    } catch (const TgBot::TgException& ex) {
        throw ChannelError(std::string("sendDocument failed: ") + ex.what());
    } catch (const std::exception& ex) {
        throw ChannelError("cannot read " + path.string() + ": " + ex.what());
    }
}

void TelegramChannel::SendChatAction(std::int64_t chat_id, const std::string& action) {
    try {
        bot_->getApi().sendChatAction(chat_id, action);
    } catch (const TgBot::TgException& ex) {
        throw ChannelError(std::string("sendChatAction failed: ") + ex.what());
    } catch (const std::exception& ex) {
        throw ChannelError(std::string("sendChatAction error: ") + ex.what());
    }
}

}  // namespace aide::channels
