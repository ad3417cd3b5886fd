#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

#include "bus/events.hpp"
#include "store/task_store.hpp"
#include "utils/logging.hpp"

namespace aide::channels {

class ChannelError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A chat transport. Subclasses provide the outbound primitives and the receive loop;
// the base class authorizes inbound messages, answers commands and queues tasks.
class ChannelBase {
public:
    using EnqueueListener = std::function<void(std::int64_t task_id)>;

    ChannelBase(std::string name,
                aide::store::TaskStore& store,
                std::vector<std::string> allow_from,
                std::vector<std::int64_t> allow_chats,
                aide::utils::Logger logger);
    virtual ~ChannelBase() = default;

    virtual std::string Name() const { return name_; }
    virtual void Start() = 0;
    virtual void Stop() = 0;

    // All three throw ChannelError when the transport rejects the call.
    virtual void SendText(std::int64_t chat_id, const std::string& text) = 0;
    virtual void SendFile(std::int64_t chat_id,
                          const std::filesystem::path& path,
                          const std::string& caption) = 0;
    virtual void SendChatAction(std::int64_t chat_id, const std::string& action) = 0;

    bool IsAllowed(const aide::bus::InboundMessage& msg) const;
    void HandleMessage(const aide::bus::InboundMessage& msg);

    void SetEnqueueListener(EnqueueListener listener) { on_enqueued_ = std::move(listener); }

    bool IsRunning() const { return running_; }

    static std::string HelpText();

protected:
    // Best effort; failures are logged.
    void Reply(std::int64_t chat_id, const std::string& text);

    std::string name_;
    aide::store::TaskStore& store_;
    std::vector<std::string> allow_from_;
    std::vector<std::int64_t> allow_chats_;
    aide::utils::Logger logger_;
    bool running_ = false;

private:
    void Enqueue(const aide::bus::InboundMessage& msg, const std::string& text);
    std::string RenderStatus(std::int64_t chat_id);

    EnqueueListener on_enqueued_;
};

}  // namespace aide::channels
