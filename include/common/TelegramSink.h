#pragma once

#include "network/IHttpClient.h"
#include <spdlog/sinks/base_sink.h>
#include <memory>
#include <mutex>
#include <string>

namespace daypilot {

// Posts each formatted message to a Telegram chat through the Bot API.
// Delivery failures go to stderr and are never rethrown into the logger.
class TelegramSink : public spdlog::sinks::base_sink<std::mutex> {
public:
    TelegramSink(std::shared_ptr<network::IHttpClient> client, std::string bot_token, std::string chat_id);

    // Client bound to https://api.telegram.org
    static std::shared_ptr<TelegramSink> create(const std::string& bot_token, const std::string& chat_id);

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override;
    void flush_() override {}

private:
    std::shared_ptr<network::IHttpClient> client_;
    std::string bot_token_;
    std::string chat_id_;
};

} // namespace daypilot
