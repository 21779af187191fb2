#include "common/TelegramSink.h"
#include "network/HttpClient.h"
#include <iostream>

namespace daypilot {

TelegramSink::TelegramSink(std::shared_ptr<network::IHttpClient> client, std::string bot_token,
                           std::string chat_id)
    : client_(std::move(client))
    , bot_token_(std::move(bot_token))
    , chat_id_(std::move(chat_id))
{}

std::shared_ptr<TelegramSink> TelegramSink::create(const std::string& bot_token, const std::string& chat_id) {
    auto client = std::make_shared<network::HttpClient>("https://api.telegram.org", 10);
    return std::make_shared<TelegramSink>(client, bot_token, chat_id);
}

void TelegramSink::sink_it_(const spdlog::details::log_msg& msg) {
    spdlog::memory_buf_t formatted;
    formatter_->format(msg, formatted);
    std::string text = fmt::to_string(formatted);
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }

    std::map<std::string, std::string> form;
    form["chat_id"] = chat_id_;
    form["text"] = text;

    try {
        const auto response = client_->postForm("/bot" + bot_token_ + "/sendMessage", form);
        if (!response.isSuccess()) {
            std::cerr << "Telegram alert rejected: HTTP " << response.status_code << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "Telegram alert failed: " << e.what() << std::endl;
    }
}

} // namespace daypilot
