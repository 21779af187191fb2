#include "common/Types.h"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace daypilot {

namespace {
std::string toUpperCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}
}

double Candle::body() const {
    return std::abs(close - open);
}

double Candle::range() const {
    return high - low;
}

const char* toString(Direction direction) {
    switch (direction) {
        case Direction::BUY: return "BUY";
        case Direction::SELL: return "SELL";
        case Direction::NONE: return "NONE";
    }
    return "NONE";
}

const char* toString(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::BREAKOUT: return "BREAKOUT";
        case StrategyKind::REVERSION: return "REVERSION";
    }
    return "REVERSION";
}

std::optional<Direction> parseDirection(const std::string& text) {
    const std::string upper = toUpperCopy(text);
    if (upper == "BUY") return Direction::BUY;
    if (upper == "SELL") return Direction::SELL;
    return std::nullopt;
}

std::optional<StrategyKind> parseStrategyKind(const std::string& text) {
    const std::string upper = toUpperCopy(text);
    if (upper == "BREAKOUT") return StrategyKind::BREAKOUT;
    if (upper == "REVERSION") return StrategyKind::REVERSION;
    return std::nullopt;
}

double roundTo2(double value) {
    return std::round(value * 100.0) / 100.0;
}

} // namespace daypilot
