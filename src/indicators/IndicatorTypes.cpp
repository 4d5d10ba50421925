#include "indicators/IndicatorTypes.h"

#include <cctype>
#include <sstream>

#include "domain/Errors.h"

namespace indicators {
namespace {

std::string upper(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c)) == 0) {
            out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        }
    }
    return out;
}

}  // namespace

const char* kind_name(IndicatorKind kind) {
    switch (kind) {
    case IndicatorKind::SMA:
        return "SMA";
    case IndicatorKind::EMA:
        return "EMA";
    case IndicatorKind::RSI:
        return "RSI";
    case IndicatorKind::MACD:
        return "MACD";
    case IndicatorKind::StochRSI:
        return "StochRSI";
    }
    return "?";
}

std::optional<IndicatorKind> kind_from_name(std::string_view name) {
    const std::string key = upper(name);
    if (key == "SMA") {
        return IndicatorKind::SMA;
    }
    if (key == "EMA") {
        return IndicatorKind::EMA;
    }
    if (key == "RSI") {
        return IndicatorKind::RSI;
    }
    if (key == "MACD") {
        return IndicatorKind::MACD;
    }
    if (key == "STOCHRSI" || key == "STOCH_RSI") {
        return IndicatorKind::StochRSI;
    }
    return std::nullopt;
}

std::string IndicatorSpec::label() const {
    std::ostringstream oss;
    oss << kind_name(kind) << " (";
    for (std::size_t i = 0; i < params.size(); ++i) {
        if (i > 0) {
            oss << ',';
        }
        oss << params[i];
    }
    oss << ')';
    return oss.str();
}

std::size_t IndicatorSpecHash::operator()(const IndicatorSpec& spec) const noexcept {
    std::size_t h = std::hash<int>{}(static_cast<int>(spec.kind));
    for (int p : spec.params) {
        h ^= std::hash<int>{}(p) + 0x9e3779b9U + (h << 6) + (h >> 2);
    }
    return h;
}

IndicatorSpec parse_spec(std::string_view text) {
    const auto colon = text.find(':');
    const std::string_view namePart = colon == std::string_view::npos ? text : text.substr(0, colon);
    const auto kind = kind_from_name(namePart);
    if (!kind) {
        throw domain::ConfigError("unknown indicator kind '" + std::string(namePart) + "'");
    }

    IndicatorSpec spec;
    spec.kind = *kind;
    if (colon == std::string_view::npos) {
        return spec;
    }

    std::istringstream input{std::string(text.substr(colon + 1))};
    std::string token;
    while (std::getline(input, token, ',')) {
        std::size_t consumed = 0;
        int value = 0;
        try {
            value = std::stoi(token, &consumed, 10);
        }
        catch (const std::exception&) {
            throw domain::ConfigError("invalid parameter '" + token + "' in '" + std::string(text) + "'");
        }
        while (consumed < token.size() && std::isspace(static_cast<unsigned char>(token[consumed])) != 0) {
            ++consumed;
        }
        if (consumed != token.size()) {
            throw domain::ConfigError("invalid parameter '" + token + "' in '" + std::string(text) + "'");
        }
        spec.params.push_back(value);
    }
    return spec;
}

}  // namespace indicators
