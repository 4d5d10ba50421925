#include "ui/IndicatorInput.h"

#include "logging/Log.h"

namespace ui {

void IndicatorInput::begin() {
    active_ = true;
    text_.clear();
}

void IndicatorInput::cancel() {
    if (active_) {
        LOG_DEBUG(logging::LogCategory::UI, "indicator entry cancelled");
    }
    active_ = false;
    text_.clear();
}

bool IndicatorInput::append(sf::Uint32 unicode) {
    if (!active_ || unicode < 0x20 || unicode > 0x7E || text_.size() >= kMaxLength) {
        return false;
    }
    text_.push_back(static_cast<char>(unicode));
    return true;
}

void IndicatorInput::erase() {
    if (active_ && !text_.empty()) {
        text_.pop_back();
    }
}

std::optional<std::string> IndicatorInput::submit() {
    if (!active_) {
        return std::nullopt;
    }
    active_ = false;
    std::string value;
    value.swap(text_);
    const auto first = value.find_first_not_of(' ');
    if (first == std::string::npos) {
        return std::nullopt;
    }
    const auto last = value.find_last_not_of(' ');
    return value.substr(first, last - first + 1);
}

}  // namespace ui
