#include "ui/HUD.h"

#include <SFML/Graphics/CircleShape.hpp>
#include <SFML/Graphics/RectangleShape.hpp>
#include <SFML/Graphics/Text.hpp>

#include <cmath>

#include "logging/Log.h"
#include "ui/Palette.h"

namespace ui {

namespace {
constexpr float kPad = 12.f;
constexpr float kButtonWidth = 44.f;
constexpr float kButtonHeight = 26.f;
constexpr float kChipTextInset = 8.f;
constexpr float kCloseWidth = 18.f;
constexpr float kChipGap = 8.f;
constexpr float kFallbackCharWidth = 7.f;
constexpr unsigned kFontSize = 14;
constexpr unsigned kChipFontSize = 12;

sf::Text makeText(const sf::Font& font, const std::string& value, unsigned size, sf::Color color) {
    sf::Text text;
    text.setFont(font);
    text.setCharacterSize(size);
    text.setString(value);
    text.setFillColor(color);
    return text;
}

float textWidth(const sf::Font* font, const std::string& value, unsigned size) {
    if (font == nullptr) {
        return kFallbackCharWidth * static_cast<float>(value.size());
    }
    return makeText(*font, value, size, sf::Color::White).getLocalBounds().width;
}

std::string chipText(const HudChip& chip) {
    return chip.failed ? chip.label + " !" : chip.label;
}
}  // namespace

const char* HUD::badgeText(FeedBadge badge) {
    switch (badge) {
    case FeedBadge::Live:
        return "LIVE";
    case FeedBadge::Connecting:
        return "CONNECTING...";
    case FeedBadge::Reconnecting:
        return "RECONNECTING...";
    }
    return "";
}

float HUD::height(const HudModel& model) const {
    return kToolbarHeight + (model.chips.empty() ? 0.f : kChipsHeight);
}

void HUD::layout(const HudModel& model, const sf::Font* font) {
    buttons_.clear();
    chips_.clear();

    const float buttonTop = (kToolbarHeight - kButtonHeight) * 0.5f;
    float x = kPad;
    if (font != nullptr) {
        x += textWidth(font, model.symbol, kFontSize + 2) + 2.f * kPad;
    }
    for (domain::Timeframe tf : domain::kAllTimeframes) {
        buttons_.emplace_back(sf::FloatRect(x, buttonTop, kButtonWidth, kButtonHeight), tf);
        x += kButtonWidth + 4.f;
    }
    hintX_ = x + kPad;

    float chipX = kPad;
    const float chipTop = kToolbarHeight + 3.f;
    const float chipHeight = kChipsHeight - 6.f;
    for (const auto& chip : model.chips) {
        const float labelWidth = textWidth(font, chipText(chip), kChipFontSize);
        const float boxWidth = kChipTextInset + labelWidth + kChipTextInset + kCloseWidth;
        ChipLayout placed;
        placed.id = chip.id;
        placed.box = sf::FloatRect(chipX, chipTop, boxWidth, chipHeight);
        placed.close = sf::FloatRect(chipX + boxWidth - kCloseWidth, chipTop, kCloseWidth, chipHeight);
        chips_.push_back(placed);
        chipX += boxWidth + kChipGap;
    }
}

void HUD::draw(sf::RenderTarget& target, const HudModel& model, const sf::Font* font) {
    const sf::Vector2u windowSize = target.getSize();
    if (windowSize.x == 0 || windowSize.y == 0) {
        return;
    }
    const float width = static_cast<float>(windowSize.x);

    sf::RectangleShape bar({width, height(model)});
    bar.setFillColor(palette::kToolbar);
    target.draw(bar);

    layout(model, font);
    const float buttonTop = (kToolbarHeight - kButtonHeight) * 0.5f;

    if (font == nullptr) {
        if (!fontWarningLogged_) {
            LOG_WARN(logging::LogCategory::UI, "HUD: font not available, toolbar text disabled.");
            fontWarningLogged_ = true;
        }
    }
    else {
        auto symbol = makeText(*font, model.symbol, kFontSize + 2, palette::kTextBright);
        symbol.setStyle(sf::Text::Bold);
        symbol.setPosition(kPad, buttonTop + 3.f);
        target.draw(symbol);
    }

    for (const auto& button : buttons_) {
        const sf::FloatRect& rect = button.first;
        const bool selected = button.second == model.timeframe;
        if (selected) {
            sf::RectangleShape active({rect.width, rect.height});
            active.setPosition(rect.left, rect.top);
            active.setFillColor(palette::kButtonActive);
            target.draw(active);
        }
        if (font != nullptr) {
            auto label = makeText(*font, domain::timeframe_label(button.second), kFontSize,
                                  selected ? palette::kTextBright : palette::kText);
            const auto bounds = label.getLocalBounds();
            label.setPosition(rect.left + (rect.width - bounds.width) * 0.5f - bounds.left, rect.top + 4.f);
            target.draw(label);
        }
    }

    if (font != nullptr) {
        if (model.entry) {
            auto prompt = makeText(*font, "Add indicator: " + *model.entry + "_", kChipFontSize, palette::kTextBright);
            prompt.setPosition(hintX_, buttonTop + 5.f);
            target.draw(prompt);
        }
        else {
            auto hint = makeText(*font, "Indicators: S E R M K  Enter: type KIND:p1,p2", kChipFontSize, palette::kText);
            hint.setPosition(hintX_, buttonTop + 5.f);
            target.draw(hint);
        }

        const sf::Color badgeColor = model.badge == FeedBadge::Live ? palette::kLiveBadge : palette::kPendingBadge;
        auto badge = makeText(*font, badgeText(model.badge), kFontSize, badgeColor);
        const auto bounds = badge.getLocalBounds();
        const float badgeX = width - kPad - bounds.width;
        badge.setPosition(badgeX, buttonTop + 4.f);
        target.draw(badge);

        if (model.badge == FeedBadge::Live) {
            const float pulse = 0.5f + 0.5f * std::sin(model.clock * 4.f);
            sf::Color dotColor = palette::kLiveBadge;
            dotColor.a = static_cast<sf::Uint8>(120 + 135 * pulse);
            sf::CircleShape dot(4.f);
            dot.setFillColor(dotColor);
            dot.setPosition(badgeX - 14.f, kToolbarHeight * 0.5f - 4.f);
            target.draw(dot);
        }
    }

    if (font == nullptr) {
        return;
    }
    for (std::size_t i = 0; i < chips_.size() && i < model.chips.size(); ++i) {
        const auto& chip = model.chips[i];
        const auto& placed = chips_[i];
        sf::RectangleShape box({placed.box.width, placed.box.height});
        box.setPosition(placed.box.left, placed.box.top);
        box.setFillColor(palette::kButtonActive);
        target.draw(box);

        auto label = makeText(*font, chipText(chip), kChipFontSize,
                              chip.failed ? palette::kFailedChip : palette::kTextBright);
        label.setPosition(placed.box.left + kChipTextInset, placed.box.top + 3.f);
        target.draw(label);

        auto close = makeText(*font, "x", kChipFontSize, palette::kText);
        const auto bounds = close.getLocalBounds();
        close.setPosition(placed.close.left + (placed.close.width - bounds.width) * 0.5f - bounds.left,
                          placed.close.top + 3.f);
        target.draw(close);
    }
}

std::optional<domain::Timeframe> HUD::timeframeAt(sf::Vector2f point) const {
    for (const auto& button : buttons_) {
        if (button.first.contains(point)) {
            return button.second;
        }
    }
    return std::nullopt;
}

std::optional<std::uint64_t> HUD::indicatorAt(sf::Vector2f point) const {
    for (const auto& chip : chips_) {
        if (chip.close.contains(point)) {
            return chip.id;
        }
    }
    return std::nullopt;
}

}  // namespace ui
