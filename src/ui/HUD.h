#pragma once

#include <SFML/Graphics/Font.hpp>
#include <SFML/Graphics/Rect.hpp>
#include <SFML/Graphics/RenderTarget.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "domain/Types.h"

namespace ui {

enum class FeedBadge { Connecting, Live, Reconnecting };

struct HudChip {
    std::uint64_t id{0};
    std::string label;
    bool failed{false};
};

struct HudModel {
    std::string symbol;
    domain::Timeframe timeframe{domain::Timeframe::D1};
    FeedBadge badge{FeedBadge::Connecting};
    std::vector<HudChip> chips;
    // Text typed so far while an indicator is being entered.
    std::optional<std::string> entry;
    // Seconds since start; drives the live dot pulse.
    float clock{0.f};
};

// Toolbar row (symbol, timeframe buttons, status badge) and the indicator chips row.
class HUD {
public:
    static constexpr float kToolbarHeight = 40.f;
    static constexpr float kChipsHeight = 28.f;

    float height(const HudModel& model) const;

    // Places buttons and chips; without a font, text widths are estimated per character.
    void layout(const HudModel& model, const sf::Font* font);

    void draw(sf::RenderTarget& target, const HudModel& model, const sf::Font* font);

    // Hit-tests against the last layout.
    std::optional<domain::Timeframe> timeframeAt(sf::Vector2f point) const;
    // Indicator whose close box is under the point.
    std::optional<std::uint64_t> indicatorAt(sf::Vector2f point) const;

    static const char* badgeText(FeedBadge badge);

private:
    struct ChipLayout {
        std::uint64_t id{0};
        sf::FloatRect box;
        sf::FloatRect close;
    };

    std::vector<std::pair<sf::FloatRect, domain::Timeframe>> buttons_;
    std::vector<ChipLayout> chips_;
    float hintX_{0.f};
    bool fontWarningLogged_{false};
};

}  // namespace ui
