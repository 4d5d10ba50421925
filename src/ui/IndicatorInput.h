#pragma once

#include <SFML/Config.hpp>

#include <cstddef>
#include <optional>
#include <string>

namespace ui {

// Line editor for typing an indicator as `KIND:p1,p2,p3`.
// Fed from sf::Event::TextEntered; Enter and Escape arrive as key presses.
class IndicatorInput {
public:
    static constexpr std::size_t kMaxLength = 32;

    void begin();
    void cancel();
    bool active() const noexcept { return active_; }
    const std::string& text() const noexcept { return text_; }

    // Printable ASCII only; returns false when the character was dropped.
    bool append(sf::Uint32 unicode);
    void erase();

    // Ends entry. Returns the trimmed text, or nullopt when nothing was typed.
    std::optional<std::string> submit();

private:
    bool active_{false};
    std::string text_;
};

}  // namespace ui
