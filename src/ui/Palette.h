#pragma once

#include <SFML/Graphics/Color.hpp>

namespace ui::palette {

inline const sf::Color kBackground(0x0D, 0x11, 0x17);
inline const sf::Color kGrid(0x21, 0x26, 0x2D);
inline const sf::Color kText(0x8B, 0x94, 0x9E);
inline const sf::Color kTextBright(0xE6, 0xED, 0xF3);
inline const sf::Color kToolbar(0x16, 0x1B, 0x22);
inline const sf::Color kButtonActive(0x30, 0x36, 0x3D);

inline const sf::Color kUp(0x3F, 0xB9, 0x50);
inline const sf::Color kDown(0xF8, 0x51, 0x49);
// rgba(..., 0.4)
inline const sf::Color kVolumeUp(0x3F, 0xB9, 0x50, 102);
inline const sf::Color kVolumeDown(0xF8, 0x51, 0x49, 102);

inline const sf::Color kSma(0xFF, 0x98, 0x00);
inline const sf::Color kEma(0x29, 0x62, 0xFF);
inline const sf::Color kRsi(0xA8, 0x55, 0xF7);
inline const sf::Color kMacdLine(0x29, 0x62, 0xFF);
inline const sf::Color kMacdSignal(0xFF, 0x6D, 0x00);
inline const sf::Color kMacdHistUp(0x26, 0xA6, 0x9A);
inline const sf::Color kMacdHistDown(0xEF, 0x53, 0x50);
inline const sf::Color kStochK(0x29, 0x62, 0xFF);
inline const sf::Color kStochD(0xFF, 0x6D, 0x00);

inline const sf::Color kLiveBadge(0x3F, 0xB9, 0x50);
inline const sf::Color kPendingBadge(0xD2, 0x99, 0x22);
inline const sf::Color kFailedChip(0xF8, 0x51, 0x49);

}  // namespace ui::palette
