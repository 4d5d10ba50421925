#pragma once

#include <SFML/Graphics/Font.hpp>

#include <filesystem>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace ui {

// Loads fonts once per key and keeps them for the lifetime of the window.
class ResourceProvider {
public:
    struct FontResource {
        std::shared_ptr<sf::Font> font;
        bool ready{false};
    };

    ResourceProvider();
    explicit ResourceProvider(std::filesystem::path root);

    FontResource getFontResource(const std::string& key);

    // nullptr when no candidate could be loaded.
    std::shared_ptr<sf::Font> getFont(const std::string& key);

    std::vector<std::filesystem::path> candidateFontPaths(const std::string& key) const;

private:
    FontResource loadFont_(const std::string& key);

    std::unordered_map<std::string, FontResource> fonts_;
    std::filesystem::path projectRoot_;
};

}  // namespace ui
