#include "ui/ResourceProvider.h"

#include "logging/Log.h"

#include <array>
#include <system_error>
#include <utility>

namespace ui {

namespace {

constexpr std::array<const char*, 4> kSystemFonts{
    "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
    "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
    "/usr/share/fonts/truetype/freefont/FreeSans.ttf",
    "/usr/share/fonts/TTF/DejaVuSans.ttf"};

bool pathExists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

}  // namespace

ResourceProvider::ResourceProvider()
    : ResourceProvider(std::filesystem::current_path()) {}

ResourceProvider::ResourceProvider(std::filesystem::path root)
    : projectRoot_(std::move(root)) {}

ResourceProvider::FontResource ResourceProvider::getFontResource(const std::string& key) {
    if (auto it = fonts_.find(key); it != fonts_.end()) {
        return it->second;
    }
    auto loaded = loadFont_(key);
    fonts_.emplace(key, loaded);
    return loaded;
}

std::shared_ptr<sf::Font> ResourceProvider::getFont(const std::string& key) {
    auto resource = getFontResource(key);
    return resource.ready ? resource.font : nullptr;
}

ResourceProvider::FontResource ResourceProvider::loadFont_(const std::string& key) {
    FontResource resource;
    resource.font = std::make_shared<sf::Font>();
    for (const auto& path : candidateFontPaths(key)) {
        if (pathExists(path) && resource.font->loadFromFile(path.string())) {
            LOG_DEBUG(logging::LogCategory::UI, "Loaded font from %s", path.string().c_str());
            resource.ready = true;
            return resource;
        }
    }

    for (const char* candidate : kSystemFonts) {
        if (pathExists(candidate) && resource.font->loadFromFile(candidate)) {
            LOG_INFO(logging::LogCategory::UI, "Loaded system font from %s", candidate);
            resource.ready = true;
            return resource;
        }
    }

    LOG_ERROR(logging::LogCategory::UI, "Unable to load font for key %s. Text rendering disabled.", key.c_str());
    return resource;
}

std::vector<std::filesystem::path> ResourceProvider::candidateFontPaths(const std::string& key) const {
    std::vector<std::filesystem::path> paths;
    if (key == "ui" || key == "default") {
        paths.emplace_back(projectRoot_ / "assets" / "Inter-Regular.ttf");
        paths.emplace_back(projectRoot_ / "resources" / "Inter-Regular.ttf");
        paths.emplace_back(projectRoot_ / "assets" / "DejaVuSans.ttf");
    }
    else {
        paths.emplace_back(projectRoot_ / key);
        paths.emplace_back(projectRoot_ / "assets" / key);
        paths.emplace_back(projectRoot_ / "resources" / key);
    }
    return paths;
}

}  // namespace ui
