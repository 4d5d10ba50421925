#pragma once

#include <SFML/Graphics/RenderWindow.hpp>
#include <SFML/Graphics/View.hpp>

#include <functional>
#include <vector>

namespace ui {

// Per-frame draw queue. Commands run in ascending z order and are cleared after each frame.
class RenderManager {
public:
    struct RenderCommand {
        int zIndex{0};
        std::function<void(sf::RenderTarget&)> drawFunc{};
    };

    RenderManager();

    void addRenderCommand(int z, std::function<void(sf::RenderTarget&)> func);

    void render(sf::RenderWindow& window);

    bool hasCommands() const { return !commands_.empty(); }

    // Keeps the view in pixel coordinates after the window changes size.
    void onResize(sf::Vector2u size);

    sf::Vector2u canvasSize() const { return canvasSize_; }

private:
    std::vector<RenderCommand> commands_;
    sf::Vector2u canvasSize_;
    sf::View windowView_;
    bool viewDirty_{true};
};

}  // namespace ui
