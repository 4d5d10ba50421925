#pragma once

#include <SFML/Graphics/RenderWindow.hpp>
#include <SFML/System/Clock.hpp>
#include <SFML/Window/Event.hpp>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <memory>
#include <string>

#include "config/Config.h"
#include "core/EventBus.h"
#include "core/TimeSeriesStore.h"
#include "infra/http/HttpClient.h"
#include "ui/HUD.h"
#include "ui/IndicatorInput.h"
#include "ui/RenderManager.h"
#include "ui/ResourceProvider.h"

namespace sf {
class Font;
}

namespace infra::feed {
class SeriesApiClient;
}

namespace ui {
class RenderSurface;
}

namespace app {

class ChartController;
class LiveFeed;

// Window host: owns the event loop, the chart session and the input bindings.
class Application {
public:
    Application(const config::Config& config, const infra::http::Url& feedUrl);
    ~Application();

    void run();

private:
    void handleEvent(const sf::Event& event);
    void handleKey(sf::Keyboard::Key key);
    void applyPresets();
    void addFromText(const std::string& text);
    bool handleEntryKey(sf::Keyboard::Key key);
    void syncSurfaceSize();
    ui::HudModel buildHudModel() const;
    void enqueueFrame();

    config::Config config_;
    boost::asio::io_context ioc_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    sf::RenderWindow window_;
    sf::Clock clock_;

    core::EventBus eventBus_;
    core::TimeSeriesStore store_;
    std::unique_ptr<infra::feed::SeriesApiClient> source_;
    std::unique_ptr<LiveFeed> feed_;
    std::unique_ptr<ui::RenderSurface> surface_;
    std::unique_ptr<ChartController> chart_;

    ui::RenderManager renderManager_;
    ui::ResourceProvider resourceProvider_;
    ui::HUD hud_;
    ui::IndicatorInput entry_;
    std::shared_ptr<sf::Font> font_;
    float lastHudHeight_{0.f};
};

}  // namespace app
