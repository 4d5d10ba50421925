#include "app/Application.h"

#include <SFML/Window/VideoMode.hpp>

#include <chrono>
#include <exception>
#include <string>

#include "app/ChartController.h"
#include "app/LiveFeed.h"
#include "domain/Errors.h"
#include "indicators/IndicatorTypes.h"
#include "infra/feed/SeriesApiClient.h"
#include "logging/Log.h"
#include "ui/RenderSurface.h"

namespace app {

namespace {
constexpr unsigned kFrameRate = 60;
constexpr const char* kWindowTitle = "LiveChart";

// Default inputs applied by the indicator keys.
constexpr const char* kSmaPreset = "SMA:20";
constexpr const char* kEmaPreset = "EMA:20";
constexpr const char* kRsiPreset = "RSI:14";
constexpr const char* kMacdPreset = "MACD:12,26,9";
constexpr const char* kStochRsiPreset = "StochRSI:14,14";

sf::VideoMode videoModeFor(const config::Config& config) {
    if (config.windowFullscreen) {
        return sf::VideoMode::getDesktopMode();
    }
    return sf::VideoMode(static_cast<unsigned>(config.windowWidth), static_cast<unsigned>(config.windowHeight));
}

domain::SeriesKey initialKey(const config::Config& config) {
    domain::SeriesKey key;
    key.symbol = config.symbol;
    key.timeframe = domain::timeframe_from_label(config.timeframe).value_or(domain::Timeframe::D1);
    return key;
}
}  // namespace

Application::Application(const config::Config& config, const infra::http::Url& feedUrl)
    : config_(config),
      work_(boost::asio::make_work_guard(ioc_)),
      window_(videoModeFor(config), kWindowTitle, config.windowFullscreen ? sf::Style::Fullscreen : sf::Style::Default) {
    window_.setFramerateLimit(kFrameRate);
    font_ = resourceProvider_.getFont("ui");
    renderManager_.onResize(window_.getSize());

    source_ = std::make_unique<infra::feed::SeriesApiClient>(ioc_, feedUrl, config_.fetchTimeoutSec);
    feed_ = std::make_unique<LiveFeed>(ioc_, *source_, store_, eventBus_,
                                       std::chrono::seconds(config_.pollIntervalSec));

    const sf::Vector2u size = window_.getSize();
    lastHudHeight_ = ui::HUD::kToolbarHeight;
    surface_ = std::make_unique<ui::RenderSurface>(
        ioc_,
        std::chrono::milliseconds(config_.resizeDebounceMs),
        ui::SurfaceSize{size.x, size.y > lastHudHeight_ ? size.y - static_cast<unsigned>(lastHudHeight_) : 1U});
    chart_ = std::make_unique<ChartController>(store_, eventBus_, *feed_, *surface_);

    LOG_INFO(logging::LogCategory::UI,
             "LiveChart %ux%u feed=%s poll=%ds timeout=%ds",
             size.x,
             size.y,
             feedUrl.toString().c_str(),
             config_.pollIntervalSec,
             config_.fetchTimeoutSec);

    applyPresets();
    chart_->start(initialKey(config_));
}

Application::~Application() {
    if (chart_) {
        chart_->dispose();
    }
    chart_.reset();
    surface_.reset();
    feed_.reset();
    source_.reset();
    // Handlers still queued for the destroyed components are dropped unrun by ~io_context.
    work_.reset();
}

void Application::run() {
    sf::Event event;
    while (window_.isOpen()) {
        while (window_.pollEvent(event)) {
            handleEvent(event);
        }
        ioc_.poll();
        syncSurfaceSize();
        enqueueFrame();
        renderManager_.render(window_);
        window_.display();
    }
    chart_->dispose();
}

void Application::handleEvent(const sf::Event& event) {
    switch (event.type) {
    case sf::Event::Closed:
        window_.close();
        break;
    case sf::Event::Resized:
        renderManager_.onResize({event.size.width, event.size.height});
        lastHudHeight_ = -1.f;
        break;
    case sf::Event::KeyPressed:
        if (!handleEntryKey(event.key.code)) {
            handleKey(event.key.code);
        }
        break;
    case sf::Event::TextEntered:
        entry_.append(event.text.unicode);
        break;
    case sf::Event::MouseButtonPressed:
        if (event.mouseButton.button == sf::Mouse::Left) {
            const sf::Vector2f point(static_cast<float>(event.mouseButton.x), static_cast<float>(event.mouseButton.y));
            if (auto tf = hud_.timeframeAt(point)) {
                chart_->setTimeframe(*tf);
            }
            else if (auto id = hud_.indicatorAt(point)) {
                chart_->removeIndicator(*id);
            }
        }
        break;
    default:
        break;
    }
}

// Enter opens the entry line; while it is open, keys edit the text instead of acting as shortcuts.
bool Application::handleEntryKey(sf::Keyboard::Key key) {
    if (!entry_.active()) {
        if (key == sf::Keyboard::Enter) {
            entry_.begin();
            return true;
        }
        return false;
    }
    switch (key) {
    case sf::Keyboard::Enter:
        if (auto text = entry_.submit()) {
            addFromText(*text);
        }
        break;
    case sf::Keyboard::Escape:
        entry_.cancel();
        break;
    case sf::Keyboard::BackSpace:
        entry_.erase();
        break;
    default:
        break;
    }
    return true;
}

void Application::handleKey(sf::Keyboard::Key key) {
    switch (key) {
    case sf::Keyboard::Num1:
        chart_->setTimeframe(domain::Timeframe::M5);
        break;
    case sf::Keyboard::Num2:
        chart_->setTimeframe(domain::Timeframe::M15);
        break;
    case sf::Keyboard::Num3:
        chart_->setTimeframe(domain::Timeframe::H1);
        break;
    case sf::Keyboard::Num4:
        chart_->setTimeframe(domain::Timeframe::H4);
        break;
    case sf::Keyboard::Num5:
        chart_->setTimeframe(domain::Timeframe::D1);
        break;
    case sf::Keyboard::S:
        addFromText(kSmaPreset);
        break;
    case sf::Keyboard::E:
        addFromText(kEmaPreset);
        break;
    case sf::Keyboard::R:
        addFromText(kRsiPreset);
        break;
    case sf::Keyboard::M:
        addFromText(kMacdPreset);
        break;
    case sf::Keyboard::K:
        addFromText(kStochRsiPreset);
        break;
    case sf::Keyboard::BackSpace: {
        const auto active = chart_->list();
        if (!active.empty()) {
            chart_->removeIndicator(active.back().id);
        }
        break;
    }
    case sf::Keyboard::Delete:
        for (const auto& entry : chart_->list()) {
            chart_->removeIndicator(entry.id);
        }
        break;
    case sf::Keyboard::Escape:
        window_.close();
        break;
    default:
        break;
    }
}

void Application::applyPresets() {
    for (const auto& preset : config_.indicators) {
        addFromText(preset);
    }
}

void Application::addFromText(const std::string& text) {
    try {
        chart_->addIndicator(indicators::parse_spec(text));
    }
    catch (const domain::ConfigError& ex) {
        LOG_WARN(logging::LogCategory::INDICATOR, "indicator '%s' rejected: %s", text.c_str(), ex.what());
    }
}

// The surface sits below the HUD, whose height depends on whether the chips row is shown.
void Application::syncSurfaceSize() {
    const float hudHeight = hud_.height(buildHudModel());
    if (hudHeight == lastHudHeight_) {
        return;
    }
    lastHudHeight_ = hudHeight;
    const sf::Vector2u size = window_.getSize();
    const unsigned hudPixels = static_cast<unsigned>(hudHeight);
    surface_->requestResize(ui::SurfaceSize{size.x, size.y > hudPixels ? size.y - hudPixels : 0U});
}

ui::HudModel Application::buildHudModel() const {
    ui::HudModel model;
    model.symbol = chart_->key().symbol;
    model.timeframe = chart_->key().timeframe;
    switch (chart_->state()) {
    case ChartState::Live:
        model.badge = ui::FeedBadge::Live;
        break;
    case ChartState::Reconnecting:
        model.badge = ui::FeedBadge::Reconnecting;
        break;
    case ChartState::Idle:
    case ChartState::Loading:
        model.badge = ui::FeedBadge::Connecting;
        break;
    }
    for (const auto& entry : chart_->list()) {
        model.chips.push_back(ui::HudChip{entry.id, entry.label, entry.failed});
    }
    if (entry_.active()) {
        model.entry = entry_.text();
    }
    model.clock = clock_.getElapsedTime().asSeconds();
    return model;
}

void Application::enqueueFrame() {
    const ui::HudModel model = buildHudModel();
    const float top = hud_.height(model);
    renderManager_.addRenderCommand(0, [this, top](sf::RenderTarget& target) {
        surface_->draw(target, font_.get(), {0.f, top});
    });
    renderManager_.addRenderCommand(10, [this, model](sf::RenderTarget& target) {
        hud_.draw(target, model, font_.get());
    });
}

}  // namespace app
