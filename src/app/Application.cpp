#include "app/Application.h"

#include <SFML/Graphics/RenderWindow.hpp>
#include <SFML/Graphics/View.hpp>

#include <chrono>
#include <exception>
#include <string>

#include "adapters/duckdb/DuckWatchlistStore.hpp"
#include "adapters/feed/HttpQuoteFetcher.hpp"
#include "adapters/feed/PollingTickSource.hpp"
#include "adapters/feed/PushTickSource.hpp"
#include "adapters/feed/WsStreamChannel.hpp"
#include "adapters/history/HttpCandleHistorySource.hpp"
#include "app/WatchlistSeed.h"
#include "common/Metrics.hpp"
#include "core/RefreshScheduler.h"
#include "logging/Log.h"

namespace lmv::app {

namespace {

constexpr std::size_t kSchedulerThreads = 2;

adapters::feed::BackoffPolicy backoffFrom(const config::Config& config) {
    adapters::feed::BackoffPolicy policy;
    policy.base = std::chrono::milliseconds(config.backoffBaseMs);
    policy.cap = std::chrono::milliseconds(config.backoffCapMs);
    policy.failAfter = config.failAfter;
    return policy;
}

std::shared_ptr<adapters::feed::ITickSource> makeTickSource(const config::Config& config) {
    if (config.feedMode == "push") {
        adapters::feed::WsEndpoint endpoint;
        endpoint.host = config.wsHost;
        endpoint.port = std::to_string(config.wsPort);
        endpoint.tls = config.wsTls;
        endpoint.pathTemplate = config.wsPathTemplate;
        auto factory = [endpoint]() -> std::unique_ptr<adapters::feed::IStreamChannel> {
            return std::make_unique<adapters::feed::WsStreamChannel>(endpoint);
        };
        return std::make_shared<adapters::feed::PushTickSource>(factory, backoffFrom(config));
    }

    infra::http::Endpoint api{config.apiHost, std::to_string(config.apiPort), config.apiTls};
    adapters::feed::PollingOptions options;
    options.interval = std::chrono::milliseconds(config.pollIntervalMs);
    options.backoff = backoffFrom(config);
    return std::make_shared<adapters::feed::PollingTickSource>(std::make_shared<adapters::feed::HttpQuoteFetcher>(api),
                                                               options);
}

domain::TimestampMs nowMs() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

}  // namespace

Application::Application(const config::Config& config)
    : config_(config),
      scheduler_(std::make_shared<core::RefreshScheduler>(kSchedulerThreads)),
      store_(std::make_shared<adapters::duckdb::DuckWatchlistStore>(config.duckdbPath)),
      resources_(config.fontPath),
      renderer_(resources_) {
    infra::http::Endpoint api{config_.apiHost, std::to_string(config_.apiPort), config_.apiTls};
    coordinator_ = std::make_unique<WatchlistCoordinator>(makeTickSource(config_),
                                                          scheduler_,
                                                          CoordinatorOptions::fromConfig(config_),
                                                          std::make_shared<adapters::history::HttpCandleHistorySource>(api));

    window_ = std::make_unique<sf::RenderWindow>(
        sf::VideoMode(static_cast<unsigned>(config_.windowWidth), static_cast<unsigned>(config_.windowHeight)),
        "LiveMarketView");
    window_->setFramerateLimit(30);

    LOG_INFO(logging::LogCategory::UI,
             "Feed mode=%s api=%s:%d ws=%s:%d",
             config_.feedMode.c_str(),
             config_.apiHost.c_str(),
             config_.apiPort,
             config_.wsHost.c_str(),
             config_.wsPort);

    loadWatchlist_();
    coordinator_->startRenderLoop([this]() { frameDue_.store(true, std::memory_order_release); });
}

Application::~Application() {
    if (coordinator_) {
        coordinator_->stop();
    }
    if (scheduler_) {
        scheduler_->stop();
    }
}

void Application::loadWatchlist_() {
    std::size_t loaded = 0;
    try {
        store_->migrate();
        loaded = coordinator_->loadFrom(*store_);
    }
    catch (const std::exception& ex) {
        LOG_WARN(logging::LogCategory::DB, "Watchlist store unavailable (%s); using configured seeds", ex.what());
        store_.reset();
    }
    if (loaded > 0) {
        return;
    }

    for (const auto& entry : parseWatchlistSeed(config_.watchlist, nowMs())) {
        if (!coordinator_->add(entry) || !store_) {
            continue;
        }
        try {
            store_->upsert(entry);
        }
        catch (const std::exception& ex) {
            LOG_WARN(logging::LogCategory::DB, "Persisting %s failed: %s", entry.id.c_str(), ex.what());
        }
    }
}

void Application::run() {
    sf::Event event;
    while (window_->isOpen()) {
        while (window_->pollEvent(event)) {
            handleEvent_(event);
        }

        if (frameDue_.exchange(false, std::memory_order_acq_rel)) {
            refreshFrame_();
        }

        const auto size = window_->getSize();
        window_->clear(sf::Color(12, 15, 21));
        renderer_.drawWatchlist(*window_, overview_);
        renderer_.drawBanner(*window_, frame_ ? &*frame_ : nullptr);
        if (frame_) {
            renderer_.draw(*window_, *frame_, ui::SfmlFrameRenderer::chartArea(size.x, size.y));
        }
        window_->display();
    }
    coordinator_->stop();
    LOG_INFO(logging::LogCategory::UI, "Session metrics: %s",
             metrics::Registry::instance().snapshot().summary().c_str());
}

void Application::refreshFrame_() {
    const auto size = window_->getSize();
    const auto area = ui::SfmlFrameRenderer::chartArea(size.x, size.y);
    frame_ = coordinator_->buildFrame(view_, static_cast<unsigned>(area.width), static_cast<unsigned>(area.height));
    overview_ = coordinator_->overview();
}

void Application::handleEvent_(const sf::Event& event) {
    switch (event.type) {
    case sf::Event::Closed:
        window_->close();
        return;
    case sf::Event::Resized:
        window_->setView(sf::View(sf::FloatRect(0.f,
                                                0.f,
                                                static_cast<float>(event.size.width),
                                                static_cast<float>(event.size.height))));
        frameDue_.store(true, std::memory_order_release);
        return;
    case sf::Event::KeyPressed:
        break;
    default:
        return;
    }

    const auto key = event.key.code;
    if (key == sf::Keyboard::Escape) {
        window_->close();
        return;
    }
    if (key == sf::Keyboard::Tab) {
        if (auto id = coordinator_->focusNext()) {
            LOG_DEBUG(logging::LogCategory::UI, "Focused %s", id->c_str());
        }
    }
    else if (key == sf::Keyboard::L) {
        view_ = render::ChartView::Line;
    }
    else if (key == sf::Keyboard::C) {
        view_ = render::ChartView::Candles;
    }
    else if (key == sf::Keyboard::B) {
        view_ = render::ChartView::Book;
    }
    else if (key >= sf::Keyboard::Num1 && key <= sf::Keyboard::Num9) {
        const int digit = static_cast<int>(key - sf::Keyboard::Num1) + 1;
        const auto granularity = granularityForDigit(digit);
        if (auto id = coordinator_->focused()) {
            coordinator_->setActiveGranularity(*id, granularity);
        }
    }
    else {
        return;
    }
    frameDue_.store(true, std::memory_order_release);
}

}  // namespace lmv::app
