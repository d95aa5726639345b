#pragma once

#include "app/WatchlistCoordinator.h"
#include "config/Config.h"
#include "render/RenderFrame.h"
#include "ui/ResourceProvider.h"
#include "ui/SfmlFrameRenderer.h"

#include <SFML/Window/Event.hpp>

#include <atomic>
#include <memory>
#include <optional>
#include <vector>

namespace sf {
class RenderWindow;
}

namespace lmv::core {
class RefreshScheduler;
}

namespace lmv::adapters::duckdb {
class DuckWatchlistStore;
}

namespace lmv::app {

class Application {
public:
    explicit Application(const config::Config& config);
    ~Application();

    void run();

private:
    void loadWatchlist_();
    void handleEvent_(const sf::Event& event);
    void refreshFrame_();

    config::Config config_;
    std::shared_ptr<core::RefreshScheduler> scheduler_;
    std::shared_ptr<adapters::duckdb::DuckWatchlistStore> store_;
    std::unique_ptr<WatchlistCoordinator> coordinator_;

    std::unique_ptr<sf::RenderWindow> window_;
    ui::ResourceProvider resources_;
    ui::SfmlFrameRenderer renderer_;

    render::ChartView view_{render::ChartView::Line};
    std::optional<render::RenderFrame> frame_;
    std::vector<EntryOverview> overview_;
    std::atomic<bool> frameDue_{true};
};

}  // namespace lmv::app
