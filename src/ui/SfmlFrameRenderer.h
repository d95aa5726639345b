#pragma once

#include <SFML/Graphics/Rect.hpp>
#include <SFML/Graphics/RenderTarget.hpp>

#include <vector>

#include "app/WatchlistCoordinator.h"
#include "render/RenderFrame.h"

namespace lmv::ui {

class ResourceProvider;

/**
 * Thin drawing adapter: turns a render::RenderFrame into SFML primitives.
 * All layout math lives in render::ChartRenderModel; this class only offsets
 * the frame into its viewport and picks colours.
 */
class SfmlFrameRenderer {
public:
    static constexpr float kPanelWidth = 260.f;
    static constexpr float kBannerHeight = 44.f;
    static constexpr float kAxisWidth = 72.f;

    explicit SfmlFrameRenderer(ResourceProvider& resources);

    // Chart viewport for a window size; the frame must be built at this size.
    static sf::FloatRect chartArea(unsigned windowWidth, unsigned windowHeight);

    void draw(sf::RenderTarget& target, const render::RenderFrame& frame, const sf::FloatRect& area);
    void drawWatchlist(sf::RenderTarget& target, const std::vector<app::EntryOverview>& rows);
    void drawBanner(sf::RenderTarget& target, const render::RenderFrame* frame);

private:
    void drawSeries_(sf::RenderTarget& target, const render::RenderFrame& frame, const sf::FloatRect& area);
    void drawCandles_(sf::RenderTarget& target, const render::RenderFrame& frame, const sf::FloatRect& area);
    void drawLadder_(sf::RenderTarget& target, const render::RenderFrame& frame, const sf::FloatRect& area);
    void drawAxis_(sf::RenderTarget& target, const render::RenderFrame& frame, const sf::FloatRect& area);
    void drawText_(sf::RenderTarget& target, const std::string& text, float x, float y, unsigned size, sf::Color color);

    ResourceProvider& resources_;
    bool fontWarningLogged_{false};
};

}  // namespace lmv::ui
