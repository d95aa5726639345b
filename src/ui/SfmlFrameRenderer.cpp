#include "ui/SfmlFrameRenderer.h"

#include <SFML/Graphics/Color.hpp>
#include <SFML/Graphics/RectangleShape.hpp>
#include <SFML/Graphics/Text.hpp>
#include <SFML/Graphics/VertexArray.hpp>

#include <algorithm>
#include <cstdio>
#include <string>

#include "logging/Log.h"
#include "render/PriceAxis.h"
#include "ui/ResourceProvider.h"

namespace lmv::ui {

namespace {
const sf::Color kBackground(16, 20, 28);
const sf::Color kPanelColor(22, 27, 38);
const sf::Color kFocusColor(44, 56, 80);
const sf::Color kBullishColor(48, 190, 120);
const sf::Color kBearishColor(220, 85, 85);
const sf::Color kGridColor(55, 66, 86, 120);
const sf::Color kLabelColor(210, 214, 228);
const sf::Color kDimLabelColor(140, 148, 166);
const sf::Color kLineColor(90, 170, 255);
const sf::Color kAskBarColor(220, 85, 85, 90);
const sf::Color kBidBarColor(48, 190, 120, 90);

sf::Color bannerColor(const render::RenderFrame& frame) {
    if (frame.connection == domain::ConnectionState::Failed) {
        return sf::Color(205, 92, 92, 180);
    }
    if (frame.connection == domain::ConnectionState::Reconnecting || frame.status == domain::EntryStatus::Subscribing) {
        return sf::Color(70, 130, 180, 180);
    }
    switch (frame.dataState) {
    case render::DataState::Empty:
        return sf::Color(128, 128, 128, 180);
    case render::DataState::InsufficientHistory:
        return sf::Color(200, 150, 60, 180);
    case render::DataState::Live:
        return sf::Color(46, 139, 87, 180);
    }
    return sf::Color(0, 0, 0, 160);
}

sf::Color statusColor(domain::ConnectionState state) {
    switch (state) {
    case domain::ConnectionState::Connected:
        return kBullishColor;
    case domain::ConnectionState::Reconnecting:
        return sf::Color(230, 190, 80);
    case domain::ConnectionState::Failed:
        return kBearishColor;
    }
    return kDimLabelColor;
}

const char* viewLabel(render::ChartView view) {
    switch (view) {
    case render::ChartView::Line:
        return "line";
    case render::ChartView::Candles:
        return "candles";
    case render::ChartView::Book:
        return "book";
    }
    return "";
}
}  // namespace

SfmlFrameRenderer::SfmlFrameRenderer(ResourceProvider& resources) : resources_(resources) {}

sf::FloatRect SfmlFrameRenderer::chartArea(unsigned windowWidth, unsigned windowHeight) {
    const float left = kPanelWidth + 8.f;
    const float top = kBannerHeight + 16.f;
    const float width = std::max(0.f, static_cast<float>(windowWidth) - left - kAxisWidth - 8.f);
    const float height = std::max(0.f, static_cast<float>(windowHeight) - top - 16.f);
    return sf::FloatRect(left, top, width, height);
}

void SfmlFrameRenderer::draw(sf::RenderTarget& target, const render::RenderFrame& frame, const sf::FloatRect& area) {
    sf::RectangleShape background(sf::Vector2f(area.width, area.height));
    background.setPosition(area.left, area.top);
    background.setFillColor(kBackground);
    target.draw(background);

    switch (frame.view) {
    case render::ChartView::Line:
        drawSeries_(target, frame, area);
        break;
    case render::ChartView::Candles:
        drawCandles_(target, frame, area);
        break;
    case render::ChartView::Book:
        drawLadder_(target, frame, area);
        break;
    }
    drawAxis_(target, frame, area);
}

void SfmlFrameRenderer::drawSeries_(sf::RenderTarget& target,
                                    const render::RenderFrame& frame,
                                    const sf::FloatRect& area) {
    if (frame.seriesPath.empty()) {
        return;
    }
    sf::VertexArray line(sf::LineStrip, frame.seriesPath.size());
    sf::VertexArray fill(sf::TriangleStrip, frame.seriesPath.size() * 2);
    const float bottom = area.top + area.height;
    for (std::size_t i = 0; i < frame.seriesPath.size(); ++i) {
        const auto& p = frame.seriesPath[i];
        const sf::Vector2f pos(area.left + p.x, area.top + p.y);
        line[i].position = pos;
        line[i].color = kLineColor;
        fill[i * 2].position = pos;
        fill[i * 2].color = sf::Color(kLineColor.r, kLineColor.g, kLineColor.b, 70);
        fill[i * 2 + 1].position = sf::Vector2f(pos.x, bottom);
        fill[i * 2 + 1].color = sf::Color(kLineColor.r, kLineColor.g, kLineColor.b, 0);
    }
    target.draw(fill);
    target.draw(line);

    for (const auto& p : frame.seriesPath) {
        sf::RectangleShape dot(sf::Vector2f(3.f, 3.f));
        dot.setPosition(area.left + p.x - 1.5f, area.top + p.y - 1.5f);
        dot.setFillColor(p.tag == domain::TradeSide::Buy ? kBullishColor : kBearishColor);
        target.draw(dot);
    }
}

void SfmlFrameRenderer::drawCandles_(sf::RenderTarget& target,
                                     const render::RenderFrame& frame,
                                     const sf::FloatRect& area) {
    sf::VertexArray wicks(sf::Lines);
    for (const auto& candle : frame.candles.candles) {
        const sf::Color color = candle.bullish ? kBullishColor : kBearishColor;
        const float x = area.left + candle.x;
        wicks.append(sf::Vertex(sf::Vector2f(x, area.top + candle.wickTop), color));
        wicks.append(sf::Vertex(sf::Vector2f(x, area.top + candle.wickBottom), color));

        sf::RectangleShape body(sf::Vector2f(candle.halfWidth * 2.f, candle.bodyBottom - candle.bodyTop));
        body.setPosition(x - candle.halfWidth, area.top + candle.bodyTop);
        if (candle.complete) {
            body.setFillColor(color);
        }
        else {
            body.setFillColor(sf::Color(color.r, color.g, color.b, 110));
            body.setOutlineColor(color);
            body.setOutlineThickness(1.f);
        }
        target.draw(body);
    }
    target.draw(wicks);

    const auto& candles = frame.candles.candles;
    if (!candles.empty()) {
        const float y = area.top + area.height + 2.f;
        drawText_(target, render::formatTimeLabel(candles.front().periodStart), area.left + 2.f, y, 11, kDimLabelColor);
        drawText_(target, render::formatTimeLabel(candles.back().periodStart), area.left + area.width - 56.f, y, 11,
                  kDimLabelColor);
    }
}

void SfmlFrameRenderer::drawLadder_(sf::RenderTarget& target,
                                    const render::RenderFrame& frame,
                                    const sf::FloatRect& area) {
    if (frame.ladder.empty()) {
        return;
    }
    const float rowHeight = std::min(22.f, area.height / static_cast<float>(frame.ladder.size()));
    const float barSpan = area.width * 0.45f;
    int decimals = 2;
    if (frame.lastPrice && *frame.lastPrice > 0.0) {
        decimals = render::computePriceDecimals(*frame.lastPrice * 0.0005);
    }

    float y = area.top;
    for (const auto& row : frame.ladder) {
        sf::RectangleShape bar(sf::Vector2f(barSpan * row.depthRatio, rowHeight - 2.f));
        bar.setPosition(area.left + area.width - bar.getSize().x, y + 1.f);
        bar.setFillColor(row.side == render::LadderSide::Ask ? kAskBarColor : kBidBarColor);
        target.draw(bar);

        const sf::Color color = row.side == render::LadderSide::Ask ? kBearishColor : kBullishColor;
        const unsigned size = static_cast<unsigned>(std::max(10.f, rowHeight * 0.6f));
        drawText_(target, render::formatPrice(row.price, decimals), area.left + 8.f, y + 2.f, size, color);
        drawText_(target, render::formatPrice(row.volume, 4), area.left + area.width * 0.3f, y + 2.f, size, kLabelColor);
        drawText_(target, render::formatPrice(row.cumulative, 4), area.left + area.width * 0.5f, y + 2.f, size,
                  kDimLabelColor);
        y += rowHeight;
    }
}

void SfmlFrameRenderer::drawAxis_(sf::RenderTarget& target,
                                  const render::RenderFrame& frame,
                                  const sf::FloatRect& area) {
    sf::VertexArray grid(sf::Lines);
    for (const auto& mark : frame.priceAxis) {
        const float y = area.top + mark.y;
        grid.append(sf::Vertex(sf::Vector2f(area.left, y), kGridColor));
        grid.append(sf::Vertex(sf::Vector2f(area.left + area.width, y), kGridColor));
        drawText_(target, mark.text, area.left + area.width + 6.f, y - 8.f, 12, kDimLabelColor);
    }
    target.draw(grid);
}

void SfmlFrameRenderer::drawWatchlist(sf::RenderTarget& target, const std::vector<app::EntryOverview>& rows) {
    const sf::Vector2u size = target.getSize();
    sf::RectangleShape panel(sf::Vector2f(kPanelWidth, static_cast<float>(size.y)));
    panel.setFillColor(kPanelColor);
    target.draw(panel);

    float y = 12.f;
    drawText_(target, "Watchlist", 12.f, y, 16, kLabelColor);
    y += 30.f;
    for (const auto& row : rows) {
        if (row.focused) {
            sf::RectangleShape highlight(sf::Vector2f(kPanelWidth, 44.f));
            highlight.setPosition(0.f, y - 4.f);
            highlight.setFillColor(kFocusColor);
            target.draw(highlight);
        }

        sf::RectangleShape dot(sf::Vector2f(8.f, 8.f));
        dot.setPosition(12.f, y + 5.f);
        dot.setFillColor(statusColor(row.connection));
        target.draw(dot);

        drawText_(target, row.label, 28.f, y, 14, kLabelColor);

        std::string detail = row.granularity + "  " + domain::to_string(row.status);
        if (row.lastPrice) {
            detail = render::formatPrice(*row.lastPrice, render::computePriceDecimals(*row.lastPrice * 0.0005)) +
                     "  " + detail;
        }
        sf::Color detailColor = kDimLabelColor;
        if (row.changePercent) {
            char change[32];
            std::snprintf(change, sizeof(change), "  %+.2f%%", *row.changePercent);
            detail += change;
            detailColor = *row.changePercent >= 0.0 ? kBullishColor : kBearishColor;
        }
        drawText_(target, detail, 28.f, y + 18.f, 12, detailColor);
        y += 48.f;
    }
}

void SfmlFrameRenderer::drawBanner(sf::RenderTarget& target, const render::RenderFrame* frame) {
    const sf::Vector2u windowSize = target.getSize();
    const float left = kPanelWidth + 8.f;
    if (windowSize.x == 0 || static_cast<float>(windowSize.x) <= left + 8.f) {
        return;
    }

    sf::RectangleShape rect(sf::Vector2f(static_cast<float>(windowSize.x) - left - 8.f, kBannerHeight));
    rect.setPosition(left, 8.f);
    rect.setFillColor(frame ? bannerColor(*frame) : sf::Color(128, 128, 128, 180));
    target.draw(rect);

    std::string message = "watchlist empty";
    if (frame) {
        message = frame->title + "  " + frame->granularity + "  [" + viewLabel(frame->view) + "]";
        if (frame->lastPrice) {
            message += "  " + render::formatPrice(*frame->lastPrice, render::computePriceDecimals(*frame->lastPrice * 0.0005));
        }
        if (!frame->stateMessage.empty()) {
            message += "  " + frame->stateMessage;
        }
    }
    drawText_(target, message, left + 12.f, 18.f, 18, sf::Color::White);
}

void SfmlFrameRenderer::drawText_(sf::RenderTarget& target,
                                  const std::string& text,
                                  float x,
                                  float y,
                                  unsigned size,
                                  sf::Color color) {
    auto font = resources_.font();
    if (!font) {
        if (!fontWarningLogged_) {
            LOG_WARN(logging::LogCategory::UI, "Text overlay skipped: font not available.");
            fontWarningLogged_ = true;
        }
        return;
    }
    sf::Text label;
    label.setFont(*font);
    label.setCharacterSize(size);
    label.setString(text);
    label.setFillColor(color);
    label.setPosition(x, y);
    target.draw(label);
}

}  // namespace lmv::ui
