#pragma once

#include <SFML/Graphics/Font.hpp>

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace lmv::ui {

// Loads the overlay font once: the configured path first, then common system
// locations. A missing font disables text but never the charts.
class ResourceProvider {
public:
    explicit ResourceProvider(std::string preferredFontPath = {});

    std::shared_ptr<sf::Font> font();
    bool fontReady();

private:
    std::shared_ptr<sf::Font> loadFontUnlocked_();
    std::vector<std::filesystem::path> candidateFontPaths_() const;

    std::string preferredFontPath_;
    std::shared_ptr<sf::Font> font_;
    bool attempted_{false};
    std::mutex mutex_;
};

}  // namespace lmv::ui
