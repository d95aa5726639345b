#include "ui/ResourceProvider.h"

#include "logging/Log.h"

#include <array>
#include <system_error>
#include <utility>

namespace lmv::ui {

ResourceProvider::ResourceProvider(std::string preferredFontPath)
    : preferredFontPath_(std::move(preferredFontPath)) {}

std::shared_ptr<sf::Font> ResourceProvider::font() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!attempted_) {
        attempted_ = true;
        font_ = loadFontUnlocked_();
    }
    return font_;
}

bool ResourceProvider::fontReady() {
    return font() != nullptr;
}

std::vector<std::filesystem::path> ResourceProvider::candidateFontPaths_() const {
    std::vector<std::filesystem::path> paths;
    if (!preferredFontPath_.empty()) {
        paths.emplace_back(preferredFontPath_);
    }
    paths.emplace_back(std::filesystem::current_path() / "assets" / "fonts" / "ui.ttf");

    static const std::array<const char*, 3> systemCandidates{
        "/usr/share/fonts/truetype/dejavu/DejaVuSansMono.ttf",
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf"};
    for (const char* candidate : systemCandidates) {
        paths.emplace_back(candidate);
    }
    return paths;
}

std::shared_ptr<sf::Font> ResourceProvider::loadFontUnlocked_() {
    auto font = std::make_shared<sf::Font>();
    for (const auto& path : candidateFontPaths_()) {
        std::error_code ec;
        if (std::filesystem::exists(path, ec) && font->loadFromFile(path.string())) {
            LOG_DEBUG(logging::LogCategory::UI, "Loaded font from %s", path.string().c_str());
            return font;
        }
    }
    LOG_WARN(logging::LogCategory::UI, "No usable font found; text overlays disabled");
    return nullptr;
}

}  // namespace lmv::ui
