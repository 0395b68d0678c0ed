#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "fa/core/indicator/CompositeIndicator.hpp"

namespace fa::config {

struct IndicatorConfig {
    std::string name;
    std::string title;
    Units graphUnits{Units::Tc};
    Units mapUnits{Units::TcPerHa};
    std::string palette{"Greens"};
    Color background{255, 255, 255};
    int legendBins{8};
    std::vector<BlendPattern> patterns;  // fold order
};

struct RenderConfig {
    std::filesystem::path outputDir{"frames"};
    std::optional<std::filesystem::path> boundingBox;
    std::string logLevel{"info"};
    std::optional<std::filesystem::path> tempDir;
    std::vector<IndicatorConfig> indicators;
};

// Relative paths in the document are taken relative to baseDir.
// Throws std::runtime_error on missing or malformed fields.
RenderConfig parseRenderConfig(const nlohmann::json& doc, const std::filesystem::path& baseDir);

// Reads a render config file; relative paths resolve against its directory.
RenderConfig loadRenderConfig(const std::filesystem::path& path);

std::unique_ptr<CompositeIndicator> makeIndicator(const IndicatorConfig& cfg);

} // namespace fa::config
