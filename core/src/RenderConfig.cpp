#include "fa/core/util/RenderConfig.hpp"

#include "fa/core/render/ColormapColorizer.hpp"
#include "fa/core/util/LoadJson.hpp"
#include "fa/core/util/Logging.hpp"

#include <nlohmann/json.hpp>
#include <cmath>
#include <stdexcept>
#include <string>

namespace fa::config {

namespace {

// One legend entry per colormap LUT entry at most.
constexpr int kMaxLegendBins = 256;

std::filesystem::path resolve(const std::filesystem::path& p, const std::filesystem::path& baseDir)
{
    return p.is_absolute() || baseDir.empty() ? p : baseDir / p;
}

Color parseColor(const nlohmann::json& value, const std::string& context)
{
    if (!value.is_array() || value.size() != 3) {
        throw std::runtime_error(context + " background_color must be [r, g, b]");
    }
    Color color;
    for (int i = 0; i < 3; ++i) {
        if (!value[i].is_number_integer()) {
            throw std::runtime_error(context + " background_color must hold integers");
        }
        const int c = value[i].get<int>();
        if (c < 0 || c > 255) {
            throw std::runtime_error(context + " background_color component out of range: " +
                                     std::to_string(c));
        }
        color[i] = static_cast<uint8_t>(c);
    }
    return color;
}

IndicatorConfig parseIndicator(const nlohmann::json& j, const std::filesystem::path& baseDir)
{
    fa::json::require_fields(j, {"name", "patterns"}, "indicator");

    IndicatorConfig cfg;
    cfg.name = j["name"].get<std::string>();
    const std::string context = "indicator '" + cfg.name + "'";

    cfg.title = fa::json::string_or(&j, "title", cfg.name);
    cfg.graphUnits = unitsFromString(fa::json::string_or(&j, "graph_units", "Tc"));
    cfg.mapUnits = unitsFromString(fa::json::string_or(&j, "map_units", "TcPerHa"));
    cfg.palette = fa::json::string_or(&j, "palette", cfg.palette);
    if (j.contains("background_color")) {
        cfg.background = parseColor(j["background_color"], context);
    }
    const double bins = fa::json::number_or(&j, "legend_bins", cfg.legendBins);
    if (!std::isfinite(bins) || bins < 1.0 || bins > kMaxLegendBins) {
        throw std::runtime_error(context + " legend_bins must be between 1 and " +
                                 std::to_string(kMaxLegendBins));
    }
    cfg.legendBins = static_cast<int>(bins);

    fa::json::require_array(j, "patterns", context);
    for (const auto& p : j["patterns"]) {
        fa::json::require_fields(p, {"pattern"}, context + " pattern");
        BlendPattern bp;
        bp.pattern = resolve(p["pattern"].get<std::string>(), baseDir).string();
        bp.mode = blendModeFromString(fa::json::string_or(&p, "blend_mode", "add"));
        cfg.patterns.push_back(std::move(bp));
    }
    return cfg;
}

} // namespace

RenderConfig parseRenderConfig(const nlohmann::json& doc, const std::filesystem::path& baseDir)
{
    fa::json::require_array(doc, "indicators", "render config");

    RenderConfig cfg;
    cfg.outputDir = resolve(fa::json::string_or(&doc, "output_dir", cfg.outputDir.string()), baseDir);
    cfg.logLevel = fa::json::string_or(&doc, "log_level", cfg.logLevel);
    if (doc.contains("bounding_box")) {
        cfg.boundingBox = resolve(doc["bounding_box"].get<std::string>(), baseDir);
    }
    if (doc.contains("temp_dir")) {
        cfg.tempDir = resolve(doc["temp_dir"].get<std::string>(), baseDir);
    }

    for (const auto& j : doc["indicators"]) {
        cfg.indicators.push_back(parseIndicator(j, baseDir));
    }
    return cfg;
}

RenderConfig loadRenderConfig(const std::filesystem::path& path)
{
    const auto doc = fa::json::load_json_file(path);
    try {
        auto cfg = parseRenderConfig(doc, path.parent_path());
        Logger()->debug("loaded {} indicators from {}", cfg.indicators.size(), path);
        return cfg;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid render config " + path.string() + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error("Invalid render config " + path.string() + ": " + e.what());
    }
}

std::unique_ptr<CompositeIndicator> makeIndicator(const IndicatorConfig& cfg)
{
    return std::make_unique<CompositeIndicator>(cfg.name, cfg.patterns, cfg.title, cfg.graphUnits,
                                                cfg.mapUnits, cfg.palette, cfg.background,
                                                std::make_shared<ColormapColorizer>(cfg.legendBins));
}

} // namespace fa::config
