// Render map (and optionally graph) animation frames for composite indicators.
//
// Usage:
//   fa_render_frames --config <render.json> [--bounding-box <tif>] [--output <dir>]
//
// Frames are written as <output>/<indicator>_<year>.png next to
// <output>/<indicator>_legend.json; graph frames as
// <output>/<indicator>_graph_<year>.png.

#include "fa/core/indicator/CompositeIndicator.hpp"
#include "fa/core/render/LinePlotter.hpp"
#include "fa/core/types/BoundingBox.hpp"
#include "fa/core/util/Logging.hpp"
#include "fa/core/util/RenderConfig.hpp"
#include "fa/core/util/TempFile.hpp"

#include <boost/program_options.hpp>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>

namespace fs = std::filesystem;
namespace po = boost::program_options;

namespace {

void copyFrames(const std::vector<fa::Frame>& frames, const fs::path& outDir, const std::string& prefix)
{
    for (const auto& frame : frames) {
        const fs::path target = outDir / (prefix + "_" + std::to_string(frame.year) + ".png");
        fs::copy_file(frame.path, target, fs::copy_options::overwrite_existing);
    }
}

void writeLegend(const fa::Legend& legend, const fs::path& path)
{
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& entry : legend) {
        entries.push_back({
            {"label", entry.label},
            {"min", entry.minValue},
            {"max", entry.maxValue},
            {"color", {entry.color[0], entry.color[1], entry.color[2]}}
        });
    }

    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Cannot write legend: " + path.string());
    }
    out << entries.dump(2) << "\n";
}

int run(const po::variables_map& vm)
{
    auto cfg = fa::config::loadRenderConfig(vm["config"].as<std::string>());

    if (vm.count("log-level")) {
        cfg.logLevel = vm["log-level"].as<std::string>();
    }
    fa::SetLogLevel(cfg.logLevel);
    if (vm.count("log-file")) {
        fa::AddLogFile(vm["log-file"].as<std::string>());
    }
    if (vm.count("output")) {
        cfg.outputDir = vm["output"].as<std::string>();
    }
    if (vm.count("bounding-box")) {
        cfg.boundingBox = fs::path(vm["bounding-box"].as<std::string>());
    }
    if (cfg.tempDir) {
        fa::TempFileManager::setTempDir(*cfg.tempDir);
    }

    fs::create_directories(cfg.outputDir);

    std::unique_ptr<fa::BoundingBox> bbox;
    if (cfg.boundingBox) {
        bbox = std::make_unique<fa::BoundingBox>(*cfg.boundingBox);
    }

    const bool graphs = vm.count("graphs") > 0;
    const fa::LinePlotter plotter;
    for (const auto& indicatorCfg : cfg.indicators) {
        auto indicator = fa::config::makeIndicator(indicatorCfg);
        fa::Logger()->info("rendering {}", indicator->title());

        const auto result = indicator->renderMapFrames(bbox.get());
        copyFrames(result.frames, cfg.outputDir, indicator->name());
        writeLegend(result.legend, cfg.outputDir / (indicator->name() + "_legend.json"));

        if (graphs) {
            copyFrames(indicator->renderGraphFrames(plotter), cfg.outputDir, indicator->name() + "_graph");
        }
        fa::Logger()->info("{}: {} frames written to {}", indicator->name(), result.frames.size(), cfg.outputDir);
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[])
{
    po::options_description opts("fa_render_frames options");
    opts.add_options()
        ("help,h", "Show help")
        ("config,c", po::value<std::string>()->required(), "Render config JSON")
        ("bounding-box,b", po::value<std::string>(), "Bounding box raster (overrides config)")
        ("output,o", po::value<std::string>(), "Output directory (overrides config)")
        ("graphs", "Also render graph frames")
        ("log-level", po::value<std::string>(), "debug, info, warn, error or off")
        ("log-file", po::value<std::string>(), "Append log output to this file");

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(opts).run(), vm);
        if (vm.count("help")) {
            std::cout << opts << "\n";
            return 0;
        }
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\nUse --help for usage\n";
        return 1;
    }

    int rc = 1;
    try {
        rc = run(vm);
    } catch (const std::exception& e) {
        fa::Logger()->error("{}", e.what());
    }
    fa::TempFileManager::cleanup();
    return rc;
}
