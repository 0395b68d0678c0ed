#include "fa/core/util/Discovery.hpp"

#include "fa/core/util/Errors.hpp"
#include "fa/core/util/Logging.hpp"

#include <glob.h>

#include <algorithm>
#include <cctype>

namespace fa {

namespace {

// Releases the matches of a glob(3) call when it goes out of scope.
struct GlobGuard {
    glob_t* g;
    ~GlobGuard() { globfree(g); }
};

} // namespace

std::vector<std::filesystem::path> globFiles(const std::string& pattern)
{
    glob_t g{};
    GlobGuard guard{&g};
    const int rc = glob(pattern.c_str(), 0, nullptr, &g);
    if (rc == GLOB_NOMATCH) {
        return {};
    }
    if (rc != 0) {
        throw DiscoveryError("failed to expand pattern " + pattern +
                             (rc == GLOB_NOSPACE ? ": out of memory" : ": read error"));
    }

    std::vector<std::filesystem::path> paths;
    paths.reserve(g.gl_pathc);
    for (size_t i = 0; i < g.gl_pathc; ++i) {
        paths.emplace_back(g.gl_pathv[i]);
    }
    return paths;
}

int yearFromPath(const std::filesystem::path& path)
{
    const std::string stem = path.stem().string();
    if (stem.size() < 4) {
        throw DiscoveryError("no year in file name: " + path.string());
    }

    const std::string digits = stem.substr(stem.size() - 4);
    if (!std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw DiscoveryError("no year in file name: " + path.string());
    }
    return std::stoi(digits);
}

LayerCollection findLayers(const std::string& pattern,
                           const std::string& palette,
                           const Color& background)
{
    LayerCollection layers(palette, background);
    for (const auto& path : globFiles(pattern)) {
        layers.append(std::make_shared<RasterLayer>(path, yearFromPath(path)));
    }

    if (!layers) {
        throw DiscoveryError("No spatial output found for pattern: " + pattern);
    }

    Logger()->debug("found {} layers for {}", layers.size(), pattern);
    return layers;
}

} // namespace fa
