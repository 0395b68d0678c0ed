#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "fa/core/types/LayerCollection.hpp"

namespace fa {

// Paths matching a shell glob, sorted. No match gives an empty list; a failing
// directory read throws DiscoveryError.
std::vector<std::filesystem::path> globFiles(const std::string& pattern);

// Year from the last four characters of the file stem ("NPP_2001.tif" -> 2001).
// Throws DiscoveryError if they are not all digits.
int yearFromPath(const std::filesystem::path& path);

// One dated layer per file matching pattern, in glob order.
// Throws DiscoveryError if nothing matches.
LayerCollection findLayers(const std::string& pattern,
                           const std::string& palette = "Greens",
                           const Color& background = Color(255, 255, 255));

} // namespace fa
