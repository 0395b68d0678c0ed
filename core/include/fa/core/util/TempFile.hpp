#pragma once

#include <filesystem>
#include <string>

namespace fa {

// Hands out unique file paths for derived rasters and frames. All paths live in
// one process-private directory that is created on first use and removed by
// cleanup(); callers own the decision of when to clean up.
class TempFileManager
{
public:
    TempFileManager() = delete;

    // Fresh, not yet existing path ending in suffix (e.g. ".tif").
    static std::filesystem::path mktmp(const std::string& suffix = ".tif");

    // Parent for the private directory; defaults to the system temp directory.
    // Takes effect for the next directory created.
    static void setTempDir(const std::filesystem::path& dir);

    [[nodiscard]] static std::filesystem::path directory();

    static void cleanup();
};

} // namespace fa
