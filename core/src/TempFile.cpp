#include "fa/core/util/TempFile.hpp"

#include "fa/core/util/Logging.hpp"

#include <mutex>
#include <optional>
#include <random>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace fa {

namespace {

std::mutex tempMutex;
std::optional<fs::path> tempParent;
std::optional<fs::path> tempDir;
unsigned long long tempCounter = 0;

fs::path create_temp_directory(const fs::path& parent, const std::string& prefix)
{
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 999999);

    fs::create_directories(parent);

    fs::path new_dir;
    do {
        new_dir = parent / (prefix + "_" + std::to_string(dis(gen)));
    } while (fs::exists(new_dir));

    if (!fs::create_directory(new_dir)) {
        throw std::runtime_error("could not create temp directory " + new_dir.string());
    }
    return new_dir;
}

fs::path directoryLocked()
{
    if (!tempDir) {
        fs::path parent = tempParent ? *tempParent : fs::temp_directory_path();
        tempDir = create_temp_directory(parent, "fluxanim");
        Logger()->debug("temp directory {}", *tempDir);
    }
    return *tempDir;
}

} // namespace

fs::path TempFileManager::mktmp(const std::string& suffix)
{
    std::lock_guard<std::mutex> lock(tempMutex);
    fs::path dir = directoryLocked();
    fs::path path;
    do {
        path = dir / ("tmp" + std::to_string(tempCounter++) + suffix);
    } while (fs::exists(path));
    return path;
}

void TempFileManager::setTempDir(const fs::path& dir)
{
    std::lock_guard<std::mutex> lock(tempMutex);
    tempParent = dir;
}

fs::path TempFileManager::directory()
{
    std::lock_guard<std::mutex> lock(tempMutex);
    return directoryLocked();
}

void TempFileManager::cleanup()
{
    std::lock_guard<std::mutex> lock(tempMutex);
    if (!tempDir) {
        return;
    }

    std::error_code ec;
    fs::remove_all(*tempDir, ec);
    if (ec) {
        Logger()->warn("could not remove temp directory {}: {}", *tempDir, ec.message());
    }
    tempDir.reset();
}

} // namespace fa
