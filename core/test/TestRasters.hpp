#pragma once

// Helpers for writing small synthetic GeoTIFFs in tests.

#include <filesystem>
#include <optional>
#include <random>
#include <string>
#include <system_error>

#include <opencv2/core.hpp>

#include "fa/core/util/GeoTiff.hpp"

namespace fa_test {

// Directory removed with its contents when the object goes out of scope.
class ScratchDir
{
public:
    explicit ScratchDir(const std::string& name)
    {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 999999);

        const auto parent = std::filesystem::temp_directory_path();
        do {
            path_ = parent / ("fa_test_" + name + "_" + std::to_string(dis(gen)));
        } while (!std::filesystem::create_directory(path_));
    }

    ~ScratchDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }
    std::filesystem::path operator/(const std::string& leaf) const { return path_ / leaf; }

private:
    std::filesystem::path path_;
};

// Origin (100, 200), 1 x 1 units, north-up.
inline fa::GeoTransform defaultTransform()
{
    return {100.0, 1.0, 0.0, 200.0, 0.0, -1.0};
}

inline void writeTestRaster(const std::filesystem::path& path,
                            const cv::Mat_<double>& values,
                            std::optional<double> nodata = -1.0,
                            const fa::GeoTransform& transform = defaultTransform(),
                            int depth = CV_32F)
{
    fa::Raster r;
    r.info.width = values.cols;
    r.info.height = values.rows;
    r.info.transform = transform;
    r.info.nodata = nodata;
    r.info.depth = depth;
    r.values = values.clone();
    fa::writeRaster(path, r);
}

inline cv::Mat_<double> filled(int rows, int cols, double value)
{
    return cv::Mat_<double>(rows, cols, value);
}

} // namespace fa_test
