#include "test.hpp"
#include "TestRasters.hpp"

#include "fa/core/types/BoundingBox.hpp"
#include "fa/core/util/Errors.hpp"
#include "fa/core/util/TempFile.hpp"

using fa_test::ScratchDir;
using fa_test::writeTestRaster;

namespace {

// 6x6 box, nodata -1, data in rows 2-3 and columns 1-4.
void writeBox(const std::filesystem::path& path)
{
    cv::Mat_<double> box = fa_test::filled(6, 6, -1.0);
    box(cv::Rect(1, 2, 4, 2)).setTo(1.0);
    writeTestRaster(path, box, -1.0);
}

// 6x6 layer with value 10 * row + column.
void writeGradient(const std::filesystem::path& path,
                   std::optional<double> nodata = -9.0,
                   int depth = CV_32F)
{
    cv::Mat_<double> values(6, 6);
    for (int y = 0; y < 6; ++y)
        for (int x = 0; x < 6; ++x)
            values(y, x) = 10 * y + x;
    writeTestRaster(path, values, nodata, fa_test::defaultTransform(), depth);
}

} // namespace

// --- bounds -------------------------------------------------------------------

TEST(BoundingBox, PixelBoundsAreOnePixelWiderThanData)
{
    ScratchDir dir("bbox_pixel");
    writeBox(dir / "box.tif");

    fa::BoundingBox bbox(dir / "box.tif");
    EXPECT_TRUE(bbox.state() == fa::BoundingBox::State::Uninitialized);

    const fa::PixelBounds b = bbox.minPixelBounds();
    EXPECT_EQ(b.xMin, 0);
    EXPECT_EQ(b.xMax, 5);
    EXPECT_EQ(b.yMin, 1);
    EXPECT_EQ(b.yMax, 4);
    EXPECT_TRUE(bbox.state() == fa::BoundingBox::State::BoundsComputed);
}

TEST(BoundingBox, GeographicBoundsFollowTransform)
{
    ScratchDir dir("bbox_geo");
    writeBox(dir / "box.tif");

    fa::BoundingBox bbox(dir / "box.tif");
    const fa::PixelBounds p = bbox.minPixelBounds();
    const fa::GeoBounds g = bbox.minGeographicBounds();
    const fa::GeoTransform gt = fa_test::defaultTransform();

    EXPECT_FLOAT_EQ(g.xMin, gt[0] + p.xMin * gt[1]);
    EXPECT_FLOAT_EQ(g.yMin, gt[3] + p.yMin * gt[5]);
    EXPECT_FLOAT_EQ(g.xMax, gt[0] + p.xMax * gt[1]);
    EXPECT_FLOAT_EQ(g.yMax, gt[3] + p.yMax * gt[5]);
    EXPECT_FLOAT_EQ(g.yMin, 199.0);
    EXPECT_FLOAT_EQ(g.yMax, 196.0);
}

TEST(BoundingBox, DataTouchingEdgesExtendsPastRaster)
{
    ScratchDir dir("bbox_edges");
    writeTestRaster(dir / "box.tif", fa_test::filled(3, 4, 1.0), -1.0);

    fa::BoundingBox bbox(dir / "box.tif");
    EXPECT_TRUE(bbox.minPixelBounds() == (fa::PixelBounds{-1, 4, -1, 3}));
}

TEST(BoundingBox, AllNodataThrows)
{
    ScratchDir dir("bbox_empty");
    writeTestRaster(dir / "box.tif", fa_test::filled(4, 4, -1.0), -1.0);

    fa::BoundingBox bbox(dir / "box.tif");
    EXPECT_THROW((void)bbox.minPixelBounds(), fa::AlignmentError);
    EXPECT_THROW((void)bbox.crop(bbox), fa::AlignmentError);
}

// --- crop ---------------------------------------------------------------------

TEST(BoundingBox, CropMasksWithBoxNodata)
{
    ScratchDir dir("bbox_crop");
    writeBox(dir / "box.tif");
    writeGradient(dir / "layer.tif");

    fa::BoundingBox bbox(dir / "box.tif");
    fa::RasterLayer layer(dir / "layer.tif", 2005);
    const auto cropped = bbox.crop(layer);

    ASSERT_TRUE(cropped != nullptr);
    EXPECT_EQ(cropped->year(), std::optional<int>(2005));
    const fa::Raster r = cropped->open();
    EXPECT_EQ(r.values.cols, 5);
    EXPECT_EQ(r.values.rows, 3);
    EXPECT_FLOAT_EQ(r.info.transform[0], 100.0);
    EXPECT_FLOAT_EQ(r.info.transform[3], 199.0);
    ASSERT_TRUE(r.info.nodata.has_value());
    EXPECT_FLOAT_EQ(*r.info.nodata, -9.0);

    // box row 1 is all nodata, box column 0 is nodata
    for (int x = 0; x < 5; ++x) EXPECT_FLOAT_EQ(r.values(0, x), -9.0);
    EXPECT_FLOAT_EQ(r.values(1, 0), -9.0);
    EXPECT_FLOAT_EQ(r.values(1, 1), 21.0);
    EXPECT_FLOAT_EQ(r.values(2, 4), 34.0);

    // the source layer is untouched
    EXPECT_FLOAT_EQ(layer.open().values(2, 0), 20.0);
}

TEST(BoundingBox, CropWithoutLayerNodataUsesDefault)
{
    ScratchDir dir("bbox_default_nodata");
    writeBox(dir / "box.tif");
    writeGradient(dir / "layer.tif", std::nullopt, CV_16U);

    fa::BoundingBox bbox(dir / "box.tif");
    fa::RasterLayer layer(dir / "layer.tif", 2005);
    const auto cropped = bbox.crop(layer);

    const fa::Raster r = cropped->open();
    EXPECT_EQ(r.info.depth, CV_32F);
    ASSERT_TRUE(cropped->nodataValue().has_value());
    EXPECT_EQ(*cropped->nodataValue(), fa::kDefaultNodata);
    EXPECT_EQ(r.values(0, 0), fa::kDefaultNodata);
    EXPECT_FLOAT_EQ(r.values(2, 2), 32.0);
}

TEST(BoundingBox, CropOfAlignedLayerKeepsExtent)
{
    ScratchDir dir("bbox_idempotent");
    writeBox(dir / "box.tif");
    writeGradient(dir / "layer.tif");

    fa::BoundingBox bbox(dir / "box.tif");
    fa::RasterLayer layer(dir / "layer.tif", 2001);
    const auto once = bbox.crop(layer);
    const auto twice = bbox.crop(*once);

    const fa::RasterInfo a = once->info();
    const fa::RasterInfo b = twice->info();
    EXPECT_EQ(a.width, b.width);
    EXPECT_EQ(a.height, b.height);
    for (int i = 0; i < 6; ++i) {
        EXPECT_NEAR(a.transform[i], b.transform[i], 1e-9);
    }
}

TEST(BoundingBox, SelfCropHappensOnce)
{
    ScratchDir dir("bbox_selfcrop");
    writeBox(dir / "box.tif");
    writeGradient(dir / "layer.tif");

    fa::BoundingBox bbox(dir / "box.tif");
    fa::RasterLayer layer(dir / "layer.tif", 2001);
    const auto original = bbox.path();

    (void)bbox.crop(layer);
    const auto afterFirst = bbox.path();
    EXPECT_NE(afterFirst, original);
    EXPECT_TRUE(bbox.state() == fa::BoundingBox::State::SelfCropped);

    (void)bbox.crop(layer);
    (void)bbox.crop(layer);
    EXPECT_EQ(bbox.path(), afterFirst);

    // bounds stay those of the original raster
    EXPECT_TRUE(bbox.minPixelBounds() == (fa::PixelBounds{0, 5, 1, 4}));
    const fa::RasterInfo info = bbox.info();
    EXPECT_EQ(info.width, 5);
    EXPECT_EQ(info.height, 3);
}

TEST(BoundingBox, CropFailures)
{
    ScratchDir dir("bbox_failures");
    writeBox(dir / "box.tif");
    fa::BoundingBox bbox(dir / "box.tif");

    fa::RasterLayer missing(dir / "missing.tif", 2001);
    EXPECT_THROW((void)bbox.crop(missing), fa::RasterIOError);

    // completely outside the box extent
    const fa::GeoTransform far{5000.0, 1.0, 0.0, 9000.0, 0.0, -1.0};
    writeTestRaster(dir / "far.tif", fa_test::filled(6, 6, 1.0), -1.0, far);
    fa::RasterLayer farLayer(dir / "far.tif", 2001);
    EXPECT_THROW((void)bbox.crop(farLayer), fa::RasterIOError);

    // same extent, twice the resolution
    const fa::GeoTransform fine{100.0, 0.5, 0.0, 200.0, 0.0, -0.5};
    writeTestRaster(dir / "fine.tif", fa_test::filled(12, 12, 1.0), -1.0, fine);
    fa::RasterLayer fineLayer(dir / "fine.tif", 2001);
    EXPECT_THROW((void)bbox.crop(fineLayer), fa::AlignmentError);
}
