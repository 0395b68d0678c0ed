#include "test.hpp"
#include "TestRasters.hpp"

#include "fa/core/indicator/CompositeIndicator.hpp"
#include "fa/core/indicator/ResultsProvider.hpp"
#include "fa/core/render/GraphPlotter.hpp"
#include "fa/core/render/LayerColorizer.hpp"
#include "fa/core/util/Errors.hpp"

using fa_test::ScratchDir;
using fa_test::writeTestRaster;

namespace {

class CountingColorizer : public fa::LayerColorizer
{
public:
    fa::RenderResult colorize(const std::vector<fa::LayerSlot>& slots,
                              const std::string& palette,
                              const fa::Color&) const override
    {
        ++calls;
        seenPalette = palette;
        fa::RenderResult result;
        for (const auto& slot : slots) {
            result.frames.push_back({slot.year, slot.layer ? slot.layer->path() : std::filesystem::path(), {}});
        }
        result.legend.push_back({"all", 0.0, 1.0, fa::Color(0, 0, 0)});
        return result;
    }

    mutable int calls = 0;
    mutable std::string seenPalette;
};

class RecordingPlotter : public fa::GraphPlotter
{
public:
    std::vector<fa::Frame> render(const std::string& indicator,
                                  const std::string& title,
                                  const fa::ResultsProvider& provider,
                                  fa::Units units,
                                  const fa::GraphOptions&) const override
    {
        seenIndicator = indicator;
        seenTitle = title;
        seenUnits = units;
        seenYears = provider.simulationYears();
        return {};
    }

    mutable std::string seenIndicator;
    mutable std::string seenTitle;
    mutable fa::Units seenUnits{fa::Units::Blank};
    mutable std::pair<int, int> seenYears;
};

// A_2001 = B_2001, A_2002 = B_2002 + 5.
void writeComponents(const ScratchDir& dir)
{
    cv::Mat_<double> v(2, 3);
    v << 1, 2, 3, 4, 5, -1;
    writeTestRaster(dir / "A_2001.tif", v, -1.0);
    writeTestRaster(dir / "B_2001.tif", v, -1.0);

    cv::Mat_<double> b2002 = fa_test::filled(2, 3, 10.0);
    writeTestRaster(dir / "B_2002.tif", b2002, -1.0);
    writeTestRaster(dir / "A_2002.tif", cv::Mat_<double>(b2002 + 5.0), -1.0);
}

fa::CompositeIndicator makeIndicator(const ScratchDir& dir, std::shared_ptr<const fa::LayerColorizer> colorizer)
{
    return fa::CompositeIndicator(
        "NBP",
        {{(dir / "A_*.tif").string(), fa::BlendMode::Add},
         {(dir / "B_*.tif").string(), fa::BlendMode::Subtract}},
        "", fa::Units::Ktc, fa::Units::TcPerHa, "viridis", fa::Color(255, 255, 255),
        std::move(colorizer));
}

} // namespace

TEST(CompositeIndicator, TitleDefaultsToName)
{
    fa::CompositeIndicator indicator("NBP", {});
    EXPECT_EQ(indicator.title(), std::string("NBP"));
    EXPECT_TRUE(indicator.graphUnits() == fa::Units::Tc);
    EXPECT_TRUE(indicator.mapUnits() == fa::Units::TcPerHa);
    EXPECT_EQ(indicator.palette(), std::string("Greens"));

    fa::CompositeIndicator titled("NBP", {}, "Net Biome Productivity");
    EXPECT_EQ(titled.title(), std::string("Net Biome Productivity"));
}

TEST(CompositeIndicator, AddThenSubtractOfEqualComponentsIsZero)
{
    ScratchDir dir("composite_zero");
    writeComponents(dir);
    auto colorizer = std::make_shared<CountingColorizer>();
    auto indicator = makeIndicator(dir, colorizer);

    const auto& composite = indicator.compositeLayers();
    ASSERT_EQ(composite.size(), 2u);
    EXPECT_EQ(composite.years(), (std::vector<int>{2001, 2002}));

    const fa::Raster r2001 = composite.layer(2001)->open();
    for (int y = 0; y < 2; ++y) {
        for (int x = 0; x < 3; ++x) {
            const double v = r2001.values(y, x);
            EXPECT_TRUE(v == 0.0 || fa::isNodata(v, r2001.info.nodata));
        }
    }
    EXPECT_TRUE(fa::isNodata(r2001.values(1, 2), r2001.info.nodata));

    const fa::Raster r2002 = composite.layer(2002)->open();
    EXPECT_FLOAT_EQ(r2002.values(0, 0), 5.0);
}

TEST(CompositeIndicator, CompositeIsBuiltOnce)
{
    ScratchDir dir("composite_once");
    writeComponents(dir);
    auto indicator = makeIndicator(dir, std::make_shared<CountingColorizer>());

    const auto& first = indicator.compositeLayers();
    const auto path2001 = first.layer(2001)->path();
    const auto& second = indicator.compositeLayers();
    EXPECT_EQ(&first, &second);
    EXPECT_EQ(second.layer(2001)->path(), path2001);

    (void)indicator.renderMapFrames();
    EXPECT_EQ(indicator.compositeLayers().layer(2001)->path(), path2001);
}

TEST(CompositeIndicator, RenderMapFramesCoversSimulationYears)
{
    ScratchDir dir("composite_render");
    writeComponents(dir);
    auto colorizer = std::make_shared<CountingColorizer>();
    auto indicator = makeIndicator(dir, colorizer);

    const auto result = indicator.renderMapFrames();
    EXPECT_EQ(colorizer->calls, 1);
    EXPECT_EQ(colorizer->seenPalette, std::string("viridis"));
    ASSERT_EQ(result.frames.size(), 2u);
    EXPECT_EQ(result.frames[0].year, 2001);
    EXPECT_EQ(result.frames[1].year, 2002);
    EXPECT_EQ(result.legend.size(), 1u);
}

TEST(CompositeIndicator, RenderGraphFramesUsesCompositeResults)
{
    ScratchDir dir("composite_graph");
    writeComponents(dir);
    auto indicator = makeIndicator(dir, std::make_shared<CountingColorizer>());

    RecordingPlotter plotter;
    (void)indicator.renderGraphFrames(plotter);
    EXPECT_EQ(plotter.seenIndicator, std::string("NBP"));
    EXPECT_EQ(plotter.seenTitle, std::string("NBP"));
    EXPECT_TRUE(plotter.seenUnits == fa::Units::Ktc);
    EXPECT_EQ(plotter.seenYears.first, 2001);
    EXPECT_EQ(plotter.seenYears.second, 2002);
}

TEST(CompositeIndicator, MissingComponentFailsBeforeBlending)
{
    ScratchDir dir("composite_missing");
    writeComponents(dir);
    fa::CompositeIndicator indicator(
        "NBP",
        {{(dir / "A_*.tif").string(), fa::BlendMode::Add},
         {(dir / "Rh_*.tif").string(), fa::BlendMode::Subtract}});

    try {
        (void)indicator.renderMapFrames();
        EXPECT_TRUE(false);
    } catch (const fa::DiscoveryError& e) {
        EXPECT_NE(std::string(e.what()).find("Rh_*.tif"), std::string::npos);
    }
}

TEST(CompositeIndicator, MismatchedComponentYearsThrow)
{
    ScratchDir dir("composite_years");
    writeComponents(dir);
    writeTestRaster(dir / "C_2001.tif", fa_test::filled(2, 3, 1.0), -1.0);
    fa::CompositeIndicator indicator(
        "NBP",
        {{(dir / "A_*.tif").string(), fa::BlendMode::Add},
         {(dir / "C_*.tif").string(), fa::BlendMode::Add}});

    EXPECT_THROW((void)indicator.renderMapFrames(), fa::AlignmentError);
}
