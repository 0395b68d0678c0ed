#include "test.hpp"
#include "TestRasters.hpp"

#include <stdexcept>

#include "fa/core/indicator/ResultsProvider.hpp"
#include "fa/core/indicator/Units.hpp"

using fa_test::ScratchDir;
using fa_test::writeTestRaster;

namespace {

fa::LayerCollection series(const ScratchDir& dir, const fa::GeoTransform& gt)
{
    fa::LayerCollection layers;
    for (int year : {2012, 2010, 2011}) {
        cv::Mat_<double> v = fa_test::filled(2, 2, year - 2009);
        v(0, 0) = -1.0;
        const auto path = dir / ("NBP_" + std::to_string(year) + ".tif");
        writeTestRaster(path, v, -1.0, gt);
        layers.append(std::make_shared<fa::RasterLayer>(path, year));
    }
    return layers;
}

} // namespace

TEST(Units, LabelsAndDivisors)
{
    EXPECT_EQ(fa::unitsLabel(fa::Units::TcPerHa), std::string("tC/ha"));
    EXPECT_EQ(fa::unitsLabel(fa::Units::Blank), std::string());
    EXPECT_FLOAT_EQ(fa::unitsDivisor(fa::Units::Ktc), 1e3);
    EXPECT_FLOAT_EQ(fa::unitsDivisor(fa::Units::Mtc), 1e6);
    EXPECT_TRUE(fa::unitsFromString("tcperha") == fa::Units::TcPerHa);
    EXPECT_TRUE(fa::unitsFromString("MtC") == fa::Units::Mtc);
    EXPECT_TRUE(fa::unitsFromString("tC/ha") == fa::Units::TcPerHa);
    EXPECT_THROW(fa::unitsFromString("bushels"), std::invalid_argument);
}

TEST(SpatialResultsProvider, SimulationYearsAreMinAndMax)
{
    ScratchDir dir("provider_years");
    fa::SpatialResultsProvider provider(series(dir, fa_test::defaultTransform()), false);
    const auto [first, last] = provider.simulationYears();
    EXPECT_EQ(first, 2010);
    EXPECT_EQ(last, 2012);

    fa::SpatialResultsProvider empty(fa::LayerCollection(), false);
    EXPECT_THROW((void)empty.simulationYears(), std::runtime_error);
}

TEST(SpatialResultsProvider, AnnualTotalsSkipNodata)
{
    ScratchDir dir("provider_totals");
    fa::SpatialResultsProvider provider(series(dir, fa_test::defaultTransform()), false);

    const auto totals = provider.annualResults(fa::Units::Tc);
    ASSERT_EQ(totals.size(), 3u);
    EXPECT_FLOAT_EQ(totals.at(2010), 3.0);
    EXPECT_FLOAT_EQ(totals.at(2012), 9.0);

    const auto ranged = provider.annualResults(fa::Units::Ktc, 2011, 2011);
    ASSERT_EQ(ranged.size(), 1u);
    EXPECT_FLOAT_EQ(ranged.at(2011), 6.0 / 1e3);
}

TEST(SpatialResultsProvider, PerHectareScalesByPixelArea)
{
    ScratchDir dir("provider_area");
    // 100 m pixels are one hectare each; 200 m pixels four.
    const fa::GeoTransform gt{0.0, 200.0, 0.0, 1000.0, 0.0, -200.0};
    fa::SpatialResultsProvider provider(series(dir, gt), true);
    EXPECT_TRUE(provider.perHectare());
    EXPECT_FLOAT_EQ(provider.annualResults(fa::Units::Tc).at(2010), 12.0);
}
