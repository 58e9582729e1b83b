/**
 * @file test_stem.cpp
 * @brief Unit tests for the STEM class taper, height, volume and weight equations
 */

#include <gtest/gtest.h>
#include "stem.hpp"

#include <cmath>
#include <limits>
#include <string>
#include <vector>

class StemTest : public ::testing::Test {
protected:
    void SetUp() override {
        coefficients = TABLE_PROVIDER::reference();
        model_default.resolve( coefficients );
        model_outside.resolve( coefficients );
    }

    TABLE_PROVIDER coefficients;
    STEM model_default;
    STEM model_outside{ "deep south", "loblolly pine", 16.0, 90.0, 0 };
};

// table with the reference loblolly pine rows and custom segmentation coefficients
static TABLE_PROVIDER custom_segmentation( const SEGMENT_PARMS &seg )
{
    TABLE_PROVIDER table;
    table.add_regression( "deep south", "loblolly pine", BARK::INSIDE, { -0.47, 0.91, 0.80, 0.59 } );
    table.add_segmentation( "loblolly pine", BARK::INSIDE, seg );
    return table;
}

TEST_F(StemTest, DefaultDescriptors) {
    STEM stem;
    EXPECT_EQ(stem.get_region(), "deep south");
    EXPECT_EQ(stem.get_spp(), "loblolly pine");
    EXPECT_DOUBLE_EQ(stem.get_dbh(), 16.0);
    EXPECT_DOUBLE_EQ(stem.get_ht(), 90.0);
    EXPECT_EQ(stem.get_bark(), BARK::INSIDE);
    EXPECT_FALSE(stem.is_resolved());
}

TEST_F(StemTest, DescriptorsMatchResolvedRows) {
    EXPECT_EQ(model_default.get_bark(), BARK::INSIDE);
    EXPECT_DOUBLE_EQ(model_default.get_regression().reg17_a, 0.80);
    EXPECT_DOUBLE_EQ(model_default.get_segmentation().butt_r, 31.0);
    EXPECT_EQ(model_default.estimate_diameter(10.0), 13.59);

    EXPECT_EQ(model_outside.get_bark(), BARK::OUTSIDE);
    EXPECT_DOUBLE_EQ(model_outside.get_regression().reg17_a, 0.86);
    EXPECT_DOUBLE_EQ(model_outside.get_segmentation().butt_r, 38.0);
    EXPECT_EQ(model_outside.estimate_diameter(10.0), 14.97);

    // changing dimensions keeps the descriptors and the resolved rows together
    model_default.set_dimensions( 16.0, 90.0 );
    EXPECT_EQ(model_default.get_bark(), BARK::INSIDE);
    EXPECT_EQ(model_default.estimate_diameter(10.0), 13.59);
}

TEST_F(StemTest, ResolveStoresCoefficients) {
    EXPECT_TRUE(model_default.has_regression());
    EXPECT_TRUE(model_default.has_segmentation());
    EXPECT_TRUE(model_default.is_resolved());
    EXPECT_DOUBLE_EQ(model_default.get_regression().reg17_a, 0.80);
    EXPECT_DOUBLE_EQ(model_default.get_segmentation().ustem_a, 0.62);
    EXPECT_DOUBLE_EQ(model_default.get_weight().tons_per_cuft, 0.0275);
}

TEST_F(StemTest, DiaAtGirardEquals) {
    EXPECT_EQ(model_default.dia_at_girard(), 13.15);
}

TEST_F(StemTest, DiaAtGirardLessThanDbh) {
    EXPECT_LT(model_outside.dia_at_girard(), model_outside.get_dbh());
}

TEST_F(StemTest, DbhInsideBarkLessThanDbh) {
    EXPECT_EQ(model_default.dbh_inside_bark(), 14.09);
    EXPECT_LT(model_default.dbh_inside_bark(), model_default.get_dbh());
    EXPECT_LT(model_outside.dbh_inside_bark(), model_outside.get_dbh());
}

TEST_F(StemTest, StemDiameterEquals) {
    EXPECT_EQ(model_default.estimate_diameter(50.0), 9.80);
}

TEST_F(StemTest, StemHeightEquals) {
    EXPECT_EQ(model_default.estimate_height(9.8), 50.0);
}

TEST_F(StemTest, HeightInvertsDiameter) {
    for (double h : {1.0, 2.0, 3.0, 10.0, 12.0, 15.0, 25.0, 40.0, 50.0, 60.0, 70.0, 85.0}) {
        double d = model_default.estimate_diameter(h);
        EXPECT_NEAR(model_default.estimate_height(d), h, 0.1) << "h = " << h << ", d = " << d;
    }
}

TEST_F(StemTest, DiameterInsideBarkBelowDbh) {
    for (int i = 1; i < 900; ++i) {
        double h = i / 10.0;
        EXPECT_LT(model_default.estimate_diameter(h), model_default.get_dbh()) << "h = " << h;
    }
}

TEST_F(StemTest, DiameterDecreasesUpTheStem) {
    EXPECT_GT(model_default.estimate_diameter(1.0), model_default.estimate_diameter(4.0));
    EXPECT_GT(model_default.estimate_diameter(5.0), model_default.estimate_diameter(17.0));
    EXPECT_GT(model_default.estimate_diameter(20.0), model_default.estimate_diameter(80.0));
    EXPECT_EQ(model_default.estimate_diameter(90.0), 0.0);
}

TEST_F(StemTest, OutsideBarkDiameterBelowDbh) {
    EXPECT_LT(model_outside.estimate_diameter(5.0), model_outside.get_dbh());
}

TEST_F(StemTest, BreakpointsEvaluateToZero) {
    EXPECT_NO_THROW(model_default.estimate_diameter(4.5));
    EXPECT_NO_THROW(model_default.estimate_diameter(17.3));
    EXPECT_EQ(model_default.estimate_diameter(4.5), 0.0);
    EXPECT_EQ(model_default.estimate_diameter(17.3), 0.0);
    EXPECT_EQ(model_outside.estimate_diameter(4.5), 0.0);
    EXPECT_EQ(model_outside.estimate_diameter(17.3), 0.0);
}

TEST_F(StemTest, HeightAtZeroDiameterIsTotalHeight) {
    EXPECT_EQ(model_default.estimate_height(0.0), 90.0);
}

TEST_F(StemTest, VolumeEquals) {
    EXPECT_EQ(model_default.estimate_volume(1.0, 50.0), 42.0);
    EXPECT_EQ(model_default.estimate_volume(0.0, 90.0), 51.0);
}

TEST_F(StemTest, VolumeClampsToTotalHeight) {
    EXPECT_EQ(model_default.estimate_volume(0.0, 100.0), model_default.estimate_volume(0.0, 90.0));
    EXPECT_EQ(model_default.estimate_volume(95.0, 100.0), 0.0);
    EXPECT_EQ(model_default.estimate_volume(20.0, 20.0), 0.0);
}

TEST_F(StemTest, VolumeNonDecreasingInUpper) {
    for (auto *stem : {&model_default, &model_outside}) {
        double last = 0.0;
        for (int i = 0; i <= 200; ++i) {
            double upper = i / 2.0;
            double v = stem->estimate_volume(0.0, upper);
            EXPECT_GE(v, last) << "upper = " << upper;
            last = v;
        }
    }
}

TEST_F(StemTest, WeightUsesSpeciesConversion) {
    EXPECT_EQ(model_default.estimate_weight(0.0, 90.0), 1.40);
}

TEST_F(StemTest, WeightFallsBackToDefaultConversion) {
    STEM stem;
    stem.resolve( custom_segmentation( model_default.get_segmentation() ) );
    EXPECT_DOUBLE_EQ(stem.get_weight().tons_per_cuft, DEFAULT_TONS_PER_CUFT);
    EXPECT_EQ(stem.estimate_weight(0.0, 90.0), 1.12);
}

TEST_F(StemTest, MissingSpeciesRaisesLookupError) {
    STEM stem( "deep south", "slash pine", 14.0, 80.0, 1 );
    try {
        stem.resolve( coefficients );
        FAIL() << "expected LOOKUP_ERROR";
    } catch (const LOOKUP_ERROR &e) {
        EXPECT_EQ(e.missing(), (std::vector<std::string>{ "regression", "segmentation" }));
        EXPECT_NE(std::string(e.what()).find("slash pine"), std::string::npos);
    }

    EXPECT_FALSE(stem.has_regression());
    EXPECT_FALSE(stem.has_segmentation());
    EXPECT_DOUBLE_EQ(stem.get_weight().tons_per_cuft, 0.022);
    EXPECT_THROW(stem.dia_at_girard(), UNRESOLVED_PARAMETERS);
    EXPECT_THROW(stem.estimate_diameter(50.0), UNRESOLVED_PARAMETERS);
    EXPECT_THROW(stem.estimate_height(9.8), UNRESOLVED_PARAMETERS);
    EXPECT_THROW(stem.estimate_volume(1.0, 50.0), UNRESOLVED_PARAMETERS);
    EXPECT_THROW(stem.estimate_weight(1.0, 50.0), UNRESOLVED_PARAMETERS);
}

TEST_F(StemTest, MissingRegionLeavesSegmentationResolved) {
    STEM stem( "piedmont", "loblolly pine", 16.0, 90.0, 1 );
    try {
        stem.resolve( coefficients );
        FAIL() << "expected LOOKUP_ERROR";
    } catch (const LOOKUP_ERROR &e) {
        EXPECT_EQ(e.missing(), (std::vector<std::string>{ "regression" }));
    }

    EXPECT_FALSE(stem.has_regression());
    EXPECT_TRUE(stem.has_segmentation());
    EXPECT_THROW(stem.estimate_diameter(50.0), UNRESOLVED_PARAMETERS);
}

TEST_F(StemTest, RegressionOnlyStillGivesGirardDiameter) {
    TABLE_PROVIDER table;
    table.add_regression( "deep south", "loblolly pine", BARK::INSIDE, model_default.get_regression() );

    STEM stem;
    EXPECT_THROW(stem.resolve( table ), LOOKUP_ERROR);
    EXPECT_EQ(stem.dia_at_girard(), 13.15);
    EXPECT_EQ(stem.dbh_inside_bark(), 14.09);
    EXPECT_THROW(stem.estimate_diameter(50.0), UNRESOLVED_PARAMETERS);
}

TEST_F(StemTest, ResolveAgainKeepsResolvedGroups) {
    TABLE_PROVIDER empty;
    EXPECT_NO_THROW(model_default.resolve( empty ));
    EXPECT_EQ(model_default.dia_at_girard(), 13.15);
    EXPECT_DOUBLE_EQ(model_default.get_weight().tons_per_cuft, 0.0275);
    EXPECT_EQ(model_default.estimate_diameter(50.0), 9.80);
}

TEST_F(StemTest, ResolveRetriesMissingGroups) {
    STEM stem;
    TABLE_PROVIDER empty;
    EXPECT_THROW(stem.resolve( empty ), LOOKUP_ERROR);
    EXPECT_FALSE(stem.is_resolved());

    EXPECT_NO_THROW(stem.resolve( coefficients ));
    EXPECT_TRUE(stem.is_resolved());
    EXPECT_EQ(stem.estimate_diameter(50.0), 9.80);
}

TEST_F(StemTest, SetDimensionsRecomputesDerivedDiameters) {
    model_default.set_dimensions( 16.0, 80.0 );
    EXPECT_EQ(model_default.dia_at_girard(), 13.24);
    EXPECT_EQ(model_default.estimate_diameter(50.0), 8.93);

    EXPECT_THROW(model_default.set_dimensions( 16.0, 17.3 ), INVALID_DIMENSION);
    EXPECT_DOUBLE_EQ(model_default.get_ht(), 80.0);
}

TEST_F(StemTest, InvalidDimensionsRejected) {
    EXPECT_THROW(STEM( "deep south", "loblolly pine", 0.0, 90.0, 1 ), INVALID_DIMENSION);
    EXPECT_THROW(STEM( "deep south", "loblolly pine", -2.0, 90.0, 1 ), INVALID_DIMENSION);
    EXPECT_THROW(STEM( "deep south", "loblolly pine", 16.0, 10.0, 1 ), INVALID_DIMENSION);
    EXPECT_THROW(STEM( "deep south", "loblolly pine", 16.0, 90.0, 2 ), INVALID_DIMENSION);
    EXPECT_THROW(STEM( "deep south", "loblolly pine", 16.0, 90.0, -1 ), INVALID_DIMENSION);
}

TEST_F(StemTest, GirardHeightTreeIsDomainError) {
    EXPECT_THROW(STEM( "deep south", "loblolly pine", 16.0, 17.3, 1 ), DOMAIN_ERROR);
}

TEST_F(StemTest, InvalidQueriesRejected) {
    EXPECT_THROW(model_default.estimate_diameter(-1.0), INVALID_DIMENSION);
    EXPECT_THROW(model_default.estimate_diameter(91.0), INVALID_DIMENSION);
    EXPECT_THROW(model_default.estimate_height(-1.0), INVALID_DIMENSION);
    EXPECT_THROW(model_default.estimate_volume(-1.0, 50.0), INVALID_DIMENSION);
    EXPECT_THROW(model_default.estimate_volume(50.0, 10.0), INVALID_DIMENSION);
}

TEST_F(StemTest, NonFiniteQueriesRejected) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();

    EXPECT_THROW(model_default.estimate_diameter(nan), INVALID_DIMENSION);
    EXPECT_THROW(model_default.estimate_height(nan), INVALID_DIMENSION);
    EXPECT_THROW(model_default.estimate_height(inf), INVALID_DIMENSION);
    EXPECT_THROW(model_default.estimate_volume(nan, nan), INVALID_DIMENSION);
    EXPECT_THROW(model_default.estimate_volume(0.0, nan), INVALID_DIMENSION);
    EXPECT_THROW(model_default.estimate_volume(0.0, inf), INVALID_DIMENSION);
    EXPECT_THROW(model_default.estimate_weight(nan, 50.0), INVALID_DIMENSION);
}

TEST_F(StemTest, DiameterAboveButtIsDomainError) {
    // butt diameter at ground level is 15.66 for the reference tree
    EXPECT_EQ(model_default.estimate_height(15.66), 0.0);
    EXPECT_THROW(model_default.estimate_height(16.0), DOMAIN_ERROR);
    EXPECT_THROW(model_default.estimate_height(20.0), DOMAIN_ERROR);
}

TEST_F(StemTest, NegativeSquaredDiameterIsDomainError) {
    STEM stem;
    stem.resolve( custom_segmentation( { 31.0, 0.2, 100.0, 6.5, -0.5, 0.62 } ) );
    EXPECT_THROW(stem.estimate_diameter(50.0), DOMAIN_ERROR);
}

TEST_F(StemTest, ZeroDenominatorIsDomainError) {
    // lstem_p == 0 makes X == Y
    STEM stem;
    stem.resolve( custom_segmentation( { 31.0, 0.2, 100.0, 0.0, 2.1113, 0.62 } ) );
    EXPECT_THROW(stem.estimate_diameter(10.0), DOMAIN_ERROR);
    EXPECT_THROW(stem.estimate_height(13.5), DOMAIN_ERROR);
    EXPECT_THROW(stem.estimate_volume(0.0, 90.0), DOMAIN_ERROR);
}

TEST_F(StemTest, LegacyHeightExponent) {
    // butt and lower stem sections divide by r and p instead of taking the root
    EXPECT_EQ(model_default.estimate_height(15.1, HEIGHT_EXPONENT::LEGACY), 87.95);
    EXPECT_EQ(model_default.estimate_height(13.59, HEIGHT_EXPONENT::LEGACY), 83.57);
    EXPECT_NEAR(model_default.estimate_height(15.1), 1.0, 0.1);
    EXPECT_NEAR(model_default.estimate_height(13.59), 10.0, 0.1);

    // upper stem is the same in both modes
    EXPECT_EQ(model_default.estimate_height(9.8, HEIGHT_EXPONENT::LEGACY), 50.0);
}

TEST_F(StemTest, DescribeListsCoefficients) {
    STEM stem;
    EXPECT_NE(stem.describe().find("reg=None"), std::string::npos);
    EXPECT_NE(model_default.describe().find("loblolly pine"), std::string::npos);
    EXPECT_NE(model_default.describe().find("ustem_a=0.62"), std::string::npos);
}
