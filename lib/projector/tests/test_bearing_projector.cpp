#include <gtest/gtest.h>
#include <cmath>
#include "../include/BearingProjector.h"
#include "../include/Readout.h"

class BearingProjectorTest : public ::testing::Test
{
protected:
    static ProjectorConfig unsmoothed()
    {
        ProjectorConfig config;
        config.position_smoothing = 1.0f;
        return config;
    }

    GeoPoint origin{0.0, 0.0, 0.0};
    GeoPoint east{0.0, 1.0, 0.0};
};

TEST_F(BearingProjectorTest, NoOutputBeforeFirstProjection)
{
    BearingProjector projector;
    EXPECT_FALSE(projector.hasProjection());
}

TEST_F(BearingProjectorTest, TargetStraightAhead)
{
    BearingProjector projector(unsmoothed());
    ASSERT_TRUE(projector.project(origin, east, 90.0f));

    const float radius = projector.getConfig().render_radius;
    EXPECT_NEAR(projector.result().relative_bearing_deg, 0.0f, 1e-4f);
    EXPECT_NEAR(projector.direction().x(), 0.0f, 1e-4f);
    EXPECT_NEAR(projector.direction().y(), 0.0f, 1e-4f);
    EXPECT_NEAR(projector.direction().z(), -radius, 1e-4f);
}

TEST_F(BearingProjectorTest, TargetToTheRightAndBehind)
{
    BearingProjector projector(unsmoothed());
    const float radius = projector.getConfig().render_radius;

    projector.project(origin, east, 0.0f);
    EXPECT_NEAR(projector.result().relative_bearing_deg, 90.0f, 1e-4f);
    EXPECT_NEAR(projector.direction().x(), radius, 1e-4f);
    EXPECT_NEAR(projector.direction().z(), 0.0f, 1e-4f);

    projector.project(origin, east, 270.0f);
    EXPECT_NEAR(projector.result().relative_bearing_deg, 180.0f, 1e-4f);
    EXPECT_NEAR(projector.direction().x(), 0.0f, 1e-4f);
    EXPECT_NEAR(projector.direction().z(), radius, 1e-4f);
}

TEST_F(BearingProjectorTest, RelativeBearingAlwaysInHalfOpenRange)
{
    BearingProjector projector(unsmoothed());
    const GeoPoint targets[] = {{1, 0}, {0, 1}, {-1, 0}, {0, -1}, {1, 1}, {-1, -1}, {0.5, -0.2}};

    for (const GeoPoint &target : targets)
    {
        for (float heading = 0.0f; heading < 360.0f; heading += 7.5f)
        {
            ASSERT_TRUE(projector.project(origin, target, heading));
            float relative = projector.result().relative_bearing_deg;
            EXPECT_GT(relative, -180.0f);
            EXPECT_LE(relative, 180.0f);
        }
    }
}

TEST_F(BearingProjectorTest, ElevationClampedForSteepTargets)
{
    BearingProjector projector(unsmoothed());
    const float limit = projector.getConfig().max_elevation_rad;

    // Roughly one metre north, ten kilometres up
    GeoPoint above(1.0 / 111194.93, 0.0, 10000.0);
    projector.project(origin, above, 0.0f);
    EXPECT_FLOAT_EQ(projector.result().elevation_rad, limit);
    EXPECT_NEAR(projector.direction().y(), projector.getConfig().render_radius * std::sin(limit), 1e-4f);

    GeoPoint below(1.0 / 111194.93, 0.0, -10000.0);
    projector.project(origin, below, 0.0f);
    EXPECT_FLOAT_EQ(projector.result().elevation_rad, -limit);
}

TEST_F(BearingProjectorTest, ShallowElevationNotClamped)
{
    BearingProjector projector(unsmoothed());
    GeoPoint hill(0.0, 1.0, 1000.0);
    projector.project(origin, hill, 90.0f);

    float expected = std::atan2(1000.0f, static_cast<float>(projector.result().horizontal_distance_m));
    EXPECT_NEAR(projector.result().elevation_rad, expected, 1e-6f);
}

TEST_F(BearingProjectorTest, ConfiguredClampIsHonoured)
{
    ProjectorConfig config = unsmoothed();
    config.max_elevation_rad = static_cast<float>(M_PI / 6.0);
    BearingProjector projector(config);

    projector.project(origin, GeoPoint(0.0, 0.0001, 5000.0), 0.0f);
    EXPECT_FLOAT_EQ(projector.result().elevation_rad, config.max_elevation_rad);
}

TEST_F(BearingProjectorTest, DistancesIncludeAltitude)
{
    BearingProjector projector(unsmoothed());
    GeoPoint raised(0.0, 1.0, 500.0);
    projector.project(GeoPoint(0.0, 0.0, 100.0), raised, 0.0f);

    const BearingResult &result = projector.result();
    EXPECT_NEAR(result.horizontal_distance_m, 111194.93, 1.0);
    EXPECT_NEAR(result.total_distance_m, std::sqrt(result.horizontal_distance_m * result.horizontal_distance_m + 400.0 * 400.0), 1e-6);
}

TEST_F(BearingProjectorTest, DegenerateBeforeAnyBearingEmitsNothing)
{
    BearingProjector projector(unsmoothed());
    EXPECT_FALSE(projector.project(origin, origin, 0.0f));
    EXPECT_FALSE(projector.hasProjection());
}

TEST_F(BearingProjectorTest, DegenerateRetainsLastRelativeBearing)
{
    BearingProjector projector(unsmoothed());
    GeoPoint target(10.0, 20.0, 0.0);

    projector.project(GeoPoint(10.0, 19.0, 0.0), target, 45.0f);
    float previous = projector.result().relative_bearing_deg;
    Eigen::Vector3f previous_direction = projector.direction();

    ASSERT_TRUE(projector.project(target, target, 300.0f));
    EXPECT_TRUE(projector.isDegenerate());
    EXPECT_FLOAT_EQ(projector.result().relative_bearing_deg, previous);
    EXPECT_DOUBLE_EQ(projector.result().horizontal_distance_m, 0.0);
    EXPECT_FALSE(std::isnan(projector.direction().x()));
    EXPECT_TRUE(projector.direction().isApprox(previous_direction, 1e-5f));
}

TEST_F(BearingProjectorTest, PlacementIsSmoothedTowardRawValue)
{
    ProjectorConfig config;
    config.position_smoothing = 0.5f;
    BearingProjector projector(config);
    const float radius = config.render_radius;

    // First placement is taken as-is
    projector.project(origin, east, 90.0f);
    EXPECT_NEAR(projector.direction().z(), -radius, 1e-4f);

    // Target now at +90: raw (r, 0, 0), smoothed halfway
    projector.project(origin, east, 0.0f);
    EXPECT_NEAR(projector.direction().x(), radius * 0.5f, 1e-4f);
    EXPECT_NEAR(projector.direction().z(), -radius * 0.5f, 1e-4f);
    // Bearing outputs are not smoothed
    EXPECT_NEAR(projector.result().relative_bearing_deg, 90.0f, 1e-4f);
}

TEST_F(BearingProjectorTest, NonFiniteHeadingLeavesOutputUntouched)
{
    BearingProjector projector(unsmoothed());
    projector.project(origin, east, 90.0f);
    BearingResult before = projector.result();

    EXPECT_FALSE(projector.project(origin, east, NAN));
    EXPECT_FLOAT_EQ(projector.result().relative_bearing_deg, before.relative_bearing_deg);
}

TEST_F(BearingProjectorTest, ResetForgetsEverything)
{
    BearingProjector projector(unsmoothed());
    projector.project(origin, east, 90.0f);
    projector.reset();

    EXPECT_FALSE(projector.hasProjection());
    EXPECT_FALSE(projector.project(origin, origin, 0.0f));
}

TEST(ReadoutTest, CompassStripOffsetWraps)
{
    EXPECT_FLOAT_EQ(compassStripOffset(0.0f, 1.0f), 0.0f);
    EXPECT_FLOAT_EQ(compassStripOffset(90.0f, 1.0f), 90.0f);
    EXPECT_FLOAT_EQ(compassStripOffset(90.0f, 2.0f), 180.0f);
    EXPECT_FLOAT_EQ(compassStripOffset(450.0f, 1.0f), 90.0f);
    EXPECT_FLOAT_EQ(compassStripOffset(-10.0f, 1.0f), 350.0f);
    EXPECT_FLOAT_EQ(compassStripOffset(90.0f, 0.0f), 0.0f);
}

TEST(ReadoutTest, DistanceRoundedToNearestMetre)
{
    Projection projection;
    projection.available = true;
    projection.bearing.total_distance_m = 1234.5;

    DisplayReadout readout = makeReadout(projection, 12.0f, 1.0f);
    EXPECT_TRUE(readout.available);
    EXPECT_EQ(readout.rounded_distance_m, 1235);
    EXPECT_FLOAT_EQ(readout.compass_offset_px, 12.0f);
}

TEST(ReadoutTest, UnavailableProjectionHasNoDistance)
{
    Projection projection;
    DisplayReadout readout = makeReadout(projection, 0.0f, 1.0f);
    EXPECT_FALSE(readout.available);
    EXPECT_EQ(readout.rounded_distance_m, 0);
}
