#include <gtest/gtest.h>

#include "hough_ml/core/config.hpp"
#include "hough_ml/core/errors.hpp"

#include <limits>

using namespace hough_ml::core;

TEST(ConfigTest, DefaultsAreValid) {
    AnalysisConfig config;
    EXPECT_NO_THROW(validateConfig(config));

    MatchingParams matching = config.matchingParams();
    EXPECT_DOUBLE_EQ(matching.tolerance, config.hough.tolerance);
    EXPECT_EQ(matching.square_size, config.hough.square_size);
}

TEST(ConfigTest, RejectsBadHoughParameters) {
    AnalysisConfig config;
    config.hough.nbin_phi = 0;
    EXPECT_THROW(validateConfig(config), ConfigurationError);

    config = AnalysisConfig();
    config.hough.square_size = 0;
    EXPECT_THROW(validateConfig(config), ConfigurationError);

    config = AnalysisConfig();
    config.hough.tolerance = 0.0;
    EXPECT_THROW(validateConfig(config), ConfigurationError);

    config.hough.tolerance = std::numeric_limits<double>::infinity();
    EXPECT_THROW(validateConfig(config), ConfigurationError);
}

TEST(ConfigTest, RejectsBadPeakParameters) {
    AnalysisConfig config;
    config.peak_detection.threshold_rel = 1.5;
    EXPECT_THROW(validateConfig(config), ConfigurationError);

    config = AnalysisConfig();
    config.peak_detection.min_distance = 0;
    EXPECT_THROW(validateConfig(config), ConfigurationError);

    config = AnalysisConfig();
    config.peak_detection.smooth_sigma = -1.0;
    EXPECT_THROW(validateConfig(config), ConfigurationError);
}

TEST(ConfigTest, RejectsSlicesOutsideRange) {
    AnalysisConfig config;
    config.processing.total_slices = 4;
    config.processing.slice_list = {0, 3, -1};
    EXPECT_NO_THROW(validateConfig(config));

    config.processing.slice_list = {4};
    EXPECT_THROW(validateConfig(config), ConfigurationError);

    config.processing.slice_list = {-2};
    EXPECT_THROW(validateConfig(config), ConfigurationError);

    config.processing.slice_list.clear();
    EXPECT_THROW(validateConfig(config), ConfigurationError);
}

TEST(ConfigTest, VzRangeCheckedOnlyWhenEnabled) {
    AnalysisConfig config;
    config.processing.vz_min = 10.0;
    config.processing.vz_max = -10.0;
    EXPECT_THROW(validateConfig(config), ConfigurationError);

    config.processing.use_vz_range = false;
    EXPECT_NO_THROW(validateConfig(config));
}

TEST(ConfigTest, VzRangeNeedsTwoValues) {
    ProcessingParams processing;
    processing.setVzRange({-50.0, 75.0});
    EXPECT_DOUBLE_EQ(processing.vz_min, -50.0);
    EXPECT_DOUBLE_EQ(processing.vz_max, 75.0);

    EXPECT_THROW(processing.setVzRange({-50.0}), ConfigurationError);
    EXPECT_THROW(processing.setVzRange({}), ConfigurationError);
    EXPECT_THROW(processing.setVzRange({-1.0, 0.0, 1.0}), ConfigurationError);

    // A rejected list leaves the previous range untouched
    EXPECT_DOUBLE_EQ(processing.vz_min, -50.0);
    EXPECT_DOUBLE_EQ(processing.vz_max, 75.0);
}

TEST(ConfigTest, RejectsEmptyEasingName) {
    AnalysisConfig config;
    config.easing_type.clear();
    EXPECT_THROW(validateConfig(config), ConfigurationError);
}

TEST(ConfigTest, SummaryNamesKeySettings) {
    AnalysisConfig config;
    config.processing.slice_list = {1, 2};
    const std::string summary = config.toString();
    EXPECT_NE(summary.find("Easing Type: InSquare"), std::string::npos);
    EXPECT_NE(summary.find("[1, 2]"), std::string::npos);
}
