#include "alica/core/config.hpp"
#include "alica/core/errors.hpp"

#include <gtest/gtest.h>

#include <limits>

namespace alica::core {
namespace gtest {

TEST(Config, DefaultsAreValid) {
	EXPECT_NO_THROW(validate(PipelineConfig{}));
}

TEST(Config, TickIntervalLowerBound) {
	ControlConfig config;
	config.tickIntervalMs = MIN_TICK_INTERVAL_MS;
	EXPECT_NO_THROW(validate(config));

	config.tickIntervalMs = 50;
	EXPECT_THROW(validate(config), ConfigurationError);
}

TEST(Config, RejectsInvalidAnalysis) {
	AnalysisConfig config;
	config.maxFps = 0;
	EXPECT_THROW(validate(config), ConfigurationError);

	config               = {};
	config.pollBackoffMs = 0;
	EXPECT_THROW(validate(config), ConfigurationError);
}

TEST(Config, RejectsInvalidLaserLimits) {
	EXPECT_THROW(validate(LaserLimits{10.0, 5.0, 0.05}), ConfigurationError);
	EXPECT_THROW(validate(LaserLimits{0.0, 5.0, 1.5}), ConfigurationError);
	EXPECT_THROW(validate(LaserLimits{0.0, std::numeric_limits<double>::infinity(), 0.05}), ConfigurationError);
	EXPECT_THROW(validate(LaserLimits{0.0, 5.0, std::numeric_limits<double>::quiet_NaN()}), ConfigurationError);
	EXPECT_NO_THROW(validate(LaserLimits{5.0, 5.0, 0.0}));
}

TEST(Config, PipelineValidatesParts) {
	PipelineConfig config;
	config.control.tickIntervalMs = 10;
	EXPECT_THROW(validate(config), ConfigurationError);

	config               = {};
	config.joinTimeoutMs = 0;
	EXPECT_THROW(validate(config), ConfigurationError);
}

TEST(Config, MinFramePeriod) {
	AnalysisConfig config;
	config.maxFps = 10;
	EXPECT_EQ(minFramePeriod(config), std::chrono::milliseconds(100));
	config.maxFps = 1;
	EXPECT_EQ(minFramePeriod(config), std::chrono::milliseconds(1000));
}

} // namespace gtest
} // namespace alica::core
