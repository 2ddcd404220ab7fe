#pragma once

#include "alica/core/laser.hpp"

#include <chrono>

namespace alica::core {

//! Minimum controller tick interval. Bounds actuator chatter.
inline constexpr int MIN_TICK_INTERVAL_MS = 100;

//! Frame acquisition and analysis pacing.
struct AnalysisConfig {
	int maxFps{10};              //!< Upper bound of analysed frames per second (polling sources).
	int pollBackoffMs{2};        //!< Sleep between polls while no new frame is available.
	int frameWaitTimeoutMs{100}; //!< Longest single wait for a pushed frame before the stop flag is re-checked.
};

//! Controller scheduling.
struct ControlConfig {
	int tickIntervalMs{1000}; //!< Period of the control loop. At least MIN_TICK_INTERVAL_MS.
};

//! Full configuration of a run.
struct PipelineConfig {
	AnalysisConfig analysis{};
	ControlConfig control{};
	LaserLimits laser{0.0, 100.0, 0.05};
	int joinTimeoutMs{10000}; //!< How long stop() waits for each loop before reporting it as hung.
};

//! \throws ConfigurationError naming the first violated constraint.
void validate(const AnalysisConfig& config);
void validate(const ControlConfig& config);
void validate(const LaserLimits& limits);
void validate(const PipelineConfig& config);

//! Minimum time between two analysed frames for the given frame limit.
std::chrono::milliseconds minFramePeriod(const AnalysisConfig& config);

} // namespace alica::core
