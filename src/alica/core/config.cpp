#include "alica/core/config.hpp"

#include "alica/core/errors.hpp"

#include <cmath>
#include <format>

namespace alica::core {

void validate(const AnalysisConfig& config) {
	if (config.maxFps < 1) {
		throw ConfigurationError(std::format("Maximum FPS must be positive (got {}).", config.maxFps));
	}
	if (config.pollBackoffMs < 1) {
		throw ConfigurationError(std::format("Poll backoff must be at least 1 ms (got {}).", config.pollBackoffMs));
	}
	if (config.frameWaitTimeoutMs < 1) {
		throw ConfigurationError(std::format("Frame wait timeout must be at least 1 ms (got {}).", config.frameWaitTimeoutMs));
	}
}

void validate(const ControlConfig& config) {
	if (config.tickIntervalMs < MIN_TICK_INTERVAL_MS) {
		throw ConfigurationError(std::format("Controller tick rate must be at least {} ms (got {}).", MIN_TICK_INTERVAL_MS, config.tickIntervalMs));
	}
}

void validate(const LaserLimits& limits) {
	if (!std::isfinite(limits.minPower) || !std::isfinite(limits.maxPower)) {
		throw ConfigurationError("Laser power limits must be finite.");
	}
	if (limits.minPower > limits.maxPower) {
		throw ConfigurationError(std::format("Minimum laser power {} exceeds maximum {}.", limits.minPower, limits.maxPower));
	}
	if (!(limits.deadzone >= 0.0 && limits.deadzone <= 1.0)) {
		throw ConfigurationError(std::format("Laser deadzone must be within [0, 1] (got {}).", limits.deadzone));
	}
}

void validate(const PipelineConfig& config) {
	validate(config.analysis);
	validate(config.control);
	validate(config.laser);
	if (config.joinTimeoutMs < 1) {
		throw ConfigurationError(std::format("Join timeout must be at least 1 ms (got {}).", config.joinTimeoutMs));
	}
}

std::chrono::milliseconds minFramePeriod(const AnalysisConfig& config) {
	return std::chrono::milliseconds(1000 / config.maxFps);
}

} // namespace alica::core
