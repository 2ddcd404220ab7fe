#include "alica/plugins/factory.hpp"

#include "alica/core/errors.hpp"
#include "alica/plugins/intensityAnalyzer.hpp"
#include "alica/plugins/manualController.hpp"
#include "alica/plugins/thresholdController.hpp"

#include <format>

namespace alica::plugins {

std::unique_ptr<core::Analyzer> makeAnalyzer(const AnalyzerConfig& config) {
	std::unique_ptr<core::Analyzer> analyzer;
	if (config.type == "intensity") {
		analyzer = std::make_unique<IntensityAnalyzer>();
	} else if (config.type == "spots") {
		analyzer = std::make_unique<SpotCounter>(config.spots);
	} else {
		throw core::ConfigurationError(std::format("Unknown analyzer '{}'.", config.type));
	}

	analyzer->setRoi(config.roi);
	return analyzer;
}

std::unique_ptr<core::Controller> makeController(const ControllerConfig& config) {
	if (config.type == "pid") {
		return std::make_unique<PidController>(config.pid, config.setpoint);
	}
	if (config.type == "threshold") {
		return std::make_unique<ThresholdController>(config.thresholdLow, config.thresholdHigh, config.setpoint);
	}
	if (config.type == "manual") {
		return std::make_unique<ManualController>(config.setpoint);
	}
	throw core::ConfigurationError(std::format("Unknown controller '{}'.", config.type));
}

std::vector<std::string> analyzerTypes() {
	return {"intensity", "spots"};
}

std::vector<std::string> controllerTypes() {
	return {"pid", "threshold", "manual"};
}

} // namespace alica::plugins
