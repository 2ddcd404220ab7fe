#pragma once

#include "alica/core/analyzer.hpp"
#include "alica/core/controller.hpp"
#include "alica/plugins/pidController.hpp"
#include "alica/plugins/spotCounter.hpp"

#include <memory>
#include <string>
#include <vector>

namespace alica::plugins {

//! Analyzer selection by name ("intensity", "spots").
struct AnalyzerConfig {
	std::string type{"spots"};
	SpotCounterConfig spots{};
	cv::Rect roi{}; //!< Initial region of interest. Empty -> whole image.
};

//! Controller selection by name ("pid", "threshold", "manual").
struct ControllerConfig {
	std::string type{"pid"};
	double setpoint{0.0};
	PidConfig pid{};
	double thresholdLow{0.0};
	double thresholdHigh{1.0};
};

//! \throws ConfigurationError for an unknown type or invalid parameters.
std::unique_ptr<core::Analyzer> makeAnalyzer(const AnalyzerConfig& config);
std::unique_ptr<core::Controller> makeController(const ControllerConfig& config);

std::vector<std::string> analyzerTypes();
std::vector<std::string> controllerTypes();

} // namespace alica::plugins
