#include "alica/pipeline/coordinator.hpp"

#include "alica/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <chrono>
#include <exception>
#include <format>
#include <utility>

namespace alica::pipeline {

namespace {

//! Coordinator whose onRunFinished callback is running on this thread.
thread_local const Coordinator* t_finishingRun = nullptr;

constexpr std::array<std::pair<ImagingMode, std::string_view>, 3> MODE_NAMES{{
        {ImagingMode::GrabFromCore, "GrabFromCore"},
        {ImagingMode::Live, "Live"},
        {ImagingMode::NextAcquisition, "NextAcquisition"},
}};

} // namespace

std::string_view toString(const ImagingMode mode) {
	for (const auto& [value, name] : MODE_NAMES) {
		if (value == mode) {
			return name;
		}
	}
	return "Unknown";
}

std::optional<ImagingMode> imagingModeFromString(const std::string_view name) {
	for (const auto& [value, valueName] : MODE_NAMES) {
		if (valueName == name) {
			return value;
		}
	}
	return std::nullopt;
}

Coordinator::Coordinator(Components components, const core::PipelineConfig config) : m_components(std::move(components)), m_config(config) {
	core::validate(m_config);
}

Coordinator::~Coordinator() {
	try {
		stop();
	} catch (const core::FatalPipelineError& ex) {
		spdlog::critical("Coordinator: Destroyed with a hung loop, waiting for it indefinitely: {}", ex.what());
	}
}

void Coordinator::connect(Callbacks callbacks) {
	std::lock_guard lock(m_mutex);
	if (loopsActive()) {
		throw core::ConfigurationError("Coordinator callbacks can only be changed while stopped.");
	}
	m_callbacks = std::move(callbacks);
}

void Coordinator::start(const ImagingMode mode) {
	std::lock_guard lock(m_mutex);
	if (loopsActive()) {
		throw core::ConfigurationError(std::format("Coordinator is already running in mode {}.", toString(*m_mode)));
	}
	stopLocked(); // Reap loops of a run that finished on its own.

	core::validate(m_config);
	validateComponents(mode);

	m_clock.restart();
	m_components.controller->reset();
	seedLaserCache();
	m_acquisitionEnded = false;
	m_lastRun          = {};
	createLoops(mode);

	m_analysis->start();
	try {
		m_control->start();
	} catch (const std::exception&) {
		m_analysis->shutdown();
		m_control.reset();
		m_analysis.reset();
		throw;
	}
	m_mode = mode;

	spdlog::info("Coordinator: Started in mode {} with analyzer {}, controller {} and laser {}-{}.", toString(mode),
	             m_components.analyzer->getName(), m_components.controller->getName(), m_components.laser->getDeviceName(),
	             m_components.laser->getPropertyName());
}

void Coordinator::stop() {
	if (t_finishingRun == this) {
		spdlog::debug("Coordinator: stop() called from onRunFinished, the run is already ending.");
		return;
	}
	std::lock_guard lock(m_mutex);
	stopLocked();
}

void Coordinator::requestStop() {
	if (t_finishingRun == this) {
		return;
	}
	std::lock_guard lock(m_mutex);
	if (m_control) {
		m_control->requestStop();
	}
	if (m_analysis) {
		m_analysis->requestStop();
	}
}

bool Coordinator::isRunning() const {
	std::lock_guard lock(m_mutex);
	return loopsActive();
}

bool Coordinator::healthy() const {
	std::lock_guard lock(m_mutex);
	return !(m_analysis && m_analysis->hasFailed()) && !(m_control && m_control->hasFailed());
}

void Coordinator::setSetpoint(const double value) {
	std::lock_guard lock(m_mutex);
	if (m_control) {
		m_control->setSetpoint(value);
	} else {
		m_components.controller->setSetpoint(value);
	}
	spdlog::info("Coordinator: Setpoint changed to {}.", value);
}

double Coordinator::getSetpoint() const {
	std::lock_guard lock(m_mutex);
	return m_control ? m_control->getSetpoint() : m_components.controller->getSetpoint();
}

void Coordinator::setRoi(const cv::Rect& roi) {
	std::lock_guard lock(m_mutex);
	if (m_analysis) {
		m_analysis->setRoi(roi);
	} else {
		m_components.analyzer->setRoi(roi);
	}
	spdlog::info("Coordinator: ROI changed to {}x{} at ({}, {}).", roi.width, roi.height, roi.x, roi.y);
}

void Coordinator::setTickIntervalMs(const int intervalMs) {
	std::lock_guard lock(m_mutex);
	core::ControlConfig control = m_config.control;
	control.tickIntervalMs      = intervalMs;
	core::validate(control);

	m_config.control = control;
	if (m_control) {
		m_control->setTickInterval(std::chrono::milliseconds(intervalMs));
	}
}

TelemetrySnapshot Coordinator::telemetry() const {
	std::lock_guard lock(m_mutex);
	if (!m_analysis && !m_control) {
		TelemetrySnapshot snapshot = m_lastRun;
		snapshot.laserPower        = m_components.laser->getPowerCached();
		return snapshot;
	}
	return snapshotLocked();
}

TelemetrySnapshot Coordinator::snapshotLocked() const {
	TelemetrySnapshot snapshot;
	snapshot.timeMs     = m_clock.elapsedMs();
	snapshot.laserPower = m_components.laser->getPowerCached();
	if (m_analysis) {
		const AnalysisStatistics analysis = m_analysis->statistics();
		snapshot.frameCount               = analysis.frameCount;
		snapshot.failedFrames             = analysis.failedFrames;
		snapshot.fps                      = analysis.fps;
		snapshot.lastAnalysisMs           = analysis.lastAnalysisMs;
		snapshot.intermittentOutput       = analysis.intermittentOutput;
	}
	if (m_control) {
		const ControlStatistics control = m_control->statistics();
		snapshot.batchOutput            = control.signal;
		snapshot.controllerOutput       = m_control->currentOutput();
		snapshot.controlTicks           = control.ticks;
		snapshot.failedTicks            = control.failedTicks;
	}
	return snapshot;
}

std::string Coordinator::analyzerDescription() const {
	std::lock_guard lock(m_mutex);
	return m_analysis ? m_analysis->analyzerDescription() : m_components.analyzer->getShortDescription();
}

std::optional<ImagingMode> Coordinator::mode() const {
	std::lock_guard lock(m_mutex);
	return m_mode;
}

core::PipelineConfig Coordinator::config() const {
	std::lock_guard lock(m_mutex);
	return m_config;
}

void Coordinator::validateComponents(const ImagingMode mode) const {
	if (!m_components.analyzer) {
		throw core::ConfigurationError("No analyzer configured.");
	}
	if (!m_components.controller) {
		throw core::ConfigurationError("No controller configured.");
	}
	if (!m_components.laser) {
		throw core::ConfigurationError("No laser configured.");
	}

	if (mode == ImagingMode::GrabFromCore && !m_components.pollingSource) {
		throw core::ConfigurationError(std::format("Mode {} requires a polling frame source.", toString(mode)));
	}
	if (mode != ImagingMode::GrabFromCore && !m_components.pushSource) {
		throw core::ConfigurationError(std::format("Mode {} requires a push frame source.", toString(mode)));
	}
}

void Coordinator::createLoops(const ImagingMode mode) {
	core::Analyzer& analyzer = *m_components.analyzer;
	if (mode == ImagingMode::GrabFromCore) {
		m_analysis = std::make_unique<AnalysisLoop>(analyzer, *m_components.pollingSource, m_clock, m_config.analysis);
	} else {
		m_analysis = std::make_unique<AnalysisLoop>(analyzer, *m_components.pushSource, m_clock, m_config.analysis);
	}
	m_control = std::make_unique<ControlLoop>(*m_analysis, *m_components.controller, *m_components.laser, m_clock, m_config.control);

	AnalysisLoop::Callbacks analysisCallbacks{m_callbacks.onIntermittentOutput, m_callbacks.onFps, {}, {}};
	if (mode == ImagingMode::NextAcquisition) {
		// Called on the source thread with its locks held. Must not take m_mutex, stop() may be waiting for the loops while
		// holding it.
		analysisCallbacks.onAcquisitionEnded = [this, analysis = m_analysis.get(), control = m_control.get()]() {
			spdlog::info("Coordinator: Acquisition finished, ending run.");
			m_acquisitionEnded = true;
			control->requestStop();
			analysis->requestStop();
		};
		analysisCallbacks.onStopped = [this]() { finishRun(); };
	}
	m_analysis->connect(std::move(analysisCallbacks));
	m_control->connect({m_callbacks.onBatchOutput, m_callbacks.onPowerApplied});
}

void Coordinator::finishRun() {
	if (!m_acquisitionEnded || !m_callbacks.onRunFinished) {
		return;
	}

	t_finishingRun = this;
	try {
		m_callbacks.onRunFinished();
	} catch (const std::exception& ex) {
		spdlog::error("Coordinator: onRunFinished failed: {}", ex.what());
	}
	t_finishingRun = nullptr;
}

void Coordinator::seedLaserCache() {
	try {
		const double power = m_components.laser->getPower();
		spdlog::debug("Coordinator: Laser {}-{} reports {}.", m_components.laser->getDeviceName(), m_components.laser->getPropertyName(), power);
	} catch (const core::DeviceError& ex) {
		spdlog::warn("Coordinator: Failed to read initial laser power, using cached value {}: {}", m_components.laser->getPowerCached(), ex.what());
	}
}

bool Coordinator::loopsActive() const {
	const auto active = [](const core::Worker* worker) { return worker != nullptr && worker->state() != core::WorkerState::Stopped; };
	return active(m_analysis.get()) || active(m_control.get());
}

void Coordinator::stopLocked() {
	if (!m_analysis && !m_control) {
		return;
	}

	// The control loop queries the analysis loop, so it goes first.
	const std::array<core::Worker*, 2> workers{m_control.get(), m_analysis.get()};
	for (core::Worker* worker : workers) {
		if (worker != nullptr) {
			worker->requestStop();
		}
	}

	const auto timeout = std::chrono::milliseconds(m_config.joinTimeoutMs);
	for (core::Worker* worker : workers) {
		if (worker == nullptr) {
			continue;
		}
		if (!worker->join(timeout)) {
			spdlog::critical("Coordinator: {} did not stop within {} ms.", worker->name(), m_config.joinTimeoutMs);
			throw core::FatalPipelineError(std::format("{} did not stop within {} ms.", worker->name(), m_config.joinTimeoutMs));
		}
		if (worker->hasFailed()) {
			spdlog::error("Coordinator: {} terminated by an error during the run.", worker->name());
		}
	}

	m_lastRun = snapshotLocked();
	m_control.reset();
	m_analysis.reset();
	m_mode.reset();
	spdlog::info("Coordinator: Stopped after {} frames.", m_lastRun.frameCount);
}

} // namespace alica::pipeline
