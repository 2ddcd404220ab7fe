#include "alica/pipeline/controlLoop.hpp"

#include "alica/core/errors.hpp"
#include "alica/pipeline/analysisLoop.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <utility>

namespace alica::pipeline {

ControlLoop::ControlLoop(AnalysisLoop& analysis, core::Controller& controller, core::Laser& laser, const core::RunClock& clock,
                         const core::ControlConfig config)
    : core::Worker("ControlLoop"), m_analysis(analysis), m_controller(controller), m_laser(laser), m_clock(clock),
      m_tickIntervalMs(config.tickIntervalMs) {
	core::validate(config);
}

ControlLoop::~ControlLoop() {
	shutdown();
}

void ControlLoop::connect(Callbacks callbacks) {
	if (state() != core::WorkerState::Stopped) {
		throw core::ConfigurationError("ControlLoop callbacks can only be changed while stopped.");
	}
	m_callbacks = std::move(callbacks);
}

void ControlLoop::setSetpoint(const double value) {
	std::lock_guard lock(m_controllerMutex);
	m_controller.setSetpoint(value);
}

double ControlLoop::getSetpoint() const {
	std::lock_guard lock(m_controllerMutex);
	return m_controller.getSetpoint();
}

double ControlLoop::currentOutput() const {
	std::lock_guard lock(m_controllerMutex);
	return m_controller.getCurrentOutput();
}

void ControlLoop::setTickInterval(const std::chrono::milliseconds interval) {
	core::ControlConfig config;
	config.tickIntervalMs = static_cast<int>(interval.count());
	core::validate(config);
	m_tickIntervalMs = config.tickIntervalMs;
}

ControlStatistics ControlLoop::statistics() const {
	ControlStatistics stats;
	stats.ticks        = m_ticks.load();
	stats.failedTicks  = m_failedTicks.load();
	stats.signal       = m_lastSignal.load();
	stats.setpoint     = m_lastSetpoint.load();
	stats.appliedPower = m_appliedPower.load();
	return stats;
}

void ControlLoop::run() {
	m_ticks        = 0;
	m_failedTicks  = 0;
	m_appliedPower = m_laser.getPowerCached();

	auto nextTick = std::chrono::steady_clock::now() + tickInterval();
	while (!stopRequested()) {
		if (!sleepUntil(nextTick)) {
			break; // Stop requested while waiting.
		}

		tick();

		// Missed ticks are dropped instead of being executed back to back.
		const auto now = std::chrono::steady_clock::now();
		nextTick += tickInterval();
		if (nextTick <= now) {
			nextTick = now + tickInterval();
		}
	}
}

void ControlLoop::tick() {
	const std::uint64_t frameNumber = m_analysis.currentImageCount();
	const std::int64_t timestampMs  = m_clock.elapsedMs();

	double signal = m_lastSignal.load();
	try {
		signal = m_analysis.queryBatchOutput();
	} catch (const std::exception& ex) {
		spdlog::warn("ControlLoop: Failed to query analyzer batch output, reusing last value {}: {}", signal, ex.what());
	}
	m_lastSignal = signal;
	if (m_callbacks.onBatchOutput) {
		m_callbacks.onBatchOutput(frameNumber, signal);
	}

	double setpoint;
	try {
		std::lock_guard lock(m_controllerMutex);
		m_controller.nextValue(signal, timestampMs);
		setpoint = m_controller.getCurrentOutput();
	} catch (const std::exception& ex) {
		++m_failedTicks;
		spdlog::warn("ControlLoop: Controller failed at {} ms, laser stays at {}: {}", timestampMs, m_laser.getPowerCached(), ex.what());
		return;
	}
	m_lastSetpoint = setpoint;

	double applied;
	try {
		applied = m_laser.setPower(setpoint);
	} catch (const std::exception& ex) {
		++m_failedTicks;
		spdlog::warn("ControlLoop: Failed to set laser power to {}, laser stays at {}: {}", setpoint, m_laser.getPowerCached(), ex.what());
		return;
	}
	m_appliedPower = applied;
	++m_ticks;

	if (m_callbacks.onPowerApplied) {
		m_callbacks.onPowerApplied(frameNumber, setpoint, applied);
	}
}

} // namespace alica::pipeline
