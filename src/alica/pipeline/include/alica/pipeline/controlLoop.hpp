#pragma once

#include "alica/core/config.hpp"
#include "alica/core/controller.hpp"
#include "alica/core/laser.hpp"
#include "alica/core/runClock.hpp"
#include "alica/core/worker.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <limits>
#include <mutex>

namespace alica::pipeline {

class AnalysisLoop;

//! Results of the most recent control tick.
struct ControlStatistics {
	std::uint64_t ticks{0};                                        //!< Completed ticks in this run.
	std::uint64_t failedTicks{0};                                  //!< Ticks where the controller or the laser failed.
	double signal{std::numeric_limits<double>::quiet_NaN()};       //!< Last batch output fed to the controller.
	double setpoint{std::numeric_limits<double>::quiet_NaN()};     //!< Last controller output.
	double appliedPower{std::numeric_limits<double>::quiet_NaN()}; //!< Power in force after the last tick.
};

/*! Periodic controller driver.
 *  Every tick the batch output of the analyzer is fed to the controller and the controller output is sent to the laser.
 *  A failing controller or laser is logged and the laser keeps its previous power.
 */
class ControlLoop : public core::Worker {
public:
	//! Invoked on the loop thread. Must return quickly and not throw.
	struct Callbacks {
		std::function<void(std::uint64_t, double)> onBatchOutput;          //!< (frame number, batch output) per tick.
		std::function<void(std::uint64_t, double, double)> onPowerApplied; //!< (frame number, controller output, applied power).
	};

public:
	//! \throws ConfigurationError if the tick interval is below MIN_TICK_INTERVAL_MS.
	ControlLoop(AnalysisLoop& analysis, core::Controller& controller, core::Laser& laser, const core::RunClock& clock, core::ControlConfig config);
	~ControlLoop() override;

	void connect(Callbacks callbacks); //!< Set the callbacks. Only while Stopped.

	void setSetpoint(double value); //!< Thread-safe. Takes effect at the next tick.
	double getSetpoint() const;
	double currentOutput() const; //!< Controller output without advancing the controller.

	//! Change the tick interval. Takes effect after the pending tick.
	//! \throws ConfigurationError if the interval is below MIN_TICK_INTERVAL_MS.
	void setTickInterval(std::chrono::milliseconds interval);
	std::chrono::milliseconds tickInterval() const { return std::chrono::milliseconds(m_tickIntervalMs.load()); }

	ControlStatistics statistics() const;

protected:
	void run() override;

private:
	void tick();

private:
	AnalysisLoop& m_analysis;
	core::Controller& m_controller;
	core::Laser& m_laser;
	const core::RunClock& m_clock;

	mutable std::mutex m_controllerMutex; //!< Held for the duration of a single controller call.
	std::atomic<int> m_tickIntervalMs;
	Callbacks m_callbacks{};

	std::atomic<std::uint64_t> m_ticks{0};
	std::atomic<std::uint64_t> m_failedTicks{0};
	std::atomic<double> m_lastSignal{std::numeric_limits<double>::quiet_NaN()};
	std::atomic<double> m_lastSetpoint{std::numeric_limits<double>::quiet_NaN()};
	std::atomic<double> m_appliedPower{std::numeric_limits<double>::quiet_NaN()};
};

} // namespace alica::pipeline
