#pragma once

#include "alica/core/analyzer.hpp"
#include "alica/core/config.hpp"
#include "alica/core/controller.hpp"
#include "alica/core/frameSource.hpp"
#include "alica/core/laser.hpp"
#include "alica/core/runClock.hpp"
#include "alica/pipeline/analysisLoop.hpp"
#include "alica/pipeline/controlLoop.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace alica::pipeline {

//! Where the frames of a run come from.
enum class ImagingMode {
	GrabFromCore,    //!< Poll the camera directly for its newest image.
	Live,            //!< Analyse frames pushed by the live stream.
	NextAcquisition, //!< Analyse frames pushed by an acquisition. The run ends with the acquisition.
};

std::string_view toString(ImagingMode mode);
std::optional<ImagingMode> imagingModeFromString(std::string_view name);

//! Collaborators of a run. A single object may serve as both frame source variants.
struct Components {
	std::unique_ptr<core::Analyzer> analyzer;
	std::unique_ptr<core::Controller> controller;
	std::unique_ptr<core::Laser> laser;
	std::shared_ptr<core::PollingFrameSource> pollingSource; //!< Required for ImagingMode::GrabFromCore.
	std::shared_ptr<core::PushFrameSource> pushSource;       //!< Required for ImagingMode::Live and ImagingMode::NextAcquisition.
};

//! Consistent view of the running pipeline for displays and telemetry.
struct TelemetrySnapshot {
	std::int64_t timeMs{0};         //!< Run time.
	std::uint64_t frameCount{0};    //!< Frames analysed since the last acquisition start.
	std::uint64_t failedFrames{0};  //!< Frames rejected by the analyzer.
	int fps{0};                     //!< Analysed frames in the last second.
	std::int64_t lastAnalysisMs{0}; //!< Duration of the last analysis.
	double intermittentOutput{std::numeric_limits<double>::quiet_NaN()};
	double batchOutput{std::numeric_limits<double>::quiet_NaN()};
	double controllerOutput{std::numeric_limits<double>::quiet_NaN()};
	double laserPower{std::numeric_limits<double>::quiet_NaN()}; //!< Cached power, no device I/O.
	std::uint64_t controlTicks{0};
	std::uint64_t failedTicks{0};
};

/*! Owns the collaborators and the two loops of a closed-loop run.
 *  Wires FrameSource -> AnalysisLoop -> ControlLoop -> Laser, starts and stops both loops and forwards runtime configuration.
 *  All public functions are thread-safe.
 */
class Coordinator {
public:
	//! Forwarded from the loops. See AnalysisLoop::Callbacks and ControlLoop::Callbacks for the calling threads.
	struct Callbacks {
		std::function<void(std::uint64_t, double)> onIntermittentOutput;
		std::function<void(std::uint64_t, double)> onBatchOutput;
		std::function<void(std::uint64_t, double, double)> onPowerApplied;
		std::function<void(int)> onFps;
		/*! The run ended on its own (end of acquisition). Called on the analysis loop thread after the frame source was
		 *  released and the analyzer disposed. stop() and requestStop() return immediately when called from here, the host
		 *  reaps the run with a later stop() or start(). Other Coordinator functions must not be called from here.
		 */
		std::function<void()> onRunFinished;
	};

public:
	//! \throws ConfigurationError if the configuration is invalid.
	Coordinator(Components components, core::PipelineConfig config);
	~Coordinator();

	Coordinator(const Coordinator&)            = delete;
	Coordinator& operator=(const Coordinator&) = delete;

	void connect(Callbacks callbacks); //!< Only while stopped.

	/*! Validate the configuration and start both loops.
	 * \throws ConfigurationError if already running, a collaborator is missing or the mode has no matching source.
	 *         No thread is started in that case.
	 */
	void start(ImagingMode mode);

	/*! Stop both loops and wait for them to drain. The telemetry of the run stays readable until the next start().
	 * \throws FatalPipelineError if a loop did not finish within the join timeout.
	 */
	void stop();

	//! Ask both loops to stop without waiting.
	void requestStop();

	bool isRunning() const;
	bool healthy() const; //!< False if a loop thread of the current run died from an escaped exception.

	void setSetpoint(double value);
	double getSetpoint() const;
	void setRoi(const cv::Rect& roi);
	void setTickIntervalMs(int intervalMs); //!< \throws ConfigurationError below MIN_TICK_INTERVAL_MS.

	TelemetrySnapshot telemetry() const; //!< Current run, or the final values of the last run while stopped.
	std::string analyzerDescription() const;
	std::optional<ImagingMode> mode() const;
	core::PipelineConfig config() const;

private:
	void validateComponents(ImagingMode mode) const;
	void createLoops(ImagingMode mode);
	void seedLaserCache();
	bool loopsActive() const;
	void stopLocked();
	TelemetrySnapshot snapshotLocked() const;
	void finishRun();

private:
	Components m_components;
	core::PipelineConfig m_config;
	core::RunClock m_clock;

	mutable std::mutex m_mutex; //!< Guards the loops, the mode and the configuration changes.
	Callbacks m_callbacks{};
	std::optional<ImagingMode> m_mode{};
	std::unique_ptr<AnalysisLoop> m_analysis;
	std::unique_ptr<ControlLoop> m_control;
	TelemetrySnapshot m_lastRun{}; //!< Taken when the loops of a run are reaped.

	std::atomic<bool> m_acquisitionEnded{false}; //!< Set on the source thread in ImagingMode::NextAcquisition.
};

} // namespace alica::pipeline
