#pragma once

#include "alica/core/analyzer.hpp"
#include "alica/core/config.hpp"
#include "alica/core/fpsCounter.hpp"
#include "alica/core/frameSource.hpp"
#include "alica/core/frameWatcher.hpp"
#include "alica/core/runClock.hpp"
#include "alica/core/worker.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <limits>
#include <mutex>
#include <optional>
#include <string>

namespace alica::pipeline {

//! Throughput statistics of the analysis loop.
struct AnalysisStatistics {
	int fps{0};                     //!< Frames received in the last full second of loop time.
	std::int64_t lastAnalysisMs{0}; //!< Duration of the last processImage() call.
	std::uint64_t frameCount{0};    //!< Frames handed to the analyzer since the last acquisition start, rejected ones included.
	std::uint64_t failedFrames{0};  //!< Frames rejected by the analyzer in this run.
	double intermittentOutput{std::numeric_limits<double>::quiet_NaN()};
};

/*! Consumer thread driving the Analyzer.
 *  Always takes the newest frame. Frames arriving faster than the analyzer can process them are skipped.
 *  Every analyzer call goes through one lock, so the ControlLoop can query the batch output from its own thread.
 *  A push source is connected by start(), so no notification sent after start() returned is lost.
 *  On exit the source is released and the analyzer disposed, also when the last frame failed.
 */
class AnalysisLoop : public core::Worker {
public:
	//! Invoked on the loop thread (onAcquisitionEnded on the source thread). Must return quickly and not throw.
	struct Callbacks {
		std::function<void(std::uint64_t, double)> onIntermittentOutput; //!< (frame number, value) after every analysed frame.
		std::function<void(int)> onFps;                                  //!< Once per second of loop time.
		std::function<void()> onAcquisitionEnded;                        //!< Push source finished its acquisition. Source locks may be held.
		std::function<void()> onStopped;                                 //!< Last call of the loop thread, source released and analyzer disposed.
	};

public:
	//! Poll the source for new frames, at most config.maxFps per second.
	AnalysisLoop(core::Analyzer& analyzer, core::PollingFrameSource& source, const core::RunClock& clock, core::AnalysisConfig config);

	//! Analyse frames pushed by the source.
	AnalysisLoop(core::Analyzer& analyzer, core::PushFrameSource& source, const core::RunClock& clock, core::AnalysisConfig config);

	~AnalysisLoop() override;

	void connect(Callbacks callbacks); //!< Set the callbacks. Only while Stopped.

	double queryIntermittentOutput(); //!< Locked call to Analyzer::getIntermittentOutput().
	double queryBatchOutput();        //!< Locked call to Analyzer::getBatchOutput(). Resets the analyzer aggregation.
	void setRoi(const cv::Rect& roi); //!< Locked call to Analyzer::setRoi().
	std::string analyzerDescription() const;

	AnalysisStatistics statistics() const;
	std::uint64_t currentImageCount() const { return m_imageCounter.load(); }

	void resetImageCounter(); //!< Restart frame numbering. Called when an acquisition starts.

	const core::FrameWatcher& watcher() const { return m_watcher; }

protected:
	void run() override;
	void wake() override;
	void onStarting() override;

private:
	std::optional<core::Frame> nextFrame();
	std::optional<core::Frame> pollFrame();
	std::optional<core::Frame> awaitPushedFrame();

	void analyseFrames();
	bool analyse(core::Frame& frame);
	void publishFrameStatistics(std::int64_t finishedMs);

	void attachPushSource();
	void detachPushSource();
	void disposeAnalyzer();

private:
	core::Analyzer& m_analyzer;
	core::PollingFrameSource* m_pollingSource{nullptr}; //!< Set in polling mode.
	core::PushFrameSource* m_pushSource{nullptr};       //!< Set in push mode.
	const core::RunClock& m_clock;
	const core::AnalysisConfig m_config;

	mutable std::mutex m_analyzerMutex; //!< Held for the duration of a single analyzer call.
	core::FrameWatcher m_watcher;       //!< Single-slot handoff from the push source.
	Callbacks m_callbacks{};

	// Loop thread only.
	std::optional<core::FrameId> m_lastPolledId{};
	core::FpsCounter m_fpsCounter{};

	// Published for other threads.
	std::atomic<int> m_lastFps{0};
	std::atomic<std::int64_t> m_lastAnalysisMs{0};
	std::atomic<std::uint64_t> m_imageCounter{0};
	std::atomic<std::uint64_t> m_failedFrames{0};
	std::atomic<double> m_intermittentOutput{std::numeric_limits<double>::quiet_NaN()};
};

} // namespace alica::pipeline
