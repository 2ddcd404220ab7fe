#include "alica/pipeline/analysisLoop.hpp"

#include "alica/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <exception>
#include <utility>

namespace alica::pipeline {

namespace {

//! Runs a function when leaving the scope, also during stack unwinding.
template <typename F>
class ScopeExit {
public:
	explicit ScopeExit(F function) : m_function(std::move(function)) {
	}
	~ScopeExit() {
		m_function();
	}

	ScopeExit(const ScopeExit&)            = delete;
	ScopeExit& operator=(const ScopeExit&) = delete;

private:
	F m_function;
};

} // namespace

AnalysisLoop::AnalysisLoop(core::Analyzer& analyzer, core::PollingFrameSource& source, const core::RunClock& clock, const core::AnalysisConfig config)
    : core::Worker("AnalysisLoop"), m_analyzer(analyzer), m_pollingSource(&source), m_clock(clock), m_config(config) {
	core::validate(m_config);
}

AnalysisLoop::AnalysisLoop(core::Analyzer& analyzer, core::PushFrameSource& source, const core::RunClock& clock, const core::AnalysisConfig config)
    : core::Worker("AnalysisLoop"), m_analyzer(analyzer), m_pushSource(&source), m_clock(clock), m_config(config) {
	core::validate(m_config);
}

AnalysisLoop::~AnalysisLoop() {
	shutdown();
}

void AnalysisLoop::connect(Callbacks callbacks) {
	if (state() != core::WorkerState::Stopped) {
		throw core::ConfigurationError("AnalysisLoop callbacks can only be changed while stopped.");
	}
	m_callbacks = std::move(callbacks);
}

double AnalysisLoop::queryIntermittentOutput() {
	std::lock_guard lock(m_analyzerMutex);
	return m_analyzer.getIntermittentOutput();
}

double AnalysisLoop::queryBatchOutput() {
	std::lock_guard lock(m_analyzerMutex);
	return m_analyzer.getBatchOutput();
}

void AnalysisLoop::setRoi(const cv::Rect& roi) {
	std::lock_guard lock(m_analyzerMutex);
	m_analyzer.setRoi(roi);
}

std::string AnalysisLoop::analyzerDescription() const {
	std::lock_guard lock(m_analyzerMutex);
	return m_analyzer.getShortDescription();
}

AnalysisStatistics AnalysisLoop::statistics() const {
	AnalysisStatistics stats;
	stats.fps                = m_lastFps.load();
	stats.lastAnalysisMs     = m_lastAnalysisMs.load();
	stats.frameCount         = m_imageCounter.load();
	stats.failedFrames       = m_failedFrames.load();
	stats.intermittentOutput = m_intermittentOutput.load();
	return stats;
}

void AnalysisLoop::resetImageCounter() {
	m_imageCounter = 0;
}

void AnalysisLoop::wake() {
	m_watcher.interrupt();
}

void AnalysisLoop::onStarting() {
	m_fpsCounter.reset(m_clock.elapsedMs());
	m_lastPolledId.reset();
	m_failedFrames = 0;
	m_watcher.reset();
	attachPushSource();
}

void AnalysisLoop::run() {
	analyseFrames();
	if (m_callbacks.onStopped) {
		m_callbacks.onStopped();
	}
}

void AnalysisLoop::analyseFrames() {
	// Declared first, so the analyzer is released after the source stopped notifying.
	ScopeExit releaseAnalyzer([this]() { disposeAnalyzer(); });
	ScopeExit releaseSource([this]() { detachPushSource(); });

	while (!stopRequested()) {
		std::optional<core::Frame> frame = nextFrame();
		if (!frame) {
			continue; // Timeout, interrupt or stop request. Re-check the loop condition.
		}

		const auto periodStart = std::chrono::steady_clock::now();
		analyse(*frame);

		// Frame limiter. Push sources are paced by the notifier.
		if (m_pollingSource != nullptr) {
			sleepUntil(periodStart + core::minFramePeriod(m_config));
		}
	}
}

std::optional<core::Frame> AnalysisLoop::nextFrame() {
	return m_pollingSource != nullptr ? pollFrame() : awaitPushedFrame();
}

std::optional<core::Frame> AnalysisLoop::pollFrame() {
	const auto backoff = std::chrono::milliseconds(m_config.pollBackoffMs);

	// Query until the source delivers a frame that differs from the last analysed one.
	while (!stopRequested()) {
		try {
			std::optional<core::Frame> frame = m_pollingSource->getLatestFrame();
			if (frame && !frame->empty() && (!m_lastPolledId || frame->id != *m_lastPolledId)) {
				m_lastPolledId = frame->id;
				return frame;
			}
		} catch (const core::TransientAcquisitionError& ex) {
			spdlog::debug("AnalysisLoop: Failed to receive image from {}: {}", m_pollingSource->getName(), ex.what());
		}
		sleepFor(backoff);
	}
	return std::nullopt;
}

std::optional<core::Frame> AnalysisLoop::awaitPushedFrame() {
	const std::optional<core::FrameId> id = m_watcher.awaitNext(std::chrono::milliseconds(m_config.frameWaitTimeoutMs));
	if (!id) {
		return std::nullopt;
	}

	try {
		core::Frame frame = m_pushSource->fetchFrame(*id);
		if (frame.empty()) {
			spdlog::debug("AnalysisLoop: Frame {} from {} is empty.", *id, m_pushSource->getName());
			return std::nullopt;
		}
		return frame;
	} catch (const core::TransientAcquisitionError& ex) {
		spdlog::debug("AnalysisLoop: Frame {} no longer available from {}: {}", *id, m_pushSource->getName(), ex.what());
		return std::nullopt;
	}
}

bool AnalysisLoop::analyse(core::Frame& frame) {
	frame.timestampMs = m_clock.elapsedMs();

	const std::uint64_t frameNumber = ++m_imageCounter;

	double output;
	try {
		{
			std::lock_guard lock(m_analyzerMutex);
			m_analyzer.processImage(frame.pixels, frame.pixelSizeUm, frame.timestampMs);
		}
		m_lastAnalysisMs = m_clock.elapsedMs() - frame.timestampMs;
		output           = queryIntermittentOutput();
	} catch (const std::exception& ex) {
		// A single bad frame must not stop the pipeline. It still counts as a received frame.
		++m_failedFrames;
		spdlog::warn("AnalysisLoop: Error in processing frame {} ({}x{}, image {}): {}", frame.id, frame.width(), frame.height(), frameNumber,
		             ex.what());
		publishFrameStatistics(m_clock.elapsedMs());
		return false;
	}

	m_intermittentOutput = output;
	if (m_callbacks.onIntermittentOutput) {
		m_callbacks.onIntermittentOutput(frameNumber, output);
	}

	publishFrameStatistics(frame.timestampMs + m_lastAnalysisMs.load());
	return true;
}

void AnalysisLoop::publishFrameStatistics(const std::int64_t finishedMs) {
	const std::optional<int> fps = m_fpsCounter.addFrame(finishedMs);
	if (!fps) {
		return;
	}

	m_lastFps = *fps;
	if (m_callbacks.onFps) {
		m_callbacks.onFps(*fps);
	}
}

void AnalysisLoop::attachPushSource() {
	if (m_pushSource == nullptr) {
		return;
	}

	m_pushSource->connect({
	        [this](core::FrameId id) { m_watcher.publish(id); },
	        [this]() {
		        spdlog::info("AnalysisLoop: Acquisition start detected. Analysing frames from {}.", m_pushSource->getName());
		        m_watcher.reset();
		        resetImageCounter();
	        },
	        [this]() {
		        spdlog::info("AnalysisLoop: Acquisition end detected on {}.", m_pushSource->getName());
		        if (m_callbacks.onAcquisitionEnded) {
			        m_callbacks.onAcquisitionEnded();
		        }
	        },
	});
}

void AnalysisLoop::detachPushSource() {
	if (m_pushSource != nullptr) {
		m_pushSource->disconnect();
	}
}

void AnalysisLoop::disposeAnalyzer() {
	try {
		std::lock_guard lock(m_analyzerMutex);
		m_analyzer.dispose();
	} catch (const std::exception& ex) {
		spdlog::error("AnalysisLoop: Failed to dispose analyzer {}: {}", m_analyzer.getName(), ex.what());
	}
}

} // namespace alica::pipeline
