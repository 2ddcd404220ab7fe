#include "alica/plugins/simulatedCamera.hpp"

#include "alica/core/errors.hpp"

#include <opencv2/imgproc.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <format>
#include <numbers>
#include <utility>

namespace alica::plugins {

void validate(const SimulatedCameraConfig& config) {
	if (config.width <= 0 || config.height <= 0) {
		throw core::ConfigurationError(std::format("Invalid simulated image size {}x{}.", config.width, config.height));
	}
	if (!std::isfinite(config.fps) || config.fps <= 0.0) {
		throw core::ConfigurationError(std::format("Simulated frame rate must be > 0, got {}.", config.fps));
	}
	if (config.spotCount < 0) {
		throw core::ConfigurationError(std::format("Spot count must be >= 0, got {}.", config.spotCount));
	}
	if (config.spotSigmaPx <= 0.0 || config.noiseSigma < 0.0) {
		throw core::ConfigurationError("Spot width must be > 0 and noise must be >= 0.");
	}
	if (config.storeSize == 0) {
		throw core::ConfigurationError("Frame store must hold at least one frame.");
	}
}

SimulatedCamera::SimulatedCamera(SimulatedCameraConfig config)
    : core::Worker("SimulatedCamera"), m_config(std::move(config)), m_spotCount(m_config.spotCount), m_rng(m_config.seed) {
	validate(m_config);
}

SimulatedCamera::~SimulatedCamera() {
	shutdown();
}

std::optional<core::Frame> SimulatedCamera::getLatestFrame() {
	std::lock_guard lock(m_storeMutex);
	if (m_store.empty()) {
		return std::nullopt;
	}
	return m_store.back();
}

void SimulatedCamera::connect(core::PushFrameSource::Callbacks callbacks) {
	std::lock_guard lock(m_callbackMutex);
	m_callbacks = std::move(callbacks);
}

void SimulatedCamera::disconnect() {
	std::lock_guard lock(m_callbackMutex);
	m_callbacks = {};
}

core::Frame SimulatedCamera::fetchFrame(const core::FrameId id) {
	std::lock_guard lock(m_storeMutex);
	for (const core::Frame& frame: m_store) {
		if (frame.id == id) {
			return frame;
		}
	}
	throw core::TransientAcquisitionError(std::format("Frame {} not in the store of {}.", id, getName()));
}

void SimulatedCamera::setSpotCount(const int count) {
	m_spotCount = std::max(count, 0);
}

cv::Mat SimulatedCamera::render(const int spotCount) {
	std::lock_guard lock(m_renderMutex);

	// Delta peaks scaled so the blurred peak reaches the configured amplitude.
	const double sigma = m_config.spotSigmaPx;
	const float weight = static_cast<float>(m_config.spotAmplitude * 2.0 * std::numbers::pi * sigma * sigma);
	m_canvas.create(m_config.height, m_config.width, CV_32F);
	m_canvas.setTo(0.0);
	for (int i = 0; i < spotCount; ++i) {
		const int x = m_rng.uniform(0, m_config.width);
		const int y = m_rng.uniform(0, m_config.height);
		m_canvas.at<float>(y, x) += weight;
	}
	cv::GaussianBlur(m_canvas, m_canvas, cv::Size(), sigma);

	m_noise.create(m_canvas.size(), CV_32F);
	m_rng.fill(m_noise, cv::RNG::NORMAL, m_config.background, m_config.noiseSigma);
	m_canvas += m_noise;

	cv::Mat image;
	m_canvas.convertTo(image, CV_8U); // Saturating.
	return image;
}

void SimulatedCamera::run() {
	{
		std::lock_guard lock(m_storeMutex);
		m_store.clear();
	}
	m_produced = 0;

	const auto period = std::chrono::duration_cast<std::chrono::steady_clock::duration>(std::chrono::duration<double>(1.0 / m_config.fps));
	const bool finite = m_config.acquisitionFrames > 0;

	notifyAcquisitionStarted();
	auto next = std::chrono::steady_clock::now();
	while (!stopRequested()) {
		core::Frame frame;
		frame.pixels      = render(m_spotCount.load());
		frame.pixelSizeUm = m_config.pixelSizeUm;
		{
			std::lock_guard lock(m_storeMutex);
			frame.id = m_nextId++;
		}
		const core::FrameId id = frame.id;
		store(std::move(frame));
		notifyFrame(id);

		if (++m_produced >= m_config.acquisitionFrames && finite) {
			spdlog::info("SimulatedCamera: Acquisition of {} frames finished.", m_config.acquisitionFrames);
			notifyAcquisitionEnded();
			return;
		}

		next += period;
		if (!sleepUntil(next)) {
			break;
		}
	}
}

void SimulatedCamera::store(core::Frame frame) {
	std::lock_guard lock(m_storeMutex);
	m_store.push_back(std::move(frame));
	while (m_store.size() > m_config.storeSize) {
		m_store.pop_front();
	}
}

void SimulatedCamera::notifyFrame(const core::FrameId id) {
	std::lock_guard lock(m_callbackMutex);
	if (m_callbacks.onNewFrame) {
		m_callbacks.onNewFrame(id);
	}
}

void SimulatedCamera::notifyAcquisitionStarted() {
	std::lock_guard lock(m_callbackMutex);
	if (m_callbacks.onAcquisitionStarted) {
		m_callbacks.onAcquisitionStarted();
	}
}

void SimulatedCamera::notifyAcquisitionEnded() {
	std::lock_guard lock(m_callbackMutex);
	if (m_callbacks.onAcquisitionEnded) {
		m_callbacks.onAcquisitionEnded();
	}
}

} // namespace alica::plugins
