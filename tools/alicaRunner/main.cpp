#include "alica/core/errors.hpp"
#include "alica/core/laser.hpp"
#include "alica/pipeline/coordinator.hpp"
#include "alica/plugins/factory.hpp"
#include "alica/plugins/simulatedCamera.hpp"
#include "alica/plugins/simulatedPowerDriver.hpp"
#include "alica/plugins/videoCaptureSource.hpp"

#include <cxxopts.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <cmath>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {

std::atomic<bool> g_interrupted{false};

void onSignal(int /*signal*/) {
	g_interrupted = true;
}

cxxopts::Options buildOptions() {
	cxxopts::Options options("alicaRunner", "Closed-loop laser power control on a camera stream");
	// clang-format off
	options.add_options()
	    ("mode", "Imaging mode: GrabFromCore, Live or NextAcquisition", cxxopts::value<std::string>()->default_value("Live"))
	    ("source", "Frame source: sim, camera or a video file path", cxxopts::value<std::string>()->default_value("sim"))
	    ("camera-index", "Device index for --source=camera", cxxopts::value<int>()->default_value("0"))
	    ("duration", "Run time in seconds. 0 -> until interrupted", cxxopts::value<int>()->default_value("10"))
	    ("analyzer", "Analyzer: intensity or spots", cxxopts::value<std::string>()->default_value("spots"))
	    ("controller", "Controller: pid, threshold or manual", cxxopts::value<std::string>()->default_value("pid"))
	    ("setpoint", "Target analyzer output", cxxopts::value<double>()->default_value("20"))
	    ("kp", "PID proportional gain", cxxopts::value<double>()->default_value("0.5"))
	    ("ki", "PID integral gain (1/s)", cxxopts::value<double>()->default_value("0.2"))
	    ("kd", "PID derivative gain (s)", cxxopts::value<double>()->default_value("0"))
	    ("threshold-low", "Threshold controller low output", cxxopts::value<double>()->default_value("0"))
	    ("threshold-high", "Threshold controller high output", cxxopts::value<double>()->default_value("10"))
	    ("min-power", "Lowest laser power", cxxopts::value<double>()->default_value("0"))
	    ("max-power", "Highest laser power", cxxopts::value<double>()->default_value("100"))
	    ("deadzone", "Relative laser deadzone (0-1)", cxxopts::value<double>()->default_value("0.05"))
	    ("tick-ms", "Control loop interval in ms", cxxopts::value<int>()->default_value("1000"))
	    ("max-fps", "Frame limit for polling sources", cxxopts::value<int>()->default_value("10"))
	    ("sim-fps", "Simulated camera frame rate", cxxopts::value<double>()->default_value("20"))
	    ("sim-frames", "Frames per simulated acquisition. 0 -> endless", cxxopts::value<std::uint64_t>()->default_value("0"))
	    ("sim-spots-per-power", "Simulated emitters per unit of laser power", cxxopts::value<double>()->default_value("1.0"))
	    ("pixel-size", "Pixel size in um for camera and file sources", cxxopts::value<double>()->default_value("0"))
	    ("log-level", "trace, debug, info, warn, error or critical", cxxopts::value<std::string>()->default_value("info"))
	    ("h,help", "Print usage");
	// clang-format on
	return options;
}

} // namespace

int main(int argc, char** argv) {
	using namespace alica;

	cxxopts::Options options = buildOptions();
	cxxopts::ParseResult args;
	try {
		args = options.parse(argc, argv);
	} catch (const cxxopts::exceptions::exception& ex) {
		std::cerr << ex.what() << "\n" << options.help() << std::endl;
		return 1;
	}
	if (args.count("help")) {
		std::cout << options.help() << std::endl;
		return 0;
	}

	spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] [%t] %v");
	spdlog::set_level(spdlog::level::from_str(args["log-level"].as<std::string>()));

	const auto mode = pipeline::imagingModeFromString(args["mode"].as<std::string>());
	if (!mode) {
		spdlog::error("alicaRunner: Unknown imaging mode '{}'.", args["mode"].as<std::string>());
		return 1;
	}

	core::PipelineConfig config;
	config.analysis.maxFps        = args["max-fps"].as<int>();
	config.control.tickIntervalMs = args["tick-ms"].as<int>();
	config.laser.minPower         = args["min-power"].as<double>();
	config.laser.maxPower         = args["max-power"].as<double>();
	config.laser.deadzone         = args["deadzone"].as<double>();

	plugins::AnalyzerConfig analyzerConfig;
	analyzerConfig.type = args["analyzer"].as<std::string>();

	plugins::ControllerConfig controllerConfig;
	controllerConfig.type          = args["controller"].as<std::string>();
	controllerConfig.setpoint      = args["setpoint"].as<double>();
	controllerConfig.pid.kp        = args["kp"].as<double>();
	controllerConfig.pid.ki        = args["ki"].as<double>();
	controllerConfig.pid.kd        = args["kd"].as<double>();
	controllerConfig.pid.outputMin = config.laser.minPower;
	controllerConfig.pid.outputMax = config.laser.maxPower;
	controllerConfig.thresholdLow  = args["threshold-low"].as<double>();
	controllerConfig.thresholdHigh = args["threshold-high"].as<double>();

	try {
		pipeline::Components components;
		components.analyzer   = plugins::makeAnalyzer(analyzerConfig);
		components.controller = plugins::makeController(controllerConfig);
		components.laser      = std::make_unique<core::LaserGateway>(std::make_unique<plugins::SimulatedPowerDriver>(config.laser.minPower), config.laser);

		std::shared_ptr<plugins::SimulatedCamera> camera;
		const std::string source = args["source"].as<std::string>();
		if (source == "sim") {
			plugins::SimulatedCameraConfig cameraConfig;
			cameraConfig.fps               = args["sim-fps"].as<double>();
			cameraConfig.acquisitionFrames = args["sim-frames"].as<std::uint64_t>();
			camera                         = std::make_shared<plugins::SimulatedCamera>(cameraConfig);
			components.pollingSource       = camera;
			components.pushSource          = camera;
		} else {
			plugins::VideoCaptureConfig captureConfig;
			captureConfig.pixelSizeUm = args["pixel-size"].as<double>();
			if (source == "camera") {
				captureConfig.deviceIndex = args["camera-index"].as<int>();
			} else {
				captureConfig.path = source;
			}
			components.pollingSource = std::make_shared<plugins::VideoCaptureSource>(captureConfig);
		}

		pipeline::Coordinator coordinator(std::move(components), config);

		// Simulated sample: the emitter density follows the applied laser power.
		const double spotsPerPower = args["sim-spots-per-power"].as<double>();
		coordinator.connect({
		        {},
		        {},
		        [camera, spotsPerPower](std::uint64_t, double, double applied) {
			        if (camera) {
				        camera->setSpotCount(static_cast<int>(std::lround(applied * spotsPerPower)));
			        }
		        },
		        [](int fps) { spdlog::debug("alicaRunner: {} fps", fps); },
		        {},
		});

		std::signal(SIGINT, onSignal);
		std::signal(SIGTERM, onSignal);

		coordinator.start(*mode);
		if (camera) {
			camera->start();
		}
		spdlog::info("alicaRunner: Analyzer output is {}.", coordinator.analyzerDescription());

		const int duration = args["duration"].as<int>();
		const auto end     = std::chrono::steady_clock::now() + std::chrono::seconds(duration);
		while (!g_interrupted && coordinator.isRunning() && (duration <= 0 || std::chrono::steady_clock::now() < end)) {
			std::this_thread::sleep_for(std::chrono::seconds(1));

			const pipeline::TelemetrySnapshot t = coordinator.telemetry();
			spdlog::info("alicaRunner: t={} ms frames={} fps={} signal={:.2f} batch={:.2f} output={:.2f} laser={:.2f} failed={}/{}", t.timeMs,
			             t.frameCount, t.fps, t.intermittentOutput, t.batchOutput, t.controllerOutput, t.laserPower, t.failedFrames, t.failedTicks);
			if (!coordinator.healthy()) {
				spdlog::error("alicaRunner: Pipeline unhealthy, stopping.");
				break;
			}
		}

		const bool healthy = coordinator.healthy();
		coordinator.stop();
		if (camera) {
			camera->shutdown();
		}
		return healthy ? 0 : 2;
	} catch (const core::ConfigurationError& ex) {
		spdlog::error("alicaRunner: Invalid configuration: {}", ex.what());
		return 1;
	} catch (const core::FatalPipelineError& ex) {
		spdlog::critical("alicaRunner: {}", ex.what());
		return 3;
	}
}
