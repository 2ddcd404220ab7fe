#include "alica/core/errors.hpp"
#include "alica/core/laser.hpp"
#include "alica/pipeline/coordinator.hpp"
#include "alica/plugins/manualController.hpp"
#include "alica/plugins/pidController.hpp"
#include "alica/plugins/simulatedCamera.hpp"
#include "alica/plugins/simulatedPowerDriver.hpp"
#include "alica/plugins/spotCounter.hpp"

#include "fakes.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace alica::pipeline {
namespace gtest {

namespace {

//! Collaborators of a coordinator plus raw handles to inspect them after the move.
struct Rig {
	Rig() {
		auto ownedAnalyzer   = std::make_unique<FakeAnalyzer>();
		auto ownedController = std::make_unique<FakeController>(5.0);
		auto ownedDriver     = std::make_unique<plugins::SimulatedPowerDriver>(10.0);
		analyzer             = ownedAnalyzer.get();
		controller           = ownedController.get();
		driver               = ownedDriver.get();
		polling              = std::make_shared<FakePollingSource>();
		push                 = std::make_shared<FakePushSource>();

		components.analyzer      = std::move(ownedAnalyzer);
		components.controller    = std::move(ownedController);
		components.laser         = std::make_unique<core::LaserGateway>(std::move(ownedDriver), core::LaserLimits{0.0, 100.0, 0.05});
		components.pollingSource = polling;
		components.pushSource    = push;

		config.control.tickIntervalMs      = core::MIN_TICK_INTERVAL_MS;
		config.analysis.maxFps             = 100;
		config.analysis.frameWaitTimeoutMs = 20;
	}

	Components components;
	core::PipelineConfig config;

	FakeAnalyzer* analyzer{nullptr};
	FakeController* controller{nullptr};
	plugins::SimulatedPowerDriver* driver{nullptr};
	std::shared_ptr<FakePollingSource> polling;
	std::shared_ptr<FakePushSource> push;
};

} // namespace

TEST(ImagingMode, NamesRoundTrip) {
	for (const ImagingMode mode: {ImagingMode::GrabFromCore, ImagingMode::Live, ImagingMode::NextAcquisition}) {
		EXPECT_EQ(imagingModeFromString(toString(mode)), mode);
	}
	EXPECT_FALSE(imagingModeFromString("Burst").has_value());
}

TEST(Coordinator, RejectsInvalidConfig) {
	Rig rig;
	rig.config.control.tickIntervalMs = 50;
	EXPECT_THROW(Coordinator(std::move(rig.components), rig.config), core::ConfigurationError);
}

TEST(Coordinator, RejectsModeWithoutSource) {
	Rig rig;
	rig.components.pushSource.reset();
	Coordinator coordinator(std::move(rig.components), rig.config);

	EXPECT_THROW(coordinator.start(ImagingMode::Live), core::ConfigurationError);
	EXPECT_THROW(coordinator.start(ImagingMode::NextAcquisition), core::ConfigurationError);
	EXPECT_FALSE(coordinator.isRunning());
	EXPECT_EQ(rig.push->connects.load(), 0);

	EXPECT_NO_THROW(coordinator.start(ImagingMode::GrabFromCore));
	EXPECT_TRUE(coordinator.isRunning());
}

TEST(Coordinator, RejectsMissingCollaborator) {
	Rig rig;
	rig.components.laser.reset();
	Coordinator coordinator(std::move(rig.components), rig.config);

	EXPECT_THROW(coordinator.start(ImagingMode::Live), core::ConfigurationError);
	EXPECT_FALSE(coordinator.isRunning());
}

TEST(Coordinator, RejectsReentrantStart) {
	Rig rig;
	Coordinator coordinator(std::move(rig.components), rig.config);
	coordinator.start(ImagingMode::Live);

	EXPECT_THROW(coordinator.start(ImagingMode::Live), core::ConfigurationError);
	EXPECT_THROW(coordinator.start(ImagingMode::GrabFromCore), core::ConfigurationError);
	EXPECT_EQ(coordinator.mode(), ImagingMode::Live);
	EXPECT_EQ(rig.push->connects.load(), 1);
}

TEST(Coordinator, ClosedLoopLive) {
	Rig rig;
	Coordinator coordinator(std::move(rig.components), rig.config);

	std::atomic<int> powerEvents{0};
	coordinator.connect({{}, {}, [&powerEvents](std::uint64_t, double, double) { ++powerEvents; }, {}, {}});
	coordinator.start(ImagingMode::Live);
	ASSERT_TRUE(waitFor([&] { return rig.push->connected(); }));

	rig.push->push(makeFrame(1, 20));
	ASSERT_TRUE(waitFor([&] { return coordinator.telemetry().frameCount == 1; }));

	// Controller output 20 + 5 reaches the laser on the next tick.
	ASSERT_TRUE(waitFor([&] { return rig.driver->power() == 25.0; }));
	ASSERT_TRUE(waitFor([&] { return powerEvents.load() >= 1; }));
	ASSERT_TRUE(waitFor([&] { return coordinator.telemetry().laserPower == 25.0; }));

	const TelemetrySnapshot telemetry = coordinator.telemetry();
	EXPECT_DOUBLE_EQ(telemetry.intermittentOutput, 20.0);
	EXPECT_DOUBLE_EQ(telemetry.batchOutput, 20.0);
	EXPECT_DOUBLE_EQ(telemetry.controllerOutput, 25.0);
	EXPECT_GE(telemetry.controlTicks, 1u);
	EXPECT_TRUE(coordinator.healthy());

	coordinator.stop();
	EXPECT_FALSE(coordinator.isRunning());
	EXPECT_EQ(rig.analyzer->disposed.load(), 1);
	EXPECT_FALSE(rig.push->connected());
}

TEST(Coordinator, AnalyzerFailureDoesNotStopRun) {
	Rig rig;
	rig.analyzer->failOnCall = 2;
	Coordinator coordinator(std::move(rig.components), rig.config);
	coordinator.start(ImagingMode::Live);
	ASSERT_TRUE(waitFor([&] { return rig.push->connected(); }));

	rig.push->push(makeFrame(1, 20));
	ASSERT_TRUE(waitFor([&] { return rig.driver->power() == 25.0; }));
	const std::uint64_t writes = rig.driver->writeCount();

	rig.push->push(makeFrame(2, 90)); // Fails.
	ASSERT_TRUE(waitFor([&] { return coordinator.telemetry().failedFrames == 1; }));
	std::this_thread::sleep_for(250ms); // At least one tick without new data.

	EXPECT_TRUE(coordinator.isRunning());
	EXPECT_TRUE(coordinator.healthy());
	EXPECT_EQ(rig.driver->writeCount(), writes);
	EXPECT_DOUBLE_EQ(rig.driver->power(), 25.0);

	rig.push->push(makeFrame(3, 40));
	ASSERT_TRUE(waitFor([&] { return rig.driver->power() == 45.0; }));
}

TEST(Coordinator, GrabFromCorePolls) {
	Rig rig;
	rig.polling->setFrame(makeFrame(1, 30));
	Coordinator coordinator(std::move(rig.components), rig.config);
	coordinator.start(ImagingMode::GrabFromCore);

	ASSERT_TRUE(waitFor([&] { return rig.driver->power() == 35.0; }));
	EXPECT_EQ(coordinator.telemetry().frameCount, 1u);
	EXPECT_EQ(rig.push->connects.load(), 0);
}

TEST(Coordinator, NextAcquisitionEndsWithAcquisition) {
	Rig rig;
	Coordinator coordinator(std::move(rig.components), rig.config);

	std::atomic<bool> finished{false};
	coordinator.connect({{}, {}, {}, {}, [&finished]() { finished = true; }});
	coordinator.start(ImagingMode::NextAcquisition);
	ASSERT_TRUE(waitFor([&] { return rig.push->connected(); }));

	rig.push->startAcquisition();
	rig.push->push(makeFrame(1, 10));
	ASSERT_TRUE(waitFor([&] { return coordinator.telemetry().frameCount == 1; }));

	rig.push->endAcquisition();
	ASSERT_TRUE(waitFor([&] { return finished.load(); }));
	ASSERT_TRUE(waitFor([&] { return !coordinator.isRunning(); }));
	EXPECT_EQ(rig.analyzer->disposed.load(), 1);

	// The finished run can be reaped and a new one started.
	coordinator.stop();
	EXPECT_FALSE(coordinator.mode().has_value());
	EXPECT_NO_THROW(coordinator.start(ImagingMode::NextAcquisition));
	EXPECT_TRUE(coordinator.isRunning());
}

TEST(Coordinator, RunFinishedMayStopCoordinator) {
	Rig rig;
	rig.config.joinTimeoutMs = 1000;
	Coordinator coordinator(std::move(rig.components), rig.config);

	std::atomic<bool> finished{false};
	coordinator.connect({{}, {}, {}, {}, [&coordinator, &finished]() {
		                     coordinator.stop();
		                     coordinator.requestStop();
		                     finished = true;
	                     }});
	coordinator.start(ImagingMode::NextAcquisition);

	rig.push->startAcquisition();
	rig.push->push(makeFrame(1, 10));
	ASSERT_TRUE(waitFor([&] { return coordinator.telemetry().frameCount == 1; }));

	// The source holds its lock while notifying the end of the acquisition.
	const auto begin = std::chrono::steady_clock::now();
	EXPECT_NO_THROW(rig.push->endAcquisition());
	EXPECT_LT(std::chrono::steady_clock::now() - begin, 500ms);

	ASSERT_TRUE(waitFor([&] { return finished.load(); }));
	ASSERT_TRUE(waitFor([&] { return !coordinator.isRunning(); }));
	EXPECT_TRUE(coordinator.healthy());
	EXPECT_NO_THROW(coordinator.stop());
	EXPECT_EQ(rig.push->disconnects.load(), 1);
	EXPECT_EQ(rig.analyzer->disposed.load(), 1);
}

TEST(Coordinator, SimulatedAcquisitionEndsCleanly) {
	plugins::SimulatedCameraConfig cameraConfig;
	cameraConfig.fps               = 50.0;
	cameraConfig.acquisitionFrames = 5;
	auto camera                    = std::make_shared<plugins::SimulatedCamera>(cameraConfig);

	Components components;
	components.analyzer   = std::make_unique<plugins::SpotCounter>();
	components.controller = std::make_unique<plugins::ManualController>(10.0);
	components.laser      = std::make_unique<core::LaserGateway>(std::make_unique<plugins::SimulatedPowerDriver>(10.0),
                                                            core::LaserLimits{0.0, 100.0, 0.05});
	components.pushSource = camera;

	core::PipelineConfig config;
	config.control.tickIntervalMs = core::MIN_TICK_INTERVAL_MS;
	config.joinTimeoutMs          = 1000;

	Coordinator coordinator(std::move(components), config);
	std::atomic<bool> finished{false};
	coordinator.connect({{}, {}, {}, {}, [&coordinator, &finished]() {
		                     coordinator.stop();
		                     finished = true;
	                     }});
	coordinator.start(ImagingMode::NextAcquisition);
	camera->start();

	ASSERT_TRUE(waitFor([&] { return finished.load(); }));
	ASSERT_TRUE(waitFor([&] { return !coordinator.isRunning(); }));
	ASSERT_TRUE(waitFor([&] { return camera->state() == core::WorkerState::Stopped; }));
	EXPECT_FALSE(camera->hasFailed());
	EXPECT_TRUE(coordinator.healthy());

	coordinator.stop();
	EXPECT_LE(coordinator.telemetry().frameCount, 5u);
}

TEST(Coordinator, LiveIgnoresAcquisitionEnd) {
	Rig rig;
	Coordinator coordinator(std::move(rig.components), rig.config);
	coordinator.start(ImagingMode::Live);
	ASSERT_TRUE(waitFor([&] { return rig.push->connected(); }));

	rig.push->endAcquisition();
	std::this_thread::sleep_for(50ms);
	EXPECT_TRUE(coordinator.isRunning());
}

TEST(Coordinator, SetpointForwarding) {
	Rig rig;
	Coordinator coordinator(std::move(rig.components), rig.config);

	coordinator.setSetpoint(3.0); // Not running: set on the controller.
	EXPECT_DOUBLE_EQ(rig.controller->getSetpoint(), 3.0);

	coordinator.start(ImagingMode::Live);
	coordinator.setSetpoint(7.0);
	EXPECT_DOUBLE_EQ(coordinator.getSetpoint(), 7.0);
	EXPECT_DOUBLE_EQ(rig.controller->getSetpoint(), 7.0);
}

TEST(Coordinator, RuntimeConfiguration) {
	Rig rig;
	Coordinator coordinator(std::move(rig.components), rig.config);
	coordinator.start(ImagingMode::Live);

	coordinator.setRoi(cv::Rect(1, 2, 3, 4));
	EXPECT_EQ(rig.analyzer->lastRoi, cv::Rect(1, 2, 3, 4));

	EXPECT_THROW(coordinator.setTickIntervalMs(10), core::ConfigurationError);
	EXPECT_EQ(coordinator.config().control.tickIntervalMs, core::MIN_TICK_INTERVAL_MS);
	coordinator.setTickIntervalMs(400);
	EXPECT_EQ(coordinator.config().control.tickIntervalMs, 400);

	EXPECT_EQ(coordinator.analyzerDescription(), "first pixel");
}

TEST(Coordinator, StopIsIdempotentAndRestartable) {
	Rig rig;
	Coordinator coordinator(std::move(rig.components), rig.config);
	coordinator.stop();

	coordinator.start(ImagingMode::Live);
	coordinator.stop();
	coordinator.stop();
	EXPECT_FALSE(coordinator.isRunning());

	coordinator.start(ImagingMode::GrabFromCore);
	EXPECT_EQ(coordinator.mode(), ImagingMode::GrabFromCore);
}

TEST(Coordinator, ConnectedWhenStartReturns) {
	Rig rig;
	Coordinator coordinator(std::move(rig.components), rig.config);
	coordinator.start(ImagingMode::NextAcquisition);

	EXPECT_TRUE(rig.push->connected());
	rig.push->startAcquisition();
	rig.push->push(makeFrame(1, 10));
	ASSERT_TRUE(waitFor([&] { return coordinator.telemetry().frameCount == 1; }));
}

TEST(Coordinator, ControllerResetOnEveryStart) {
	Rig rig;
	Coordinator coordinator(std::move(rig.components), rig.config);
	coordinator.setSetpoint(4.0);

	coordinator.start(ImagingMode::Live);
	EXPECT_EQ(rig.controller->resets.load(), 1);
	coordinator.stop();

	coordinator.start(ImagingMode::GrabFromCore);
	EXPECT_EQ(rig.controller->resets.load(), 2);
	EXPECT_DOUBLE_EQ(coordinator.getSetpoint(), 4.0);
}

TEST(Coordinator, RestartClearsIntegral) {
	Rig rig;
	rig.components.controller = std::make_unique<plugins::PidController>(plugins::PidConfig{0.0, 1.0, 0.0, 0.0, 100.0}, 10.0);
	Coordinator coordinator(std::move(rig.components), rig.config);

	// Signal 0 below setpoint 10: the integral grows by 1 per 100 ms tick.
	coordinator.start(ImagingMode::Live);
	rig.push->push(makeFrame(1, 0));
	ASSERT_TRUE(waitFor([&] { return rig.driver->power() >= 3.0; }));
	coordinator.stop();

	std::mutex mutex;
	std::vector<double> outputs;
	coordinator.connect({{}, {}, [&](std::uint64_t, double output, double) {
		                     std::lock_guard lock(mutex);
		                     outputs.push_back(output);
	                     },
	                     {},
	                     {}});
	coordinator.start(ImagingMode::Live);
	ASSERT_TRUE(waitFor([&] {
		std::lock_guard lock(mutex);
		return !outputs.empty();
	}));
	coordinator.stop();

	// The first tick of the new run has no elapsed time and no history.
	std::lock_guard lock(mutex);
	EXPECT_DOUBLE_EQ(outputs.front(), 0.0);
}

TEST(Coordinator, TelemetrySurvivesStop) {
	Rig rig;
	Coordinator coordinator(std::move(rig.components), rig.config);
	coordinator.start(ImagingMode::Live);

	rig.push->push(makeFrame(1, 20));
	ASSERT_TRUE(waitFor([&] { return coordinator.telemetry().controlTicks >= 1; }));
	coordinator.stop();

	const TelemetrySnapshot last = coordinator.telemetry();
	EXPECT_EQ(last.frameCount, 1u);
	EXPECT_GE(last.controlTicks, 1u);
	EXPECT_DOUBLE_EQ(last.intermittentOutput, 20.0);
	EXPECT_DOUBLE_EQ(last.laserPower, 25.0);

	coordinator.start(ImagingMode::Live);
	EXPECT_EQ(coordinator.telemetry().frameCount, 0u);
}

TEST(Coordinator, HungLoopIsFatal) {
	Rig rig;
	rig.analyzer->processDelay = 1500ms;
	rig.config.joinTimeoutMs   = 100;
	Coordinator coordinator(std::move(rig.components), rig.config);
	coordinator.start(ImagingMode::Live);
	ASSERT_TRUE(waitFor([&] { return rig.push->connected(); }));

	rig.push->push(makeFrame(1, 1));
	ASSERT_TRUE(waitFor([&] { return rig.analyzer->processed.load() == 1; }));

	EXPECT_THROW(coordinator.stop(), core::FatalPipelineError);

	// The loop drains eventually and can be reaped.
	ASSERT_TRUE(waitFor([&] { return !coordinator.isRunning(); }));
	EXPECT_NO_THROW(coordinator.stop());
}

TEST(Coordinator, SimulatedClosedLoop) {
	plugins::SimulatedCameraConfig cameraConfig;
	cameraConfig.fps       = 50.0;
	cameraConfig.spotCount = 0;
	auto camera            = std::make_shared<plugins::SimulatedCamera>(cameraConfig);
	auto ownedDriver       = std::make_unique<plugins::SimulatedPowerDriver>(10.0);
	auto* driver           = ownedDriver.get();

	Components components;
	components.analyzer   = std::make_unique<plugins::SpotCounter>();
	components.controller = std::make_unique<plugins::ManualController>(40.0);
	components.laser      = std::make_unique<core::LaserGateway>(std::move(ownedDriver), core::LaserLimits{0.0, 100.0, 0.05});
	components.pushSource = camera;

	core::PipelineConfig config;
	config.control.tickIntervalMs = core::MIN_TICK_INTERVAL_MS;

	Coordinator coordinator(std::move(components), config);
	coordinator.start(ImagingMode::Live);
	camera->start();

	ASSERT_TRUE(waitFor([&] { return coordinator.telemetry().frameCount >= 5; }));
	ASSERT_TRUE(waitFor([&] { return driver->power() == 40.0; }));

	coordinator.stop();
	camera->shutdown();
	EXPECT_TRUE(coordinator.healthy());
}

} // namespace gtest
} // namespace alica::pipeline
