#include "alica/core/worker.hpp"

#include "alica/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <utility>

namespace alica::core {

std::string_view toString(const WorkerState state) {
	switch (state) {
	case WorkerState::Stopped:
		return "Stopped";
	case WorkerState::Running:
		return "Running";
	case WorkerState::StopRequested:
		return "StopRequested";
	}
	return "Unknown";
}

Worker::Worker(std::string name) : m_name(std::move(name)) {
}

Worker::~Worker() {
	// Derived classes stop the thread in their destructor. This only catches a worker that was never started.
	if (m_thread.joinable()) {
		m_thread.join();
	}
}

void Worker::start() {
	std::lock_guard lock(m_mutex);
	if (m_state != WorkerState::Stopped) {
		throw ConfigurationError(m_name + " is already running.");
	}

	// Reap the thread of a previous run.
	if (m_thread.joinable()) {
		m_thread.join();
	}

	onStarting();

	m_stopFlag = false;
	m_failed   = false;
	m_state    = WorkerState::Running;
	m_thread   = std::thread([this]() { threadMain(); });
	spdlog::info("{}: Started", m_name);
}

void Worker::requestStop() {
	{
		std::lock_guard lock(m_mutex);
		m_stopFlag = true;
		if (m_state == WorkerState::Running) {
			m_state = WorkerState::StopRequested;
		}
	}
	m_stateChanged.notify_all();
	wake();
}

bool Worker::join(const std::chrono::milliseconds timeout) {
	std::unique_lock lock(m_mutex);
	if (!m_stateChanged.wait_for(lock, timeout, [this] { return m_state == WorkerState::Stopped; })) {
		return false;
	}

	if (m_thread.joinable() && m_thread.get_id() != std::this_thread::get_id()) {
		std::thread finished = std::move(m_thread);
		lock.unlock();
		finished.join();
	}
	return true;
}

void Worker::shutdown() {
	requestStop();
	if (m_thread.joinable() && m_thread.get_id() != std::this_thread::get_id()) {
		m_thread.join();
	}
}

WorkerState Worker::state() const {
	std::lock_guard lock(m_mutex);
	return m_state;
}

bool Worker::sleepFor(const std::chrono::milliseconds duration) {
	return sleepUntil(std::chrono::steady_clock::now() + duration);
}

bool Worker::sleepUntil(const std::chrono::steady_clock::time_point deadline) {
	std::unique_lock lock(m_mutex);
	return !m_stateChanged.wait_until(lock, deadline, [this] { return m_stopFlag.load(); });
}

void Worker::threadMain() {
	try {
		run();
	} catch (const std::exception& ex) {
		// Loops handle their per-iteration errors. Anything reaching this point kills the loop.
		m_failed = true;
		spdlog::critical("{}: Thread terminated by an unexpected error: {}", m_name, ex.what());
	}

	{
		std::lock_guard lock(m_mutex);
		m_state = WorkerState::Stopped;
	}
	m_stateChanged.notify_all();
	spdlog::info("{}: Stopped", m_name);
}

} // namespace alica::core
