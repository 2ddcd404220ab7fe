#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

namespace alica::core {

enum class WorkerState { Stopped, Running, StopRequested };

std::string_view toString(WorkerState state);

/*! Base of the pipeline loops. Owns one thread that calls run() until it returns.
 *  Derived classes implement run() as a loop checking stopRequested() once per iteration and override wake() to interrupt
 *  their blocking waits. Derived destructors must call shutdown() so the thread never outlives the derived object.
 */
class Worker {
public:
	explicit Worker(std::string name);
	virtual ~Worker();

	Worker(const Worker&)            = delete;
	Worker& operator=(const Worker&) = delete;

	//! Call onStarting() and spawn the thread.
	//! \throws ConfigurationError if the worker is not Stopped. Exceptions of onStarting() leave it Stopped.
	void start();

	//! Ask the loop to finish the current iteration and exit. Does not block.
	void requestStop();

	//! Wait until the thread has exited.
	//! \returns False if the thread did not exit within timeout. The thread is left running in that case.
	bool join(std::chrono::milliseconds timeout);

	//! requestStop() and an unbounded join. Used by destructors.
	void shutdown();

	WorkerState state() const;
	bool isRunning() const { return state() == WorkerState::Running; }
	bool hasFailed() const { return m_failed.load(); } //!< True if the last run ended by an escaped exception.
	const std::string& name() const { return m_name; }

protected:
	virtual void run() = 0; //!< The worker loop.
	virtual void wake() {}  //!< Interrupt a blocking wait inside run() after a stop request.

	//! Runs on the thread calling start(), before the worker thread exists. Prepares state that must be in place once
	//! start() returns.
	virtual void onStarting() {}

	bool stopRequested() const { return m_stopFlag.load(); }

	//! Sleep for the given duration or until a stop is requested.
	//! \returns False if woken by a stop request.
	bool sleepFor(std::chrono::milliseconds duration);
	bool sleepUntil(std::chrono::steady_clock::time_point deadline);

private:
	void threadMain();

private:
	const std::string m_name;

	mutable std::mutex m_mutex;
	std::condition_variable m_stateChanged; //!< Signalled on state transitions and stop requests.
	WorkerState m_state{WorkerState::Stopped};

	std::atomic<bool> m_stopFlag{false};
	std::atomic<bool> m_failed{false};
	std::thread m_thread;
};

} // namespace alica::core
