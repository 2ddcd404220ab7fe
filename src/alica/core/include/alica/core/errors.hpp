#pragma once

#include <stdexcept>
#include <string>

namespace alica::core {

//! Base of all errors raised by the pipeline and its collaborators.
class Error : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

//! Frame temporarily unavailable. Retried after a short backoff, never fatal.
class TransientAcquisitionError : public Error {
public:
	using Error::Error;
};

//! Processing of a single frame failed. The frame is skipped.
class AnalysisError : public Error {
public:
	using Error::Error;
};

//! The controller could not compute a new output. The previous actuator value stays in force.
class ControllerError : public Error {
public:
	using Error::Error;
};

//! Communication with the actuator failed. The previous actuator value stays in force.
class DeviceError : public Error {
public:
	using Error::Error;
};

//! Invalid configuration or lifecycle misuse. Raised synchronously before any thread is spawned.
class ConfigurationError : public Error {
public:
	using Error::Error;
};

//! A loop did not terminate within the join timeout.
class FatalPipelineError : public Error {
public:
	using Error::Error;
};

} // namespace alica::core
