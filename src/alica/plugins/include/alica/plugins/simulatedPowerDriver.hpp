#pragma once

#include "alica/core/laser.hpp"

#include <cstdint>
#include <mutex>
#include <string>

namespace alica::plugins {

//! In-memory laser power property. Counts writes and can be told to fail, for tests and dry runs.
class SimulatedPowerDriver : public core::PowerDriver {
public:
	explicit SimulatedPowerDriver(double initialPower = 0.0, std::string deviceName = "SimulatedLaser", std::string propertyName = "Power");

	void writePower(double value) override;
	double readPower() override;

	std::string getDeviceName() const override { return m_deviceName; }
	std::string getPropertyName() const override { return m_propertyName; }

	double power() const;             //!< Current value without counting as a device read.
	std::uint64_t writeCount() const; //!< Successful writes so far.

	void failNextWrites(int count); //!< The next count writes throw DeviceError.
	void setFailReads(bool fail);   //!< Reads throw DeviceError while set.

private:
	const std::string m_deviceName;
	const std::string m_propertyName;

	mutable std::mutex m_mutex;
	double m_power;
	std::uint64_t m_writeCount{0};
	int m_failingWrites{0};
	bool m_failReads{false};
};

} // namespace alica::plugins
