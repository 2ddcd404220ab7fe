#include "alica/plugins/simulatedPowerDriver.hpp"

#include "alica/core/errors.hpp"

#include <format>
#include <utility>

namespace alica::plugins {

SimulatedPowerDriver::SimulatedPowerDriver(const double initialPower, std::string deviceName, std::string propertyName)
    : m_deviceName(std::move(deviceName)), m_propertyName(std::move(propertyName)), m_power(initialPower) {
}

void SimulatedPowerDriver::writePower(const double value) {
	std::lock_guard lock(m_mutex);
	if (m_failingWrites > 0) {
		--m_failingWrites;
		throw core::DeviceError(std::format("{}-{}: Simulated write failure.", m_deviceName, m_propertyName));
	}
	m_power = value;
	++m_writeCount;
}

double SimulatedPowerDriver::readPower() {
	std::lock_guard lock(m_mutex);
	if (m_failReads) {
		throw core::DeviceError(std::format("{}-{}: Simulated read failure.", m_deviceName, m_propertyName));
	}
	return m_power;
}

double SimulatedPowerDriver::power() const {
	std::lock_guard lock(m_mutex);
	return m_power;
}

std::uint64_t SimulatedPowerDriver::writeCount() const {
	std::lock_guard lock(m_mutex);
	return m_writeCount;
}

void SimulatedPowerDriver::failNextWrites(const int count) {
	std::lock_guard lock(m_mutex);
	m_failingWrites = count;
}

void SimulatedPowerDriver::setFailReads(const bool fail) {
	std::lock_guard lock(m_mutex);
	m_failReads = fail;
}

} // namespace alica::plugins
