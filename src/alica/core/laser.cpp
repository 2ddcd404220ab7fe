#include "alica/core/laser.hpp"

#include "alica/core/config.hpp"
#include "alica/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace alica::core {

bool isWithinDeadzone(const double current, const double desired, const double deadzone) {
	const double delta = std::abs(current - desired);
	if (delta == 0.0) {
		return true;
	}
	if (current == 0.0) {
		return false; // Any change away from zero is an infinite relative change.
	}
	return delta / std::abs(current) < deadzone;
}

LaserGateway::LaserGateway(std::unique_ptr<PowerDriver> driver, const LaserLimits limits) : m_driver(std::move(driver)), m_limits(limits) {
	if (!m_driver) {
		throw ConfigurationError("Laser gateway requires a power driver.");
	}
	validate(m_limits);
}

double LaserGateway::setPower(const double desired) {
	double current;
	{
		std::lock_guard lock(m_cacheMutex);
		current = m_cachedPower;
	}

	// NaN means "no instruction".
	if (std::isnan(desired)) {
		return current;
	}

	if (isWithinDeadzone(current, desired, m_limits.deadzone)) {
		spdlog::debug("LaserGateway: Request {:.4f} within deadzone of {:.4f}. Ignored.", desired, current);
		return current;
	}

	const double actual = std::clamp(desired, m_limits.minPower, m_limits.maxPower);
	if (actual == current) {
		return current; // Clamped onto the value already in force.
	}

	{
		std::lock_guard io(m_ioMutex);
		spdlog::info("LaserGateway: Setting {}-{} to {:8.4f}", m_driver->getDeviceName(), m_driver->getPropertyName(), actual);
		m_driver->writePower(actual);
	}

	std::lock_guard lock(m_cacheMutex);
	m_cachedPower = actual;
	return actual;
}

double LaserGateway::getPower() {
	double power;
	{
		std::lock_guard io(m_ioMutex);
		power = m_driver->readPower();
	}

	std::lock_guard lock(m_cacheMutex);
	m_cachedPower = power;
	return power;
}

double LaserGateway::getPowerCached() const {
	std::lock_guard lock(m_cacheMutex);
	return m_cachedPower;
}

double LaserGateway::getMinPower() const {
	return m_limits.minPower;
}

double LaserGateway::getMaxPower() const {
	return m_limits.maxPower;
}

std::string LaserGateway::getDeviceName() const {
	return m_driver->getDeviceName();
}

std::string LaserGateway::getPropertyName() const {
	return m_driver->getPropertyName();
}

} // namespace alica::core
