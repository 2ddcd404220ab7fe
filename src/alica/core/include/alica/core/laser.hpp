#pragma once

#include <memory>
#include <mutex>
#include <string>

namespace alica::core {

//! Actuator accepting a laser power instruction.
class Laser {
public:
	virtual ~Laser() = default;

	//! Request a new power. Returns the power actually in force after the call.
	//! \throws DeviceError on communication failure. The cached power is left unchanged in that case.
	virtual double setPower(double desired) = 0;

	//! Authoritative read from the device. Refreshes the cache.
	//! \throws DeviceError on communication failure.
	virtual double getPower() = 0;

	virtual double getPowerCached() const = 0; //!< Last known power without device I/O.

	virtual double getMinPower() const = 0;
	virtual double getMaxPower() const = 0;

	virtual std::string getDeviceName() const   = 0;
	virtual std::string getPropertyName() const = 0;
};

//! Device level access to one numeric power property (real hardware or simulation).
class PowerDriver {
public:
	virtual ~PowerDriver() = default;

	virtual void writePower(double value) = 0; //!< \throws DeviceError
	virtual double readPower()            = 0; //!< \throws DeviceError

	virtual std::string getDeviceName() const   = 0;
	virtual std::string getPropertyName() const = 0;
};

//! Limits applied by the LaserGateway.
struct LaserLimits {
	double minPower{0.0};  //!< Lowest power ever written to the device.
	double maxPower{0.0};  //!< Highest power ever written to the device.
	double deadzone{0.05}; //!< Minimum relative change before a request is applied (fraction, 0-1).
};

/*! Laser implementation guarding a PowerDriver with deadzone suppression and min/max clamping.
 *  The cached value is protected by its own lock, which is never held during device I/O. Device calls are serialised
 *  through a second lock, so getPowerCached() never blocks on a slow device.
 */
class LaserGateway : public Laser {
public:
	//! \throws ConfigurationError if the driver is null or the limits are inconsistent.
	LaserGateway(std::unique_ptr<PowerDriver> driver, LaserLimits limits);

	double setPower(double desired) override;
	double getPower() override;
	double getPowerCached() const override;

	double getMinPower() const override;
	double getMaxPower() const override;

	std::string getDeviceName() const override;
	std::string getPropertyName() const override;

private:
	std::unique_ptr<PowerDriver> m_driver;
	const LaserLimits m_limits;

	mutable std::mutex m_cacheMutex; //!< Guards m_cachedPower.
	double m_cachedPower{0.0};       //!< Last value written to or read from the device.

	std::mutex m_ioMutex; //!< Serialises device access.
};

//! True if changing from current to desired is a relative change below the deadzone.
//! A zero difference is always inside the deadzone.
bool isWithinDeadzone(double current, double desired, double deadzone);

} // namespace alica::core
