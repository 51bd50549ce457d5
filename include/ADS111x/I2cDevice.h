/// @file I2cDevice.h
/// @brief Transport interface the ADS111x driver talks through
#pragma once

#include <cstddef>
#include <cstdint>

#include "ADS111x/Status.h"

namespace ADS111x {

/// Byte-level access to one device on a two-wire bus.
///
/// Implementations own the bus connection and the device address. Every call
/// blocks until the transfer completes or the implementation's own timeout
/// fires. Failures are reported as Status and passed through the driver
/// unchanged.
class I2cDevice {
public:
  virtual ~I2cDevice() = default;

  /// Release the bus connection.
  virtual Status close() = 0;

  /// Read len bytes from the currently addressed register.
  virtual Status read(uint8_t* buf, size_t len) = 0;

  /// Read len bytes starting at register reg.
  virtual Status readRegister(uint8_t reg, uint8_t* buf, size_t len) = 0;

  /// Write len raw bytes.
  virtual Status write(const uint8_t* buf, size_t len) = 0;

  /// Write len bytes starting at register reg.
  virtual Status writeRegister(uint8_t reg, const uint8_t* buf, size_t len) = 0;
};

} // namespace ADS111x
