/// @file LinuxI2cDevice.h
/// @brief I2cDevice on a Linux i2c-dev bus node
#pragma once

#include <cstddef>
#include <cstdint>

#include "ADS111x/CommandTable.h"
#include "ADS111x/I2cDevice.h"
#include "ADS111x/Status.h"

namespace ADS111x {

/// Talks to one device on /dev/i2c-N. Each transfer is a single I2C_RDWR
/// ioctl carrying the slave address, so register reads are one combined
/// pointer-write / data-read transaction.
class LinuxI2cDevice : public I2cDevice {
public:
  LinuxI2cDevice() = default;
  ~LinuxI2cDevice() override;

  LinuxI2cDevice(const LinuxI2cDevice&) = delete;
  LinuxI2cDevice& operator=(const LinuxI2cDevice&) = delete;

  /// Open a bus node such as "/dev/i2c-1".
  /// @return I2C_ERROR with errno in detail if the node cannot be opened
  Status open(const char* path, uint8_t address = cmd::ADDR_GND);

  /// Open /dev/i2c-<busNum>.
  Status open(int busNum, uint8_t address = cmd::ADDR_GND);

  bool isOpen() const { return _fd >= 0; }
  int fd() const { return _fd; }
  uint8_t address() const { return _address; }

  Status close() override;
  Status read(uint8_t* buf, size_t len) override;
  Status readRegister(uint8_t reg, uint8_t* buf, size_t len) override;
  Status write(const uint8_t* buf, size_t len) override;
  Status writeRegister(uint8_t reg, const uint8_t* buf, size_t len) override;

  /// Largest payload writeRegister() frames behind the register byte
  static constexpr size_t MAX_WRITE_LEN = 32;

private:
  int _fd = -1;
  uint8_t _address = cmd::ADDR_GND;
};

} // namespace ADS111x
