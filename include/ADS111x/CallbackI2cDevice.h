/// @file CallbackI2cDevice.h
/// @brief I2cDevice backed by plain write / write-read callbacks
#pragma once

#include <cstddef>
#include <cstdint>

#include "ADS111x/CommandTable.h"
#include "ADS111x/I2cDevice.h"
#include "ADS111x/Status.h"

namespace ADS111x {

/// I2C write callback signature
/// @param addr     I2C device address (7-bit)
/// @param data     Pointer to data to write
/// @param len      Number of bytes to write
/// @param timeoutMs Maximum time to wait for completion
/// @param user     User context pointer passed through from Settings
/// @return Status indicating success or failure
using I2cWriteFn = Status (*)(uint8_t addr, const uint8_t* data, size_t len,
                              uint32_t timeoutMs, void* user);

/// I2C write-then-read callback signature
/// @param addr     I2C device address (7-bit)
/// @param txData   Pointer to data to write (may be null when txLen is 0)
/// @param txLen    Number of bytes to write
/// @param rxData   Pointer to buffer for read data
/// @param rxLen    Number of bytes to read
/// @param timeoutMs Maximum time to wait for completion
/// @param user     User context pointer passed through from Settings
/// @return Status indicating success or failure
using I2cWriteReadFn = Status (*)(uint8_t addr, const uint8_t* txData, size_t txLen,
                                  uint8_t* rxData, size_t rxLen, uint32_t timeoutMs,
                                  void* user);

/// Adapts MCU-style bus callbacks (e.g. Arduino Wire) to I2cDevice.
class CallbackI2cDevice : public I2cDevice {
public:
  struct Settings {
    I2cWriteFn i2cWrite = nullptr;
    I2cWriteReadFn i2cWriteRead = nullptr;
    void* i2cUser = nullptr;
    uint8_t i2cAddress = cmd::ADDR_GND;  ///< 0x48-0x4B based on ADDR pin
    uint32_t i2cTimeoutMs = 50;          ///< I2C transaction timeout in ms
  };

  /// Largest payload writeRegister() frames behind the register byte
  static constexpr size_t MAX_WRITE_LEN = 8;

  Status begin(const Settings& settings);
  bool isOpen() const { return _open; }
  uint8_t address() const { return _settings.i2cAddress; }

  Status close() override;
  Status read(uint8_t* buf, size_t len) override;
  Status readRegister(uint8_t reg, uint8_t* buf, size_t len) override;
  Status write(const uint8_t* buf, size_t len) override;
  Status writeRegister(uint8_t reg, const uint8_t* buf, size_t len) override;

private:
  Settings _settings;
  bool _open = false;
};

} // namespace ADS111x
