/// @file BoardConfig.h
/// @brief Board pin and bus settings for examples (NOT part of library)
#pragma once

#include <Arduino.h>
#include <Wire.h>

namespace board {

static constexpr int I2C_SDA = 8;
static constexpr int I2C_SCL = 9;
static constexpr uint32_t I2C_FREQ_HZ = 400000;
static constexpr uint32_t I2C_TIMEOUT_MS = 50;
static constexpr uint32_t SERIAL_BAUD = 115200;

inline void initSerial() {
  Serial.begin(SERIAL_BAUD);
}

inline bool initI2c() {
  if (!Wire.begin(I2C_SDA, I2C_SCL, I2C_FREQ_HZ)) {
    return false;
  }
  Wire.setTimeOut(static_cast<uint16_t>(I2C_TIMEOUT_MS));
  return true;
}

} // namespace board
