/// @file I2cTransport.h
/// @brief Wire-backed callbacks for CallbackI2cDevice (NOT part of library)
#pragma once

#include <Arduino.h>
#include <Wire.h>

#include "ADS111x/CallbackI2cDevice.h"
#include "ADS111x/Status.h"

namespace transport {

inline ADS111x::Status wireWrite(uint8_t addr, const uint8_t* data, size_t len,
                                 uint32_t timeoutMs, void* user) {
  (void)timeoutMs;
  (void)user;
  Wire.beginTransmission(addr);
  if (Wire.write(data, len) != len) {
    Wire.endTransmission();
    return ADS111x::Status::Error(ADS111x::Err::I2C_ERROR, "Wire buffer overflow");
  }
  uint8_t rc = Wire.endTransmission();
  if (rc != 0) {
    return ADS111x::Status::Error(ADS111x::Err::I2C_ERROR, "I2C write failed", rc);
  }
  return ADS111x::Status::Ok();
}

inline ADS111x::Status wireWriteRead(uint8_t addr, const uint8_t* txData, size_t txLen,
                                     uint8_t* rxData, size_t rxLen, uint32_t timeoutMs,
                                     void* user) {
  (void)timeoutMs;
  (void)user;
  if (txLen > 0) {
    Wire.beginTransmission(addr);
    Wire.write(txData, txLen);
    uint8_t rc = Wire.endTransmission(false);
    if (rc != 0) {
      return ADS111x::Status::Error(ADS111x::Err::I2C_ERROR, "I2C pointer write failed", rc);
    }
  }

  size_t received = Wire.requestFrom(addr, static_cast<uint8_t>(rxLen));
  if (received != rxLen) {
    return ADS111x::Status::Error(ADS111x::Err::I2C_ERROR, "I2C short read",
                                  static_cast<int32_t>(received));
  }
  for (size_t i = 0; i < rxLen; ++i) {
    rxData[i] = static_cast<uint8_t>(Wire.read());
  }
  return ADS111x::Status::Ok();
}

inline uint32_t nowMs(void* user) {
  (void)user;
  return millis();
}

inline void sleepMs(uint32_t ms, void* user) {
  (void)user;
  delay(ms);
}

} // namespace transport
