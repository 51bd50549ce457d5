/// @file CallbackI2cDevice.cpp
/// @brief Callback-backed I2C transport

#include "ADS111x/CallbackI2cDevice.h"

namespace ADS111x {

namespace {

Status transportClosed() {
  return Status::Error(Err::NOT_INITIALIZED, "I2C transport closed");
}

} // namespace

constexpr size_t CallbackI2cDevice::MAX_WRITE_LEN;

Status CallbackI2cDevice::begin(const Settings& settings) {
  _settings = settings;
  _open = false;

  if (_settings.i2cWrite == nullptr || _settings.i2cWriteRead == nullptr) {
    return Status::Error(Err::INVALID_CONFIG, "I2C callbacks required");
  }
  if (_settings.i2cTimeoutMs == 0) {
    return Status::Error(Err::INVALID_CONFIG, "Timeout must be > 0");
  }

  _open = true;
  return Status::Ok();
}

Status CallbackI2cDevice::close() {
  _open = false;
  return Status::Ok();
}

Status CallbackI2cDevice::read(uint8_t* buf, size_t len) {
  if (!_open) {
    return transportClosed();
  }
  return _settings.i2cWriteRead(_settings.i2cAddress, nullptr, 0, buf, len,
                                _settings.i2cTimeoutMs, _settings.i2cUser);
}

Status CallbackI2cDevice::readRegister(uint8_t reg, uint8_t* buf, size_t len) {
  if (!_open) {
    return transportClosed();
  }
  return _settings.i2cWriteRead(_settings.i2cAddress, &reg, 1, buf, len,
                                _settings.i2cTimeoutMs, _settings.i2cUser);
}

Status CallbackI2cDevice::write(const uint8_t* buf, size_t len) {
  if (!_open) {
    return transportClosed();
  }
  return _settings.i2cWrite(_settings.i2cAddress, buf, len,
                            _settings.i2cTimeoutMs, _settings.i2cUser);
}

Status CallbackI2cDevice::writeRegister(uint8_t reg, const uint8_t* buf, size_t len) {
  if (!_open) {
    return transportClosed();
  }
  if (len > MAX_WRITE_LEN || (buf == nullptr && len > 0)) {
    return Status::Error(Err::INVALID_PARAM, "Invalid register write length",
                         static_cast<int32_t>(len));
  }

  // Build write buffer: [register, data...]
  uint8_t txBuf[1 + MAX_WRITE_LEN];
  txBuf[0] = reg;
  for (size_t i = 0; i < len; i++) {
    txBuf[1 + i] = buf[i];
  }
  return _settings.i2cWrite(_settings.i2cAddress, txBuf, 1 + len,
                            _settings.i2cTimeoutMs, _settings.i2cUser);
}

} // namespace ADS111x
