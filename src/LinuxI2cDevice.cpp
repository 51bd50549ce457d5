/// @file LinuxI2cDevice.cpp
/// @brief Linux i2c-dev transport

#include "ADS111x/LinuxI2cDevice.h"

#include <fcntl.h>
#include <linux/i2c.h>
#include <linux/i2c-dev.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <cstdio>

namespace ADS111x {

namespace {

Status notOpen() {
  return Status::Error(Err::NOT_INITIALIZED, "I2C bus not open");
}

Status transfer(int fd, i2c_msg* msgs, uint32_t count) {
  i2c_rdwr_ioctl_data data;
  data.msgs = msgs;
  data.nmsgs = count;
  if (::ioctl(fd, I2C_RDWR, &data) < 0) {
    return Status::Error(Err::I2C_ERROR, "I2C_RDWR transfer failed", errno);
  }
  return Status::Ok();
}

bool validBuffer(const void* buf, size_t len) {
  return buf != nullptr && len > 0 && len <= UINT16_MAX;
}

} // namespace

constexpr size_t LinuxI2cDevice::MAX_WRITE_LEN;

LinuxI2cDevice::~LinuxI2cDevice() {
  if (_fd >= 0) {
    ::close(_fd);
  }
}

Status LinuxI2cDevice::open(const char* path, uint8_t address) {
  if (path == nullptr) {
    return Status::Error(Err::INVALID_CONFIG, "I2C bus path required");
  }
  if (_fd >= 0) {
    return Status::Error(Err::INVALID_CONFIG, "I2C bus already open");
  }

  int fd = ::open(path, O_RDWR);
  if (fd < 0) {
    return Status::Error(Err::I2C_ERROR, "Failed to open I2C bus", errno);
  }
  _fd = fd;
  _address = address;
  return Status::Ok();
}

Status LinuxI2cDevice::open(int busNum, uint8_t address) {
  if (busNum < 0) {
    return Status::Error(Err::INVALID_CONFIG, "Invalid I2C bus number", busNum);
  }
  char path[32];
  std::snprintf(path, sizeof(path), "/dev/i2c-%d", busNum);
  return open(path, address);
}

Status LinuxI2cDevice::close() {
  if (_fd < 0) {
    return notOpen();
  }
  int fd = _fd;
  _fd = -1;
  if (::close(fd) < 0) {
    return Status::Error(Err::I2C_ERROR, "Failed to close I2C bus", errno);
  }
  return Status::Ok();
}

Status LinuxI2cDevice::read(uint8_t* buf, size_t len) {
  if (_fd < 0) {
    return notOpen();
  }
  if (!validBuffer(buf, len)) {
    return Status::Error(Err::INVALID_PARAM, "Invalid read buffer");
  }

  i2c_msg msg;
  msg.addr = _address;
  msg.flags = I2C_M_RD;
  msg.len = static_cast<uint16_t>(len);
  msg.buf = buf;
  return transfer(_fd, &msg, 1);
}

Status LinuxI2cDevice::readRegister(uint8_t reg, uint8_t* buf, size_t len) {
  if (_fd < 0) {
    return notOpen();
  }
  if (!validBuffer(buf, len)) {
    return Status::Error(Err::INVALID_PARAM, "Invalid read buffer");
  }

  i2c_msg msgs[2];
  msgs[0].addr = _address;
  msgs[0].flags = 0;
  msgs[0].len = 1;
  msgs[0].buf = &reg;
  msgs[1].addr = _address;
  msgs[1].flags = I2C_M_RD;
  msgs[1].len = static_cast<uint16_t>(len);
  msgs[1].buf = buf;
  return transfer(_fd, msgs, 2);
}

Status LinuxI2cDevice::write(const uint8_t* buf, size_t len) {
  if (_fd < 0) {
    return notOpen();
  }
  if (!validBuffer(buf, len)) {
    return Status::Error(Err::INVALID_PARAM, "Invalid write buffer");
  }

  i2c_msg msg;
  msg.addr = _address;
  msg.flags = 0;
  msg.len = static_cast<uint16_t>(len);
  // The kernel never writes through buf for a write message.
  msg.buf = const_cast<uint8_t*>(buf);
  return transfer(_fd, &msg, 1);
}

Status LinuxI2cDevice::writeRegister(uint8_t reg, const uint8_t* buf, size_t len) {
  if (_fd < 0) {
    return notOpen();
  }
  if (len > MAX_WRITE_LEN || (buf == nullptr && len > 0)) {
    return Status::Error(Err::INVALID_PARAM, "Invalid register write length",
                         static_cast<int32_t>(len));
  }

  uint8_t txBuf[1 + MAX_WRITE_LEN];
  txBuf[0] = reg;
  for (size_t i = 0; i < len; i++) {
    txBuf[1 + i] = buf[i];
  }

  i2c_msg msg;
  msg.addr = _address;
  msg.flags = 0;
  msg.len = static_cast<uint16_t>(1 + len);
  msg.buf = txBuf;
  return transfer(_fd, &msg, 1);
}

} // namespace ADS111x
