/// @file ADS111x.cpp
/// @brief Implementation of ADS111x driver

#include "ADS111x/ADS111x.h"

namespace ADS111x {

namespace {

/// Positive full-scale voltage per PGA code; ranges are symmetric around 0 V
constexpr double kFullScaleVolts[] = {
  6.144,  // FSR_6_144V
  4.096,  // FSR_4_096V
  2.048,  // FSR_2_048V
  1.024,  // FSR_1_024V
  0.512,  // FSR_0_512V
  0.256   // FSR_0_256V
};

static_assert(sizeof(kFullScaleVolts) / sizeof(kFullScaleVolts[0]) == 6,
              "one entry per PGA setting");

Status notInitialized() {
  return Status::Error(Err::NOT_INITIALIZED, "Driver not initialized");
}

} // namespace

// ============================================================================
// Lifecycle
// ============================================================================

Status ADS111x::begin(const Config& config) {
  _config = config;

  if (_config.i2c == nullptr) {
    return Status::Error(Err::INVALID_CONFIG, "I2C transport required");
  }
  if (_config.pollIntervalMs == 0) {
    _config.pollIntervalMs = 1;
  }
  return Status::Ok();
}

Status ADS111x::close() {
  if (!isBound()) {
    return notInitialized();
  }
  return _config.i2c->close();
}

// ============================================================================
// Diagnostics
// ============================================================================

Status ADS111x::probe() {
  if (!isBound()) {
    return notInitialized();
  }
  uint16_t configReg = 0;
  Status st = readRegister16(cmd::REG_CONFIG, configReg);
  if (!st.ok()) {
    return Status::Error(Err::DEVICE_NOT_FOUND, "ADS111x not responding", st.detail);
  }
  return Status::Ok();
}

// ============================================================================
// Conversion API
// ============================================================================

Status ADS111x::readRaw(Mux input, int16_t& out) {
  if (!isBound()) {
    return notInitialized();
  }

  uint16_t configReg = 0;
  Status st = readConfig(configReg);
  if (!st.ok()) {
    return st;
  }

  const uint16_t wanted = static_cast<uint16_t>(input);
  if (field::extract(configReg, field::MUX) != wanted) {
    st = writeConfig(field::encode(configReg, field::MUX, wanted));
    if (!st.ok()) {
      return st;
    }
  }

  uint16_t rawReg = 0;
  st = readRegister16(cmd::REG_CONVERSION, rawReg);
  if (!st.ok()) {
    return st;
  }
  out = static_cast<int16_t>(rawReg);
  return Status::Ok();
}

Status ADS111x::readVoltage(Mux input, double& volts) {
  if (!isBound()) {
    return notInitialized();
  }

  uint16_t configReg = 0;
  Status st = readConfig(configReg);
  if (!st.ok()) {
    return st;
  }

  int16_t raw = 0;
  st = readRaw(input, raw);
  if (!st.ok()) {
    return st;
  }

  Gain gain = static_cast<Gain>(field::extract(configReg, field::GAIN));
  return countsToVolts(raw, gain, volts);
}

Status ADS111x::startConversion() {
  return _writeField(field::STATUS, cmd::OS_START);
}

Status ADS111x::isIdle(bool& idle) {
  ConversionStatus status = ConversionStatus::BUSY;
  Status st = getStatus(status);
  if (!st.ok()) {
    return st;
  }
  idle = (status == ConversionStatus::IDLE);
  return Status::Ok();
}

Status ADS111x::waitForIdle(uint32_t timeoutMs) {
  if (!isBound()) {
    return notInitialized();
  }
  if (_config.nowMs == nullptr || _config.delayMs == nullptr) {
    return Status::Error(Err::INVALID_CONFIG, "waitForIdle needs nowMs and delayMs");
  }

  const uint32_t startMs = _config.nowMs(_config.clockUser);
  while (true) {
    bool idle = false;
    Status st = isIdle(idle);
    if (!st.ok()) {
      return st;
    }
    if (idle) {
      return Status::Ok();
    }
    if ((_config.nowMs(_config.clockUser) - startMs) >= timeoutMs) {
      return Status::Error(Err::TIMEOUT, "Conversion timeout");
    }
    _config.delayMs(_config.pollIntervalMs, _config.clockUser);
  }
}

// ============================================================================
// Configuration
// ============================================================================

Status ADS111x::readConfig(uint16_t& config) {
  return readRegister16(cmd::REG_CONFIG, config);
}

Status ADS111x::writeConfig(uint16_t config) {
  return writeRegister(cmd::REG_CONFIG, RegisterPayload::Word(config));
}

Status ADS111x::getStatus(ConversionStatus& status) {
  uint16_t value = 0;
  Status st = _readField(field::STATUS, value);
  if (!st.ok()) {
    return st;
  }
  status = static_cast<ConversionStatus>(value);
  return Status::Ok();
}

Status ADS111x::setMux(Mux mux) {
  return _writeField(field::MUX, static_cast<uint16_t>(mux));
}

Status ADS111x::getMux(Mux& mux) {
  uint16_t value = 0;
  Status st = _readField(field::MUX, value);
  if (!st.ok()) {
    return st;
  }
  mux = static_cast<Mux>(value);
  return Status::Ok();
}

Status ADS111x::setGain(Gain gain) {
  return _writeField(field::GAIN, static_cast<uint16_t>(gain));
}

Status ADS111x::getGain(Gain& gain) {
  uint16_t value = 0;
  Status st = _readField(field::GAIN, value);
  if (!st.ok()) {
    return st;
  }
  gain = static_cast<Gain>(value);
  return Status::Ok();
}

Status ADS111x::setMode(Mode mode) {
  return _writeField(field::MODE, static_cast<uint16_t>(mode));
}

Status ADS111x::getMode(Mode& mode) {
  uint16_t value = 0;
  Status st = _readField(field::MODE, value);
  if (!st.ok()) {
    return st;
  }
  mode = static_cast<Mode>(value);
  return Status::Ok();
}

Status ADS111x::setDataRate(DataRate rate) {
  return _writeField(field::DATA_RATE, static_cast<uint16_t>(rate));
}

Status ADS111x::getDataRate(DataRate& rate) {
  uint16_t value = 0;
  Status st = _readField(field::DATA_RATE, value);
  if (!st.ok()) {
    return st;
  }
  rate = static_cast<DataRate>(value);
  return Status::Ok();
}

Status ADS111x::readField(const char* name, uint16_t& value) {
  const FieldSpec* spec = nullptr;
  Status st = field::lookup(name, spec);
  if (!st.ok()) {
    return st;
  }
  return _readField(*spec, value);
}

Status ADS111x::writeField(const char* name, uint16_t value) {
  const FieldSpec* spec = nullptr;
  Status st = field::lookup(name, spec);
  if (!st.ok()) {
    return st;
  }
  return _writeField(*spec, value);
}

// ============================================================================
// Comparator
// ============================================================================

Status ADS111x::setComparatorMode(ComparatorMode mode) {
  return _writeField(field::COMP_MODE, static_cast<uint16_t>(mode));
}

Status ADS111x::getComparatorMode(ComparatorMode& mode) {
  uint16_t value = 0;
  Status st = _readField(field::COMP_MODE, value);
  if (!st.ok()) {
    return st;
  }
  mode = static_cast<ComparatorMode>(value);
  return Status::Ok();
}

Status ADS111x::setComparatorPolarity(ComparatorPolarity polarity) {
  return _writeField(field::COMP_POL, static_cast<uint16_t>(polarity));
}

Status ADS111x::getComparatorPolarity(ComparatorPolarity& polarity) {
  uint16_t value = 0;
  Status st = _readField(field::COMP_POL, value);
  if (!st.ok()) {
    return st;
  }
  polarity = static_cast<ComparatorPolarity>(value);
  return Status::Ok();
}

Status ADS111x::setComparatorLatch(ComparatorLatch latch) {
  return _writeField(field::COMP_LAT, static_cast<uint16_t>(latch));
}

Status ADS111x::getComparatorLatch(ComparatorLatch& latch) {
  uint16_t value = 0;
  Status st = _readField(field::COMP_LAT, value);
  if (!st.ok()) {
    return st;
  }
  latch = static_cast<ComparatorLatch>(value);
  return Status::Ok();
}

Status ADS111x::setComparatorQueue(ComparatorQueue queue) {
  return _writeField(field::COMP_QUE, static_cast<uint16_t>(queue));
}

Status ADS111x::getComparatorQueue(ComparatorQueue& queue) {
  uint16_t value = 0;
  Status st = _readField(field::COMP_QUE, value);
  if (!st.ok()) {
    return st;
  }
  queue = static_cast<ComparatorQueue>(value);
  return Status::Ok();
}

Status ADS111x::setThresholds(int16_t low, int16_t high) {
  Status st = writeRegister(cmd::REG_LO_THRESH,
                            RegisterPayload::Word(static_cast<uint16_t>(low)));
  if (!st.ok()) {
    return st;
  }
  return writeRegister(cmd::REG_HI_THRESH,
                       RegisterPayload::Word(static_cast<uint16_t>(high)));
}

Status ADS111x::getThresholds(int16_t& low, int16_t& high) {
  uint16_t lowReg = 0;
  uint16_t highReg = 0;
  Status st = readRegister16(cmd::REG_LO_THRESH, lowReg);
  if (!st.ok()) {
    return st;
  }
  st = readRegister16(cmd::REG_HI_THRESH, highReg);
  if (!st.ok()) {
    return st;
  }

  low = static_cast<int16_t>(lowReg);
  high = static_cast<int16_t>(highReg);
  return Status::Ok();
}

// ============================================================================
// Register Access
// ============================================================================

Status ADS111x::read(uint8_t* buf, size_t len) {
  if (!isBound()) {
    return notInitialized();
  }
  if (buf == nullptr || len == 0) {
    return Status::Error(Err::INVALID_PARAM, "Read buffer required");
  }
  return _config.i2c->read(buf, len);
}

Status ADS111x::write(const uint8_t* buf, size_t len) {
  if (!isBound()) {
    return notInitialized();
  }
  if (buf == nullptr || len == 0) {
    return Status::Error(Err::INVALID_PARAM, "Write buffer required");
  }
  return _config.i2c->write(buf, len);
}

Status ADS111x::readRegister(uint8_t reg, uint8_t* buf, size_t len) {
  if (!isBound()) {
    return notInitialized();
  }
  if (buf == nullptr || len == 0) {
    return Status::Error(Err::INVALID_PARAM, "Read buffer required");
  }
  return _config.i2c->readRegister(reg, buf, len);
}

Status ADS111x::readRegister16(uint8_t reg, uint16_t& value) {
  uint8_t rx[cmd::REG_SIZE] = {0, 0};
  Status st = readRegister(reg, rx, sizeof(rx));
  if (!st.ok()) {
    return st;
  }
  value = static_cast<uint16_t>((static_cast<uint16_t>(rx[0]) << 8) | rx[1]);
  return Status::Ok();
}

Status ADS111x::writeRegister(uint8_t reg, const RegisterPayload& data) {
  if (!isBound()) {
    return notInitialized();
  }

  uint8_t tx[cmd::REG_SIZE] = {0, 0};
  const uint8_t* bytes = nullptr;
  switch (data.kind) {
    case RegisterPayload::Kind::WORD:
      tx[0] = static_cast<uint8_t>((data.word >> 8) & 0xFF);
      tx[1] = static_cast<uint8_t>(data.word & 0xFF);
      bytes = tx;
      break;
    case RegisterPayload::Kind::BYTES:
      if (data.bytes == nullptr) {
        return Status::Error(Err::INVALID_PARAM, "Register payload buffer is null");
      }
      if (data.len != cmd::REG_SIZE) {
        return Status::Error(Err::INVALID_PARAM, "Register payload must be exactly 2 bytes",
                             static_cast<int32_t>(data.len));
      }
      bytes = data.bytes;
      break;
    default:
      return Status::Error(Err::INVALID_PARAM,
                           "Register payload must be a 16-bit word or a 2-byte buffer");
  }
  return _config.i2c->writeRegister(reg, bytes, cmd::REG_SIZE);
}

// ============================================================================
// Utility
// ============================================================================

Status ADS111x::gainBounds(Gain gain, double& minVolts, double& maxVolts) {
  const uint16_t value = static_cast<uint16_t>(gain);
  if (!field::isValidValue(field::GAIN, value)) {
    return Status::Error(Err::INVALID_PARAM, "Unknown full-scale range", value);
  }
  const double fullScale = kFullScaleVolts[field::decode(value, field::GAIN)];
  minVolts = -fullScale;
  maxVolts = fullScale;
  return Status::Ok();
}

Status ADS111x::gainRange(Gain gain, double& rangeVolts) {
  double minVolts = 0.0;
  double maxVolts = 0.0;
  Status st = gainBounds(gain, minVolts, maxVolts);
  if (!st.ok()) {
    return st;
  }
  rangeVolts = maxVolts - minVolts;
  return Status::Ok();
}

Status ADS111x::lsbVolts(Gain gain, double& volts) {
  double range = 0.0;
  Status st = gainRange(gain, range);
  if (!st.ok()) {
    return st;
  }
  volts = range / static_cast<double>(cmd::RESOLUTION);
  return Status::Ok();
}

Status ADS111x::countsToVolts(int16_t raw, Gain gain, double& volts) {
  double range = 0.0;
  Status st = gainRange(gain, range);
  if (!st.ok()) {
    return st;
  }
  volts = static_cast<double>(raw) * range / static_cast<double>(cmd::RESOLUTION);
  return Status::Ok();
}

// ============================================================================
// Field Access
// ============================================================================

Status ADS111x::_readField(const FieldSpec& f, uint16_t& value) {
  uint16_t configReg = 0;
  Status st = readConfig(configReg);
  if (!st.ok()) {
    return st;
  }
  value = field::extract(configReg, f);
  return Status::Ok();
}

// In single-shot mode the OS bit reads back as 1 when idle, so writing the
// word back also starts a conversion.
Status ADS111x::_writeField(const FieldSpec& f, uint16_t value) {
  uint16_t configReg = 0;
  Status st = readConfig(configReg);
  if (!st.ok()) {
    return st;
  }
  return writeConfig(field::encode(configReg, f, value));
}

} // namespace ADS111x
