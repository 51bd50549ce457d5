/// @file ADS111x.h
/// @brief Main driver class for ADS1113/ADS1114/ADS1115
#pragma once

#include <cstddef>
#include <cstdint>

#include "ADS111x/CommandTable.h"
#include "ADS111x/Config.h"
#include "ADS111x/ConfigRegister.h"
#include "ADS111x/I2cDevice.h"
#include "ADS111x/Status.h"
#include "ADS111x/Version.h"

namespace ADS111x {

/// Data for writeRegister(): either a 16-bit word, sent MSB first, or a
/// caller-owned buffer holding exactly the two register bytes.
struct RegisterPayload {
  enum class Kind : uint8_t {
    WORD,
    BYTES
  };

  Kind kind;
  uint16_t word;
  const uint8_t* bytes;
  size_t len;

  constexpr RegisterPayload(Kind kindIn, uint16_t wordIn, const uint8_t* bytesIn, size_t lenIn)
      : kind(kindIn), word(wordIn), bytes(bytesIn), len(lenIn) {}

  static constexpr RegisterPayload Word(uint16_t value) {
    return RegisterPayload{Kind::WORD, value, nullptr, 0};
  }

  static constexpr RegisterPayload Bytes(const uint8_t* data, size_t len) {
    return RegisterPayload{Kind::BYTES, 0, data, len};
  }
};

/// ADS111x driver class
///
/// Holds no copy of the device registers. Every getter reads the config
/// register from the device, every setter does read-modify-write of a single
/// field. Changing several fields therefore takes several bus round trips.
///
/// Not thread-safe: a setter's read and write are separate transfers, so two
/// writers sharing one device lose updates. Serialize access externally.
class ADS111x {
public:
  // === Lifecycle ===
  Status begin(const Config& config);
  Status close();
  bool isBound() const { return _config.i2c != nullptr; }

  // === Diagnostics ===
  Status probe();

  // === Conversion API ===
  /// Read the conversion register for input. Rewrites the mux field first if
  /// a different input is selected. Does not wait for the new conversion to
  /// finish; call waitForIdle() (single-shot) or allow one conversion period
  /// (continuous) if a fresh sample is required.
  Status readRaw(Mux input, int16_t& out);

  /// readRaw() scaled by the full-scale range read from the config register.
  /// The range and the sample come from separate config reads.
  Status readVoltage(Mux input, double& volts);

  Status startConversion();
  Status isIdle(bool& idle);
  Status waitForIdle(uint32_t timeoutMs);

  // === Configuration ===
  Status readConfig(uint16_t& config);
  Status writeConfig(uint16_t config);

  Status getStatus(ConversionStatus& status);

  Status setMux(Mux mux);
  Status getMux(Mux& mux);

  Status setGain(Gain gain);
  Status getGain(Gain& gain);

  Status setMode(Mode mode);
  Status getMode(Mode& mode);

  Status setDataRate(DataRate rate);
  Status getDataRate(DataRate& rate);

  /// Field access by name ("mux", "gain", ...). Values are pre-shifted.
  Status readField(const char* name, uint16_t& value);
  Status writeField(const char* name, uint16_t value);

  // === Comparator ===
  Status setComparatorMode(ComparatorMode mode);
  Status getComparatorMode(ComparatorMode& mode);

  Status setComparatorPolarity(ComparatorPolarity polarity);
  Status getComparatorPolarity(ComparatorPolarity& polarity);

  Status setComparatorLatch(ComparatorLatch latch);
  Status getComparatorLatch(ComparatorLatch& latch);

  Status setComparatorQueue(ComparatorQueue queue);
  Status getComparatorQueue(ComparatorQueue& queue);

  Status setThresholds(int16_t low, int16_t high);
  Status getThresholds(int16_t& low, int16_t& high);

  // === Register Access ===
  Status read(uint8_t* buf, size_t len);
  Status write(const uint8_t* buf, size_t len);
  Status readRegister(uint8_t reg, uint8_t* buf, size_t len);
  Status readRegister16(uint8_t reg, uint16_t& value);
  Status writeRegister(uint8_t reg, const RegisterPayload& data);

  // === Utility ===
  static Status gainBounds(Gain gain, double& minVolts, double& maxVolts);
  static Status gainRange(Gain gain, double& rangeVolts);
  static Status lsbVolts(Gain gain, double& volts);
  static Status countsToVolts(int16_t raw, Gain gain, double& volts);

private:
  // === Field Access ===
  Status _readField(const FieldSpec& f, uint16_t& value);
  Status _writeField(const FieldSpec& f, uint16_t value);

  // === State ===
  Config _config;
};

} // namespace ADS111x
