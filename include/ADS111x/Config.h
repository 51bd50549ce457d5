/// @file Config.h
/// @brief Configuration structure and register field enums for ADS111x driver
#pragma once

#include <cstddef>
#include <cstdint>

#include "ADS111x/CommandTable.h"
#include "ADS111x/I2cDevice.h"
#include "ADS111x/Status.h"

namespace ADS111x {

/// Millisecond clock callback signature
/// @param user User context pointer passed through from Config
/// @return Monotonic time in milliseconds
using NowMsFn = uint32_t (*)(void* user);

/// Millisecond delay callback signature
/// @param ms   Time to sleep
/// @param user User context pointer passed through from Config
using DelayMsFn = void (*)(uint32_t ms, void* user);

// Field enums hold the field value already shifted into its register
// position, so a value can be OR'd straight into the config word.

/// Operational status (OS bit)
enum class ConversionStatus : uint16_t {
  BUSY = cmd::OS_BUSY,  ///< Conversion in progress
  IDLE = cmd::OS_IDLE   ///< No conversion in progress (power-up)
};

/// Input multiplexer configuration
enum class Mux : uint16_t {
  AIN0_AIN1 = cmd::MUX_AIN0_AIN1,  ///< Differential: AIN0 - AIN1 (default)
  AIN0_AIN3 = cmd::MUX_AIN0_AIN3,  ///< Differential: AIN0 - AIN3
  AIN1_AIN3 = cmd::MUX_AIN1_AIN3,  ///< Differential: AIN1 - AIN3
  AIN2_AIN3 = cmd::MUX_AIN2_AIN3,  ///< Differential: AIN2 - AIN3
  AIN0_GND  = cmd::MUX_AIN0_GND,   ///< Single-ended: AIN0
  AIN1_GND  = cmd::MUX_AIN1_GND,   ///< Single-ended: AIN1
  AIN2_GND  = cmd::MUX_AIN2_GND,   ///< Single-ended: AIN2
  AIN3_GND  = cmd::MUX_AIN3_GND    ///< Single-ended: AIN3
};

/// Programmable Gain Amplifier (full-scale range)
enum class Gain : uint16_t {
  FSR_6_144V = cmd::PGA_6_144V,  ///< +/-6.144V (LSB = 187.5uV)
  FSR_4_096V = cmd::PGA_4_096V,  ///< +/-4.096V (LSB = 125uV)
  FSR_2_048V = cmd::PGA_2_048V,  ///< +/-2.048V (LSB = 62.5uV) - default
  FSR_1_024V = cmd::PGA_1_024V,  ///< +/-1.024V (LSB = 31.25uV)
  FSR_0_512V = cmd::PGA_0_512V,  ///< +/-0.512V (LSB = 15.625uV)
  FSR_0_256V = cmd::PGA_0_256V   ///< +/-0.256V (LSB = 7.8125uV)
};

/// Data rate (samples per second)
enum class DataRate : uint16_t {
  SPS_8   = cmd::DR_8SPS,    ///<   8 SPS
  SPS_16  = cmd::DR_16SPS,   ///<  16 SPS
  SPS_32  = cmd::DR_32SPS,   ///<  32 SPS
  SPS_64  = cmd::DR_64SPS,   ///<  64 SPS
  SPS_128 = cmd::DR_128SPS,  ///< 128 SPS (default)
  SPS_250 = cmd::DR_250SPS,  ///< 250 SPS
  SPS_475 = cmd::DR_475SPS,  ///< 475 SPS
  SPS_860 = cmd::DR_860SPS   ///< 860 SPS
};

/// Operating mode
enum class Mode : uint16_t {
  CONTINUOUS  = cmd::MODE_CONTINUOUS,  ///< Continuous conversion mode
  SINGLE_SHOT = cmd::MODE_SINGLE_SHOT  ///< Single-shot / power-down mode (default)
};

/// Comparator mode
enum class ComparatorMode : uint16_t {
  TRADITIONAL = cmd::COMP_MODE_TRADITIONAL,  ///< Traditional comparator with hysteresis (default)
  WINDOW      = cmd::COMP_MODE_WINDOW        ///< Window comparator
};

/// Comparator polarity
enum class ComparatorPolarity : uint16_t {
  ACTIVE_LOW  = cmd::COMP_POL_ACTIVE_LOW,  ///< ALERT/RDY active low (default)
  ACTIVE_HIGH = cmd::COMP_POL_ACTIVE_HIGH  ///< ALERT/RDY active high
};

/// Comparator latch
enum class ComparatorLatch : uint16_t {
  NON_LATCHING = cmd::COMP_LAT_NON_LATCHING,  ///< Non-latching (default)
  LATCHING     = cmd::COMP_LAT_LATCHING       ///< Latching
};

/// Comparator queue (assertions before ALERT)
enum class ComparatorQueue : uint16_t {
  ASSERT_1 = cmd::COMP_QUE_ASSERT_1,  ///< Assert after 1 conversion
  ASSERT_2 = cmd::COMP_QUE_ASSERT_2,  ///< Assert after 2 conversions
  ASSERT_4 = cmd::COMP_QUE_ASSERT_4,  ///< Assert after 4 conversions
  DISABLE  = cmd::COMP_QUE_DISABLE    ///< Disable comparator (default), ALERT/RDY high-Z
};

/// Configuration for ADS111x driver
struct Config {
  // === Transport (required) ===
  I2cDevice* i2c = nullptr;        ///< Not owned; must outlive the driver

  // === Clock (optional, only used by waitForIdle) ===
  NowMsFn nowMs = nullptr;
  DelayMsFn delayMs = nullptr;
  void* clockUser = nullptr;
  uint32_t pollIntervalMs = 1;     ///< Delay between status polls
};

} // namespace ADS111x
