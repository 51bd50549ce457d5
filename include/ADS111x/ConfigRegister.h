/// @file ConfigRegister.h
/// @brief Field layout and encode/decode helpers for the config register
#pragma once

#include <cstddef>
#include <cstdint>

#include "ADS111x/CommandTable.h"
#include "ADS111x/Status.h"

namespace ADS111x {

/// Position and value set of one config register field
struct FieldSpec {
  const char* name;       ///< Lookup key used by readField()/writeField()
  uint8_t lsb;            ///< Bit position of the field's least significant bit
  uint8_t width;          ///< Field width in bits
  uint16_t mask;          ///< Field bits in register position
  uint16_t defaultValue;  ///< Power-up value, pre-shifted
  uint8_t valueCount;     ///< Number of valid codes, starting at 0
};

namespace field {

static constexpr FieldSpec STATUS    = {"status",    cmd::BIT_OS,        1, cmd::MASK_OS,        cmd::OS_IDLE,               2};
static constexpr FieldSpec MUX       = {"mux",       cmd::BIT_MUX,       3, cmd::MASK_MUX,       cmd::MUX_AIN0_AIN1,         8};
static constexpr FieldSpec GAIN      = {"gain",      cmd::BIT_PGA,       3, cmd::MASK_PGA,       cmd::PGA_2_048V,            6};
static constexpr FieldSpec MODE      = {"mode",      cmd::BIT_MODE,      1, cmd::MASK_MODE,      cmd::MODE_SINGLE_SHOT,      2};
static constexpr FieldSpec DATA_RATE = {"data_rate", cmd::BIT_DR,        3, cmd::MASK_DR,        cmd::DR_128SPS,             8};
static constexpr FieldSpec COMP_MODE = {"comp_mode", cmd::BIT_COMP_MODE, 1, cmd::MASK_COMP_MODE, cmd::COMP_MODE_TRADITIONAL, 2};
static constexpr FieldSpec COMP_POL  = {"comp_pol",  cmd::BIT_COMP_POL,  1, cmd::MASK_COMP_POL,  cmd::COMP_POL_ACTIVE_LOW,   2};
static constexpr FieldSpec COMP_LAT  = {"comp_lat",  cmd::BIT_COMP_LAT,  1, cmd::MASK_COMP_LAT,  cmd::COMP_LAT_NON_LATCHING, 2};
static constexpr FieldSpec COMP_QUE  = {"comp_que",  cmd::BIT_COMP_QUE,  2, cmd::MASK_COMP_QUE,  cmd::COMP_QUE_DISABLE,      4};

static constexpr size_t COUNT = 9;

/// Every field, MSB first
extern const FieldSpec ALL[COUNT];

/// Field value shifted down to a small code (0 .. 2^width - 1).
/// Any register value decodes; the code is not checked against the field's
/// value set.
constexpr uint16_t decode(uint16_t reg, const FieldSpec& f) {
  return static_cast<uint16_t>((reg & f.mask) >> f.lsb);
}

/// Field value left in register position, comparable with the field enums.
constexpr uint16_t extract(uint16_t reg, const FieldSpec& f) {
  return static_cast<uint16_t>(reg & f.mask);
}

/// Replace one field. value must already be shifted into position; bits of
/// value outside the field are dropped so the rest of reg is left untouched.
constexpr uint16_t encode(uint16_t reg, const FieldSpec& f, uint16_t value) {
  return static_cast<uint16_t>((reg & static_cast<uint16_t>(~f.mask)) | (value & f.mask));
}

/// Shift a small code into the field's position.
constexpr uint16_t fromCode(const FieldSpec& f, uint16_t code) {
  return static_cast<uint16_t>((code << f.lsb) & f.mask);
}

/// @return true if value (pre-shifted) lies inside the field and names one
///         of its enumerated settings
constexpr bool isValidValue(const FieldSpec& f, uint16_t value) {
  return (value & static_cast<uint16_t>(~f.mask)) == 0 && decode(value, f) < f.valueCount;
}

/// Config word with every field at its default (matches CONFIG_DEFAULT)
uint16_t defaultConfig();

/// @return field with the given name, or nullptr
const FieldSpec* find(const char* name);

/// Look up a field by name.
/// @return UNKNOWN_FIELD if no field has that name, INVALID_PARAM if name is null
Status lookup(const char* name, const FieldSpec*& out);

} // namespace field
} // namespace ADS111x
