/// @file ConfigRegister.cpp
/// @brief Config register field table and lookup

#include "ADS111x/ConfigRegister.h"

#include <cstring>

namespace ADS111x {
namespace field {

const FieldSpec ALL[COUNT] = {
  STATUS, MUX, GAIN, MODE, DATA_RATE, COMP_MODE, COMP_POL, COMP_LAT, COMP_QUE
};

uint16_t defaultConfig() {
  uint16_t config = 0;
  for (size_t i = 0; i < COUNT; ++i) {
    config = encode(config, ALL[i], ALL[i].defaultValue);
  }
  return config;
}

const FieldSpec* find(const char* name) {
  if (name == nullptr) {
    return nullptr;
  }
  for (size_t i = 0; i < COUNT; ++i) {
    if (std::strcmp(ALL[i].name, name) == 0) {
      return &ALL[i];
    }
  }
  return nullptr;
}

Status lookup(const char* name, const FieldSpec*& out) {
  if (name == nullptr) {
    return Status::Error(Err::INVALID_PARAM, "Field name is null");
  }
  const FieldSpec* spec = find(name);
  if (spec == nullptr) {
    return Status::Error(Err::UNKNOWN_FIELD,
                         "Unknown config field (expected status, mux, gain, mode, "
                         "data_rate, comp_mode, comp_pol, comp_lat or comp_que)");
  }
  out = spec;
  return Status::Ok();
}

} // namespace field
} // namespace ADS111x
