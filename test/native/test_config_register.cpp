/// @file test_config_register.cpp
/// @brief Unit tests for config register field layout and codec

#include "TestHarness.h"

#include <cstring>

#include "ADS111x/ADS111x.h"
#include "ADS111x/ConfigRegister.h"

using namespace ADS111x;
using Driver = ::ADS111x::ADS111x;

// ============================================================================
// Layout
// ============================================================================

TEST(fields_do_not_overlap_and_cover_register) {
  uint16_t seen = 0;
  for (size_t i = 0; i < field::COUNT; ++i) {
    const FieldSpec& f = field::ALL[i];
    ASSERT_EQ(seen & f.mask, 0);
    ASSERT_EQ(f.mask, static_cast<uint16_t>(((1u << f.width) - 1u) << f.lsb));
    ASSERT_TRUE(f.valueCount <= (1u << f.width));
    seen = static_cast<uint16_t>(seen | f.mask);
  }
  ASSERT_EQ(seen, 0xFFFF);
}

TEST(field_defaults_form_power_up_value) {
  ASSERT_EQ(field::defaultConfig(), cmd::CONFIG_DEFAULT);
  for (size_t i = 0; i < field::COUNT; ++i) {
    const FieldSpec& f = field::ALL[i];
    ASSERT_TRUE(field::isValidValue(f, f.defaultValue));
  }
}

TEST(default_config_decodes_to_datasheet_settings) {
  const uint16_t cfg = cmd::CONFIG_DEFAULT;
  ASSERT_EQ(field::extract(cfg, field::MODE), static_cast<uint16_t>(Mode::SINGLE_SHOT));
  ASSERT_EQ(field::extract(cfg, field::DATA_RATE), static_cast<uint16_t>(DataRate::SPS_128));
  ASSERT_EQ(field::extract(cfg, field::GAIN), static_cast<uint16_t>(Gain::FSR_2_048V));
  ASSERT_EQ(field::extract(cfg, field::MUX), static_cast<uint16_t>(Mux::AIN0_AIN1));
  ASSERT_EQ(field::extract(cfg, field::STATUS), static_cast<uint16_t>(ConversionStatus::IDLE));
  ASSERT_EQ(field::extract(cfg, field::COMP_QUE), static_cast<uint16_t>(ComparatorQueue::DISABLE));
  ASSERT_EQ(field::decode(cfg, field::DATA_RATE), 4);
  ASSERT_EQ(field::decode(cfg, field::MODE), 1);
}

// ============================================================================
// Codec laws, checked over every register value
// ============================================================================

TEST(encode_of_current_value_is_identity) {
  for (uint32_t reg = 0; reg <= 0xFFFF; ++reg) {
    const uint16_t r = static_cast<uint16_t>(reg);
    for (size_t i = 0; i < field::COUNT; ++i) {
      const FieldSpec& f = field::ALL[i];
      ASSERT_EQ(field::encode(r, f, field::extract(r, f)), r);
      ASSERT_EQ(field::encode(r, f, field::fromCode(f, field::decode(r, f))), r);
    }
  }
}

TEST(encode_touches_only_field_bits) {
  for (uint32_t reg = 0; reg <= 0xFFFF; reg += 7) {
    const uint16_t before = static_cast<uint16_t>(reg);
    for (size_t i = 0; i < field::COUNT; ++i) {
      const FieldSpec& f = field::ALL[i];
      for (uint16_t code = 0; code < (1u << f.width); ++code) {
        const uint16_t after = field::encode(before, f, field::fromCode(f, code));
        ASSERT_EQ((before ^ after) & static_cast<uint16_t>(~f.mask), 0);
        ASSERT_EQ(field::decode(after, f), code);
      }
    }
  }
}

TEST(encode_masks_out_of_field_value) {
  // 0xFFFF is not a valid gain; only the gain bits may change
  const uint16_t after = field::encode(0x0000, field::GAIN, 0xFFFF);
  ASSERT_EQ(after, cmd::MASK_PGA);
  ASSERT_FALSE(field::isValidValue(field::GAIN, 0xFFFF));
  ASSERT_FALSE(field::isValidValue(field::GAIN, 0x0C00));
  ASSERT_TRUE(field::isValidValue(field::GAIN, 0x0A00));
}

TEST(set_gain_0_256_reads_back_regardless_of_other_bits) {
  const uint16_t samples[] = {0x0000, 0xFFFF, 0x8583, 0x5A5A, 0xA5A5, 0x0E00};
  for (uint16_t reg : samples) {
    const uint16_t after = field::encode(reg, field::GAIN, static_cast<uint16_t>(Gain::FSR_0_256V));
    ASSERT_EQ(field::extract(after, field::GAIN), static_cast<uint16_t>(Gain::FSR_0_256V));
    ASSERT_EQ(after & static_cast<uint16_t>(~cmd::MASK_PGA), reg & static_cast<uint16_t>(~cmd::MASK_PGA));
  }
}

// ============================================================================
// Lookup
// ============================================================================

TEST(lookup_by_name) {
  const FieldSpec* f = nullptr;
  ASSERT_TRUE(field::lookup("data_rate", f).ok());
  ASSERT_EQ(f->mask, cmd::MASK_DR);
  ASSERT_EQ(f->lsb, 5);
  ASSERT_TRUE(field::lookup("status", f).ok());
  ASSERT_EQ(f->mask, cmd::MASK_OS);
  ASSERT_EQ(std::strcmp(field::find("comp_que")->name, "comp_que"), 0);
}

TEST(lookup_unknown_name_fails) {
  const FieldSpec* f = nullptr;
  Status st = field::lookup("pga_gain", f);
  ASSERT_EQ(st.code, Err::UNKNOWN_FIELD);
  ASSERT_TRUE(std::strlen(st.msg) > 0);
  ASSERT_EQ(f, nullptr);
  ASSERT_EQ(field::find("MUX"), nullptr);
  ASSERT_EQ(field::lookup(nullptr, f).code, Err::INVALID_PARAM);
}

// ============================================================================
// Full-scale table
// ============================================================================

TEST(gain_bounds_are_symmetric) {
  const Gain gains[] = {Gain::FSR_6_144V, Gain::FSR_4_096V, Gain::FSR_2_048V,
                        Gain::FSR_1_024V, Gain::FSR_0_512V, Gain::FSR_0_256V};
  const double widths[] = {12.288, 8.192, 4.096, 2.048, 1.024, 0.512};
  for (size_t i = 0; i < 6; ++i) {
    double lo = 0.0;
    double hi = 0.0;
    ASSERT_TRUE(Driver::gainBounds(gains[i], lo, hi).ok());
    ASSERT_EQ(lo, -hi);
    ASSERT_NEAR(hi - lo, widths[i], 1e-12);

    double range = 0.0;
    ASSERT_TRUE(Driver::gainRange(gains[i], range).ok());
    ASSERT_NEAR(range, widths[i], 1e-12);
  }
}

TEST(gain_codes_outside_table_rejected) {
  double lo = 1.0;
  double hi = 2.0;
  Status st = Driver::gainBounds(static_cast<Gain>(0x0C00), lo, hi);
  ASSERT_EQ(st.code, Err::INVALID_PARAM);
  ASSERT_EQ(lo, 1.0);
  ASSERT_EQ(hi, 2.0);
  ASSERT_EQ(Driver::gainBounds(static_cast<Gain>(0x0E00), lo, hi).code, Err::INVALID_PARAM);
}

TEST(counts_to_volts) {
  double volts = 0.0;
  ASSERT_TRUE(Driver::countsToVolts(16384, Gain::FSR_2_048V, volts).ok());
  ASSERT_NEAR(volts, 1.024, 1e-9);
  ASSERT_TRUE(Driver::countsToVolts(-32768, Gain::FSR_4_096V, volts).ok());
  ASSERT_NEAR(volts, -4.096, 1e-9);
  ASSERT_TRUE(Driver::countsToVolts(1, Gain::FSR_0_256V, volts).ok());
  ASSERT_NEAR(volts, 7.8125e-6, 1e-12);

  double lsb = 0.0;
  ASSERT_TRUE(Driver::lsbVolts(Gain::FSR_6_144V, lsb).ok());
  ASSERT_NEAR(lsb, 187.5e-6, 1e-12);
}

// ============================================================================
// Main
// ============================================================================

int main() {
  printf("\n=== ADS111x Config Register Tests ===\n\n");

  RUN_TEST(fields_do_not_overlap_and_cover_register);
  RUN_TEST(field_defaults_form_power_up_value);
  RUN_TEST(default_config_decodes_to_datasheet_settings);
  RUN_TEST(encode_of_current_value_is_identity);
  RUN_TEST(encode_touches_only_field_bits);
  RUN_TEST(encode_masks_out_of_field_value);
  RUN_TEST(set_gain_0_256_reads_back_regardless_of_other_bits);
  RUN_TEST(lookup_by_name);
  RUN_TEST(lookup_unknown_name_fails);
  RUN_TEST(gain_bounds_are_symmetric);
  RUN_TEST(gain_codes_outside_table_rejected);
  RUN_TEST(counts_to_volts);

  return TEST_SUMMARY();
}
