/// @file main.cpp
/// @brief ADS111x basic bringup example
/// @note This is an EXAMPLE, not part of the library

#include <Arduino.h>

#include "examples/common/BoardConfig.h"
#include "examples/common/I2cTransport.h"
#include "examples/common/Log.h"

#include "ADS111x/ADS111x.h"
#include "ADS111x/CallbackI2cDevice.h"

// ============================================================================
// Globals
// ============================================================================

ADS111x::CallbackI2cDevice bus;
ADS111x::ADS111x device;
ADS111x::Mux activeInput = ADS111x::Mux::AIN0_GND;
bool verboseMode = false;

// ============================================================================
// Helper Functions
// ============================================================================

const char* errToStr(ADS111x::Err err) {
  using ADS111x::Err;
  switch (err) {
    case Err::OK:               return "OK";
    case Err::NOT_INITIALIZED:  return "NOT_INITIALIZED";
    case Err::INVALID_CONFIG:   return "INVALID_CONFIG";
    case Err::I2C_ERROR:        return "I2C_ERROR";
    case Err::TIMEOUT:          return "TIMEOUT";
    case Err::INVALID_PARAM:    return "INVALID_PARAM";
    case Err::DEVICE_NOT_FOUND: return "DEVICE_NOT_FOUND";
    case Err::UNKNOWN_FIELD:    return "UNKNOWN_FIELD";
    default:                    return "UNKNOWN";
  }
}

void printStatus(const ADS111x::Status& st) {
  Serial.printf("  Status: %s (code=%u, detail=%ld)\n",
                errToStr(st.code),
                static_cast<unsigned>(st.code),
                static_cast<long>(st.detail));
  if (st.msg && st.msg[0]) {
    Serial.printf("  Message: %s\n", st.msg);
  }
}

void printHelp() {
  Serial.println("Commands:");
  Serial.println("  help              - Show this help");
  Serial.println("  raw               - Read raw count on active input");
  Serial.println("  voltage           - Read voltage on active input");
  Serial.println("  read              - Start single-shot, wait, read voltage");
  Serial.println("  start             - Start single-shot conversion");
  Serial.println("  poll              - Check if conversion is idle");
  Serial.println();
  Serial.println("Channel/Gain:");
  Serial.println("  ch [0|1|2|3]      - Select single-ended input (AINx vs GND)");
  Serial.println("  diff [0|1|2|3]    - Select differential pair");
  Serial.println("  gain [0..5]       - Set PGA (0=6.144V, 2=2.048V, 5=0.256V)");
  Serial.println("  rate [0..7]       - Set data rate");
  Serial.println("  mode [single|cont] - Set operating mode");
  Serial.println();
  Serial.println("Comparator:");
  Serial.println("  thresh LO HI      - Set comparator thresholds (raw counts)");
  Serial.println("  queue [0..3]      - Set comparator queue (3=disable)");
  Serial.println();
  Serial.println("Registers:");
  Serial.println("  config            - Dump config register fields");
  Serial.println("  field NAME [HEX]  - Read or write one config field");
  Serial.println("  probe             - Probe device");
  Serial.println("  verbose [0|1]     - Enable/disable verbose output");
  Serial.println("  stress [N]        - Run N single-shot reads");
}

ADS111x::Mux channelToMux(int channel) {
  switch (channel) {
    case 0: return ADS111x::Mux::AIN0_GND;
    case 1: return ADS111x::Mux::AIN1_GND;
    case 2: return ADS111x::Mux::AIN2_GND;
    case 3: return ADS111x::Mux::AIN3_GND;
    default: return ADS111x::Mux::AIN0_GND;
  }
}

ADS111x::Mux diffToMux(int index) {
  switch (index) {
    case 0: return ADS111x::Mux::AIN0_AIN1;
    case 1: return ADS111x::Mux::AIN0_AIN3;
    case 2: return ADS111x::Mux::AIN1_AIN3;
    case 3: return ADS111x::Mux::AIN2_AIN3;
    default: return ADS111x::Mux::AIN0_AIN1;
  }
}

void printConfig() {
  uint16_t config = 0;
  ADS111x::Status st = device.readConfig(config);
  if (!st.ok()) {
    printStatus(st);
    return;
  }
  Serial.printf("  Config: 0x%04X\n", config);
  for (size_t i = 0; i < ADS111x::field::COUNT; ++i) {
    const ADS111x::FieldSpec& f = ADS111x::field::ALL[i];
    Serial.printf("    %-10s = %u%s\n", f.name,
                  static_cast<unsigned>(ADS111x::field::decode(config, f)),
                  ADS111x::field::isValidValue(f, ADS111x::field::extract(config, f))
                      ? "" : " (invalid)");
  }
}

ADS111x::Status singleShotVolts(double& volts) {
  ADS111x::Status st = device.setMux(activeInput);
  if (!st.ok()) {
    return st;
  }
  st = device.startConversion();
  if (!st.ok()) {
    return st;
  }
  st = device.waitForIdle(200);
  if (!st.ok()) {
    return st;
  }
  return device.readVoltage(activeInput, volts);
}

void selectInput(ADS111x::Mux mux) {
  activeInput = mux;
  auto st = device.setMux(mux);
  printStatus(st);
}

// ============================================================================
// Command Processing
// ============================================================================

void processCommand(const String& cmdLine) {
  String cmd = cmdLine;
  cmd.trim();

  if (cmd.length() == 0) {
    return;
  }

  if (cmd == "help" || cmd == "?") {
    printHelp();
  } else if (cmd == "probe") {
    LOGI("Probing device...");
    printStatus(device.probe());
  } else if (cmd == "verbose") {
    LOGI("Verbose mode: %s", verboseMode ? "ON" : "OFF");
  } else if (cmd.startsWith("verbose ")) {
    verboseMode = (cmd.substring(8).toInt() != 0);
    LOGI("Verbose mode: %s", verboseMode ? "ON" : "OFF");
  } else if (cmd == "start") {
    printStatus(device.startConversion());
  } else if (cmd == "poll") {
    bool idle = false;
    auto st = device.isIdle(idle);
    if (st.ok()) {
      LOGI("Conversion idle: %s", idle ? "YES" : "NO");
    } else {
      printStatus(st);
    }
  } else if (cmd == "raw") {
    int16_t raw = 0;
    auto st = device.readRaw(activeInput, raw);
    if (st.ok()) {
      Serial.printf("  Raw: %d\n", raw);
    } else {
      printStatus(st);
    }
  } else if (cmd == "voltage") {
    double volts = 0.0;
    auto st = device.readVoltage(activeInput, volts);
    if (st.ok()) {
      Serial.printf("  Voltage: %.6f V\n", volts);
    } else {
      printStatus(st);
    }
  } else if (cmd == "read") {
    double volts = 0.0;
    auto st = singleShotVolts(volts);
    if (st.ok()) {
      Serial.printf("  Voltage: %.6f V\n", volts);
    } else {
      printStatus(st);
    }
  } else if (cmd.startsWith("ch ")) {
    int channel = cmd.substring(3).toInt();
    if (channel < 0 || channel > 3) {
      LOGW("Invalid channel");
      return;
    }
    selectInput(channelToMux(channel));
  } else if (cmd.startsWith("diff ")) {
    int idx = cmd.substring(5).toInt();
    if (idx < 0 || idx > 3) {
      LOGW("Invalid differential index");
      return;
    }
    selectInput(diffToMux(idx));
  } else if (cmd.startsWith("gain ")) {
    int gain = cmd.substring(5).toInt();
    if (gain < 0 || gain > 5) {
      LOGW("Invalid gain");
      return;
    }
    auto value = ADS111x::field::fromCode(ADS111x::field::GAIN, static_cast<uint16_t>(gain));
    printStatus(device.setGain(static_cast<ADS111x::Gain>(value)));
  } else if (cmd.startsWith("rate ")) {
    int rate = cmd.substring(5).toInt();
    if (rate < 0 || rate > 7) {
      LOGW("Invalid rate");
      return;
    }
    auto value = ADS111x::field::fromCode(ADS111x::field::DATA_RATE, static_cast<uint16_t>(rate));
    printStatus(device.setDataRate(static_cast<ADS111x::DataRate>(value)));
  } else if (cmd.startsWith("mode ")) {
    String mode = cmd.substring(5);
    mode.trim();
    if (mode == "single") {
      printStatus(device.setMode(ADS111x::Mode::SINGLE_SHOT));
    } else if (mode == "cont" || mode == "continuous") {
      printStatus(device.setMode(ADS111x::Mode::CONTINUOUS));
    } else {
      LOGW("Invalid mode");
    }
  } else if (cmd.startsWith("thresh ")) {
    String args = cmd.substring(7);
    args.trim();
    int space = args.indexOf(' ');
    if (space < 0) {
      LOGW("Usage: thresh LO HI");
      return;
    }
    long lo = args.substring(0, space).toInt();
    long hi = args.substring(space + 1).toInt();
    if (lo < INT16_MIN || lo > INT16_MAX || hi < INT16_MIN || hi > INT16_MAX) {
      LOGW("Threshold out of range");
      return;
    }
    printStatus(device.setThresholds(static_cast<int16_t>(lo), static_cast<int16_t>(hi)));
  } else if (cmd.startsWith("queue ")) {
    int queue = cmd.substring(6).toInt();
    if (queue < 0 || queue > 3) {
      LOGW("Invalid queue");
      return;
    }
    auto value = ADS111x::field::fromCode(ADS111x::field::COMP_QUE, static_cast<uint16_t>(queue));
    printStatus(device.setComparatorQueue(static_cast<ADS111x::ComparatorQueue>(value)));
  } else if (cmd.startsWith("field ")) {
    String args = cmd.substring(6);
    args.trim();
    int space = args.indexOf(' ');
    String name = (space < 0) ? args : args.substring(0, space);
    if (space < 0) {
      uint16_t value = 0;
      auto st = device.readField(name.c_str(), value);
      if (st.ok()) {
        Serial.printf("  %s = 0x%04X\n", name.c_str(), value);
      } else {
        printStatus(st);
      }
    } else {
      uint16_t value = static_cast<uint16_t>(strtoul(args.substring(space + 1).c_str(), nullptr, 16));
      printStatus(device.writeField(name.c_str(), value));
    }
  } else if (cmd == "config") {
    printConfig();
  } else if (cmd.startsWith("stress")) {
    int count = 10;
    if (cmd.length() > 6) {
      count = cmd.substring(7).toInt();
    }
    if (count <= 0) {
      LOGW("Invalid count");
      return;
    }
    int ok = 0;
    int fail = 0;
    for (int i = 0; i < count; ++i) {
      double volts = 0.0;
      auto st = singleShotVolts(volts);
      if (st.ok()) {
        ok++;
        LOGV(verboseMode, "  %d: %.6f V", i + 1, volts);
      } else {
        fail++;
        if (verboseMode) {
          printStatus(st);
        }
      }
    }
    Serial.printf("  Stress results: %d ok, %d failed\n", ok, fail);
  } else {
    LOGW("Unknown command: %s", cmd.c_str());
  }
}

// ============================================================================
// Setup and Loop
// ============================================================================

void setup() {
  board::initSerial();
  delay(100);

  LOGI("=== ADS111x Bringup Example (v%s) ===", ADS111x::VERSION);

  if (!board::initI2c()) {
    LOGE("Failed to initialize I2C");
    return;
  }
  LOGI("I2C initialized (SDA=%d, SCL=%d)", board::I2C_SDA, board::I2C_SCL);

  ADS111x::CallbackI2cDevice::Settings busCfg;
  busCfg.i2cWrite = transport::wireWrite;
  busCfg.i2cWriteRead = transport::wireWriteRead;
  busCfg.i2cAddress = ADS111x::cmd::ADDR_GND;
  busCfg.i2cTimeoutMs = board::I2C_TIMEOUT_MS;
  auto st = bus.begin(busCfg);
  if (!st.ok()) {
    LOGE("Failed to set up transport");
    printStatus(st);
    return;
  }

  ADS111x::Config cfg;
  cfg.i2c = &bus;
  cfg.nowMs = transport::nowMs;
  cfg.delayMs = transport::sleepMs;
  st = device.begin(cfg);
  if (!st.ok()) {
    LOGE("Failed to initialize device");
    printStatus(st);
    return;
  }

  st = device.probe();
  if (!st.ok()) {
    LOGE("Device not responding");
    printStatus(st);
    return;
  }

  LOGI("Device initialized successfully");
  printConfig();

  Serial.println("\nType 'help' for commands");
  Serial.print("> ");
}

void loop() {
  static String inputBuffer;
  while (Serial.available()) {
    char c = static_cast<char>(Serial.read());
    if (c == '\n' || c == '\r') {
      if (inputBuffer.length() > 0) {
        processCommand(inputBuffer);
        inputBuffer = "";
        Serial.print("> ");
      }
    } else {
      inputBuffer += c;
    }
  }
}
