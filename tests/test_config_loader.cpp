#include <gtest/gtest.h>
#include "core/config_loader.h"
#include "core/logger.h"

#include <cstdio>
#include <fstream>
#include <stdexcept>

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().setLevel(LogLevel::Error);
    }
};

TEST_F(ConfigLoaderTest, DefaultsWhenSectionsMissing) {
    AppConfig cfg = ConfigLoader::loadFromString("{}");

    EXPECT_EQ(cfg.sensitivity, "medium");
    EXPECT_TRUE(cfg.checkBase64);
    EXPECT_EQ(cfg.quarantineThreshold, 50);
    EXPECT_EQ(cfg.maxScanBytes, 1048576u);
    EXPECT_TRUE(cfg.customPatterns.empty());
    EXPECT_TRUE(cfg.logFile.empty());
    EXPECT_EQ(cfg.logLevel, "info");
}

TEST_F(ConfigLoaderTest, ParsesDetectorSection) {
    AppConfig cfg = ConfigLoader::loadFromString(R"(
detector:
  sensitivity: high
  check_base64: false
  quarantine_threshold: 70
  max_scan_bytes: 4096
  custom_patterns:
    - pattern: "(?i)wire\\s+transfer"
      name: custom_wire
logging:
  level: debug
  file: /tmp/injection_guard.log
)");

    EXPECT_EQ(cfg.sensitivity, "high");
    EXPECT_FALSE(cfg.checkBase64);
    EXPECT_EQ(cfg.quarantineThreshold, 70);
    EXPECT_EQ(cfg.maxScanBytes, 4096u);
    ASSERT_EQ(cfg.customPatterns.size(), 1u);
    EXPECT_EQ(cfg.customPatterns[0].pattern, "(?i)wire\\s+transfer");
    EXPECT_EQ(cfg.customPatterns[0].name, "custom_wire");
    EXPECT_EQ(cfg.logLevel, "debug");
    EXPECT_EQ(cfg.logFile, "/tmp/injection_guard.log");

    DetectorConfig d = cfg.detectorConfig();
    EXPECT_EQ(d.sensitivity, Sensitivity::High);
    EXPECT_FALSE(d.checkBase64);
    EXPECT_EQ(d.quarantineThreshold, 70);
}

TEST_F(ConfigLoaderTest, RejectsUnknownSensitivity) {
    EXPECT_THROW(ConfigLoader::loadFromString("detector:\n  sensitivity: paranoid\n"),
                 std::runtime_error);
}

TEST_F(ConfigLoaderTest, RejectsThresholdOutOfRange) {
    EXPECT_THROW(ConfigLoader::loadFromString("detector:\n  quarantine_threshold: 101\n"),
                 std::runtime_error);
    EXPECT_THROW(ConfigLoader::loadFromString("detector:\n  quarantine_threshold: -1\n"),
                 std::runtime_error);
}

TEST_F(ConfigLoaderTest, RejectsZeroScanLimit) {
    EXPECT_THROW(ConfigLoader::loadFromString("detector:\n  max_scan_bytes: 0\n"),
                 std::runtime_error);
}

TEST_F(ConfigLoaderTest, CustomPatternNeedsName) {
    try {
        ConfigLoader::loadFromString(
            "detector:\n  custom_patterns:\n    - pattern: foo\n");
        FAIL() << "expected validation failure";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("custom_patterns[0].name is required"),
                  std::string::npos);
    }
}

TEST_F(ConfigLoaderTest, CollectsEveryError) {
    try {
        ConfigLoader::loadFromString(
            "detector:\n  sensitivity: extreme\n  quarantine_threshold: 500\n"
            "logging:\n  level: verbose\n");
        FAIL() << "expected validation failure";
    } catch (const std::runtime_error& e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("detector.sensitivity"), std::string::npos);
        EXPECT_NE(msg.find("detector.quarantine_threshold"), std::string::npos);
        EXPECT_NE(msg.find("logging.level"), std::string::npos);
    }
}

TEST_F(ConfigLoaderTest, SensitivityIsCaseInsensitive) {
    AppConfig cfg = ConfigLoader::loadFromString("detector:\n  sensitivity: LOW\n");
    EXPECT_EQ(cfg.detectorConfig().sensitivity, Sensitivity::Low);
}

TEST_F(ConfigLoaderTest, LoadsFromFile) {
    const std::string path = ::testing::TempDir() + "injection_guard_config.yml";
    {
        std::ofstream out(path);
        out << "detector:\n  quarantine_threshold: 40\n";
    }

    AppConfig cfg = ConfigLoader::loadFromFile(path);
    EXPECT_EQ(cfg.quarantineThreshold, 40);
    std::remove(path.c_str());
}

TEST_F(ConfigLoaderTest, MissingFileThrows) {
    EXPECT_ANY_THROW(ConfigLoader::loadFromFile("/nonexistent/injection_guard.yml"));
}
