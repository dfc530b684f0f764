#include "symseal/config/settings.hpp"

#include <gtest/gtest.h>

#include <cstdlib>

using Symseal::ConfigurationError;
using Symseal::Config::Settings;

namespace {

const char* const kVariables[] = {
    "SYMSEAL_DATA_CIPHER",
    "SYMSEAL_PASSWORD_CIPHER",
    "SYMSEAL_PRIVATE_KEY_CIPHER",
    "SYMSEAL_COMPRESSION_ENABLED",
    "SYMSEAL_COMPRESSION_LEVEL",
};

class SettingsEnvironmentTest : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear() {
        for (const char* name : kVariables) unsetenv(name);
    }
};

} // namespace

TEST(SettingsTest, DefaultsAreValid) {
    Settings settings;
    EXPECT_EQ(settings.data_cipher, "AES-256-CBC");
    EXPECT_EQ(settings.password_cipher, "AES-128-CBC");
    EXPECT_EQ(settings.private_key_cipher, "AES-256-CBC");
    EXPECT_TRUE(settings.compression_enabled);
    EXPECT_EQ(settings.compression_level, 9);
    EXPECT_NO_THROW(settings.validate());
}

TEST(SettingsTest, ValidateRejectsUnknownCiphers) {
    Settings data;
    data.data_cipher = "AES-512-CBC";
    EXPECT_THROW(data.validate(), ConfigurationError);

    Settings password;
    password.password_cipher = "AES-256-ECB";
    EXPECT_THROW(password.validate(), ConfigurationError);

    Settings wrap;
    wrap.private_key_cipher = "";
    EXPECT_THROW(wrap.validate(), ConfigurationError);

    Settings stealing;
    stealing.data_cipher = "AES-256-CBC-CTS";
    EXPECT_THROW(stealing.validate(), ConfigurationError);
}

TEST(SettingsTest, ValidateChecksCompressionLevel) {
    Settings settings;
    settings.compression_level = 0;
    EXPECT_NO_THROW(settings.validate());
    settings.compression_level = -1;
    EXPECT_THROW(settings.validate(), ConfigurationError);
    settings.compression_level = 10;
    EXPECT_THROW(settings.validate(), ConfigurationError);
}

TEST_F(SettingsEnvironmentTest, EmptyEnvironmentKeepsBase) {
    Settings base;
    base.data_cipher = "AES-256-GCM";
    Settings result = Settings::from_environment(base);
    EXPECT_EQ(result.data_cipher, "AES-256-GCM");
    EXPECT_EQ(result.compression_level, 9);
}

TEST_F(SettingsEnvironmentTest, EmptyEnvironmentYieldsDefaults) {
    Settings defaults;
    Settings result = Settings::from_environment();
    EXPECT_EQ(result.data_cipher, defaults.data_cipher);
    EXPECT_EQ(result.password_cipher, defaults.password_cipher);
    EXPECT_EQ(result.private_key_cipher, defaults.private_key_cipher);
    EXPECT_EQ(result.compression_enabled, defaults.compression_enabled);
    EXPECT_EQ(result.compression_level, defaults.compression_level);
}

TEST_F(SettingsEnvironmentTest, ReadsEveryVariable) {
    setenv("SYMSEAL_DATA_CIPHER", "ChaCha20-Poly1305", 1);
    setenv("SYMSEAL_PASSWORD_CIPHER", "AES-256-GCM", 1);
    setenv("SYMSEAL_PRIVATE_KEY_CIPHER", "AES-128-GCM", 1);
    setenv("SYMSEAL_COMPRESSION_ENABLED", "off", 1);
    setenv("SYMSEAL_COMPRESSION_LEVEL", "4", 1);

    Settings result = Settings::from_environment();
    EXPECT_EQ(result.data_cipher, "ChaCha20-Poly1305");
    EXPECT_EQ(result.password_cipher, "AES-256-GCM");
    EXPECT_EQ(result.private_key_cipher, "AES-128-GCM");
    EXPECT_FALSE(result.compression_enabled);
    EXPECT_EQ(result.compression_level, 4);
    EXPECT_NO_THROW(result.validate());
}

TEST_F(SettingsEnvironmentTest, BooleanSpellings) {
    for (const char* yes : {"1", "true", "TRUE", "yes", "On"}) {
        setenv("SYMSEAL_COMPRESSION_ENABLED", yes, 1);
        EXPECT_TRUE(Settings::from_environment().compression_enabled) << yes;
    }
    for (const char* no : {"0", "false", "No", "off"}) {
        setenv("SYMSEAL_COMPRESSION_ENABLED", no, 1);
        EXPECT_FALSE(Settings::from_environment().compression_enabled) << no;
    }
}

TEST_F(SettingsEnvironmentTest, UnparsableValuesAreConfigurationErrors) {
    setenv("SYMSEAL_COMPRESSION_ENABLED", "maybe", 1);
    EXPECT_THROW(Settings::from_environment(), ConfigurationError);
    unsetenv("SYMSEAL_COMPRESSION_ENABLED");

    setenv("SYMSEAL_COMPRESSION_LEVEL", "high", 1);
    EXPECT_THROW(Settings::from_environment(), ConfigurationError);
    setenv("SYMSEAL_COMPRESSION_LEVEL", "5x", 1);
    EXPECT_THROW(Settings::from_environment(), ConfigurationError);
    setenv("SYMSEAL_COMPRESSION_LEVEL", "99999999999999", 1);
    EXPECT_THROW(Settings::from_environment(), ConfigurationError);
}

TEST_F(SettingsEnvironmentTest, OutOfRangeLevelParsesButFailsValidation) {
    setenv("SYMSEAL_COMPRESSION_LEVEL", "11", 1);
    Settings result = Settings::from_environment();
    EXPECT_EQ(result.compression_level, 11);
    EXPECT_THROW(result.validate(), ConfigurationError);
}
