#include "symseal/config/settings.hpp"
#include "symseal/core/pipeline.hpp"
#include "symseal/data/transport.hpp"
#include "symseal/io/binary_stream.hpp"
#include "symseal/io/token.hpp"

#include <gtest/gtest.h>

using namespace Symseal;
using Symseal::Config::Configuration;
using Symseal::Config::Settings;

// One test body: the configuration freezes on first read and stays frozen for the process.
TEST(ConfigurationTest, ConfigureBeforeFreezeThenLocked) {
    ASSERT_FALSE(Configuration::frozen());

    Configuration::configure([](Settings& s) {
        s.data_cipher = "AES-256-GCM";
        s.compression_enabled = false;
        s.compression_level = 3;
    });

    // A rejected update leaves the previous settings in place.
    EXPECT_THROW(Configuration::configure([](Settings& s) { s.data_cipher = "AES-256-ECB"; }),
                 ConfigurationError);
    EXPECT_THROW(Configuration::configure([](Settings& s) { s.compression_level = 42; }),
                 ConfigurationError);
    EXPECT_FALSE(Configuration::frozen());

    Core::Pipeline& pipeline = Core::default_pipeline();
    EXPECT_TRUE(Configuration::frozen());
    EXPECT_EQ(&pipeline, &Core::default_pipeline());

    const Settings& settings = Configuration::settings();
    EXPECT_EQ(settings.data_cipher, "AES-256-GCM");
    EXPECT_FALSE(settings.compression_enabled);
    EXPECT_EQ(settings.compression_level, 3);
    EXPECT_EQ(pipeline.settings().data_cipher, "AES-256-GCM");

    PrivateKey key = pipeline.key_manager().generate_key();
    std::string token = pipeline.encrypt_with_key(Data::Value("configured"), key);
    byte_vec raw = Data::decode_transport(token);
    IO::ByteReader in(raw);
    IO::Token parsed;
    parsed.read_header(in);
    EXPECT_EQ(parsed.cipher_id, "AES-256-GCM");
    EXPECT_FALSE(parsed.is_compressed());

    EXPECT_THROW(Configuration::configure([](Settings& s) { s.compression_enabled = true; }),
                 ConfigurationError);
    EXPECT_FALSE(Configuration::settings().compression_enabled);
}
