#include "symseal/io/token.hpp"
#include "symseal/io/binary_stream.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace Symseal;
using Symseal::IO::ByteReader;
using Symseal::IO::Token;

namespace {

Token sample_token() {
    Token token;
    token.initialize_for_encryption("AES-256-CBC", true);
    token.iv = byte_vec(16, 0xAA);
    token.ciphertext = {1, 2, 3};
    token.tag = byte_vec(32, 0xBB);
    return token;
}

} // namespace

TEST(TokenTest, WritesDocumentedLayout) {
    byte_vec raw = sample_token().write();

    ASSERT_EQ(raw.size(), 1u + 1u + 11u + 1u + 16u + 3u + 32u);
    EXPECT_EQ(raw[0], Constants::TOKEN_VERSION);
    EXPECT_EQ(raw[1], 11);
    EXPECT_EQ(std::string(raw.begin() + 2, raw.begin() + 13), "AES-256-CBC");
    EXPECT_EQ(raw[13], Constants::FLAG_COMPRESSED);
    EXPECT_EQ(raw[14], 0xAA);
    EXPECT_EQ(raw[30], 1);
    EXPECT_EQ(raw[33], 0xBB);
}

TEST(TokenTest, AadIsTheHeader) {
    Token token = sample_token();
    byte_vec aad = token.generate_aad();
    byte_vec raw = token.write();

    EXPECT_EQ(aad.size(), token.get_header_size());
    EXPECT_EQ(aad, byte_vec(raw.begin(), raw.begin() + static_cast<long>(aad.size())));
}

TEST(TokenTest, ReadsBackWhatWasWritten) {
    Token original = sample_token();
    byte_vec raw = original.write();

    ByteReader in(raw);
    Token parsed;
    parsed.read_header(in);
    parsed.read_body(in, 16, 32);

    EXPECT_EQ(parsed.cipher_id, "AES-256-CBC");
    EXPECT_TRUE(parsed.is_compressed());
    EXPECT_EQ(parsed.iv, original.iv);
    EXPECT_EQ(parsed.ciphertext, original.ciphertext);
    EXPECT_EQ(parsed.tag, original.tag);
    EXPECT_TRUE(in.at_end());
}

TEST(TokenTest, UncompressedFlagIsZero) {
    Token token;
    token.initialize_for_encryption("AES-128-GCM", false);
    EXPECT_FALSE(token.is_compressed());
    EXPECT_EQ(token.generate_aad().back(), 0x00);
}

TEST(TokenTest, RejectsUnknownVersion) {
    byte_vec raw = sample_token().write();
    raw[0] = 0x02;
    ByteReader in(raw);
    Token parsed;
    EXPECT_THROW(parsed.read_header(in), FormatError);
}

TEST(TokenTest, RejectsUnknownFlags) {
    byte_vec raw = sample_token().write();
    raw[13] = 0x02;
    ByteReader in(raw);
    Token parsed;
    EXPECT_THROW(parsed.read_header(in), FormatError);
}

TEST(TokenTest, RejectsBadCipherId) {
    byte_vec empty_id{Constants::TOKEN_VERSION, 0x00, 0x00};
    ByteReader in(empty_id);
    Token parsed;
    EXPECT_THROW(parsed.read_header(in), FormatError);

    byte_vec control_char{Constants::TOKEN_VERSION, 0x02, 'A', '\n', 0x00};
    ByteReader in2(control_char);
    EXPECT_THROW(parsed.read_header(in2), FormatError);

    Token token;
    EXPECT_THROW(token.initialize_for_encryption(std::string(65, 'A'), false), FormatError);
    EXPECT_THROW(token.initialize_for_encryption("AES 256", false), FormatError);
}

TEST(TokenTest, RejectsTruncatedHeaderAndBody) {
    byte_vec raw = sample_token().write();

    byte_vec header_only(raw.begin(), raw.begin() + 5);
    ByteReader short_header(header_only);
    Token parsed;
    EXPECT_THROW(parsed.read_header(short_header), FormatError);

    byte_vec short_body(raw.begin(), raw.begin() + 14 + 40);
    ByteReader in(short_body);
    parsed.read_header(in);
    EXPECT_THROW(parsed.read_body(in, 16, 32), FormatError);
}
