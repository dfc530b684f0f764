#include "symseal/io/binary_stream.hpp"

#include <gtest/gtest.h>

using namespace Symseal;
using namespace Symseal::IO;

TEST(BinaryStreamTest, WritesIntegersBigEndian) {
    byte_vec out;
    write_uint8(out, 0xAB);
    write_uint32_network(out, 0x01020304u);
    write_uint64_network(out, 0x1122334455667788ull);

    EXPECT_EQ(out, (byte_vec{0xAB, 0x01, 0x02, 0x03, 0x04,
                             0x11, 0x22, 0x33, 0x44, 0x55, 0x66, 0x77, 0x88}));
}

TEST(BinaryStreamTest, ReadsBackWhatWasWritten) {
    byte_vec out;
    write_uint32_network(out, 0xDEADBEEFu);
    write_string(out, "abc");
    write_uint64_network(out, 42);

    ByteReader in(out);
    EXPECT_EQ(read_uint32_network(in), 0xDEADBEEFu);
    EXPECT_EQ(read_string(in, 3), "abc");
    EXPECT_EQ(read_uint64_network(in), 42u);
    EXPECT_TRUE(in.at_end());
}

TEST(BinaryStreamTest, TruncationThrowsWithoutConsuming) {
    byte_vec data{1, 2, 3};
    ByteReader in(data);

    EXPECT_THROW(read_uint32_network(in), FormatError);
    EXPECT_EQ(in.position(), 0u);
    EXPECT_EQ(read_exact_bytes(in, 2), (byte_vec{1, 2}));
    EXPECT_THROW(read_exact_bytes(in, 2), FormatError);
    EXPECT_EQ(read_remaining(in), (byte_vec{3}));
    EXPECT_THROW(read_uint8(in), FormatError);
}

TEST(BinaryStreamTest, ReaderTracksPositionOverBuffer) {
    byte_vec empty;
    ByteReader none(empty);
    EXPECT_TRUE(none.at_end());
    EXPECT_EQ(none.remaining(), 0u);

    byte_vec data{0x00, 0x2A, 0xFF};
    ByteReader in(data);
    EXPECT_EQ(read_uint8(in), 0x00);
    EXPECT_EQ(in.position(), 1u);
    EXPECT_EQ(in.remaining(), 2u);
    EXPECT_EQ(read_remaining(in), (byte_vec{0x2A, 0xFF}));
    EXPECT_TRUE(in.at_end());
}
