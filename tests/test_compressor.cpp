#include "symseal/data/compressor.hpp"
#include "symseal/crypto/primitives.hpp"

#include <gtest/gtest.h>

#include <limits>

using Symseal::byte_vec;
using Symseal::ConfigurationError;
using Symseal::FormatError;
using Symseal::InternalError;
using Symseal::Data::checked_zlib_length;
using Symseal::Data::compress;
using Symseal::Data::decompress;

TEST(CompressorTest, RepetitiveInputShrinksAndRoundTrips) {
    byte_vec input(10000, 'x');
    byte_vec packed = compress(input, 9);

    EXPECT_LT(packed.size(), 200u);
    EXPECT_EQ(decompress(packed), input);
}

TEST(CompressorTest, EveryValidLevelRoundTrips) {
    byte_vec input = Symseal::Crypto::generate_random_bytes(3000);
    input.insert(input.end(), 3000, 0x41);
    for (int level = 0; level <= 9; ++level) {
        byte_vec packed = compress(input, level);
        EXPECT_EQ(packed.at(0), 0x78) << "zlib header expected at level " << level;
        EXPECT_EQ(decompress(packed), input) << "level " << level;
    }
}

TEST(CompressorTest, EmptyInputRoundTrips) {
    EXPECT_TRUE(decompress(compress({}, 6)).empty());
}

TEST(CompressorTest, RejectsInvalidLevel) {
    EXPECT_THROW(compress({1, 2, 3}, -1), ConfigurationError);
    EXPECT_THROW(compress({1, 2, 3}, 10), ConfigurationError);
    EXPECT_THROW(Symseal::Data::validate_compression_level(42), ConfigurationError);
}

TEST(CompressorTest, RejectsDataThatIsNotZlib) {
    EXPECT_THROW(decompress({1, 2, 3, 4}), FormatError);
    EXPECT_THROW(decompress({}), FormatError);
}

TEST(CompressorTest, RejectsTruncatedStream) {
    byte_vec packed = compress(byte_vec(5000, 'q'), 9);
    packed.resize(packed.size() - 4);
    EXPECT_THROW(decompress(packed), FormatError);
}

TEST(CompressorTest, RejectsTrailingBytes) {
    byte_vec packed = compress(byte_vec(100, 'q'), 9);
    packed.push_back(0x00);
    EXPECT_THROW(decompress(packed), FormatError);
}

TEST(CompressorTest, LengthsBeyondZlibCountersAreRejected) {
    const size_t limit = std::numeric_limits<unsigned int>::max();
    EXPECT_EQ(checked_zlib_length(0), 0u);
    EXPECT_EQ(checked_zlib_length(limit), limit);
    EXPECT_THROW(checked_zlib_length(limit + 1), InternalError);
    EXPECT_THROW(checked_zlib_length(std::numeric_limits<size_t>::max()), InternalError);
}
