#ifndef SYMSEAL_DATA_TRANSPORT_HPP
#define SYMSEAL_DATA_TRANSPORT_HPP

#include "symseal/types.hpp" // For byte_vec, Exceptions
#include <string>

namespace Symseal::Data {

    /**
     * @brief Encodes bytes as base64url (RFC 4648 section 5): '-' and '_' replace '+' and '/',
     * '=' padding is kept, and no line breaks are inserted.
     */
    std::string encode_transport(const byte_vec& bytes);

    /**
     * @brief Decodes base64url text produced by encode_transport.
     * @throws FormatError on characters outside the alphabet, a length that is not a multiple of
     *         four, misplaced padding, or non-zero bits after the last encoded byte.
     */
    byte_vec decode_transport(const std::string& text);

} // namespace Symseal::Data

#endif // SYMSEAL_DATA_TRANSPORT_HPP
