//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef CIE_HASH_UTILS_HPP
#define CIE_HASH_UTILS_HPP

#include <cstdint>
#include <string>
#include <string_view>

namespace cie::utils
{
    /**
     * Compute the SHA-256 digest of the input data.
     *
     * @param data The bytes to hash.
     * @return Lowercase hexadecimal digest.
     * @throws std::runtime_error if the OpenSSL digest context fails.
     */
    std::string compute_sha256(std::string_view data);

    /**
     * Compute the 64-bit FNV-1a hash of the input data.
     */
    std::uint64_t fnv1a_hash(std::string_view data);

    /**
     * Continue an FNV-1a hash with more bytes.
     */
    std::uint64_t fnv1a_hash(std::uint64_t seed, std::string_view data);

    /**
     * Render a 64-bit value as 16 lowercase hex digits.
     */
    std::string to_hex_string(std::uint64_t value);

} // namespace cie::utils

#endif //CIE_HASH_UTILS_HPP
