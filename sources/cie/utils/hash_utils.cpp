//
// Created by gregorian-rayne on 10/18/26.
//

#include "cie/utils/hash_utils.hpp"

#include <openssl/evp.h>

#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace cie::utils {

    namespace {
        constexpr std::uint64_t kFnvOffsetBasis = 14695981039346656037ULL;
        constexpr std::uint64_t kFnvPrime = 1099511628211ULL;

        struct DigestContextDeleter {
            void operator()(EVP_MD_CTX* ctx) const noexcept {
                EVP_MD_CTX_free(ctx);
            }
        };
    }

    std::string compute_sha256(const std::string_view data) {
        const std::unique_ptr<EVP_MD_CTX, DigestContextDeleter> ctx(EVP_MD_CTX_new());
        if (!ctx) {
            throw std::runtime_error("Failed to create EVP_MD_CTX");
        }

        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hash_len = 0;

        if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
            throw std::runtime_error("EVP_DigestInit_ex failed");
        }
        if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
            throw std::runtime_error("EVP_DigestUpdate failed");
        }
        if (EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
            throw std::runtime_error("EVP_DigestFinal_ex failed");
        }

        std::ostringstream ss;
        for (unsigned int i = 0; i < hash_len; ++i) {
            ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
        }
        return ss.str();
    }

    std::uint64_t fnv1a_hash(const std::string_view data) {
        return fnv1a_hash(kFnvOffsetBasis, data);
    }

    std::uint64_t fnv1a_hash(std::uint64_t seed, const std::string_view data) {
        for (const char c : data) {
            seed ^= static_cast<unsigned char>(c);
            seed *= kFnvPrime;
        }
        return seed;
    }

    std::string to_hex_string(const std::uint64_t value) {
        std::ostringstream ss;
        ss << std::hex << std::setw(16) << std::setfill('0') << value;
        return ss.str();
    }

}  // namespace cie::utils
