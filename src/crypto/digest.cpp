#include <array>
#include <sodium.h>

#include "crypto/digest.hpp"
#include "util/log.hpp"

namespace aead
{

static_assert(DIGEST_SIZE == crypto_hash_sha256_BYTES, "digest size mismatch");

bool sodium_ready()
{
    static const bool ok = (sodium_init() >= 0);  // -1 means failed
    return ok;
}

std::string calculate_digest(const std::uint8_t *data, std::size_t len)
{
    // crypto_hash_sha256 does not depend on sodium_init(), only the RNG does
    std::array<unsigned char, DIGEST_SIZE> h{};
    crypto_hash_sha256(h.data(), data, len);

    std::array<char, DIGEST_SIZE * 2 + 1> hex{};
    sodium_bin2hex(hex.data(), hex.size(), h.data(), h.size());
    return std::string(hex.data(), DIGEST_SIZE * 2);
}

std::string calculate_digest(const std::vector<std::uint8_t> &data)
{
    return calculate_digest(data.data(), data.size());
}

bool verify_digest(const std::vector<std::uint8_t> &data, std::string_view expected_hex)
{
    if (expected_hex.size() != DIGEST_SIZE * 2)
        return false;

    std::array<unsigned char, DIGEST_SIZE> want{};
    std::size_t                            got_len = 0;
    if (sodium_hex2bin(want.data(), want.size(), expected_hex.data(), expected_hex.size(), nullptr,
                       &got_len, nullptr) != 0 ||
        got_len != want.size())
    {
        LOG_DEBUG("verify_digest: expected digest is not hex");
        return false;
    }

    std::array<unsigned char, DIGEST_SIZE> have{};
    crypto_hash_sha256(have.data(), data.data(), data.size());
    return sodium_memcmp(have.data(), want.data(), have.size()) == 0;
}

}  // namespace aead
