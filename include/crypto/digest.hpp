#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace aead
{

constexpr std::size_t DIGEST_SIZE = 32;  // SHA-256

// SHA-256 as 64 lowercase hex chars.
std::string calculate_digest(const std::uint8_t *data, std::size_t len);
std::string calculate_digest(const std::vector<std::uint8_t> &data);

// Constant-time check of `data` against a hex digest (case-insensitive).
bool verify_digest(const std::vector<std::uint8_t> &data, std::string_view expected_hex);

bool sodium_ready();

}  // namespace aead
