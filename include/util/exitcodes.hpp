#pragma once

namespace exitc
{
inline constexpr int ok              = 0;
inline constexpr int bad_args        = 2;
inline constexpr int io_error        = 3;
inline constexpr int crypto_error    = 4;
inline constexpr int upload_failed   = 5;
inline constexpr int cancelled       = 6;
inline constexpr int delivery_failed = 7;
}  // namespace exitc
