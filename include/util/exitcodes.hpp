#pragma once

namespace exitc
{
inline constexpr int ok         = 0;
inline constexpr int bad_args   = 2;
inline constexpr int io_error   = 3;
inline constexpr int no_chunks  = 4;
inline constexpr int incomplete = 5;
inline constexpr int corrupt    = 6;  // corrupt stream or conflicting chunks
inline constexpr int integrity  = 7;
}  // namespace exitc
