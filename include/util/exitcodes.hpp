#pragma once

namespace exitc
{
inline constexpr int ok           = 0;
inline constexpr int failure      = 1;
inline constexpr int bad_args     = 2;
inline constexpr int no_driver    = 3;
inline constexpr int transfer_err = 4;
inline constexpr int io_err       = 5;
}  // namespace exitc
