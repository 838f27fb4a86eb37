#pragma once

// ============================================================
// random.hpp -- OS cryptographic random bytes
// ============================================================

#include "platform.hpp"
#include <functional>

namespace rnd {

// Fills `out` from the OS CSPRNG (getrandom / arc4random / BCryptGenRandom,
// /dev/urandom as a last resort). Throws std::runtime_error when the OS
// cannot deliver; never falls back to a predictable source.
void system_random_bytes(u8* out, size_t len);

// Injectable random source; must fill the whole buffer or throw.
using RandomSource = std::function<void(u8*, size_t)>;

} // namespace rnd
