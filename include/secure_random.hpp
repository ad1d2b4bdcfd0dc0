#pragma once

#include "hashing.hpp"

namespace cd {

// 32 bytes from the operating system's CSPRNG.
Hash256 secureRandomHash();

} // namespace cd
