#include "secure_random.hpp"

#include <stdexcept>

#include <sodium.h>

namespace cd {

namespace {

void ensureSodiumReady() {
    static const bool ready = sodium_init() >= 0;
    if (!ready) {
        throw std::runtime_error("Unable to initialize libsodium RNG");
    }
}

} // namespace

Hash256 secureRandomHash() {
    Hash256 out{};
    ensureSodiumReady();
    randombytes_buf(out.data(), out.size());
    return out;
}

} // namespace cd
