#include "secure_random.hpp"

#include <stdexcept>

#include <sodium.h>

namespace wh {

Salt generateSalt() {
    if (sodium_init() < 0) {
        throw std::runtime_error("Unable to initialize libsodium RNG");
    }
    Salt salt{};
    randombytes_buf(salt.data(), salt.size());
    return salt;
}

} // namespace wh
