#pragma once

#include "commitment_scheme.hpp"

namespace wh {

// 32 bytes of full entropy from libsodium for a new commitment. Participants keep
// the salt until reveal; losing it forfeits the stake.
Salt generateSalt();

} // namespace wh
