#pragma once

#include "records.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace wh {

struct TruthObservation {
    std::int64_t value = 0; // fixed-point 1e6
    std::string evidence;
};

// Where the truth authority gets its number. Sourcing lives outside the program;
// the program only checks who signs finalize and when.
class TruthProvider {
public:
    virtual ~TruthProvider() = default;
    virtual TruthObservation observe(const Topic& topic) = 0;
};

using TruthProviderPtr = std::shared_ptr<TruthProvider>;

} // namespace wh
