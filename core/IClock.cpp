#include "IClock.hpp"
#include "Iso8601.hpp"

namespace routesim {

std::string IClock::iso8601() const {
    return formatIso8601(now());
}

} // namespace routesim
