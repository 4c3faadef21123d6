#pragma once

#include "Route.hpp"
#include <string>

namespace routesim {

// "2025-08-21T14:30:15.250Z"
std::string formatIso8601(Timestamp ts);

// Accepts "YYYY-MM-DD", "YYYY-MM-DDTHH:MM:SS" (or a space instead of 'T'),
// optional fractional seconds, and an optional "Z" or "+HH:MM"/"-HH:MM" offset.
// Strings without an offset are read as UTC. Throws std::invalid_argument.
Timestamp parseIso8601(const std::string& text);

} // namespace routesim
