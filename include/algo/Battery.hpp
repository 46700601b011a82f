#pragma once                              // ensure this header is included only once per translation unit
#include "graph/RouteMap.hpp"             // map the battery runs against
#include <string>                         // command lines and output lines
#include <vector>                         // ordered batteries

// The fixed ten-query battery, as QueryFactory command lines, in output order.
const std::vector<std::string>& standardBattery();

// Run `commands` in order against `map` and return "Output #<n>: <result>" lines.
// Throws std::invalid_argument if a command is unknown or malformed.
std::vector<std::string> runBattery(const RouteMap& map, const std::vector<std::string>& commands);
