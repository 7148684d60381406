#pragma once

#include <string>
#include <vector>

// All supporting canonical pairs.
inline const std::vector<std::string> kCanonicalPairs = {
    "BTCUSDT",
    "ETHUSDT",
    "SOLUSDT",
    "ADAUSDT",
    "XRPUSDT",
};
