#pragma once

#include <string>
#include <vector>
#include "datatypes.hpp"

namespace core {

    struct Diagnostic {
        ErrorKind kind = ErrorKind::DataGap;
        std::string asset;     // Empty for cycle-level entries
        std::string order_id;  // Set for order-level entries
        std::string message;
        Timestamp timestamp;
    };

    using Diagnostics = std::vector<Diagnostic>;

    // Per-asset / per-order failure record carried in the cycle summary
    Diagnostic makeDiagnostic(ErrorKind kind, std::string asset, std::string message,
                              Timestamp timestamp, std::string order_id = "");

} // namespace core
