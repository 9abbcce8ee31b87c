#pragma once

#include <string>
#include <memory> // For std::unique_ptr
#include <vector>

#include "datatypes.hpp" // Provides FactorRecord, Signal etc.

namespace strategy_engine {

    // --- Filter Interface ---
    // A single eligibility predicate over one FactorRecord (e.g. track != DeFi)
    class IFactorFilter {
    public:
        virtual ~IFactorFilter() = default;
        // True when the record may become a signal
        virtual bool accept(const core::FactorRecord& record) const = 0;
        // Short description used in logs
        virtual std::string describe() const = 0;
    };

    using FilterList = std::vector<std::unique_ptr<IFactorFilter>>;

} // namespace strategy_engine
