#pragma once

#include "datatypes.hpp" // Needs TimeSeries
#include <string>
#include <vector>

namespace indicators {

class IIndicator {
public:
    virtual ~IIndicator() = default; // Virtual destructor is important for interfaces!

    // Get the name of the indicator (e.g., "ROC(7)")
    virtual std::string getName() const = 0;

    // Number of initial input points consumed before the first valid output
    virtual int getLookback() const = 0;

    // Calculate the indicator over a price series (oldest first).
    // It should store the result internally.
    virtual void calculate(const core::TimeSeries<double>& prices) = 0;

    // Results aligned to input index getLookback() onwards
    virtual const core::TimeSeries<double>& getResult() const = 0;
};

} // namespace indicators
