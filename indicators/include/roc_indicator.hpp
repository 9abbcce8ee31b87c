#pragma once

#include "indicators.hpp" // Base interface
#include <vector>
#include <string>

namespace indicators {

// Rate of change in percent: ((price / price[period ago]) - 1) * 100
class RocIndicator : public IIndicator {
public:
    explicit RocIndicator(int period);

    virtual ~RocIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<double>& prices) override;
    const core::TimeSeries<double>& getResult() const override;

    // Largest value in the last calculate() result; 0 when there is none
    double getPeak() const;

private:
    const int period_;
    int lookback_;
    std::string name_;
    core::TimeSeries<double> results_;
};

} // namespace indicators
