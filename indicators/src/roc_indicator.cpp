#include "roc_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"            // TA-Lib C API
#include <vector>
#include <algorithm>            // For std::max_element
#include <stdexcept>

namespace indicators {

RocIndicator::RocIndicator(int period) : period_(period), lookback_(0) {
    if (period_ <= 0) {
         throw std::invalid_argument("ROC period must be positive.");
    }

    lookback_ = TA_ROC_Lookback(period_);
    if (lookback_ < 0) {
         throw core::IndicatorCalculationException(fmt::format("TA_ROC_Lookback returned an unexpected value: {}", lookback_));
    }

    name_ = fmt::format("ROC({})", period_);
    core::logging::getLogger()->trace("RocIndicator created: Name='{}', Period={}, Lookback={}", name_, period_, lookback_);
}

std::string RocIndicator::getName() const {
    return name_;
}

int RocIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& RocIndicator::getResult() const {
    return results_;
}

double RocIndicator::getPeak() const {
    if (results_.empty()) return 0.0;
    return *std::max_element(results_.begin(), results_.end());
}

void RocIndicator::calculate(const core::TimeSeries<double>& prices) {
    auto logger = core::logging::getLogger();
    results_.clear();

    if (prices.size() <= static_cast<size_t>(lookback_)) {
        logger->trace("Input size ({}) is not above lookback ({}) for {}. No results generated.",
                      prices.size(), lookback_, name_);
        return;
    }

    int output_size = static_cast<int>(prices.size()) - lookback_;
    results_.resize(output_size);

    int out_begin_idx = 0;
    int out_nb_element = 0;

    TA_RetCode ret_code = TA_ROC(
        0,                                   // startIdx
        static_cast<int>(prices.size()) - 1, // endIdx
        prices.data(),
        period_,
        &out_begin_idx,
        &out_nb_element,
        results_.data()
    );

    if (ret_code != TA_SUCCESS) {
        results_.clear();
        throw core::IndicatorCalculationException(
            fmt::format("TA_ROC failed for {} with code {}", name_, static_cast<int>(ret_code)));
    }

    if (out_nb_element != output_size) {
         logger->warn("TA_ROC out_nb_element ({}) does not match expected output size ({}) for {}. Resizing results vector.",
                      out_nb_element, output_size, name_);
         results_.resize(out_nb_element);
    }
}

} // namespace indicators
