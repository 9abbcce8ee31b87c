#include "utils.hpp"
#include <iomanip>    // For std::put_time, std::get_time
#include <sstream>    // For string streams
#include <string>
#include <stdexcept>  // For std::runtime_error
#include <cmath>      // For std::pow
#include <cctype>     // For std::isdigit
#include <atomic>     // For the order id sequence
#include <algorithm>  // For std::min/max

namespace core {
namespace utils {

    Timestamp stringToTimestamp(const std::string& iso_string) {
        std::tm tm = {};
        std::istringstream ss(iso_string);

        // 1. Parse main date/time part up to seconds
        ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        if (ss.fail()) {
            throw std::runtime_error("Failed to parse timestamp (date/time part): " + iso_string);
        }

        // 2. Optional fractional seconds
        double fractional_seconds = 0.0;
        if (ss.peek() == '.') {
            ss.ignore();
            std::string digits;
            while (std::isdigit(ss.peek()) && digits.size() < 9) {
                digits += static_cast<char>(ss.get());
            }
            while (std::isdigit(ss.peek())) {
                ss.ignore();
            }
            if (!digits.empty()) {
                fractional_seconds = std::stod(digits) / std::pow(10.0, static_cast<double>(digits.length()));
            }
        }

        // 3. Timezone designator: Z, +HH:MM or -HH:MM
        std::chrono::seconds offset_duration(0);
        char sign_or_z = 0;
        if (ss >> sign_or_z) {
            if (sign_or_z == '+' || sign_or_z == '-') {
                int offset_h = 0;
                int offset_m = 0;
                char colon = ' ';
                if (!(ss >> std::setw(2) >> offset_h >> colon >> std::setw(2) >> offset_m) || colon != ':') {
                     throw std::runtime_error("Failed to parse timestamp (timezone offset HH:MM): " + iso_string);
                }
                offset_duration = std::chrono::hours(offset_h) + std::chrono::minutes(offset_m);
                if (sign_or_z == '-') {
                    offset_duration *= -1;
                }
            } else if (sign_or_z != 'Z') {
                throw std::runtime_error("Invalid timezone indicator '" + std::string(1, sign_or_z) + "' in timestamp: " + iso_string);
            }
        } else {
             throw std::runtime_error("Timestamp missing timezone offset/indicator: " + iso_string);
        }

        // 4. timegm interprets struct tm as UTC
        time_t tt = timegm(&tm);
        if (tt == (time_t)-1) {
             throw std::runtime_error("Failed to convert parsed date/time to UTC epoch seconds: " + iso_string);
        }

        auto base_tp_utc = std::chrono::system_clock::from_time_t(tt);
        base_tp_utc += std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::duration<double>(fractional_seconds));

        // Local time minus its offset gives UTC
        return base_tp_utc - offset_duration;
    }

    std::string timestampToString(const Timestamp& ts) {
        auto tt = std::chrono::system_clock::to_time_t(ts);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()) % 1000;
        if (ms.count() < 0) {
            ms += std::chrono::seconds{1};
            tt -= 1;
        }

        std::tm time_tm;
        gmtime_r(&tt, &time_tm);

        std::ostringstream oss;
        oss << std::put_time(&time_tm, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
        return oss.str();
    }

    std::int64_t toEpochMillis(const Timestamp& ts) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
    }

    Timestamp fromEpochMillis(std::int64_t millis) {
        return Timestamp(std::chrono::duration_cast<Timestamp::duration>(std::chrono::milliseconds(millis)));
    }

    std::string generateClientOrderId(const Timestamp& ts) {
        static std::atomic<std::uint64_t> sequence{0};
        std::uint64_t seq = ++sequence;
        return "sa-" + std::to_string(toEpochMillis(ts)) + "-" + std::to_string(seq);
    }

    double clamp01(double value) {
        return std::min(1.0, std::max(0.0, value));
    }

} // namespace utils
} // namespace core
