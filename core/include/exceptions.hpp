#pragma once

#include <stdexcept>
#include <string>

namespace core {

    class TradingPlatformException : public std::runtime_error {
    public:
        explicit TradingPlatformException(const std::string& message)
            : std::runtime_error(message) {}

        explicit TradingPlatformException(const char* message)
            : std::runtime_error(message) {}
    };

    // Specific exception types
    class ConfigException : public TradingPlatformException {
    public: using TradingPlatformException::TradingPlatformException; };

    class DataLoadException : public TradingPlatformException {
    public: using TradingPlatformException::TradingPlatformException; };

    class ApiRequestException : public TradingPlatformException {
    public: using TradingPlatformException::TradingPlatformException; };

    class IndicatorCalculationException : public TradingPlatformException {
    public: using TradingPlatformException::TradingPlatformException; };

    class StorageException : public TradingPlatformException {
    public: using TradingPlatformException::TradingPlatformException; };

    // No snapshot at all could be obtained; aborts the cycle
    class SnapshotUnavailableException : public TradingPlatformException {
    public: using TradingPlatformException::TradingPlatformException; };

    // Network errors, rate limits, 5xx: retried with backoff
    class ExchangeTransientException : public ApiRequestException {
    public: using ApiRequestException::ApiRequestException; };

    // Rejected order, invalid instrument, bad credentials: never retried
    class ExchangeTerminalException : public ApiRequestException {
    public: using ApiRequestException::ApiRequestException; };

    // Exposure store is inconsistent; aborts the cycle
    class RiskStateException : public TradingPlatformException {
    public: using TradingPlatformException::TradingPlatformException; };

} // namespace core
