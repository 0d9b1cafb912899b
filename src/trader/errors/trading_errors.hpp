#ifndef TRADING_ERRORS_HPP
#define TRADING_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace SellManager {
namespace Core {

// Timeout or transport failure; retried with per-instrument backoff.
class TransientNetworkError : public std::runtime_error {
public:
    explicit TransientNetworkError(const std::string& message) : std::runtime_error(message) {}
};

// Broker rejected the request for exceeding its request rate.
class PacingViolationError : public std::runtime_error {
public:
    explicit PacingViolationError(const std::string& message) : std::runtime_error(message) {}
};

// Broker session unreachable; fetch work pauses until connectivity recovers.
class BrokerConnectionError : public std::runtime_error {
public:
    explicit BrokerConnectionError(const std::string& message) : std::runtime_error(message) {}
};

// Fewer bars than an indicator needs.
class DataGapError : public std::runtime_error {
public:
    explicit DataGapError(const std::string& message) : std::runtime_error(message) {}
};

class InvalidConfigurationError : public std::runtime_error {
public:
    explicit InvalidConfigurationError(const std::string& message) : std::runtime_error(message) {}
};

// Persisted series for one cache key cannot be parsed or is out of order.
class CacheCorruptionError : public std::runtime_error {
public:
    CacheCorruptionError(const std::string& cache_key, const std::string& message)
        : std::runtime_error("Cache corruption in '" + cache_key + "': " + message), corrupted_cache_key(cache_key) {}

    const std::string& cache_key() const { return corrupted_cache_key; }

private:
    std::string corrupted_cache_key;
};

class CacheWriteError : public std::runtime_error {
public:
    explicit CacheWriteError(const std::string& message) : std::runtime_error(message) {}
};

class AuditLogError : public std::runtime_error {
public:
    explicit AuditLogError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace Core
} // namespace SellManager

#endif // TRADING_ERRORS_HPP
