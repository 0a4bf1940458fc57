/**
 * @file pool_errors.hpp
 */
#pragma once
#include "workpool/common/common.hpp"

namespace workpool
{

/**
 * @brief Error codes for pool, worker and registry operations.
 *
 * @note Task-level failures (timeouts, crashes, throwing handlers) are not
 * reported through these codes. They are carried inside TaskResult; see
 * TaskFailure.
 */
enum class PoolErrorCode
{
    Configuration,
    WorkerInit,
    Protocol,
    Registry,
    InvalidState
};

/**
 * @brief Get a short name for an error code.
 */
inline const char* to_string(PoolErrorCode code) noexcept
{
    switch (code)
    {
        case PoolErrorCode::Configuration: return "Configuration";
        case PoolErrorCode::WorkerInit: return "WorkerInit";
        case PoolErrorCode::Protocol: return "Protocol";
        case PoolErrorCode::Registry: return "Registry";
        case PoolErrorCode::InvalidState: return "InvalidState";
    }
    return "Unknown";
}

/**
 * @brief Exception class for pool errors.
 *
 * @details
 * `PoolError` is thrown when a pool or registry is misconfigured, when a
 * worker cannot be brought up, or when the worker protocol is violated. Each
 * exception carries an error code and a descriptive message.
 *
 * @par Thread safety
 * - The exception object itself follows standard exception semantics.
 * - Safe to copy and rethrow across threads.
 */
class PoolError : public std::exception
{
public:
    /**
     * @brief Construct a PoolError.
     * @param code The error code indicating the type of error.
     * @param message A descriptive message explaining the error.
     */
    PoolError(PoolErrorCode code, std::string message)
        : m_code(code)
        , m_message(std::move(message))
    {
    }

    /**
     * @brief Get the error code.
     */
    PoolErrorCode code() const noexcept
    {
        return m_code;
    }

    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

private:
    PoolErrorCode m_code;
    std::string m_message;
};

/**
 * @brief Invalid pool or executor configuration.
 *
 * @details Fatal. Thrown synchronously from constructors, before any worker
 * is spawned.
 */
class ConfigurationError : public PoolError
{
public:
    explicit ConfigurationError(std::string message)
        : PoolError(PoolErrorCode::Configuration, std::move(message))
    {
    }
};

/**
 * @brief A worker could not be spawned or did not report ready.
 *
 * @details Recoverable. WorkerPool::initialize() catches it and falls back
 * to inline execution.
 */
class WorkerInitError : public PoolError
{
public:
    explicit WorkerInitError(std::string message)
        : PoolError(PoolErrorCode::WorkerInit, std::move(message))
    {
    }
};

/**
 * @brief A malformed or truncated message on a worker channel.
 */
class ProtocolError : public PoolError
{
public:
    explicit ProtocolError(std::string message)
        : PoolError(PoolErrorCode::Protocol, std::move(message))
    {
    }
};

/**
 * @brief Duplicate or unknown name in a handler or routine registry.
 */
class RegistryError : public PoolError
{
public:
    explicit RegistryError(std::string message)
        : PoolError(PoolErrorCode::Registry, std::move(message))
    {
    }
};

} // namespace workpool
