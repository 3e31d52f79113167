#pragma once

#include <stdexcept>
#include <string>

namespace parley {

/**
 * @brief Error categories, each mapped to one recovery action
 *
 * - Connection: retried with backoff; fatal for that service once attempts run out
 * - MediaFormat: only the failing conversion is skipped, the frame passes through
 * - UpstreamService: avatar rendering degrades to audio-only
 * - Configuration: fatal before any stream opens
 */
enum class ErrorType {
    None,
    Connection,
    MediaFormat,
    UpstreamService,
    Configuration,
    Cancelled,
    Unknown
};

const char* error_type_name(ErrorType type);

/**
 * @brief Error information carried inside Error control frames
 */
struct Error {
    ErrorType type = ErrorType::None;
    std::string message;

    Error() = default;
    Error(ErrorType t, const std::string& msg) : type(t), message(msg) {}

    bool is_error() const { return type != ErrorType::None; }
    explicit operator bool() const { return is_error(); }
};

/**
 * @brief Base class for all errors raised by pipeline components
 */
class PipelineError : public std::runtime_error {
public:
    PipelineError(ErrorType type, const std::string& message)
        : std::runtime_error(message), type_(type) {}

    ErrorType type() const { return type_; }
    Error to_error() const { return Error(type_, what()); }

private:
    ErrorType type_;
};

class ConnectionError : public PipelineError {
public:
    explicit ConnectionError(const std::string& message)
        : PipelineError(ErrorType::Connection, message) {}
};

class MediaFormatError : public PipelineError {
public:
    explicit MediaFormatError(const std::string& message)
        : PipelineError(ErrorType::MediaFormat, message) {}
};

class UpstreamServiceError : public PipelineError {
public:
    explicit UpstreamServiceError(const std::string& message)
        : PipelineError(ErrorType::UpstreamService, message) {}
};

class ConfigurationError : public PipelineError {
public:
    explicit ConfigurationError(const std::string& message)
        : PipelineError(ErrorType::Configuration, message) {}
};

inline const char* error_type_name(ErrorType type) {
    switch (type) {
        case ErrorType::None: return "none";
        case ErrorType::Connection: return "connection";
        case ErrorType::MediaFormat: return "media_format";
        case ErrorType::UpstreamService: return "upstream_service";
        case ErrorType::Configuration: return "configuration";
        case ErrorType::Cancelled: return "cancelled";
        default: return "unknown";
    }
}

} // namespace parley
