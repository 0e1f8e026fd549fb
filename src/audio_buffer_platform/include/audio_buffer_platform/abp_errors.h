#pragma once

#include <optional>
#include <string>
#include <variant>

namespace abp {

// ABP-owned error codes (no FFmpeg or QNetworkReply codes escape)
enum class ErrorCode {
    FileNotFound,
    TransferFailed,
    Unsupported,
    DecodeFailed,
    InvalidArg,
    Internal
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::FileNotFound:   return "FileNotFound";
        case ErrorCode::TransferFailed: return "TransferFailed";
        case ErrorCode::Unsupported:    return "Unsupported";
        case ErrorCode::DecodeFailed:   return "DecodeFailed";
        case ErrorCode::InvalidArg:     return "InvalidArg";
        case ErrorCode::Internal:       return "Internal";
    }
    return "Unknown";
}

// Error with context message
struct Error {
    ErrorCode code;
    std::string message;

    static Error file_not_found(const std::string& path) {
        return {ErrorCode::FileNotFound, "File not found: " + path};
    }
    static Error transfer_failed(const std::string& detail) {
        return {ErrorCode::TransferFailed, detail};
    }
    static Error unsupported(const std::string& detail) {
        return {ErrorCode::Unsupported, detail};
    }
    static Error decode_failed(const std::string& detail) {
        return {ErrorCode::DecodeFailed, detail};
    }
    static Error invalid_arg(const std::string& detail) {
        return {ErrorCode::InvalidArg, detail};
    }
    static Error internal(const std::string& detail) {
        return {ErrorCode::Internal, detail};
    }

    // "<Code>: message", for logs
    std::string describe() const {
        return std::string(error_code_to_string(code)) + ": " + message;
    }
};

// Result type: either value T or Error
template<typename T>
class Result {
public:
    Result(T value) : m_data(std::move(value)) {}
    Result(Error error) : m_data(std::move(error)) {}

    bool is_ok() const { return std::holds_alternative<T>(m_data); }
    bool is_error() const { return std::holds_alternative<Error>(m_data); }

    T& value() { return std::get<T>(m_data); }
    const T& value() const { return std::get<T>(m_data); }

    Error& error() { return std::get<Error>(m_data); }
    const Error& error() const { return std::get<Error>(m_data); }

private:
    std::variant<T, Error> m_data;
};

template<>
class Result<void> {
public:
    Result() : m_error(std::nullopt) {}
    Result(Error error) : m_error(std::move(error)) {}

    bool is_ok() const { return !m_error.has_value(); }
    bool is_error() const { return m_error.has_value(); }

    Error& error() { return *m_error; }
    const Error& error() const { return *m_error; }

private:
    std::optional<Error> m_error;
};

} // namespace abp
