#pragma once

#include <optional>
#include <string>
#include <variant>

namespace rmp {

// Why a media-layer call failed. FFmpeg return codes are mapped onto these
// inside impl/ and never reach callers.
enum class ErrorCode {
    FileNotFound,   // input path missing or unreadable
    Unsupported,    // no usable stream, decoder, encoder or muxer
    DecodeFailed,   // input bytes could not be turned into pixels or samples
    EncodeFailed,   // encoder, muxer or output file write
    InvalidArg,     // out-of-domain parameters or wrong asset kind
    Internal        // allocation or library-state failure
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::FileNotFound: return "FileNotFound";
        case ErrorCode::Unsupported:  return "Unsupported";
        case ErrorCode::DecodeFailed: return "DecodeFailed";
        case ErrorCode::EncodeFailed: return "EncodeFailed";
        case ErrorCode::InvalidArg:   return "InvalidArg";
        case ErrorCode::Internal:     return "Internal";
    }
    return "Unknown";
}

struct Error {
    ErrorCode code;
    std::string message;

    static Error file_not_found(const std::string& path) {
        return {ErrorCode::FileNotFound, "File not found: " + path};
    }
    static Error unsupported(const std::string& detail) {
        return {ErrorCode::Unsupported, detail};
    }
    static Error decode_failed(const std::string& detail) {
        return {ErrorCode::DecodeFailed, detail};
    }
    static Error encode_failed(const std::string& detail) {
        return {ErrorCode::EncodeFailed, detail};
    }
    static Error invalid_arg(const std::string& detail) {
        return {ErrorCode::InvalidArg, detail};
    }
    static Error internal(const std::string& detail) {
        return {ErrorCode::Internal, detail};
    }

    // Same failure, re-tagged. Used where a generic FFmpeg failure has a
    // more specific meaning for the caller (a send_frame error is an encode failure).
    Error as(ErrorCode new_code) const {
        return {new_code, message};
    }

    // "EncodeFailed: muxer rejected stream", for logs and exception text
    std::string describe() const {
        return std::string(error_code_to_string(code)) + ": " + message;
    }
};

// Value or Error. Callers test is_error() and forward error() upward;
// value() on an error result throws std::bad_variant_access.
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
    Result() = default;
    Result(Error error) : m_error(std::move(error)) {}

    bool is_ok() const { return !m_error; }
    bool is_error() const { return m_error.has_value(); }

    Error& error() { return *m_error; }
    const Error& error() const { return *m_error; }

private:
    std::optional<Error> m_error;
};

} // namespace rmp
