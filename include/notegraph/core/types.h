#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace notegraph {

// Hex-encoded SHA-256 digests
using Hash = std::string;
using NoteId = std::string;
using ImageId = std::string;

// Error types
enum class ErrorCode {
    Success = 0,
    FileNotFound,
    PermissionDenied,
    CorruptedData,
    InvalidArgument,
    InvalidData,
    InternalError,
    NotSupported,
    NotInitialized,
    Timeout,
    ValidationError,
    WriteError,
    EmbeddingFailed,
    Unknown
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::FileNotFound: return "File not found";
        case ErrorCode::PermissionDenied: return "Permission denied";
        case ErrorCode::CorruptedData: return "Corrupted data";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InvalidData: return "Invalid data";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::NotSupported: return "Not supported";
        case ErrorCode::NotInitialized: return "Not initialized";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::ValidationError: return "Validation error";
        case ErrorCode::WriteError: return "Write error";
        case ErrorCode::EmbeddingFailed: return "Embedding failed";
        case ErrorCode::Unknown: return "Unknown error";
    }
    return "Unknown error";
}

// Error struct for detailed error information
struct Error {
    ErrorCode code;
    std::string message;

    Error() : code(ErrorCode::Success), message("") {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

    bool operator==(ErrorCode c) const { return code == c; }
    bool operator!=(ErrorCode c) const { return code != c; }

    friend bool operator==(ErrorCode c, const Error& error) { return error.code == c; }
    friend bool operator!=(ErrorCode c, const Error& error) { return error.code != c; }
};

// Result type for operations that can fail. The error type defaults to Error; components
// that need richer diagnostics (the path resolver) supply their own.
template <typename T, typename E = Error> class Result {
public:
    Result(T&& value) : data_(std::in_place_index<0>, std::move(value)) {}
    Result(const T& value) : data_(std::in_place_index<0>, value) {}
    Result(E error) : data_(std::in_place_index<1>, std::move(error)) {}

    template <typename U = E, typename = std::enable_if_t<std::is_same_v<U, Error>>>
    Result(ErrorCode error) : data_(std::in_place_index<1>, Error{error}) {}

    bool has_value() const noexcept { return data_.index() == 0; }

    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<0>(data_);
    }

    T& value() & {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<0>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<0>(std::move(data_));
    }

    const E& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return std::get<1>(data_);
    }

private:
    std::variant<T, E> data_;
};

// Specialization for void
template <> class Result<void, Error> {
public:
    Result() : error_() {}
    Result(ErrorCode error) : error_(Error{error}) {}
    Result(Error error) : error_(std::move(error)) {}

    bool has_value() const noexcept { return error_.code == ErrorCode::Success; }

    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return error_;
    }

private:
    Error error_{ErrorCode::Success, ""};
};

} // namespace notegraph

// fmt library support for ErrorCode (for spdlog)
#include <spdlog/fmt/fmt.h>
template <> struct fmt::formatter<notegraph::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(notegraph::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", notegraph::errorToString(error));
    }
};

namespace notegraph {

// Read size for streaming file hashes
inline constexpr size_t DEFAULT_BUFFER_SIZE = 64 * 1024;

} // namespace notegraph
