#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace efb {

enum class ErrorCode {
    Unknown = 1,
    NotFound,
    IoError,
    InternalError,
};

class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error(ErrorCode code, std::string message, std::string detail)
        : code_(code), message_(std::move(message)), detail_(std::move(detail)) {}

    Error(ErrorCode code, std::string message, std::string detail, std::error_code cause)
        : code_(code), message_(std::move(message)), detail_(std::move(detail)),
          cause_(cause) {}

    [[nodiscard]] auto code() const noexcept -> ErrorCode { return code_; }
    [[nodiscard]] auto message() const noexcept -> std::string_view { return message_; }
    [[nodiscard]] auto detail() const noexcept -> std::string_view { return detail_; }

    /// The operating-system error that triggered this one, if any.
    [[nodiscard]] auto cause() const noexcept -> std::error_code { return cause_; }

    [[nodiscard]] auto what() const -> std::string {
        std::string out = message_;
        if (!detail_.empty()) out += ": " + detail_;
        if (cause_) out += " (" + cause_.message() + ")";
        return out;
    }

private:
    ErrorCode code_;
    std::string message_;
    std::string detail_;
    std::error_code cause_;
};

template <typename T>
using Result = std::expected<T, Error>;

using VoidResult = std::expected<void, Error>;

inline auto make_error(ErrorCode code, std::string message) -> Error {
    return Error(code, std::move(message));
}

inline auto make_error(ErrorCode code, std::string message, std::string detail) -> Error {
    return Error(code, std::move(message), std::move(detail));
}

inline auto make_error(ErrorCode code, std::string message, std::string detail,
                       std::error_code cause) -> Error {
    return Error(code, std::move(message), std::move(detail), cause);
}

inline auto error_code_to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::Unknown: return "UNKNOWN";
        case ErrorCode::NotFound: return "NOT_FOUND";
        case ErrorCode::IoError: return "IO_ERROR";
        case ErrorCode::InternalError: return "INTERNAL_ERROR";
        default: return "UNKNOWN";
    }
}

inline auto ok_result() -> Result<void> { return {}; }

} // namespace efb
