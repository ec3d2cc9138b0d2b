#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace chatvault {

enum class ErrorCode {
    Unknown = 1,
    InvalidConfig,
    InvalidArgument,
    NotFound,            // no session file (or index entry) for the id
    Corrupted,           // file exists but does not parse as a session
    StorageError,        // filesystem write, rename or remove failed
    SerializationError,
    Timeout,             // provider call outlived its deadline
    ProviderError,
    BudgetExceeded,      // messages cannot be made to fit the context window
    SessionError,        // lifecycle misuse, e.g. closing a session that is not open
    InternalError,
};

/// Failure value carried by Result. `message` is for humans; `detail` holds
/// the path, id or underlying OS/library message when there is one.
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error(ErrorCode code, std::string message, std::string detail)
        : code_(code), message_(std::move(message)), detail_(std::move(detail)) {}

    [[nodiscard]] auto code() const noexcept -> ErrorCode { return code_; }
    [[nodiscard]] auto message() const noexcept -> std::string_view { return message_; }
    [[nodiscard]] auto detail() const noexcept -> std::string_view { return detail_; }

    [[nodiscard]] auto what() const -> std::string {
        if (detail_.empty()) return message_;
        return message_ + ": " + detail_;
    }

private:
    ErrorCode code_;
    std::string message_;
    std::string detail_;
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

inline auto error_code_to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::Unknown: return "UNKNOWN";
        case ErrorCode::InvalidConfig: return "INVALID_CONFIG";
        case ErrorCode::InvalidArgument: return "INVALID_ARGUMENT";
        case ErrorCode::NotFound: return "NOT_FOUND";
        case ErrorCode::Corrupted: return "CORRUPTED";
        case ErrorCode::StorageError: return "STORAGE_ERROR";
        case ErrorCode::SerializationError: return "SERIALIZATION_ERROR";
        case ErrorCode::Timeout: return "TIMEOUT";
        case ErrorCode::ProviderError: return "PROVIDER_ERROR";
        case ErrorCode::BudgetExceeded: return "BUDGET_EXCEEDED";
        case ErrorCode::SessionError: return "SESSION_ERROR";
        case ErrorCode::InternalError: return "INTERNAL_ERROR";
        default: return "UNKNOWN";
    }
}

/// Wraps an Error so coroutines can `co_return make_fail(err)`. Returning
/// std::unexpected directly from a coroutine trips a GCC 14 ICE
/// (https://gcc.gnu.org/bugzilla/show_bug.cgi?id=112341).
struct Fail {
    Error error;

    explicit Fail(Error e) : error(std::move(e)) {}

    template <typename T>
    operator Result<T>() && { return std::unexpected(std::move(error)); }
};

inline auto make_fail(Error e) -> Fail { return Fail(std::move(e)); }

} // namespace chatvault
