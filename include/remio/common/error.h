// =============================================================================
// remio - Error Handling Framework
// =============================================================================
// Error handling for the remio stream engine.
//
// This module provides:
// - ErrorCode enum covering backend, engine and caller-misuse failures
// - ErrorClass (Transient / Fatal / Logical) driving the retry policy
// - RemioException hierarchy thrown at the public stream surface
// - Result<T, E> type for backend primitives (using std::expected)
// - Error context (object, block, part, offset) for diagnostics
//
// Propagation rules:
// - Transient errors are absorbed by the retry policy until exhausted.
// - Fatal errors on a read block surface when that block is consumed.
// - Fatal errors on a write part abort the whole upload session.
// - Logical errors surface immediately.
// =============================================================================

#ifndef REMIO_COMMON_ERROR_H
#define REMIO_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace remio {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error codes for engine and backend failures.
/// @note Values double as process exit codes for the CLI.
enum class ErrorCode : std::uint8_t {
    /// @brief Operation completed successfully.
    kSuccess = 0,

    /// @brief Invalid argument value (bad whence, negative seek, bad quantity).
    kInvalidArgument = 1,

    /// @brief Operation not valid in the current stream state.
    /// @note Write after close, read on a closed reader, etc.
    kInvalidState = 2,

    /// @brief Generic I/O failure reported by a backend.
    kIOError = 3,

    /// @brief Remote object does not exist.
    kNotFound = 4,

    /// @brief Requested range starts at or beyond the object size.
    kRangeNotSatisfiable = 5,

    /// @brief Authorization or permission failure.
    kPermissionDenied = 6,

    /// @brief Network primitive timed out.
    kTimeout = 7,

    /// @brief Connection reset or dropped mid-transfer.
    kConnectionReset = 8,

    /// @brief Server-side (5xx-class) failure.
    kServerError = 9,

    /// @brief Request throttled by the backend (429, SlowDown, ...).
    kThrottled = 10,

    /// @brief Transient failures persisted past the retry budget.
    kRetryExhausted = 11,

    /// @brief Object version changed while it was being read.
    kFileChanged = 12,

    /// @brief Multipart upload session was aborted.
    kUploadAborted = 13,

    /// @brief Operation was cancelled because its stream is closing.
    kCancelled = 14,

    /// @brief Operation not supported by the stream or backend.
    kUnsupported = 15
};

/// @brief Classification used by the retry policy and error propagation.
enum class ErrorClass : std::uint8_t {
    kTransient = 0,  ///< Retryable network or server condition
    kFatal = 1,      ///< Not retryable; surfaces to the caller
    kLogical = 2     ///< Caller misuse; surfaces synchronously
};

/// @brief Convert ErrorCode to its integer exit code value.
[[nodiscard]] constexpr int toExitCode(ErrorCode code) noexcept {
    return static_cast<int>(code);
}

/// @brief Convert ErrorCode to string representation.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kInvalidArgument:
            return "invalid argument";
        case ErrorCode::kInvalidState:
            return "invalid state";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kNotFound:
            return "not found";
        case ErrorCode::kRangeNotSatisfiable:
            return "range not satisfiable";
        case ErrorCode::kPermissionDenied:
            return "permission denied";
        case ErrorCode::kTimeout:
            return "timeout";
        case ErrorCode::kConnectionReset:
            return "connection reset";
        case ErrorCode::kServerError:
            return "server error";
        case ErrorCode::kThrottled:
            return "throttled";
        case ErrorCode::kRetryExhausted:
            return "retry exhausted";
        case ErrorCode::kFileChanged:
            return "file changed";
        case ErrorCode::kUploadAborted:
            return "upload aborted";
        case ErrorCode::kCancelled:
            return "cancelled";
        case ErrorCode::kUnsupported:
            return "unsupported";
    }
    return "unknown error";
}

/// @brief Default classification of an error code.
[[nodiscard]] constexpr ErrorClass classify(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kTimeout:
        case ErrorCode::kConnectionReset:
        case ErrorCode::kServerError:
        case ErrorCode::kThrottled:
            return ErrorClass::kTransient;
        case ErrorCode::kInvalidArgument:
        case ErrorCode::kInvalidState:
        case ErrorCode::kUnsupported:
            return ErrorClass::kLogical;
        default:
            return ErrorClass::kFatal;
    }
}

/// @brief Convert ErrorClass to string representation.
[[nodiscard]] constexpr std::string_view errorClassToString(ErrorClass cls) noexcept {
    switch (cls) {
        case ErrorClass::kTransient:
            return "transient";
        case ErrorClass::kFatal:
            return "fatal";
        case ErrorClass::kLogical:
            return "logical";
    }
    return "unknown";
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Additional context information for errors.
struct ErrorContext {
    /// @brief Name of the remote object (URL or path).
    std::string objectName;

    /// @brief Read block index where the error occurred (if applicable).
    std::optional<std::uint64_t> blockIndex;

    /// @brief Part number where the error occurred (if applicable).
    std::optional<std::uint32_t> partNumber;

    /// @brief First byte offset that could not be served (if applicable).
    std::optional<std::uint64_t> byteOffset;

    /// @brief Source location where the error was created.
    std::source_location location;

    /// @brief Default constructor with current source location.
    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    /// @brief Construct with object name.
    explicit ErrorContext(std::string name,
                          std::source_location loc = std::source_location::current())
        : objectName(std::move(name)), location(loc) {}

    ErrorContext& withObject(std::string name) {
        objectName = std::move(name);
        return *this;
    }

    ErrorContext& withBlock(std::uint64_t index) {
        blockIndex = index;
        return *this;
    }

    ErrorContext& withPart(std::uint32_t number) {
        partNumber = number;
        return *this;
    }

    ErrorContext& withOffset(std::uint64_t offset) {
        byteOffset = offset;
        return *this;
    }

    /// @brief Format context as a string for error messages.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all remio errors.
class RemioException : public std::exception {
public:
    RemioException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    RemioException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~RemioException() override = default;

    RemioException(const RemioException&) = default;
    RemioException(RemioException&&) noexcept = default;
    RemioException& operator=(const RemioException&) = default;
    RemioException& operator=(RemioException&&) noexcept = default;

    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    /// @brief Get the error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Get the classification of the error code.
    [[nodiscard]] ErrorClass errorClass() const noexcept { return classify(code_); }

    /// @brief Get the exit code for this error.
    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Get the error message (without context).
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief Get the error context.
    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

    /// @brief Check if this exception has context information.
    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

protected:
    void formatWhat();

    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
    std::string what_;
};

// =============================================================================
// Specific Exception Classes
// =============================================================================

/// @brief Fatal failure of a backend primitive, including retry exhaustion.
/// @note Keeps the originating error code (timeout, server error, ...).
class IOError : public RemioException {
public:
    explicit IOError(std::string message)
        : RemioException(ErrorCode::kIOError, std::move(message)) {}

    IOError(std::string message, ErrorContext context)
        : RemioException(ErrorCode::kIOError, std::move(message), std::move(context)) {}

    IOError(ErrorCode code, std::string message, ErrorContext context)
        : RemioException(code, std::move(message), std::move(context)) {}
};

/// @brief The remote object no longer exists.
class NotFoundError : public RemioException {
public:
    explicit NotFoundError(std::string message)
        : RemioException(ErrorCode::kNotFound, std::move(message)) {}

    NotFoundError(std::string message, ErrorContext context)
        : RemioException(ErrorCode::kNotFound, std::move(message), std::move(context)) {}
};

/// @brief Caller misuse: bad argument, closed stream, unsupported operation.
class LogicalError : public RemioException {
public:
    explicit LogicalError(std::string message)
        : RemioException(ErrorCode::kInvalidState, std::move(message)) {}

    LogicalError(ErrorCode code, std::string message)
        : RemioException(code, std::move(message)) {}

    LogicalError(ErrorCode code, std::string message, ErrorContext context)
        : RemioException(code, std::move(message), std::move(context)) {}
};

/// @brief The object changed (version tag mismatch) during a read.
class FileChangedError : public RemioException {
public:
    FileChangedError(std::string message, ErrorContext context)
        : RemioException(ErrorCode::kFileChanged, std::move(message), std::move(context)) {}
};

/// @brief A multipart upload was aborted after a part or completion failed.
/// @note The primary cause is the message; a failure of abortUpload itself is
///       kept separately and never replaces the primary cause.
class UploadAbortedError : public RemioException {
public:
    UploadAbortedError(ErrorCode cause, std::string message, ErrorContext context)
        : RemioException(ErrorCode::kUploadAborted, std::move(message), std::move(context)),
          cause_(cause) {}

    /// @brief Error code of the failure that triggered the abort.
    [[nodiscard]] ErrorCode cause() const noexcept { return cause_; }

    /// @brief Failure reported by abortUpload, if any.
    [[nodiscard]] const std::optional<std::string>& abortFailure() const noexcept {
        return abortFailure_;
    }

    void setAbortFailure(std::string message) {
        abortFailure_ = std::move(message);
        what_ += " [abort also failed: " + *abortFailure_ + "]";
    }

private:
    ErrorCode cause_;
    std::optional<std::string> abortFailure_;
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode and message.
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    explicit Error(const RemioException& ex) : code_(ex.code()), message_(ex.message()) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] ErrorClass errorClass() const noexcept { return classify(code_); }

    [[nodiscard]] bool isTransient() const noexcept {
        return errorClass() == ErrorClass::kTransient;
    }

    /// @brief "[code] message" form used in logs.
    [[nodiscard]] std::string describe() const;

    /// @brief Throw the exception type matching the error code.
    [[noreturn]] void throwException() const;

    /// @brief Throw the exception type matching the error code, with context.
    [[noreturn]] void throwException(ErrorContext context) const;

private:
    ErrorCode code_;
    std::string message_;
};

/// @brief Result type for operations that can fail.
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

/// @brief Result type for operations that return nothing on success.
using VoidResult = Result<std::monostate>;

template <typename T>
[[nodiscard]] Result<T> makeSuccess(T value) {
    return Result<T>{std::move(value)};
}

/// @brief Create an error result.
/// @note Converts to any Result<T> through std::unexpected.
[[nodiscard]] inline std::unexpected<Error> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

[[nodiscard]] inline std::unexpected<Error> makeError(Error error) {
    return std::unexpected(std::move(error));
}

[[nodiscard]] inline VoidResult makeVoidSuccess() {
    return VoidResult{std::monostate{}};
}

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Convert a Result to an exception if it contains an error.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (result.has_value()) {
        return std::move(result.value());
    }
    result.error().throwException();
}

/// @brief Convert a Result to an exception if it contains an error (void version).
inline void unwrapOrThrow(const VoidResult& result) {
    if (!result.has_value()) {
        result.error().throwException();
    }
}

/// @brief Execute a function, converting thrown exceptions to an error Result.
/// @note @p func may itself return a Result; it is passed through unchanged.
template <typename F>
[[nodiscard]] auto tryExecute(F&& func) {
    using ReturnType = std::invoke_result_t<F>;
    if constexpr (requires { typename ReturnType::error_type; }) {
        try {
            return ReturnType{func()};
        } catch (const RemioException& ex) {
            return ReturnType{std::unexpected(Error{ex})};
        } catch (const std::exception& ex) {
            return ReturnType{std::unexpected(Error{ErrorCode::kIOError, ex.what()})};
        }
    } else if constexpr (std::is_void_v<ReturnType>) {
        try {
            func();
            return makeVoidSuccess();
        } catch (const RemioException& ex) {
            return VoidResult{std::unexpected(Error{ex})};
        } catch (const std::exception& ex) {
            return VoidResult{std::unexpected(Error{ErrorCode::kIOError, ex.what()})};
        }
    } else {
        try {
            return Result<ReturnType>{func()};
        } catch (const RemioException& ex) {
            return Result<ReturnType>{std::unexpected(Error{ex})};
        } catch (const std::exception& ex) {
            return Result<ReturnType>{std::unexpected(Error{ErrorCode::kIOError, ex.what()})};
        }
    }
}

}  // namespace remio

#endif  // REMIO_COMMON_ERROR_H
