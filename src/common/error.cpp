// =============================================================================
// remio - Error Handling Framework Implementation
// =============================================================================

#include "remio/common/error.h"

#include <fmt/format.h>

#include <sstream>

namespace remio {

// =============================================================================
// ErrorContext Implementation
// =============================================================================

std::string ErrorContext::format() const {
    std::ostringstream oss;
    bool hasContent = false;

    if (!objectName.empty()) {
        oss << "object: " << objectName;
        hasContent = true;
    }

    if (blockIndex.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "block: " << *blockIndex;
        hasContent = true;
    }

    if (partNumber.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "part: " << *partNumber;
        hasContent = true;
    }

    if (byteOffset.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "offset: " << *byteOffset;
        hasContent = true;
    }

#ifndef NDEBUG
    if (hasContent) {
        oss << " (at " << location.file_name() << ":" << location.line() << ")";
    }
#endif

    return oss.str();
}

// =============================================================================
// RemioException Implementation
// =============================================================================

void RemioException::formatWhat() {
    std::ostringstream oss;
    oss << "[" << errorCodeToString(code_) << "] " << message_;

    if (context_.has_value()) {
        std::string contextStr = context_->format();
        if (!contextStr.empty()) {
            oss << " (" << contextStr << ")";
        }
    }

    what_ = oss.str();
}

// =============================================================================
// Error Implementation
// =============================================================================

std::string Error::describe() const {
    return fmt::format("[{}] {}", errorCodeToString(code_), message_);
}

[[noreturn]] void Error::throwException() const {
    throwException(ErrorContext{});
}

[[noreturn]] void Error::throwException(ErrorContext context) const {
    switch (code_) {
        case ErrorCode::kNotFound:
            throw NotFoundError(message_, std::move(context));
        case ErrorCode::kInvalidArgument:
        case ErrorCode::kInvalidState:
        case ErrorCode::kUnsupported:
            throw LogicalError(code_, message_, std::move(context));
        case ErrorCode::kFileChanged:
            throw FileChangedError(message_, std::move(context));
        case ErrorCode::kUploadAborted:
            throw UploadAbortedError(code_, message_, std::move(context));
        case ErrorCode::kSuccess:
            // Should not happen, but throw base exception
            throw RemioException(ErrorCode::kSuccess, message_, std::move(context));
        default:
            break;
    }
    // Backend and retry failures keep their originating code
    throw IOError(code_, message_, std::move(context));
}

}  // namespace remio
