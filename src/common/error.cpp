// =============================================================================
// guidfix - Error Handling Framework Implementation
// =============================================================================

#include "guidfix/common/error.h"

#include <sstream>

#include <fmt/format.h>

namespace guidfix {

// =============================================================================
// ErrorContext Implementation
// =============================================================================

std::string ErrorContext::format() const {
    std::ostringstream oss;
    bool hasContent = false;

    auto separate = [&]() {
        if (hasContent) {
            oss << ", ";
        }
        hasContent = true;
    };

    if (!filePath.empty()) {
        separate();
        oss << "file: " << filePath;
    }

    if (!sheetName.empty()) {
        separate();
        oss << "sheet: " << sheetName;
    }

    if (row.has_value()) {
        separate();
        oss << "row: " << *row;
    }

    if (!column.empty()) {
        separate();
        oss << "column: " << column;
    }

#ifndef NDEBUG
    if (hasContent) {
        oss << " (at " << location.file_name() << ":" << location.line() << ")";
    }
#endif

    return oss.str();
}

// =============================================================================
// GuidfixException Implementation
// =============================================================================

void GuidfixException::formatWhat() {
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
// IOError Implementation
// =============================================================================

std::string IOError::formatWithSystemError(const std::string& message, std::error_code ec) {
    return fmt::format("{}: {} (error code: {})", message, ec.message(), ec.value());
}

// =============================================================================
// Error Implementation
// =============================================================================

GuidfixException Error::toException() const {
    switch (code_) {
        case ErrorCode::kUsageError:
            return UsageError(message_);
        case ErrorCode::kIOError:
            return IOError(message_);
        case ErrorCode::kFormatError:
            return FormatError(message_);
        case ErrorCode::kUnresolvedIdentifier:
            return UnresolvedIdentifierError(message_);
        case ErrorCode::kSuccess:
            return GuidfixException(ErrorCode::kSuccess, message_);
    }
    return GuidfixException(code_, message_);
}

[[noreturn]] void Error::throwException() const {
    switch (code_) {
        case ErrorCode::kUsageError:
            throw UsageError(message_);
        case ErrorCode::kIOError:
            throw IOError(message_);
        case ErrorCode::kFormatError:
            throw FormatError(message_);
        case ErrorCode::kUnresolvedIdentifier:
            throw UnresolvedIdentifierError(message_);
        case ErrorCode::kSuccess:
            throw GuidfixException(ErrorCode::kSuccess, message_);
    }
    throw GuidfixException(code_, message_);
}

}  // namespace guidfix
