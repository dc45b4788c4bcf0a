// =============================================================================
// remio - Engine Configuration Implementation
// =============================================================================

#include "remio/common/config.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <limits>
#include <string>

#include <fmt/format.h>

namespace remio {

namespace {

/// @brief Read an environment variable, treating empty values as unset.
std::optional<std::string_view> envValue(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string_view(value);
}

Result<std::uint64_t> envQuantity(const char* name, std::uint64_t fallback) {
    auto value = envValue(name);
    if (!value) {
        return fallback;
    }
    auto parsed = parseQuantity(*value);
    if (!parsed) {
        return makeError(ErrorCode::kInvalidArgument,
                         fmt::format("{}: {}", name, parsed.error().message()));
    }
    return *parsed;
}

Result<std::uint64_t> envInteger(const char* name, std::uint64_t fallback) {
    auto value = envValue(name);
    if (!value) {
        return fallback;
    }
    std::uint64_t number = 0;
    const auto* end = value->data() + value->size();
    auto [ptr, ec] = std::from_chars(value->data(), end, number);
    if (ec != std::errc{} || ptr != end) {
        return makeError(ErrorCode::kInvalidArgument,
                         fmt::format("{}: invalid integer '{}'", name, *value));
    }
    return number;
}

/// @brief Multiply with overflow detection.
bool checkedMultiply(std::uint64_t a, std::uint64_t b, std::uint64_t& out) {
    if (a != 0 && b > std::numeric_limits<std::uint64_t>::max() / a) {
        return false;
    }
    out = a * b;
    return true;
}

}  // namespace

// =============================================================================
// Parsing Utilities
// =============================================================================

Result<std::uint64_t> parseQuantity(std::string_view quantity) {
    std::string_view number = quantity;
    std::string_view suffix;

    auto isExponent = [](char c) {
        return c == 'K' || c == 'k' || c == 'M' || c == 'G' || c == 'T' || c == 'P' ||
               c == 'E';
    };

    if (quantity.size() >= 2 && quantity.back() == 'i' && isExponent(quantity[quantity.size() - 2])) {
        number = quantity.substr(0, quantity.size() - 2);
        suffix = quantity.substr(quantity.size() - 2);
    } else if (!quantity.empty() && isExponent(quantity.back())) {
        number = quantity.substr(0, quantity.size() - 1);
        suffix = quantity.substr(quantity.size() - 1);
    }

    std::uint64_t value = 0;
    const auto* end = number.data() + number.size();
    auto [ptr, ec] = std::from_chars(number.data(), end, value);
    if (number.empty() || ec != std::errc{} || ptr != end) {
        return makeError(ErrorCode::kInvalidArgument,
                         fmt::format("invalid number format: '{}'", quantity));
    }

    if (suffix.empty()) {
        return value;
    }

    // SI inconsistency: lowercase k is only valid for base 1000
    if (suffix == "ki") {
        return makeError(ErrorCode::kInvalidArgument,
                         fmt::format("'{}' has unknown suffix", quantity));
    }

    const std::uint64_t base = suffix.size() == 2 ? 1024 : 1000;
    int exponent = 0;
    switch (suffix[0]) {
        case 'K':
        case 'k':
            exponent = 1;
            break;
        case 'M':
            exponent = 2;
            break;
        case 'G':
            exponent = 3;
            break;
        case 'T':
            exponent = 4;
            break;
        case 'P':
            exponent = 5;
            break;
        case 'E':
            exponent = 6;
            break;
        default:
            break;
    }

    for (int i = 0; i < exponent; ++i) {
        if (!checkedMultiply(value, base, value)) {
            return makeError(ErrorCode::kInvalidArgument,
                             fmt::format("quantity '{}' overflows", quantity));
        }
    }
    return value;
}

bool parseBoolean(std::string_view value) noexcept {
    std::string lower(value);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower == "true" || lower == "yes" || lower == "1";
}

// =============================================================================
// Validation
// =============================================================================

VoidResult RetryOptions::validate() const {
    if (maxRetryTimes == 0) {
        return makeError(ErrorCode::kInvalidArgument, "max retry times must be >= 1");
    }
    if (initialDelay.count() < 0 || maxDelay.count() < 0) {
        return makeError(ErrorCode::kInvalidArgument, "retry delays must not be negative");
    }
    return {};
}

VoidResult ReaderOptions::validate() const {
    if (blockSize == 0) {
        return makeError(ErrorCode::kInvalidArgument, "reader block size must be > 0");
    }
    if (maxBufferSize == 0) {
        return makeError(ErrorCode::kInvalidArgument, "reader max buffer size must be > 0");
    }
    if (prefetchWindow.has_value() && *prefetchWindow == 0) {
        return makeError(ErrorCode::kInvalidArgument, "prefetch window must be >= 1");
    }
    return retry.validate();
}

VoidResult WriterOptions::validate() const {
    if (blockSize.has_value() && *blockSize == 0) {
        return makeError(ErrorCode::kInvalidArgument, "writer block size must be > 0");
    }
    if (defaultBlockSize == 0) {
        return makeError(ErrorCode::kInvalidArgument, "writer default block size must be > 0");
    }
    if (maxBufferSize == 0) {
        return makeError(ErrorCode::kInvalidArgument, "writer max buffer size must be > 0");
    }
    return retry.validate();
}

VoidResult EngineConfig::validate() const {
    if (workerCount == 0) {
        return makeError(ErrorCode::kInvalidArgument, "worker count must be > 0");
    }
    if (auto result = reader.validate(); !result) {
        return result;
    }
    return writer.validate();
}

// =============================================================================
// Environment Overlay
// =============================================================================

Result<EngineConfig> EngineConfig::fromEnvironment() {
    EngineConfig config;

    auto readerBlock = envQuantity("REMIO_READER_BLOCK_SIZE", config.reader.blockSize);
    if (!readerBlock) {
        return std::unexpected(readerBlock.error());
    }
    config.reader.blockSize = static_cast<std::size_t>(*readerBlock);

    auto readerBuffer = envQuantity("REMIO_READER_MAX_BUFFER_SIZE", config.reader.maxBufferSize);
    if (!readerBuffer) {
        return std::unexpected(readerBuffer.error());
    }
    config.reader.maxBufferSize = static_cast<std::size_t>(*readerBuffer);

    if (envValue("REMIO_WRITER_BLOCK_SIZE")) {
        auto writerBlock = envQuantity("REMIO_WRITER_BLOCK_SIZE", 0);
        if (!writerBlock) {
            return std::unexpected(writerBlock.error());
        }
        config.writer.blockSize = static_cast<std::size_t>(*writerBlock);
    }

    auto writerBuffer = envQuantity("REMIO_WRITER_MAX_BUFFER_SIZE", config.writer.maxBufferSize);
    if (!writerBuffer) {
        return std::unexpected(writerBuffer.error());
    }
    config.writer.maxBufferSize = static_cast<std::size_t>(*writerBuffer);

    if (auto autoscale = envValue("REMIO_WRITER_BLOCK_AUTOSCALE")) {
        config.writer.blockAutoscale = parseBoolean(*autoscale);
    }

    auto workers = envInteger("REMIO_MAX_WORKERS", config.workerCount);
    if (!workers) {
        return std::unexpected(workers.error());
    }
    config.workerCount = static_cast<std::size_t>(*workers);

    auto retries = envInteger("REMIO_MAX_RETRY_TIMES", config.reader.retry.maxRetryTimes);
    if (!retries) {
        return std::unexpected(retries.error());
    }
    config.setMaxRetryTimes(static_cast<std::uint32_t>(*retries));

    if (auto result = config.validate(); !result) {
        return std::unexpected(result.error());
    }
    return config;
}

}  // namespace remio
