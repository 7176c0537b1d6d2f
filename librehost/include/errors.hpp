/**
 * @file errors.hpp
 * @brief Typed error taxonomy raised by the rehosting pipeline.
 */

#ifndef REHOST_ERRORS_HPP
#define REHOST_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace rehost {

    /**
     * @brief Classifies every failure the pipeline can surface to a caller.
     */
    enum class ErrorKind {
        InvalidSource,        ///< Unsupported scheme, unresolvable host, bad HTTP status
        ForbiddenDestination, ///< Host resolves to a private or loopback address
        PayloadTooLarge,      ///< Body or document exceeds the configured cap
        MalformedInput,       ///< Data URI that cannot be parsed
        UnsupportedFormat,    ///< Bytes are not a recognized image container
        EncodingFailed,       ///< No valid image bytes could be produced
        StorageUnavailable,   ///< Existence check failed for a reason other than "absent"
        StorageWriteFailed,   ///< Upload failed
        BatchItemFailed,      ///< One item of a batch failed; see BatchItemError
        InvalidRequest,       ///< Request shape is invalid (batch size, empty batch)
        Cancelled             ///< Caller requested cancellation
    };

    /**
     * @brief Stable identifier for an ErrorKind, used in logs and CLI output.
     */
    [[nodiscard]] constexpr std::string_view to_string(const ErrorKind kind) noexcept {
        switch (kind) {
            case ErrorKind::InvalidSource:        return "InvalidSource";
            case ErrorKind::ForbiddenDestination: return "ForbiddenDestination";
            case ErrorKind::PayloadTooLarge:      return "PayloadTooLarge";
            case ErrorKind::MalformedInput:       return "MalformedInput";
            case ErrorKind::UnsupportedFormat:    return "UnsupportedFormat";
            case ErrorKind::EncodingFailed:       return "EncodingFailed";
            case ErrorKind::StorageUnavailable:   return "StorageUnavailable";
            case ErrorKind::StorageWriteFailed:   return "StorageWriteFailed";
            case ErrorKind::BatchItemFailed:      return "BatchItemFailed";
            case ErrorKind::InvalidRequest:       return "InvalidRequest";
            case ErrorKind::Cancelled:            return "Cancelled";
        }
        return "Unknown";
    }

    /**
     * @brief Base exception of the library. Carries the failure kind.
     */
    class RehostError : public std::runtime_error {
    public:
        RehostError(const ErrorKind kind, const std::string& message)
            : std::runtime_error(message), kind_(kind) {}

        [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

    private:
        ErrorKind kind_;
    };

    /**
     * @brief Raised by a batch when the item at index() fails.
     *
     * kind() is always BatchItemFailed; cause() is the kind of the
     * underlying error.
     */
    class BatchItemError final : public RehostError {
    public:
        BatchItemError(const std::size_t index, const ErrorKind cause, const std::string& detail)
            : RehostError(ErrorKind::BatchItemFailed,
                          "failed to process item " + std::to_string(index) + ": " + detail),
              index_(index), cause_(cause) {}

        [[nodiscard]] std::size_t index() const noexcept { return index_; }
        [[nodiscard]] ErrorKind cause() const noexcept { return cause_; }

    private:
        std::size_t index_;
        ErrorKind cause_;
    };

} // namespace rehost

#endif // REHOST_ERRORS_HPP
