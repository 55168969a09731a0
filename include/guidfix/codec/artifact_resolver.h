// =============================================================================
// guidfix - Line-Wrap Artifact Resolver
// =============================================================================
// Recovers a compact identifier from a table cell that a document or
// spreadsheet has line-wrapped.
//
// A hyphen or underscore directly before the line break is ambiguous: it is
// either a wrap artifact (typographic hyphenation) or a genuine symbol of the
// compact alphabet. Candidates are tried in a fixed order and the codec is
// the only validity oracle:
//
//   1. No line break:  the trimmed text itself                  (kDirect)
//   2. Removed:        boundary char and break deleted,
//                      tried only if exactly 22 characters      (kRemoved)
//   3. Kept:           only the break deleted                   (kKept)
//   4. Removed again:  if step 2 was skipped for its length     (kRemovedUngated)
//
// Only the first line break is repaired ("\n", "\r\n" or a lone "\r").
// Spaces and tabs directly around it are discarded with it.
//
// All functions are pure and thread-safe.
// =============================================================================

#ifndef GUIDFIX_CODEC_ARTIFACT_RESOLVER_H
#define GUIDFIX_CODEC_ARTIFACT_RESOLVER_H

#include <cstdint>
#include <string>
#include <string_view>

#include "guidfix/codec/compact_codec.h"
#include "guidfix/common/error.h"

namespace guidfix::codec {

// =============================================================================
// Constants
// =============================================================================

/// @brief Characters that may be wrap artifacts when they precede a break.
inline constexpr std::string_view kBoundaryCharacters = "-_";

// =============================================================================
// Resolution Types
// =============================================================================

/// @brief Reason resolve() gives up.
enum class ResolutionError : std::uint8_t {
    /// @brief No candidate decoded.
    kNotRecoverable = 0
};

[[nodiscard]] constexpr std::string_view resolutionErrorToString(ResolutionError error) noexcept {
    switch (error) {
        case ResolutionError::kNotRecoverable:
            return "not recoverable";
    }
    return "unknown resolution error";
}

/// @brief The candidate that produced a resolution.
enum class Hypothesis : std::uint8_t {
    kDirect = 0,
    kRemoved = 1,
    kKept = 2,
    kRemovedUngated = 3
};

[[nodiscard]] constexpr std::string_view hypothesisToString(Hypothesis hypothesis) noexcept {
    switch (hypothesis) {
        case Hypothesis::kDirect:
            return "direct";
        case Hypothesis::kRemoved:
            return "removed";
        case Hypothesis::kKept:
            return "kept";
        case Hypothesis::kRemovedUngated:
            return "removed-ungated";
    }
    return "unknown";
}

/// @brief A recovered identifier.
struct Resolution {
    /// @brief Canonical compact form.
    std::string compactForm;

    /// @brief Canonical long form.
    std::string canonicalLongForm;

    /// @brief Winning candidate.
    Hypothesis hypothesis = Hypothesis::kDirect;
};

/// @brief Candidate strings built around the first line break.
struct WrapCandidates {
    /// @brief Whether the text contained a line break.
    bool hasLineBreak = false;

    /// @brief Break (and a boundary character before it) deleted.
    std::string removed;

    /// @brief Only the break deleted.
    std::string kept;
};

// =============================================================================
// Resolver Operations
// =============================================================================

/// @brief Strip leading and trailing whitespace (space, \t, \n, \r, \v, \f).
[[nodiscard]] std::string_view trimWhitespace(std::string_view text) noexcept;

/// @brief Build the removed/kept candidates for already-trimmed text.
/// @note Without a line break both candidates equal the input.
[[nodiscard]] WrapCandidates splitAtLineBreak(std::string_view text);

/// @brief Recover a compact identifier from raw cell text.
/// @param raw Untrusted cell text, possibly wrapped.
/// @param surplus Surplus-bit policy handed to expand().
/// @return The first candidate that decodes, or kNotRecoverable. Never throws
///         on malformed input.
[[nodiscard]] Result<Resolution, ResolutionError> resolve(
    std::string_view raw, SurplusBits surplus = SurplusBits::kReject);

}  // namespace guidfix::codec

#endif  // GUIDFIX_CODEC_ARTIFACT_RESOLVER_H
