// =============================================================================
// guidfix - Line-Wrap Artifact Resolver Implementation
// =============================================================================

#include "guidfix/codec/artifact_resolver.h"

#include <optional>
#include <utility>

namespace guidfix::codec {

namespace {

constexpr std::string_view kWhitespace = " \t\n\r\v\f";
constexpr std::string_view kLineBreaks = "\r\n";
constexpr std::string_view kWrapIndent = " \t";

[[nodiscard]] bool isBoundaryCharacter(char c) noexcept {
    return kBoundaryCharacters.find(c) != std::string_view::npos;
}

/// @brief Decode one candidate into a Resolution.
[[nodiscard]] std::optional<Resolution> attempt(std::string_view candidate,
                                                Hypothesis hypothesis,
                                                SurplusBits surplus) {
    auto expansion = expand(candidate, surplus);
    if (!expansion) {
        return std::nullopt;
    }
    return Resolution{compress(expansion->identifier),
                      std::move(expansion->canonicalLongForm),
                      hypothesis};
}

}  // namespace

std::string_view trimWhitespace(std::string_view text) noexcept {
    const auto first = text.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(kWhitespace);
    return text.substr(first, last - first + 1);
}

WrapCandidates splitAtLineBreak(std::string_view text) {
    WrapCandidates candidates;

    const auto breakBegin = text.find_first_of(kLineBreaks);
    if (breakBegin == std::string_view::npos) {
        candidates.removed = std::string(text);
        candidates.kept = candidates.removed;
        return candidates;
    }

    std::size_t breakEnd = breakBegin + 1;
    if (text[breakBegin] == '\r' && breakEnd < text.size() && text[breakEnd] == '\n') {
        ++breakEnd;
    }

    std::string_view head = text.substr(0, breakBegin);
    std::string_view tail = text.substr(breakEnd);

    // Wrap indentation on either side of the break
    const auto headEnd = head.find_last_not_of(kWrapIndent);
    head = headEnd == std::string_view::npos ? std::string_view{} : head.substr(0, headEnd + 1);
    const auto tailBegin = tail.find_first_not_of(kWrapIndent);
    tail = tailBegin == std::string_view::npos ? std::string_view{} : tail.substr(tailBegin);

    candidates.hasLineBreak = true;

    candidates.kept.reserve(head.size() + tail.size());
    candidates.kept.append(head).append(tail);

    std::string_view removedHead = head;
    if (!removedHead.empty() && isBoundaryCharacter(removedHead.back())) {
        removedHead.remove_suffix(1);
    }
    candidates.removed.reserve(removedHead.size() + tail.size());
    candidates.removed.append(removedHead).append(tail);

    return candidates;
}

Result<Resolution, ResolutionError> resolve(std::string_view raw, SurplusBits surplus) {
    const std::string_view trimmed = trimWhitespace(raw);
    const WrapCandidates candidates = splitAtLineBreak(trimmed);

    if (!candidates.hasLineBreak) {
        if (auto resolution = attempt(trimmed, Hypothesis::kDirect, surplus)) {
            return std::move(*resolution);
        }
        return std::unexpected(ResolutionError::kNotRecoverable);
    }

    // Wrap hyphenation is the common corruption, so the removed candidate
    // goes first, but only when its length already fits.
    const bool removedFits = candidates.removed.size() == kCompactFormLength;
    if (removedFits) {
        if (auto resolution = attempt(candidates.removed, Hypothesis::kRemoved, surplus)) {
            return std::move(*resolution);
        }
    }

    const bool keptIsNew = !(removedFits && candidates.kept == candidates.removed);
    if (keptIsNew) {
        if (auto resolution = attempt(candidates.kept, Hypothesis::kKept, surplus)) {
            return std::move(*resolution);
        }
    }

    if (!removedFits && candidates.removed != candidates.kept) {
        if (auto resolution =
                attempt(candidates.removed, Hypothesis::kRemovedUngated, surplus)) {
            return std::move(*resolution);
        }
    }

    return std::unexpected(ResolutionError::kNotRecoverable);
}

}  // namespace guidfix::codec
