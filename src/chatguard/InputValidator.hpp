#pragma once

#include "ContentItem.hpp"

#include <boost/filesystem/path.hpp>

#include <set>
#include <stdexcept>
#include <string>

struct ChatGuardConfig;

enum class ValidationFailure {
    EmptyPayload,
    Oversized,
    MalformedEncoding,
    UnsafePath,
    ChatNotAllowed,
    MediaUnavailable,
};

inline const char* ToString(ValidationFailure failure) {
    switch (failure) {
    case ValidationFailure::EmptyPayload:
        return "empty-payload";
    case ValidationFailure::Oversized:
        return "oversized";
    case ValidationFailure::MalformedEncoding:
        return "malformed-encoding";
    case ValidationFailure::UnsafePath:
        return "unsafe-path";
    case ValidationFailure::ChatNotAllowed:
        return "chat-not-allowed";
    case ValidationFailure::MediaUnavailable:
        return "media-unavailable";
    }

    return "invalid";
}

class ValidationError : public std::runtime_error {
public:
    ValidationError(ValidationFailure failure, const std::string& message)
        : std::runtime_error(std::string{ToString(failure)} + ": " + message)
        , failure_{failure} {}

    ValidationFailure Failure() const { return failure_; }

private:
    ValidationFailure failure_;
};

class InputValidator {
public:
    explicit InputValidator(const ChatGuardConfig& config);

    // Returns the sanitized item (media loaded, text repaired). Throws
    // ValidationError; nothing downstream runs for a rejected item.
    ContentItem Validate(const ContentItem& item) const;

    // Confines a caller-supplied relative path to the media root.
    boost::filesystem::path ResolveMediaPath(const std::string& relativePath) const;

    // Confines a generated file name to the scratch directory.
    boost::filesystem::path ScratchPath(const std::string& fileName) const;

    std::size_t LimitFor(Modality modality) const;

    // Replaces every invalid UTF-8 sequence with U+FFFD. Returns true when
    // the input was already valid.
    static bool RepairUtf8(const std::string& input, std::string& output);

private:
    static boost::filesystem::path Confine(const boost::filesystem::path& root, const std::string& relativePath);

    std::string LoadMedia(const std::string& relativePath, std::size_t limit) const;
    std::string SanitizeText(const std::string& text, const std::string& what) const;

    const ChatGuardConfig& config_;
    std::set<std::string> allowedChats_;
};
