#include "InputValidator.hpp"

#include "ChatGuardConfig.hpp"

#include <boost/filesystem/operations.hpp>

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <iterator>

namespace fs = boost::filesystem;

namespace {
const char REPLACEMENT_CHARACTER[] = "\xEF\xBF\xBD";

// Length of the UTF-8 sequence starting at input[pos], or 0 when the
// sequence is invalid (truncated, overlong, surrogate or out of range).
std::size_t ValidSequenceLength(const std::string& input, std::size_t pos) {
    const auto lead = static_cast<unsigned char>(input[pos]);
    if (lead < 0x80) {
        return 1;
    }

    std::size_t length = 0;
    uint32_t codePoint = 0;
    if ((lead & 0xE0) == 0xC0) {
        length = 2;
        codePoint = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        codePoint = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        codePoint = lead & 0x07;
    } else {
        return 0;
    }

    if (pos + length > input.size()) {
        return 0;
    }

    for (std::size_t i = 1; i < length; ++i) {
        const auto next = static_cast<unsigned char>(input[pos + i]);
        if ((next & 0xC0) != 0x80) {
            return 0;
        }
        codePoint = (codePoint << 6) | (next & 0x3F);
    }

    static const uint32_t MINIMUM[] = {0, 0, 0x80, 0x800, 0x10000};
    if (codePoint < MINIMUM[length] || codePoint > 0x10FFFF || (codePoint >= 0xD800 && codePoint <= 0xDFFF)) {
        return 0;
    }

    return length;
}

bool IsWithin(const fs::path& root, const fs::path& candidate) {
    auto rootIter = root.begin();
    auto candidateIter = candidate.begin();
    for (; rootIter != root.end(); ++rootIter, ++candidateIter) {
        if (candidateIter == candidate.end() || *rootIter != *candidateIter) {
            return false;
        }
    }

    return true;
}
} // namespace

InputValidator::InputValidator(const ChatGuardConfig& config)
    : config_{config}
    , allowedChats_{config.allowedChats.begin(), config.allowedChats.end()} {}

ContentItem InputValidator::Validate(const ContentItem& item) const {
    if (!allowedChats_.empty() && allowedChats_.count(item.chatId) == 0) {
        throw ValidationError(ValidationFailure::ChatNotAllowed, "chat " + item.chatId + " is not in allowed_chats");
    }

    const auto limit = LimitFor(item.modality);

    ContentItem sanitized = item;
    sanitized.contentHash.clear();

    if (!item.mediaPath.empty()) {
        if (item.modality == Modality::Text) {
            throw ValidationError(ValidationFailure::UnsafePath, "text items cannot reference files");
        }
        sanitized.payload = LoadMedia(item.mediaPath, limit);
    }

    if (sanitized.payload.empty()) {
        throw ValidationError(ValidationFailure::EmptyPayload, std::string{ToString(item.modality)} + " payload is empty");
    }

    if (sanitized.payload.size() > limit) {
        throw ValidationError(ValidationFailure::Oversized,
            std::string{ToString(item.modality)} + " payload of " + std::to_string(sanitized.payload.size())
                + " bytes exceeds " + std::to_string(limit));
    }

    if (item.modality == Modality::Text) {
        sanitized.caption.clear();
        sanitized.payload = SanitizeText(sanitized.payload, "text");
    } else if (!item.caption.empty()) {
        if (item.caption.size() > config_.maxTextBytes) {
            throw ValidationError(ValidationFailure::Oversized,
                "caption of " + std::to_string(item.caption.size()) + " bytes exceeds "
                    + std::to_string(config_.maxTextBytes));
        }
        sanitized.caption = SanitizeText(item.caption, "caption");
    }

    return sanitized;
}

std::string InputValidator::SanitizeText(const std::string& text, const std::string& what) const {
    std::string repaired;
    if (RepairUtf8(text, repaired)) {
        return text;
    }

    if (config_.rejectMalformedText) {
        throw ValidationError(ValidationFailure::MalformedEncoding, what + " is not valid UTF-8");
    }
    if (repaired.size() > config_.maxTextBytes) {
        throw ValidationError(ValidationFailure::Oversized,
            "repaired " + what + " exceeds " + std::to_string(config_.maxTextBytes));
    }

    return repaired;
}

fs::path InputValidator::ResolveMediaPath(const std::string& relativePath) const {
    return Confine(config_.mediaRoot, relativePath);
}

fs::path InputValidator::ScratchPath(const std::string& fileName) const {
    return Confine(config_.scratchDirectory, fileName);
}

std::size_t InputValidator::LimitFor(Modality modality) const {
    switch (modality) {
    case Modality::Text:
        return config_.maxTextBytes;
    case Modality::Image:
        return config_.maxImageBytes;
    case Modality::Video:
        return config_.maxVideoBytes;
    }

    return config_.maxTextBytes;
}

bool InputValidator::RepairUtf8(const std::string& input, std::string& output) {
    output.clear();
    output.reserve(input.size());

    bool valid = true;
    std::size_t pos = 0;
    while (pos < input.size()) {
        const auto length = ValidSequenceLength(input, pos);
        if (length == 0) {
            valid = false;
            output += REPLACEMENT_CHARACTER;
            ++pos;
            continue;
        }

        output.append(input, pos, length);
        pos += length;
    }

    return valid;
}

fs::path InputValidator::Confine(const fs::path& root, const std::string& relativePath) {
    if (relativePath.empty()) {
        throw ValidationError(ValidationFailure::UnsafePath, "empty path");
    }

    if (relativePath.find("..") != std::string::npos || relativePath.front() == '/'
        || relativePath.find('\\') != std::string::npos || relativePath.find('\0') != std::string::npos) {
        throw ValidationError(ValidationFailure::UnsafePath, "path traversal attempt: " + relativePath);
    }

    auto normalizedRoot = fs::absolute(root).lexically_normal();
    if (normalizedRoot.filename() == ".") {
        normalizedRoot = normalizedRoot.parent_path();
    }
    auto candidate = (normalizedRoot / relativePath).lexically_normal();
    if (!IsWithin(normalizedRoot, candidate)) {
        throw ValidationError(ValidationFailure::UnsafePath, "path escapes " + root.string() + ": " + relativePath);
    }

    // Symlinks inside the root must not lead outside of it either.
    boost::system::error_code ec;
    if (fs::exists(candidate, ec)) {
        const auto resolvedRoot = fs::weakly_canonical(normalizedRoot, ec);
        const auto resolved = fs::weakly_canonical(candidate, ec);
        if (ec || !IsWithin(resolvedRoot, resolved)) {
            throw ValidationError(ValidationFailure::UnsafePath, "path resolves outside " + root.string());
        }
        candidate = resolved;
    }

    return candidate;
}

std::string InputValidator::LoadMedia(const std::string& relativePath, std::size_t limit) const {
    const auto path = ResolveMediaPath(relativePath);

    boost::system::error_code ec;
    const auto size = fs::file_size(path, ec);
    if (ec || !fs::is_regular_file(path, ec)) {
        throw ValidationError(ValidationFailure::MediaUnavailable, "cannot read media " + relativePath);
    }

    if (size > limit) {
        throw ValidationError(ValidationFailure::Oversized,
            "media " + relativePath + " of " + std::to_string(size) + " bytes exceeds " + std::to_string(limit));
    }

    std::ifstream in{path.string().c_str(), std::ios::binary};
    if (!in) {
        throw ValidationError(ValidationFailure::MediaUnavailable, "cannot open media " + relativePath);
    }

    return std::string{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}
