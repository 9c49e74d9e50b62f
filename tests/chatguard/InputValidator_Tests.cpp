#include "catch.hpp"

#include "ChatGuardConfig.hpp"
#include "InputValidator.hpp"

#include <boost/filesystem.hpp>

#include <fstream>

namespace fs = boost::filesystem;

namespace {

class TemporaryDirectory {
public:
    TemporaryDirectory()
        : path_{fs::temp_directory_path() / fs::unique_path("chatguard-media-%%%%-%%%%")} {
        fs::create_directories(path_);
    }

    ~TemporaryDirectory() {
        boost::system::error_code ec;
        fs::remove_all(path_, ec);
    }

    const fs::path& Path() const { return path_; }

    void Write(const std::string& name, const std::string& contents) const {
        std::ofstream out{(path_ / name).string().c_str(), std::ios::binary};
        out << contents;
    }

private:
    fs::path path_;
};

ContentItem MakeText(const std::string& payload, const std::string& chatId = "chat-1") {
    ContentItem item;
    item.modality = Modality::Text;
    item.payload = payload;
    item.sourceId = "user-1";
    item.chatId = chatId;
    return item;
}

ValidationFailure FailureOf(const InputValidator& validator, const ContentItem& item) {
    try {
        validator.Validate(item);
    } catch (const ValidationError& e) {
        return e.Failure();
    }

    FAIL("expected a ValidationError");
    return ValidationFailure::EmptyPayload;
}

} // namespace

SCENARIO("text within the limit passes unchanged", "[validator]") {
    ChatGuardConfig config;
    InputValidator validator{config};

    auto item = MakeText("hello there");
    item.caption = "ignored for text";
    auto sanitized = validator.Validate(item);

    REQUIRE(sanitized.payload == "hello there");
    REQUIRE(sanitized.caption.empty());
}

SCENARIO("oversized and empty payloads are rejected", "[validator]") {
    ChatGuardConfig config;
    config.maxTextBytes = 16;
    InputValidator validator{config};

    REQUIRE(FailureOf(validator, MakeText(std::string(17, 'a'))) == ValidationFailure::Oversized);
    REQUIRE(FailureOf(validator, MakeText("")) == ValidationFailure::EmptyPayload);
    REQUIRE_NOTHROW(validator.Validate(MakeText(std::string(16, 'a'))));
}

SCENARIO("malformed UTF-8 is repaired or rejected", "[validator]") {
    GIVEN("the default configuration") {
        ChatGuardConfig config;
        InputValidator validator{config};

        THEN("invalid bytes are replaced with U+FFFD") {
            auto sanitized = validator.Validate(MakeText("ab\xff" "cd"));
            REQUIRE(sanitized.payload == "ab\xEF\xBF\xBD" "cd");
        }

        THEN("valid multi-byte text is kept as is") {
            auto sanitized = validator.Validate(MakeText("gr\xC3\xBC\xC3\x9F" "e"));
            REQUIRE(sanitized.payload == "gr\xC3\xBC\xC3\x9F" "e");
        }
    }

    GIVEN("strict handling of malformed text") {
        ChatGuardConfig config;
        config.rejectMalformedText = true;
        InputValidator validator{config};

        THEN("the item is rejected") {
            REQUIRE(FailureOf(validator, MakeText("ab\xff")) == ValidationFailure::MalformedEncoding);
        }
    }
}

SCENARIO("utf-8 repair handles overlong forms and surrogates", "[validator]") {
    std::string output;

    REQUIRE(InputValidator::RepairUtf8("plain", output));
    REQUIRE(output == "plain");

    REQUIRE_FALSE(InputValidator::RepairUtf8("\xC0\xAF", output));
    REQUIRE(output == "\xEF\xBF\xBD\xEF\xBF\xBD");

    REQUIRE_FALSE(InputValidator::RepairUtf8("\xED\xA0\x80", output));

    REQUIRE_FALSE(InputValidator::RepairUtf8("abc\xE2\x82", output));
    REQUIRE(output.compare(0, 3, "abc") == 0);
}

SCENARIO("only allowlisted chats are served when an allowlist is configured", "[validator]") {
    ChatGuardConfig config;
    config.allowedChats = {"chat-1", "chat-2"};
    InputValidator validator{config};

    REQUIRE_NOTHROW(validator.Validate(MakeText("hi", "chat-2")));
    REQUIRE(FailureOf(validator, MakeText("hi", "chat-9")) == ValidationFailure::ChatNotAllowed);
}

SCENARIO("media paths are confined to the media root", "[validator]") {
    TemporaryDirectory media;
    media.Write("cat.jpg", "not really a jpeg");

    ChatGuardConfig config;
    config.mediaRoot = media.Path().string();
    config.maxImageBytes = 64;
    InputValidator validator{config};

    auto image = [](const std::string& path) {
        ContentItem item;
        item.modality = Modality::Image;
        item.mediaPath = path;
        item.sourceId = "user-1";
        item.chatId = "chat-1";
        return item;
    };

    WHEN("the path stays inside the root") {
        auto sanitized = validator.Validate(image("cat.jpg"));

        THEN("the media is loaded as the payload") {
            REQUIRE(sanitized.payload == "not really a jpeg");
        }
    }

    WHEN("the path tries to traverse out of the root") {
        THEN("the item is rejected before any file is read") {
            REQUIRE(FailureOf(validator, image("../etc/passwd")) == ValidationFailure::UnsafePath);
            REQUIRE(FailureOf(validator, image("/etc/passwd")) == ValidationFailure::UnsafePath);
            REQUIRE(FailureOf(validator, image("sub\\..\\..\\x")) == ValidationFailure::UnsafePath);
        }
    }

    WHEN("the file does not exist") {
        THEN("the media is reported unavailable") {
            REQUIRE(FailureOf(validator, image("missing.jpg")) == ValidationFailure::MediaUnavailable);
        }
    }

    WHEN("the file exceeds the image limit") {
        media.Write("big.jpg", std::string(65, 'x'));

        THEN("the item is rejected as oversized") {
            REQUIRE(FailureOf(validator, image("big.jpg")) == ValidationFailure::Oversized);
        }
    }

    WHEN("a text item references a file") {
        auto item = image("cat.jpg");
        item.modality = Modality::Text;

        THEN("the item is rejected") {
            REQUIRE(FailureOf(validator, item) == ValidationFailure::UnsafePath);
        }
    }
}

SCENARIO("media captions are limited like text", "[validator]") {
    ChatGuardConfig config;
    config.maxTextBytes = 8;
    InputValidator validator{config};

    ContentItem item;
    item.modality = Modality::Image;
    item.payload = "image bytes";
    item.chatId = "chat-1";

    item.caption = "short";
    REQUIRE(validator.Validate(item).caption == "short");

    item.caption = "a caption that is too long";
    REQUIRE(FailureOf(validator, item) == ValidationFailure::Oversized);
}

SCENARIO("scratch files stay inside the scratch directory", "[validator]") {
    TemporaryDirectory scratch;

    ChatGuardConfig config;
    config.scratchDirectory = scratch.Path().string();
    InputValidator validator{config};

    auto path = validator.ScratchPath("video-1.bin");
    REQUIRE(path.filename() == "video-1.bin");
    REQUIRE(path.parent_path() == fs::absolute(scratch.Path()).lexically_normal());

    REQUIRE_THROWS_AS(validator.ScratchPath("../video-1.bin"), ValidationError);
}
