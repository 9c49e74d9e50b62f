#pragma once

#include <string>

enum class Modality {
    Text,
    Image,
    Video,
};

inline const char* ToString(Modality modality) {
    switch (modality) {
    case Modality::Text:
        return "text";
    case Modality::Image:
        return "image";
    case Modality::Video:
        return "video";
    }

    return "text";
}

// One inbound message or media attachment. The payload is raw bytes for
// media and UTF-8 for text. When mediaPath is set the payload is loaded
// from the media root after the path has been confined. Media may carry a
// caption, which is scored as text in the same request.
struct ContentItem {
    Modality modality = Modality::Text;
    std::string payload;
    std::string mediaPath;
    std::string caption;
    std::string sourceId;
    std::string chatId;
    std::string contentHash;
};
