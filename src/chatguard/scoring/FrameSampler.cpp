#include "scoring/FrameSampler.hpp"

#include "Digest.hpp"

#include "easylogging++.h"

#include <boost/filesystem/operations.hpp>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/videoio.hpp>

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <fstream>

namespace fs = boost::filesystem;

namespace scoring {

namespace {
std::atomic<uint64_t> scratchCounter{0};

// Removes the scratch copy of a video when sampling finishes or fails.
class ScratchFile {
public:
    explicit ScratchFile(fs::path path)
        : path_{std::move(path)} {}

    ~ScratchFile() {
        boost::system::error_code ec;
        fs::remove(path_, ec);
        if (ec) {
            LOG(WARNING) << "could not remove scratch file " << path_.string() << ": " << ec.message();
        }
    }

    const fs::path& Path() const { return path_; }

private:
    fs::path path_;
};
} // namespace

std::vector<std::size_t> SelectFrameIndices(std::size_t totalFrames, std::size_t maxFrames) {
    std::vector<std::size_t> indices;
    if (totalFrames == 0 || maxFrames == 0) {
        return indices;
    }

    const auto count = std::min(totalFrames, maxFrames);
    if (count == 1) {
        indices.push_back(0);
        return indices;
    }

    for (std::size_t i = 0; i < count; ++i) {
        const auto index = i * (totalFrames - 1) / (count - 1);
        if (indices.empty() || indices.back() != index) {
            indices.push_back(index);
        }
    }

    return indices;
}

namespace {
std::vector<std::string> DecodeFrames(const fs::path& path, std::size_t maxFrames, int maxDimension) {
    cv::VideoCapture capture(path.string());
    if (!capture.isOpened()) {
        throw EmptyVideoError("video could not be opened");
    }

    const auto frameCount = capture.get(cv::CAP_PROP_FRAME_COUNT);
    if (!(frameCount >= 1.0)) {
        throw EmptyVideoError("video has no frames");
    }

    std::vector<std::string> frames;
    for (auto index : SelectFrameIndices(static_cast<std::size_t>(frameCount), maxFrames)) {
        capture.set(cv::CAP_PROP_POS_FRAMES, static_cast<double>(index));

        cv::Mat frame;
        if (!capture.read(frame) || frame.empty()) {
            LOG(DEBUG) << "frame " << index << " could not be decoded";
            continue;
        }

        const auto longest = std::max(frame.cols, frame.rows);
        if (longest > maxDimension) {
            const double scale = static_cast<double>(maxDimension) / longest;
            cv::Mat resized;
            cv::resize(frame, resized, cv::Size(), scale, scale, cv::INTER_AREA);
            frame = resized;
        }

        std::vector<uchar> encoded;
        if (!cv::imencode(".jpg", frame, encoded)) {
            LOG(DEBUG) << "frame " << index << " could not be encoded";
            continue;
        }
        frames.emplace_back(encoded.begin(), encoded.end());
    }

    return frames;
}
} // namespace

OpenCvFrameSampler::OpenCvFrameSampler(ScratchPathFn scratchPath, int maxDimension)
    : scratchPath_{std::move(scratchPath)}
    , maxDimension_{maxDimension} {}

std::vector<std::string> OpenCvFrameSampler::Sample(const std::string& video, std::size_t maxFrames) {
    if (video.empty()) {
        throw EmptyVideoError("video payload is empty");
    }

    const auto fileName = "video-" + Sha256Hex(video).substr(0, 16) + "-" + std::to_string(++scratchCounter) + ".bin";
    ScratchFile scratch{scratchPath_(fileName)};

    if (scratch.Path().has_parent_path()) {
        fs::create_directories(scratch.Path().parent_path());
    }

    {
        std::ofstream out{scratch.Path().string().c_str(), std::ios::binary | std::ios::trunc};
        if (!out.write(video.data(), static_cast<std::streamsize>(video.size()))) {
            throw std::runtime_error("cannot write scratch file " + scratch.Path().string());
        }
    }

    // OpenCV reports corrupt input by throwing cv::Exception.
    std::vector<std::string> frames;
    try {
        frames = DecodeFrames(scratch.Path(), maxFrames, maxDimension_);
    } catch (const cv::Exception& e) {
        throw EmptyVideoError(std::string{"video could not be decoded: "} + e.what());
    }

    if (frames.empty()) {
        throw EmptyVideoError("no frame could be decoded");
    }

    return frames;
}

} // namespace scoring
