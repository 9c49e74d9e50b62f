#pragma once

#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/filesystem/path.hpp>

namespace scoring {

class EmptyVideoError : public std::runtime_error {
public:
    explicit EmptyVideoError(const std::string& message)
        : std::runtime_error(message) {}
};

// Up to maxFrames indices in [0, totalFrames): the first, the last and
// evenly spaced ones in between. Deterministic for the same input.
std::vector<std::size_t> SelectFrameIndices(std::size_t totalFrames, std::size_t maxFrames);

class IFrameSampler {
public:
    virtual ~IFrameSampler() = default;

    // Returns JPEG-encoded frames. Throws EmptyVideoError when the video has
    // no decodable frames.
    virtual std::vector<std::string> Sample(const std::string& video, std::size_t maxFrames) = 0;
};

class OpenCvFrameSampler : public IFrameSampler {
public:
    // scratchPath maps a generated file name to its confined location.
    using ScratchPathFn = std::function<boost::filesystem::path(const std::string&)>;

    explicit OpenCvFrameSampler(ScratchPathFn scratchPath, int maxDimension = 1024);

    std::vector<std::string> Sample(const std::string& video, std::size_t maxFrames) override;

private:
    ScratchPathFn scratchPath_;
    int maxDimension_;
};

} // namespace scoring
