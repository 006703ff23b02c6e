#pragma once

#include "LandmarkSource.hpp"
#include <string>
#include <vector>

namespace cv {
class FileStorage;
}

namespace posture {

/**
 * Replays a recorded landmark stream in place of a live detector.
 *
 * File format (YAML or JSON, read with cv::FileStorage):
 *
 *   frames:
 *     - { t: 0.0, landmarks: { nose: [x, y, z, visibility], left_shoulder: [...], ... } }
 *
 * `t` is seconds since the start of the recording. Visibility defaults to 1
 * when only x, y, z are given. Landmarks missing from a frame are invisible.
 */
class ReplaySource : public LandmarkSource {
public:
    struct Options {
        bool realtime = true;  // Pace frames by their timestamps
        bool loop = false;     // Restart at the end instead of finishing
    };

    /**
     * @throws ConfigError if the file cannot be opened or is malformed
     */
    static ReplaySource load(const std::string& path, const Options& options);
    static ReplaySource load(const std::string& path) { return load(path, Options{}); }

    /**
     * Same as load() but from in-memory YAML/JSON text.
     */
    static ReplaySource parse(const std::string& content, const Options& options);
    static ReplaySource parse(const std::string& content) { return parse(content, Options{}); }

    std::optional<LandmarkFrame> next() override;
    [[nodiscard]] bool finished() const override;
    [[nodiscard]] std::string describe() const override;

    [[nodiscard]] size_t frameCount() const { return frames_.size(); }
    [[nodiscard]] size_t position() const { return index_; }

private:
    struct Recorded {
        Duration offset{};
        LandmarkFrame frame;
    };

    ReplaySource(std::string origin, std::vector<Recorded> frames, const Options& options);

    static std::vector<Recorded> read(cv::FileStorage& fs, const std::string& origin);

    std::string origin_;
    std::vector<Recorded> frames_;
    Options options_;

    size_t index_ = 0;
    uint64_t sequence_ = 0;
    TimePoint epoch_;
    bool started_ = false;
};

} // namespace posture
