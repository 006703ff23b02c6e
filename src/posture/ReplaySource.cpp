#include "posture/ReplaySource.hpp"
#include "posture/Errors.hpp"
#include "posture/Logger.hpp"

#include <opencv2/core.hpp>
#include <chrono>

namespace posture {

namespace {

Landmark readLandmark(const cv::FileNode& node, const std::string& where) {
    if (!node.isSeq() || node.size() < 3) {
        throw ConfigError(where + ": expected [x, y, z] or [x, y, z, visibility]");
    }
    Landmark lm;
    lm.x = static_cast<float>(node[0]);
    lm.y = static_cast<float>(node[1]);
    lm.z = static_cast<float>(node[2]);
    lm.visibility = node.size() >= 4 ? static_cast<float>(node[3]) : 1.0f;
    return lm;
}

} // namespace

ReplaySource::ReplaySource(std::string origin, std::vector<Recorded> frames, const Options& options)
    : origin_(std::move(origin)), frames_(std::move(frames)), options_(options) {
}

std::vector<ReplaySource::Recorded> ReplaySource::read(cv::FileStorage& fs, const std::string& origin) {
    cv::FileNode framesNode = fs["frames"];
    if (!framesNode.isSeq()) {
        throw ConfigError(origin + ": missing 'frames' sequence");
    }

    std::vector<Recorded> frames;
    frames.reserve(framesNode.size());

    int unknownNames = 0;
    double lastT = 0.0;
    for (size_t i = 0; i < framesNode.size(); ++i) {
        cv::FileNode node = framesNode[static_cast<int>(i)];
        const std::string where = origin + " frame " + std::to_string(i);

        if (!node.isMap() || node["t"].empty()) {
            throw ConfigError(where + ": expected a map with 't'");
        }
        const double t = static_cast<double>(node["t"]);
        if (t < lastT) {
            throw ConfigError(where + ": timestamps must not decrease");
        }
        lastT = t;

        Recorded recorded;
        recorded.offset = std::chrono::round<Duration>(std::chrono::duration<double>(t));

        cv::FileNode landmarks = node["landmarks"];
        if (landmarks.isMap()) {
            for (auto it = landmarks.begin(); it != landmarks.end(); ++it) {
                cv::FileNode entry = *it;
                auto id = landmarkFromName(entry.name());
                if (!id) {
                    // Full pose recordings carry more landmarks than we use
                    unknownNames++;
                    continue;
                }
                recorded.frame.at(*id) = readLandmark(entry, where + " '" + entry.name() + "'");
            }
        }

        frames.push_back(recorded);
    }

    if (unknownNames > 0) {
        Logger::debug("ReplaySource: Ignored ", unknownNames, " unused landmark entries");
    }
    return frames;
}

ReplaySource ReplaySource::load(const std::string& path, const Options& options) {
    cv::FileStorage fs;
    try {
        fs.open(path, cv::FileStorage::READ);
    } catch (const cv::Exception& e) {
        throw ConfigError("Cannot parse replay file " + path + ": " + e.what());
    }
    if (!fs.isOpened()) {
        throw ConfigError("Cannot open replay file " + path);
    }

    auto frames = read(fs, path);
    Logger::info("ReplaySource: Loaded ", frames.size(), " frames from ", path);
    return ReplaySource(path, std::move(frames), options);
}

ReplaySource ReplaySource::parse(const std::string& content, const Options& options) {
    cv::FileStorage fs;
    try {
        fs.open(content, cv::FileStorage::READ | cv::FileStorage::MEMORY);
    } catch (const cv::Exception& e) {
        throw ConfigError(std::string("Cannot parse replay data: ") + e.what());
    }
    if (!fs.isOpened()) {
        throw ConfigError("Cannot parse replay data");
    }
    return ReplaySource("<memory>", read(fs, "<memory>"), options);
}

std::optional<LandmarkFrame> ReplaySource::next() {
    if (frames_.empty()) return std::nullopt;

    const TimePoint now = Clock::now();
    if (!started_) {
        epoch_ = now;
        started_ = true;
    }

    if (index_ >= frames_.size()) {
        if (!options_.loop) return std::nullopt;
        // Next pass starts one frame interval after the last recorded frame
        const Duration gap = frames_.size() > 1 ? frames_[1].offset - frames_[0].offset : Duration::zero();
        epoch_ += frames_.back().offset + gap;
        index_ = 0;
    }

    const Recorded& recorded = frames_[index_];
    const TimePoint due = epoch_ + recorded.offset;
    if (options_.realtime && now < due) {
        return std::nullopt;
    }

    LandmarkFrame frame = recorded.frame;
    frame.timestamp = due;
    frame.sequenceNum = sequence_++;
    index_++;
    return frame;
}

bool ReplaySource::finished() const {
    return !options_.loop && index_ >= frames_.size();
}

std::string ReplaySource::describe() const {
    return "replay:" + origin_ + " (" + std::to_string(frames_.size()) + " frames)";
}

} // namespace posture
