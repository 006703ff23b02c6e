#include "posture/AppConfig.hpp"
#include "posture/Errors.hpp"

#include <opencv2/core.hpp>
#include <algorithm>
#include <cctype>
#include <optional>

namespace posture {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::optional<bool> parseBool(const std::string& text) {
    const std::string s = lower(text);
    if (s == "true" || s == "yes" || s == "on") return true;
    if (s == "false" || s == "no" || s == "off") return false;
    return std::nullopt;
}

class Reader {
public:
    explicit Reader(std::string origin) : origin_(std::move(origin)) {}

    std::string str(const cv::FileNode& node, const char* key, const std::string& fallback) const {
        cv::FileNode value = node[key];
        if (value.empty() || value.isNone()) return fallback;
        if (value.isString()) return static_cast<std::string>(value);
        if (value.isInt()) return std::to_string(static_cast<int>(value));
        throw ConfigError(origin_ + ": '" + key + "' must be a string");
    }

    double number(const cv::FileNode& node, const char* key, double fallback) const {
        cv::FileNode value = node[key];
        if (value.empty() || value.isNone()) return fallback;
        if (value.isInt() || value.isReal()) return static_cast<double>(value);
        throw ConfigError(origin_ + ": '" + key + "' must be a number");
    }

    size_t count(const cv::FileNode& node, const char* key, size_t fallback) const {
        cv::FileNode value = node[key];
        if (value.empty() || value.isNone()) return fallback;
        if (value.isInt() && static_cast<int>(value) >= 0) return static_cast<size_t>(static_cast<int>(value));
        throw ConfigError(origin_ + ": '" + key + "' must be a non-negative integer");
    }

    bool flag(const cv::FileNode& node, const char* key, bool fallback) const {
        cv::FileNode value = node[key];
        if (value.empty() || value.isNone()) return fallback;
        if (value.isInt()) return static_cast<int>(value) != 0;
        if (value.isString()) {
            if (auto b = parseBool(static_cast<std::string>(value))) return *b;
        }
        throw ConfigError(origin_ + ": '" + key + "' must be true or false");
    }

    /**
     * Nested override maps become dotted keys: overrides.metric.slouch.threshold
     * → "metric.slouch.threshold". Type checking is left to PresetResolver.
     */
    void flatten(const cv::FileNode& node, const std::string& prefix, Overrides& out) const {
        if (node.isMap()) {
            for (auto it = node.begin(); it != node.end(); ++it) {
                cv::FileNode child = *it;
                flatten(child, prefix.empty() ? child.name() : prefix + "." + child.name(), out);
            }
            return;
        }

        const bool isEnabledKey = prefix.size() >= 8 && prefix.compare(prefix.size() - 8, 8, ".enabled") == 0;

        if (node.isInt() || node.isReal()) {
            const double value = static_cast<double>(node);
            if (isEnabledKey) {
                out[prefix] = value != 0.0;
            } else {
                out[prefix] = value;
            }
            return;
        }
        if (node.isString()) {
            const std::string text = static_cast<std::string>(node);
            if (auto b = parseBool(text)) {
                out[prefix] = *b;
            } else {
                out[prefix] = text;
            }
            return;
        }
        throw ConfigError(origin_ + ": override '" + prefix + "' must be a scalar");
    }

private:
    std::string origin_;
};

} // namespace

AppConfig AppConfig::read(const cv::FileNode& root, const std::string& origin) {
    Reader r(origin);
    AppConfig config;

    const std::string level = r.str(root, "log_level", "info");
    auto logLevel = parseLogLevel(level);
    if (!logLevel) {
        throw ConfigError(origin + ": unknown log_level '" + level + "'");
    }
    config.logLevel = *logLevel;

    config.presets.metricPreset = r.str(root, "metric_preset", config.presets.metricPreset);
    config.presets.performancePreset = r.str(root, "performance_preset", config.presets.performancePreset);

    cv::FileNode overrides = root["overrides"];
    if (!overrides.empty() && !overrides.isNone()) {
        if (!overrides.isMap()) {
            throw ConfigError(origin + ": 'overrides' must be a map");
        }
        r.flatten(overrides, "", config.overrides);
    }

    cv::FileNode calibration = root["calibration"];
    if (calibration.isMap()) {
        config.calibrationDurationS = r.number(calibration, "duration_s", config.calibrationDurationS);
        Calibrator::Options& opts = config.calibration;
        opts.minSamples = r.count(calibration, "min_samples", opts.minSamples);
        opts.minDurationS = r.number(calibration, "min_duration_s", opts.minDurationS);
        opts.acceptQuality = r.number(calibration, "accept_quality", opts.acceptQuality);
        opts.maxSpread = r.number(calibration, "max_spread", opts.maxSpread);
        opts.minVisibility = static_cast<float>(r.number(calibration, "min_visibility", opts.minVisibility));
    }
    if (config.calibrationDurationS < config.calibration.minDurationS) {
        throw ConfigError(origin + ": calibration.duration_s is shorter than min_duration_s");
    }

    cv::FileNode osc = root["osc"];
    if (osc.isMap()) {
        config.oscHost = r.str(osc, "host", config.oscHost);
        config.oscPort = r.str(osc, "port", config.oscPort);
        config.notifyBackToNormal = r.flag(osc, "back_to_normal", config.notifyBackToNormal);
    }

    cv::FileNode replay = root["replay"];
    if (replay.isMap()) {
        config.replayPath = r.str(replay, "path", config.replayPath);
        config.replayRealtime = r.flag(replay, "realtime", config.replayRealtime);
        config.replayLoop = r.flag(replay, "loop", config.replayLoop);
    }

    return config;
}

AppConfig AppConfig::load(const std::string& path) {
    cv::FileStorage fs;
    try {
        fs.open(path, cv::FileStorage::READ);
    } catch (const cv::Exception& e) {
        throw ConfigError("Cannot parse config " + path + ": " + e.what());
    }
    if (!fs.isOpened()) {
        throw ConfigError("Cannot open config " + path);
    }
    return read(fs.root(), path);
}

AppConfig AppConfig::parse(const std::string& content) {
    cv::FileStorage fs;
    try {
        fs.open(content, cv::FileStorage::READ | cv::FileStorage::MEMORY);
    } catch (const cv::Exception& e) {
        throw ConfigError(std::string("Cannot parse config: ") + e.what());
    }
    if (!fs.isOpened()) {
        throw ConfigError("Cannot parse config");
    }
    return read(fs.root(), "<memory>");
}

} // namespace posture
