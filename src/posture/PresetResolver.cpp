#include "posture/PresetResolver.hpp"
#include "posture/Errors.hpp"
#include "posture/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

namespace posture {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

const char* typeName(const OverrideValue& value) {
    if (std::holds_alternative<bool>(value)) return "bool";
    if (std::holds_alternative<double>(value)) return "number";
    return "string";
}

bool asBool(const std::string& key, const OverrideValue& value) {
    if (auto b = std::get_if<bool>(&value)) return *b;
    throw InvalidPresetError("Override '" + key + "' expects bool, got " + typeName(value));
}

double asNumber(const std::string& key, const OverrideValue& value) {
    if (auto d = std::get_if<double>(&value)) return *d;
    throw InvalidPresetError("Override '" + key + "' expects number, got " + typeName(value));
}

int asInt(const std::string& key, const OverrideValue& value) {
    double d = asNumber(key, value);
    if (!std::isfinite(d) || std::floor(d) != d ||
        d < static_cast<double>(std::numeric_limits<int>::min()) ||
        d > static_cast<double>(std::numeric_limits<int>::max())) {
        throw InvalidPresetError("Override '" + key + "' expects an integer, got " + std::to_string(d));
    }
    return static_cast<int>(d);
}

std::string asString(const std::string& key, const OverrideValue& value) {
    if (auto s = std::get_if<std::string>(&value)) return *s;
    throw InvalidPresetError("Override '" + key + "' expects string, got " + typeName(value));
}

// Threshold table rows: slouch, uneven_shoulders, head_tilt, forward_neck, rounded_shoulders, lateral_lean
constexpr std::array<ViolationDirection, kMetricCount> DIRECTIONS = {
    ViolationDirection::Above,
    ViolationDirection::Above,
    ViolationDirection::Magnitude,
    ViolationDirection::Above,
    ViolationDirection::Above,
    ViolationDirection::Magnitude
};

constexpr std::array<double, kMetricCount> DEFAULT_THRESHOLDS   = {0.15, 0.10, 0.20, 0.20, 0.20, 0.15};
constexpr std::array<double, kMetricCount> SENSITIVE_THRESHOLDS = {0.10, 0.07, 0.10, 0.15, 0.15, 0.10};
constexpr std::array<double, kMetricCount> RELAXED_THRESHOLDS   = {0.20, 0.14, 0.30, 0.30, 0.30, 0.20};

MetricConfigs makeMetricPreset(const std::array<double, kMetricCount>& thresholds) {
    MetricConfigs preset{};
    for (size_t i = 0; i < kMetricCount; ++i) {
        preset[i].enabled = true;
        preset[i].threshold = thresholds[i];
        preset[i].direction = DIRECTIONS[i];
    }
    return preset;
}

PerformanceConfig makePerformancePreset(double fps, int complexity, int landmarks,
                                        int history, double outlierStd, int smoothing) {
    PerformanceConfig preset;
    preset.targetFps = fps;
    preset.displayFps = fps;
    preset.modelComplexity = complexity;
    preset.landmarkCount = landmarks;
    preset.historySize = history;
    preset.outlierStdDeviations = outlierStd;
    preset.smoothingWindow = smoothing;
    return preset;
}

const std::array<const char*, 3> BUILTIN_METRIC_PRESETS = {"Default", "Sensitive", "Relaxed"};
const std::array<const char*, 3> BUILTIN_PERFORMANCE_PRESETS = {"Low", "Medium", "High"};

} // namespace

PresetResolver::PresetResolver() {
    for (const char* name : BUILTIN_METRIC_PRESETS) {
        metricPresets_[toLower(name)] = {name, builtinMetricPreset(name)};
    }
    for (const char* name : BUILTIN_PERFORMANCE_PRESETS) {
        performancePresets_[toLower(name)] = {name, builtinPerformancePreset(name)};
    }
}

MetricConfigs PresetResolver::builtinMetricPreset(const std::string& name) {
    const std::string key = toLower(name);
    if (key == "default") return makeMetricPreset(DEFAULT_THRESHOLDS);
    if (key == "sensitive") return makeMetricPreset(SENSITIVE_THRESHOLDS);
    if (key == "relaxed") return makeMetricPreset(RELAXED_THRESHOLDS);
    throw InvalidPresetError("Unknown built-in metric preset '" + name + "'");
}

PerformanceConfig PresetResolver::builtinPerformancePreset(const std::string& name) {
    const std::string key = toLower(name);
    //                                   fps  cx  lm  hist  sigma smooth
    if (key == "low")    return makePerformancePreset(5.0,  0, 5,  10, 2.5, 3);
    if (key == "medium") return makePerformancePreset(15.0, 1, 20, 20, 3.0, 4);
    if (key == "high")   return makePerformancePreset(30.0, 2, 40, 30, 3.0, 6);
    throw InvalidPresetError("Unknown built-in performance preset '" + name + "'");
}

bool PresetResolver::isBuiltinMetricPreset(const std::string& name) {
    const std::string key = toLower(name);
    return std::any_of(BUILTIN_METRIC_PRESETS.begin(), BUILTIN_METRIC_PRESETS.end(),
                       [&](const char* n) { return key == toLower(n); });
}

bool PresetResolver::isBuiltinPerformancePreset(const std::string& name) {
    const std::string key = toLower(name);
    return std::any_of(BUILTIN_PERFORMANCE_PRESETS.begin(), BUILTIN_PERFORMANCE_PRESETS.end(),
                       [&](const char* n) { return key == toLower(n); });
}

EffectiveConfig PresetResolver::resolve(const PresetSelection& selection, const Overrides& overrides) const {
    auto metricIt = metricPresets_.find(toLower(selection.metricPreset));
    if (metricIt == metricPresets_.end()) {
        throw InvalidPresetError("Unknown metric preset '" + selection.metricPreset + "'");
    }
    auto perfIt = performancePresets_.find(toLower(selection.performancePreset));
    if (perfIt == performancePresets_.end()) {
        throw InvalidPresetError("Unknown performance preset '" + selection.performancePreset + "'");
    }

    EffectiveConfig config;
    config.metricPreset = metricIt->second.name;
    config.performancePreset = perfIt->second.name;
    config.metrics = metricIt->second.preset;
    config.performance = perfIt->second.preset;
    config.alerts = AlertConfig{};

    for (const auto& [key, value] : overrides) {
        applyOverride(config, key, value);
    }

    validate(config);
    return config;
}

void PresetResolver::applyOverride(EffectiveConfig& config, const std::string& key, const OverrideValue& value) {
    const std::string path = toLower(key);
    const auto firstDot = path.find('.');
    if (firstDot == std::string::npos) {
        throw InvalidPresetError("Override key '" + key + "' has no section");
    }
    const std::string section = path.substr(0, firstDot);
    const std::string rest = path.substr(firstDot + 1);

    if (section == "metric") {
        const auto dot = rest.find('.');
        if (dot == std::string::npos) {
            throw InvalidPresetError("Override key '" + key + "' has no metric field");
        }
        auto metric = metricFromName(rest.substr(0, dot));
        if (!metric) {
            throw InvalidPresetError("Override '" + key + "' references unknown metric '" + rest.substr(0, dot) + "'");
        }
        const std::string field = rest.substr(dot + 1);
        MetricConfig& target = config.metric(*metric);

        if (field == "enabled") {
            target.enabled = asBool(key, value);
        } else if (field == "threshold") {
            target.threshold = asNumber(key, value);
        } else if (field == "direction") {
            auto direction = directionFromName(asString(key, value));
            if (!direction) {
                throw InvalidPresetError("Override '" + key + "' has unknown direction '" + asString(key, value) + "'");
            }
            target.direction = *direction;
        } else {
            throw InvalidPresetError("Override '" + key + "' references unknown metric field '" + field + "'");
        }
        return;
    }

    if (section == "performance") {
        PerformanceConfig& perf = config.performance;
        if (rest == "target_fps") perf.targetFps = asNumber(key, value);
        else if (rest == "display_fps") perf.displayFps = asNumber(key, value);
        else if (rest == "model_complexity") perf.modelComplexity = asInt(key, value);
        else if (rest == "landmark_count") perf.landmarkCount = asInt(key, value);
        else if (rest == "history_size") perf.historySize = asInt(key, value);
        else if (rest == "outlier_std_deviations") perf.outlierStdDeviations = asNumber(key, value);
        else if (rest == "smoothing_window") perf.smoothingWindow = asInt(key, value);
        else throw InvalidPresetError("Override '" + key + "' references unknown performance field '" + rest + "'");
        return;
    }

    if (section == "alert") {
        AlertConfig& alerts = config.alerts;
        if (rest == "min_duration_s") alerts.minDurationS = asNumber(key, value);
        else if (rest == "cooldown_s") alerts.cooldownS = asNumber(key, value);
        else if (rest == "recovery_s") alerts.recoveryS = asNumber(key, value);
        else throw InvalidPresetError("Override '" + key + "' references unknown alert field '" + rest + "'");
        return;
    }

    throw InvalidPresetError("Override '" + key + "' has unknown section '" + section + "'");
}

void PresetResolver::validate(const EffectiveConfig& config) {
    const PerformanceConfig& perf = config.performance;
    if (!(perf.targetFps > 0.0)) {
        throw InvalidPresetError("target_fps must be positive");
    }
    if (!(perf.displayFps > 0.0)) {
        throw InvalidPresetError("display_fps must be positive");
    }
    if (perf.modelComplexity < 0 || perf.modelComplexity > 2) {
        throw InvalidPresetError("model_complexity must be 0, 1 or 2");
    }
    if (perf.landmarkCount < 1) {
        throw InvalidPresetError("landmark_count must be at least 1");
    }
    if (perf.historySize < 1) {
        throw InvalidPresetError("history_size must be at least 1");
    }
    if (perf.outlierStdDeviations < 0.0) {
        throw InvalidPresetError("outlier_std_deviations must not be negative");
    }
    if (perf.smoothingWindow < 1) {
        throw InvalidPresetError("smoothing_window must be at least 1");
    }

    const AlertConfig& alerts = config.alerts;
    if (alerts.minDurationS < 0.0 || alerts.cooldownS < 0.0 || alerts.recoveryS < 0.0) {
        throw InvalidPresetError("alert timings must not be negative");
    }

    for (MetricId id : kAllMetrics) {
        const MetricConfig& m = config.metric(id);
        if (!std::isfinite(m.threshold)) {
            throw InvalidPresetError(std::string("threshold of '") + metricName(id) + "' is not finite");
        }
        if (m.direction == ViolationDirection::Magnitude && m.threshold < 0.0) {
            throw InvalidPresetError(std::string("magnitude threshold of '") + metricName(id) + "' must not be negative");
        }
    }
}

void PresetResolver::addMetricPreset(const std::string& name, const MetricConfigs& preset) {
    if (name.empty()) {
        throw InvalidPresetError("Preset name must not be empty");
    }
    if (isBuiltinMetricPreset(name)) {
        throw InvalidPresetError("Cannot replace built-in metric preset '" + name + "'");
    }
    EffectiveConfig candidate;
    candidate.metrics = preset;
    validate(candidate);

    metricPresets_[toLower(name)] = {name, preset};
    Logger::info("PresetResolver: Registered metric preset '", name, "'");
}

void PresetResolver::addPerformancePreset(const std::string& name, const PerformanceConfig& preset) {
    if (name.empty()) {
        throw InvalidPresetError("Preset name must not be empty");
    }
    if (isBuiltinPerformancePreset(name)) {
        throw InvalidPresetError("Cannot replace built-in performance preset '" + name + "'");
    }
    // Validate eagerly so a broken preset never becomes resolvable
    EffectiveConfig candidate;
    candidate.metrics = builtinMetricPreset("Default");
    candidate.performance = preset;
    validate(candidate);

    performancePresets_[toLower(name)] = {name, preset};
    Logger::info("PresetResolver: Registered performance preset '", name, "'");
}

bool PresetResolver::removeMetricPreset(const std::string& name) {
    if (isBuiltinMetricPreset(name)) return false;
    return metricPresets_.erase(toLower(name)) > 0;
}

bool PresetResolver::removePerformancePreset(const std::string& name) {
    if (isBuiltinPerformancePreset(name)) return false;
    return performancePresets_.erase(toLower(name)) > 0;
}

std::vector<std::string> PresetResolver::metricPresetNames() const {
    std::vector<std::string> names;
    names.reserve(metricPresets_.size());
    for (const auto& [key, entry] : metricPresets_) {
        names.push_back(entry.name);
    }
    return names;
}

std::vector<std::string> PresetResolver::performancePresetNames() const {
    std::vector<std::string> names;
    names.reserve(performancePresets_.size());
    for (const auto& [key, entry] : performancePresets_) {
        names.push_back(entry.name);
    }
    return names;
}

} // namespace posture
