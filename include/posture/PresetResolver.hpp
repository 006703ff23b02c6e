#pragma once

#include "Config.hpp"
#include <map>
#include <string>
#include <vector>

namespace posture {

/**
 * Merges named presets and field-level overrides into an EffectiveConfig.
 *
 * Built-in metric presets: Default, Sensitive, Relaxed.
 * Built-in performance presets: Low, Medium, High.
 * Custom presets can be registered next to the built-ins; built-ins cannot be
 * replaced or removed. Name lookup is case-insensitive.
 *
 * resolve() is pure: it never mutates the resolver and never partially applies
 * overrides. Publishing the result is the caller's job.
 */
class PresetResolver {
public:
    PresetResolver();

    /**
     * @throws InvalidPresetError on unknown preset names, unknown override keys,
     *         wrong value types or out-of-range values
     */
    [[nodiscard]] EffectiveConfig resolve(const PresetSelection& selection,
                                          const Overrides& overrides = {}) const;

    void addMetricPreset(const std::string& name, const MetricConfigs& preset);
    void addPerformancePreset(const std::string& name, const PerformanceConfig& preset);

    /**
     * @return false for built-in or unknown presets
     */
    bool removeMetricPreset(const std::string& name);
    bool removePerformancePreset(const std::string& name);

    [[nodiscard]] std::vector<std::string> metricPresetNames() const;
    [[nodiscard]] std::vector<std::string> performancePresetNames() const;

    [[nodiscard]] static bool isBuiltinMetricPreset(const std::string& name);
    [[nodiscard]] static bool isBuiltinPerformancePreset(const std::string& name);

    [[nodiscard]] static MetricConfigs builtinMetricPreset(const std::string& name);
    [[nodiscard]] static PerformanceConfig builtinPerformancePreset(const std::string& name);

private:
    // Keyed by lower-case name; value keeps the display name
    template<typename T>
    struct Entry {
        std::string name;
        T preset;
    };

    std::map<std::string, Entry<MetricConfigs>> metricPresets_;
    std::map<std::string, Entry<PerformanceConfig>> performancePresets_;

    static void applyOverride(EffectiveConfig& config, const std::string& key, const OverrideValue& value);
    static void validate(const EffectiveConfig& config);
};

} // namespace posture
