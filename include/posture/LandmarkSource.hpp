#pragma once

#include "Types.hpp"
#include <optional>
#include <string>

namespace posture {

/**
 * Boundary to the external landmark detector.
 */
class LandmarkSource {
public:
    virtual ~LandmarkSource() = default;

    /**
     * Non-blocking. nullopt when no frame is ready yet or the source is finished.
     */
    virtual std::optional<LandmarkFrame> next() = 0;

    [[nodiscard]] virtual bool finished() const = 0;
    [[nodiscard]] virtual std::string describe() const = 0;
};

} // namespace posture
