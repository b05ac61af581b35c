#include "solver_config.h"
#include "errors.h"
#include <algorithm>
#include <string>
#include <type_traits>

namespace irradiance {

int resolve_samples_per_axis(const SourceSampling& sampling, int receiver_accuracy) {
    return std::visit([receiver_accuracy](const auto& s) -> int {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, MatchReceiver>) {
            return receiver_accuracy;
        } else if constexpr (std::is_same_v<T, AdaptiveSampling>) {
            if (s.divisor < 1 || s.min_per_axis < 1 || s.min_per_axis > s.max_per_axis) {
                throw InvalidGrid("Adaptive sampling needs divisor >= 1 and 1 <= min <= max, got divisor=" +
                                  std::to_string(s.divisor) + " min=" + std::to_string(s.min_per_axis) +
                                  " max=" + std::to_string(s.max_per_axis));
            }
            return std::clamp(receiver_accuracy / s.divisor, s.min_per_axis, s.max_per_axis);
        } else {
            if (s.per_axis < 1) {
                throw InvalidGrid("Fixed source sampling needs at least 1 point per axis, got " +
                                  std::to_string(s.per_axis));
            }
            return s.per_axis;
        }
    }, sampling);
}

} // namespace irradiance
