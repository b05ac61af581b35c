#pragma once

#include "field/irradiance_field.h"

// Value-to-colour-scale mapping for renderers that draw the field.
// Works only from FieldStats, so the field is never recomputed.

namespace irradiance::display {

enum class NormType {
    TwoSlope,  // diverging scale, vcenter pinned to the middle
    Linear,
    Log,
    Power      // ((v - vmin) / (vmax - vmin))^gamma
};

struct DisplayNorm {
    NormType type = NormType::TwoSlope;
    double vmin = 0.0;
    double vcenter = 1.0;  // only meaningful for TwoSlope
    double vmax = 1.0;
    double gamma = 1.0;    // only meaningful for Power

    /**
     * @brief Position of `value` on the colour scale, clamped to [0, 1].
     *
     * TwoSlope sends vmin -> 0, vcenter -> 0.5, vmax -> 1 with independent
     * slopes on each side. Degenerate ranges map to 0.5 (TwoSlope) or 0.
     */
    double map(double value) const;
};

// Floor applied to vmin for the logarithmic scale.
constexpr double LOG_NORM_FLOOR = 1e-10;

/**
 * @brief Builds the display range for a field.
 *
 * TwoSlope keeps `vcenter` at the middle of the scale: when the data lies
 * entirely below it, vmax becomes 2*vcenter - vmin; when it lies entirely
 * above, vmin becomes 2*vcenter - vmax.
 *
 * @param gamma Exponent for NormType::Power (> 0).
 * @throws std::invalid_argument for a non-positive gamma.
 */
DisplayNorm make_norm(const FieldStats& stats,
                      NormType type = NormType::TwoSlope,
                      double gamma = 0.5,
                      double vcenter = 1.0);

} // namespace irradiance::display
