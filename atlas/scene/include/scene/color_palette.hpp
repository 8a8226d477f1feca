// Centralized color palette for the globe and the scatter chart
// Edit these colors to customize the appearance of the visualization
//
// All colors are RGBA in range [0.0, 1.0]

#pragma once

#include <math/types.hpp>
#include <stats/quintile_classifier.hpp>

namespace atlas::scene::colors {

// =============================================================================
// QUINTILE RAMP (bin 0 = lowest ... bin 4 = highest)
// =============================================================================

constexpr math::vec4 QUINTILE_LOWEST  = {0.0f, 0.0f, 1.0f, 1.0f};   // Blue
constexpr math::vec4 QUINTILE_LOW     = {0.0f, 1.0f, 1.0f, 1.0f};   // Cyan
constexpr math::vec4 QUINTILE_MEDIUM  = {1.0f, 1.0f, 1.0f, 1.0f};   // White
constexpr math::vec4 QUINTILE_HIGH    = {1.0f, 0.58f, 0.0f, 1.0f};  // Orange
constexpr math::vec4 QUINTILE_HIGHEST = {1.0f, 0.0f, 0.0f, 1.0f};   // Red

// =============================================================================
// HELPER: map a bin to its ramp color (out-of-range bins use the middle color)
// =============================================================================

inline math::vec4 quintile_color(int bin) {
    switch (bin) {
        case 0: return QUINTILE_LOWEST;
        case 1: return QUINTILE_LOW;
        case 2: return QUINTILE_MEDIUM;
        case 3: return QUINTILE_HIGH;
        case 4: return QUINTILE_HIGHEST;
        default: return QUINTILE_MEDIUM;
    }
}

} // namespace atlas::scene::colors
