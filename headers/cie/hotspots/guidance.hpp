//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef CIE_HOTSPOT_GUIDANCE_HPP
#define CIE_HOTSPOT_GUIDANCE_HPP

/**
 * @file guidance.hpp
 * @brief Static learner-facing text for each hotspot type.
 *
 * Descriptions, educational context and optimization guidance are canned
 * per hotspot_type so the same construct always reads the same way.
 */

#include "cie/types.hpp"

#include <string_view>
#include <vector>

namespace cie::hotspots {

    struct HotspotGuidance {
        std::string_view description;
        std::string_view educational_context;
        Severity estimated_impact;

        // Optimization suggestion fields
        std::string_view suggestion_type;
        std::string_view optimization;
        std::string_view implementation_effort;
        std::string_view expected_improvement;
        std::string_view code_example;
        std::string_view educational_explanation;
        std::vector<std::string_view> related_concepts;
    };

    /**
     * Returns the guidance entry for a hotspot type. Every type has one.
     */
    [[nodiscard]] const HotspotGuidance& guidance_for(HotspotType type);

    /**
     * Optimization potential implied by a severity: critical findings have
     * the most to gain.
     */
    [[nodiscard]] constexpr Severity optimization_potential(const Severity severity) noexcept {
        switch (severity) {
            case Severity::Critical: return Severity::High;
            case Severity::High:     return Severity::Medium;
            default:                 return Severity::Low;
        }
    }

}  // namespace cie::hotspots

#endif //CIE_HOTSPOT_GUIDANCE_HPP
