//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef CIE_ANALYSIS_KNOWLEDGE_HPP
#define CIE_ANALYSIS_KNOWLEDGE_HPP

/**
 * @file knowledge.hpp
 * @brief Fixed teaching vocabulary attached to recognized constructs.
 */

#include "cie/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cie::analysis {

    struct ExplanationEntry {
        std::string_view explanation;
        ComplexityLevel level;
        std::vector<std::string> related_concepts;
    };

    /**
     * Canned explanation, difficulty and concept list for a category.
     */
    const ExplanationEntry& explanation_for(ExplanationCategory category);

    /**
     * Description of a well-known kernel function, matched on the
     * unqualified name.
     */
    std::optional<std::string> function_description(std::string_view simple_name);

}  // namespace cie::analysis

#endif //CIE_ANALYSIS_KNOWLEDGE_HPP
