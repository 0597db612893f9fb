//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef CIE_HOTSPOT_CLASSIFIER_HPP
#define CIE_HOTSPOT_CLASSIFIER_HPP

/**
 * @file hotspot_classifier.hpp
 * @brief Stage 2: rule-table driven performance hotspot detection.
 *
 * Rules look at three kinds of evidence inside function bodies:
 * - resolved call sites (system-call-like, allocation, locking, I/O and
 *   math callees)
 * - construct tokens (loops, new/delete, lock types, pointer chasing,
 *   assembly mnemonics)
 * - the function's complexity band
 *
 * Loop nesting escalates loop and locking findings by one severity level.
 * All rules that match are reported; only an exact repeat of
 * (type, file, line, column) is suppressed.
 */

#include "cie/heuristics/config.hpp"
#include "cie/linker/global_linker.hpp"
#include "cie/types.hpp"

#include <vector>

namespace cie::hotspots {

    /**
     * Orders hotspots by severity, most severe first. Ties keep a total
     * order by file, line, column and type so the result is reproducible.
     */
    void sort_hotspots(std::vector<PerformanceHotspot>& hotspots);

    /**
     * Derives one optimization suggestion per hotspot from the guidance
     * table.
     */
    [[nodiscard]] std::vector<OptimizationSuggestion> optimization_suggestions(
        const std::vector<PerformanceHotspot>& hotspots);

    class HotspotClassifier {
    public:
        explicit HotspotClassifier(const heuristics::HeuristicsConfig& config);

        /**
         * Classifies every file of the corpus and returns the sorted list.
         */
        [[nodiscard]] std::vector<PerformanceHotspot> classify(const linker::LinkContext& context,
                                                               const linker::LinkedProgram& program) const;

        /**
         * Classifies one file given the resolved calls made from it.
         * The result is deduplicated but not sorted.
         */
        [[nodiscard]] std::vector<PerformanceHotspot> classify_file(
            const FileArtifacts& file,
            const std::vector<const linker::ResolvedCall*>& calls) const;

    private:
        const heuristics::HeuristicsConfig& config_;
    };

}  // namespace cie::hotspots

#endif //CIE_HOTSPOT_CLASSIFIER_HPP
