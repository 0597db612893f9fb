//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef CIE_GLOBAL_LINKER_HPP
#define CIE_GLOBAL_LINKER_HPP

/**
 * @file global_linker.hpp
 * @brief Stage 2: merges per-file symbol tables and builds the call graph.
 *
 * Linking runs in two phases over an immutable snapshot of every Stage 1
 * result:
 * - Union: every (file_path, function_name) pair becomes one registry
 *   entry. A repeated key aborts the run with DuplicateSymbol.
 * - Resolution: each provisional call site is bound to a definition,
 *   searching the calling file first, then the other files in path order,
 *   exact names before unqualified ones. Unresolved callees become extern
 *   nodes so every edge endpoint exists.
 *
 * The linker never mutates its input; a failed run publishes nothing.
 */

#include "cie/error.hpp"
#include "cie/heuristics/config.hpp"
#include "cie/result.hpp"
#include "cie/types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace cie::linker {

    /**
     * Immutable snapshot of one batch's Stage 1 results, ordered by path.
     */
    struct LinkContext {
        std::vector<std::shared_ptr<const FileArtifacts>> files;

        /**
         * Builds a context from artifacts in any order.
         */
        static LinkContext from(std::vector<std::shared_ptr<const FileArtifacts>> artifacts);

        [[nodiscard]] const FileArtifacts* find(const std::string& file_path) const;
    };

    /**
     * Position of a function definition inside a LinkContext.
     */
    struct DefinitionRef {
        std::size_t file = 0;
        std::size_t function = 0;

        bool operator==(const DefinitionRef&) const = default;
    };

    /**
     * One call site bound to its final target.
     */
    struct ResolvedCall {
        CallSite site;
        std::string from;
        std::string to;
        std::optional<DefinitionRef> target;
    };

    /**
     * Output of a successful link run.
     */
    struct LinkedProgram {
        CallGraph graph;
        std::vector<ResolvedCall> calls;
        std::unordered_map<std::string, DefinitionRef> definitions;
    };

    /**
     * Stable node id for a defined function.
     */
    [[nodiscard]] std::string function_node_id(const std::string& file_path, const std::string& function_name);

    /**
     * Stable node id for an unresolved callee.
     */
    [[nodiscard]] std::string extern_node_id(const std::string& callee);

    /**
     * Finds the definition a name refers to when seen from from_file,
     * using the linker's lookup order.
     */
    [[nodiscard]] std::optional<DefinitionRef> find_definition(const LinkContext& context,
                                                               const std::string& name,
                                                               const std::string& from_file);

    class GlobalLinker {
    public:
        explicit GlobalLinker(const heuristics::HeuristicsConfig& config);

        /**
         * Runs union and resolution over the snapshot.
         *
         * @return DuplicateSymbol naming the offending key, or ConfigError
         *         for an entry point pattern that does not compile.
         */
        [[nodiscard]] Result<LinkedProgram, Error> link(const LinkContext& context) const;

    private:
        const heuristics::HeuristicsConfig& config_;
    };

}  // namespace cie::linker

#endif //CIE_GLOBAL_LINKER_HPP
