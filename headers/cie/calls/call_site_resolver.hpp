//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef CIE_CALL_SITE_RESOLVER_HPP
#define CIE_CALL_SITE_RESOLVER_HPP

/**
 * @file call_site_resolver.hpp
 * @brief Detects call expressions and classifies them provisionally.
 *
 * A call is an identifier or path immediately followed by a parenthesized
 * argument list inside a function body (or a call/bl instruction operand
 * in assembly). Classification, first match wins:
 * - recursive:   the callee names the enclosing function and is not a
 *                method called on some receiver other than self or this
 * - system_call: the callee's unqualified name is in the configured table
 * - cross_file:  nothing in this file defines the callee
 * - local:       otherwise
 *
 * These edges are provisional; the global linker decides the final target.
 */

#include "cie/analysis/spans.hpp"
#include "cie/heuristics/config.hpp"
#include "cie/lexer/token_view.hpp"
#include "cie/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace cie::calls {

    /**
     * Last path segment: "a::b::c" -> "c".
     */
    [[nodiscard]] std::string_view simple_name(std::string_view name) noexcept;

    /**
     * Drops generic argument lists: "Stack<T>::new" -> "Stack::new". Used to
     * match a call path against the definition it names.
     */
    [[nodiscard]] std::string strip_generics(std::string_view name);

    class CallSiteResolver {
    public:
        CallSiteResolver(Language language, const heuristics::CallConfig& config);

        [[nodiscard]] std::vector<CallSite> resolve(const lexer::TokenView& tokens,
                                                    const std::vector<FunctionInfo>& functions,
                                                    const analysis::Owners& owners,
                                                    const std::string& file_path) const;

        /**
         * Classifies a call from caller to callee given the functions the
         * file defines.
         */
        [[nodiscard]] CallKind classify(const std::string& callee,
                                        const FunctionInfo& caller,
                                        const std::vector<FunctionInfo>& functions) const;

    private:
        CallKind classify(const std::string& callee,
                          const FunctionInfo& caller,
                          const std::vector<FunctionInfo>& functions,
                          bool foreign_receiver) const;

        Language language_;
        const heuristics::CallConfig& config_;
    };

}  // namespace cie::calls

#endif //CIE_CALL_SITE_RESOLVER_HPP
