//
// Created by gregorian-rayne on 10/18/26.
//

#include "cie/types.hpp"
#include "cie/utils/string_utils.hpp"

#include <algorithm>
#include <unordered_map>

namespace cie {

    std::optional<Language> language_from_string(const std::string_view name) {
        static const std::unordered_map<std::string, Language> names = {
            {"rust", Language::Rust},
            {"c", Language::C},
            {"cpp", Language::Cpp},
            {"c++", Language::Cpp},
            {"assembly", Language::Assembly},
            {"asm", Language::Assembly},
            {"auto", Language::Unknown},
            {"unknown", Language::Unknown}
        };

        if (const auto it = names.find(string_utils::to_lower(name)); it != names.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    Language language_from_path(const fs::path& path) {
        const std::string ext = path.extension().string();

        // ".S" is preprocessed assembly, so the check is case sensitive first.
        if (ext == ".S") {
            return Language::Assembly;
        }

        const std::string lower = string_utils::to_lower(ext);
        if (lower == ".rs") {
            return Language::Rust;
        }
        if (lower == ".c" || lower == ".h") {
            return Language::C;
        }
        if (lower == ".cc" || lower == ".cpp" || lower == ".cxx" ||
            lower == ".hpp" || lower == ".hh" || lower == ".hxx") {
            return Language::Cpp;
        }
        if (lower == ".s" || lower == ".asm") {
            return Language::Assembly;
        }
        return Language::Unknown;
    }

    std::string FunctionInfo::simple_name() const {
        const auto pos = name.rfind("::");
        if (pos == std::string::npos) {
            return name;
        }
        return name.substr(pos + 2);
    }

    const CallGraphNode* CallGraph::find_node(const std::string_view id) const {
        const auto it = std::ranges::find_if(nodes, [id](const CallGraphNode& node) {
            return node.id == id;
        });
        return it == nodes.end() ? nullptr : &*it;
    }

}  // namespace cie
