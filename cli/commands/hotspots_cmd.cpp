//
// Created by gregorian-rayne on 10/18/26.
//

#include "cie/cli/commands/command.hpp"
#include "cie/serialization/json_serializer.hpp"

#include <filesystem>
#include <iostream>
#include <sstream>

namespace cie::cli
{
    using nlohmann::json;

    /**
     * Hotspots command - ranked performance hotspots with guidance.
     */
    class HotspotsCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "hotspots";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Find system calls, locking, allocation and other performance hotspots";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: cie hotspots [OPTIONS] <paths...>\n"
                   "\n"
                   "Examples:\n"
                   "  cie hotspots kernel/\n"
                   "  cie hotspots --file kernel/irq.c kernel/\n"
                   "  cie hotspots --optimize --top 5 drivers/";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            return {
                {"file", 'f', "Only report hotspots in this file", false, true, "", "FILE"},
                {"optimize", 'o', "Include optimization suggestions", false, false, "", ""},
                {"top", 't', "Number of hotspots to show (0=all)", false, true, "0", "N"},
            };
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            if (args.get_flag("help")) {
                print_help();
                return 0;
            }
            apply_common_flags(args);

            auto config = load_config(args);
            if (config.is_err()) {
                print_error(config.error().to_string());
                return 1;
            }

            engine::AnalysisEngine engine(config.value());
            if (auto files = ingest_inputs(engine, corpus_id, args); files.is_err()) {
                print_error(files.error().to_string());
                return 1;
            }

            std::string target = corpus_id;
            if (const auto file = args.get("file")) {
                target = normalize_path(*file);
            }

            auto result = engine.hotspots(target);
            if (result.is_err()) {
                print_error(result.error().to_string());
                return 1;
            }
            auto response = std::move(result.value());

            const int top = args.get_int("top").value_or(0);
            if (top > 0 && response.data.size() > static_cast<std::size_t>(top)) {
                response.data.resize(static_cast<std::size_t>(top));
            }

            json output;
            output["hotspots"] = serialization::response_to_json(
                response, serialization::array_to_json(response.data, serialization::hotspot_to_json));

            if (!is_json()) {
                print_response_header(response);
                print_hotspots(response.data);
            }

            if (args.get_flag("optimize")) {
                // Derived from the (possibly truncated) list so the two views line up
                const auto suggestions = hotspots::optimization_suggestions(response.data);
                output["optimizations"] = serialization::array_to_json(
                    suggestions, serialization::optimization_to_json);
                if (!is_json()) {
                    print_optimizations(suggestions);
                }
            }

            if (is_json()) {
                std::cout << output.dump(2) << "\n";
            }

            return response.status == engine::ResponseStatus::Stale ? 1 : 0;
        }

    private:
        static constexpr const char* corpus_id = "cli";

        static std::string normalize_path(const std::string& path) {
            return std::filesystem::path(path).generic_string();
        }

        void print_hotspots(const std::vector<PerformanceHotspot>& hotspots) const {
            if (hotspots.empty()) {
                print("No hotspots found");
                return;
            }
            print("Hotspots (" + std::to_string(hotspots.size()) + "):");
            for (const auto& hotspot : hotspots) {
                std::ostringstream ss;
                ss << "  [" << to_string(hotspot.severity) << "] "
                   << hotspot.location.file_path << ":" << hotspot.location.line << ":"
                   << hotspot.location.column << " " << to_string(hotspot.hotspot_type);
                if (!hotspot.function_name.empty()) {
                    ss << " in " << hotspot.function_name;
                }
                ss << "\n      " << hotspot.description;
                if (is_verbose()) {
                    ss << "\n      " << hotspot.educational_context;
                }
                print(ss.str());
            }
        }

        void print_optimizations(const std::vector<OptimizationSuggestion>& suggestions) const {
            if (suggestions.empty()) {
                return;
            }
            print("\nOptimizations:");
            for (const auto& suggestion : suggestions) {
                std::ostringstream ss;
                ss << "  [" << to_string(suggestion.priority) << "] "
                   << suggestion.location.file_path << ":" << suggestion.location.line << " "
                   << suggestion.suggestion_type << ": " << suggestion.description
                   << "\n      effort: " << suggestion.implementation_effort
                   << ", expected: " << suggestion.expected_improvement;
                if (is_verbose()) {
                    ss << "\n" << suggestion.code_example;
                }
                print(ss.str());
            }
        }
    };

    namespace {
        struct HotspotsCommandRegistrar {
            HotspotsCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<HotspotsCommand>()
                );
            }
        } hotspots_registrar;
    }
}  // namespace cie::cli
