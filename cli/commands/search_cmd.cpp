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
    /**
     * Search command - case-insensitive symbol, comment and string search.
     */
    class SearchCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "search";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Search symbols, comments and strings across a source tree";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: cie search --query <TEXT> [OPTIONS] <paths...>\n"
                   "\n"
                   "Examples:\n"
                   "  cie search --query irq kernel/\n"
                   "  cie search -Q spin_lock --json drivers/";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            return {
                {"query", 'Q', "Text to search for", true, true, "", "TEXT"},
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

            auto results = engine.search(corpus_id, args.get_or("query", ""));
            if (results.is_err()) {
                print_error(results.error().to_string());
                return 1;
            }
            const auto& response = results.value();

            if (is_json()) {
                std::cout << serialization::response_to_json(
                    response,
                    serialization::array_to_json(response.data, serialization::search_result_to_json)
                ).dump(2) << "\n";
                return 0;
            }

            print_response_header(response);
            if (response.data.empty()) {
                print("No matches");
                return 0;
            }
            for (const auto& match : response.data) {
                std::ostringstream ss;
                ss << match.file_path << ":" << match.line << ": [" << to_string(match.result_type)
                   << "] " << match.match_text;
                if (is_verbose()) {
                    ss << "\n    " << match.context;
                }
                print(ss.str());
            }
            return 0;
        }

    private:
        static constexpr const char* corpus_id = "cli";
    };

    /**
     * Navigate command - definition and references of a symbol.
     */
    class NavigateCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "navigate";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Jump to the definition of a symbol and list its references";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: cie navigate --from <FILE> --symbol <NAME> [OPTIONS] <paths...>\n"
                   "\n"
                   "Examples:\n"
                   "  cie navigate --from kernel/main.c --symbol init_irq kernel/";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            return {
                {"from", 'F', "File the symbol is used in", true, true, "", "FILE"},
                {"symbol", 'S', "Symbol name", true, true, "", "NAME"},
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

            const std::string from = std::filesystem::path(args.get_or("from", "")).generic_string();
            auto location = engine.navigate(from, args.get_or("symbol", ""));
            if (location.is_err()) {
                print_error(location.error().to_string());
                return 1;
            }
            const auto& response = location.value();

            if (is_json()) {
                std::cout << serialization::response_to_json(
                    response, serialization::navigation_to_json(response.data)).dump(2) << "\n";
                return 0;
            }

            print_response_header(response);
            const auto& target = response.data;
            print(std::string(to_string(target.symbol_type)) + " defined at " + target.file_path + ":" +
                  std::to_string(target.line) + ":" + std::to_string(target.column));
            if (!target.references.empty()) {
                print("References:");
                for (const auto& reference : target.references) {
                    print("  " + reference.file_path + ":" + std::to_string(reference.line) + "  " +
                          reference.context);
                }
            }
            return 0;
        }

    private:
        static constexpr const char* corpus_id = "cli";
    };

    namespace {
        struct SearchCommandRegistrar {
            SearchCommandRegistrar() {
                CommandRegistry::instance().register_command(std::make_unique<SearchCommand>());
                CommandRegistry::instance().register_command(std::make_unique<NavigateCommand>());
            }
        } search_registrar;
    }
}  // namespace cie::cli
