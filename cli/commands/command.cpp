//
// Created by gregorian-rayne on 10/18/26.
//

#include "cie/cli/commands/command.hpp"
#include "cie/utils/file_utils.hpp"
#include "cie/utils/logging.hpp"
#include "cie/version.hpp"

#include <charconv>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace cie::cli
{
    // ============================================================================
    // ParsedArgs Implementation
    // ============================================================================

    void ParsedArgs::set(const std::string& name, const std::string& value) {
        args_[name] = value;
    }

    void ParsedArgs::set_flag(const std::string& name) {
        flags_[name] = true;
    }

    void ParsedArgs::add_positional(const std::string& value) {
        positional_.push_back(value);
    }

    bool ParsedArgs::has(const std::string& name) const {
        return args_.contains(name) || flags_.contains(name);
    }

    std::optional<std::string> ParsedArgs::get(const std::string& name) const {
        if (const auto it = args_.find(name); it != args_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    std::string ParsedArgs::get_or(const std::string& name, const std::string& default_val) const {
        return get(name).value_or(default_val);
    }

    std::optional<int> ParsedArgs::get_int(const std::string& name) const {
        const auto val = get(name);
        if (!val) return std::nullopt;
        int parsed = 0;
        const char* end = val->data() + val->size();
        if (auto [ptr, ec] = std::from_chars(val->data(), end, parsed); ec != std::errc{} || ptr != end) {
            return std::nullopt;
        }
        return parsed;
    }

    bool ParsedArgs::get_flag(const std::string& name) const {
        const auto it = flags_.find(name);
        return it != flags_.end() && it->second;
    }

    // ============================================================================
    // Command Implementation
    // ============================================================================

    std::string Command::usage() const {
        std::ostringstream ss;
        ss << "Usage: cie " << name();

        for (const auto args = arguments(); const auto& arg : args) {
            if (arg.required) {
                ss << " --" << arg.name << " <" << arg.value_name << ">";
            }
        }

        ss << " [OPTIONS] <paths...>";
        return ss.str();
    }

    std::string Command::validate(const ParsedArgs& args) const {
        for (const auto& def : arguments()) {
            if (def.required && !args.has(def.name)) {
                return "Missing required argument: --" + def.name;
            }
        }
        if (args.positional().empty()) {
            return "No source files specified. Use 'cie " + std::string(name()) + " <paths...>'";
        }
        return "";
    }

    void Command::print_help() const {
        std::cout << description() << "\n\n";
        std::cout << usage() << "\n\n";

        if (const auto args = arguments(); !args.empty()) {
            std::cout << "Options:\n";
            for (const auto& arg : args) {
                std::cout << "  ";
                if (arg.short_name) {
                    std::cout << "-" << arg.short_name << ", ";
                } else {
                    std::cout << "    ";
                }
                std::cout << "--" << std::left << std::setw(20) << arg.name;
                std::cout << arg.description;
                if (!arg.default_value.empty()) {
                    std::cout << " (default: " << arg.default_value << ")";
                }
                if (arg.required) {
                    std::cout << " [required]";
                }
                std::cout << "\n";
            }
        }

        std::cout << "\n";
        std::cout << "Common options:\n";
        std::cout << "  -h, --help                Show this help message\n";
        std::cout << "  -v, --verbose             Enable verbose output\n";
        std::cout << "  -q, --quiet               Only show errors\n";
        std::cout << "  -c, --config FILE         Load settings from a cie.toml file\n";
        std::cout << "      --json                Output the JSON response envelope\n";
    }

    void Command::apply_common_flags(const ParsedArgs& args) {
        if (args.get_flag("verbose")) {
            set_verbosity(Verbosity::Verbose);
        } else if (args.get_flag("quiet")) {
            set_verbosity(Verbosity::Quiet);
        }
        if (args.get_flag("json")) {
            set_output_format(OutputFormat::JSON);
        }
    }

    Result<core::Config> Command::load_config(const ParsedArgs& args) const {
        core::Config config = core::Config::default_config();

        if (const auto path = args.get("config")) {
            auto loaded = core::Config::load_from_file(*path);
            if (loaded.is_err()) {
                return Result<core::Config>::failure(loaded.error());
            }
            config = std::move(loaded.value());
        }

        // The command line overrides the configured level
        if (is_verbose()) {
            config.logging.level = "debug";
        } else if (verbosity() == Verbosity::Quiet) {
            config.logging.level = "error";
        }

        if (auto logged = logging::configure(config.logging); logged.is_err()) {
            return Result<core::Config>::failure(logged.error());
        }
        return Result<core::Config>::success(std::move(config));
    }

    Result<std::vector<std::string>> Command::ingest_inputs(
        engine::AnalysisEngine& engine,
        const std::string& corpus_id,
        const ParsedArgs& args
    ) const {
        std::vector<file_utils::fs::path> inputs;
        for (const auto& path : args.positional()) {
            inputs.emplace_back(path);
        }

        auto sources = file_utils::collect_sources(inputs);
        if (sources.is_err()) {
            return Result<std::vector<std::string>>::failure(sources.error());
        }

        std::vector<std::string> ingested;
        for (const auto& path : sources.value()) {
            auto content = file_utils::read_file(path);
            if (content.is_err()) {
                return Result<std::vector<std::string>>::failure(content.error());
            }
            const std::string key = path.generic_string();
            engine.ingest(corpus_id, key, std::move(content.value()));
            ingested.push_back(key);
        }

        if (ingested.empty()) {
            return Result<std::vector<std::string>>::failure(
                Error::not_found("No source files found in the given paths")
            );
        }

        print_verbose("Ingested " + std::to_string(ingested.size()) + " source files");
        return Result<std::vector<std::string>>::success(std::move(ingested));
    }

    void Command::print_diagnostics(const std::vector<Diagnostic>& diagnostics) const {
        if (!is_verbose()) {
            return;
        }
        for (const auto& diagnostic : diagnostics) {
            std::ostringstream ss;
            ss << diagnostic.location.file_path << ":" << diagnostic.location.line << ": "
               << to_string(diagnostic.level) << ": " << diagnostic.message
               << " [" << diagnostic.code << "]";
            std::cerr << ss.str() << "\n";
        }
    }

    void Command::print(const std::string_view msg) const {
        if (verbosity_ != Verbosity::Quiet) {
            std::cout << msg << "\n";
        }
    }

    void Command::print_error(const std::string_view msg) {
        std::cerr << "error: " << msg << "\n";
    }

    void Command::print_warning(const std::string_view msg) const {
        if (verbosity_ != Verbosity::Quiet) {
            std::cerr << "warning: " << msg << "\n";
        }
    }

    void Command::print_verbose(const std::string_view msg) const {
        if (verbosity_ >= Verbosity::Verbose) {
            std::cout << msg << "\n";
        }
    }

    // ============================================================================
    // CommandRegistry Implementation
    // ============================================================================

    CommandRegistry& CommandRegistry::instance() {
        static CommandRegistry instance;
        return instance;
    }

    void CommandRegistry::register_command(std::unique_ptr<Command> cmd) {
        commands_.push_back(std::move(cmd));
    }

    Command* CommandRegistry::find(const std::string_view name) const {
        for (const auto& cmd : commands_) {
            if (cmd->name() == name) {
                return cmd.get();
            }
        }
        return nullptr;
    }

    std::vector<Command*> CommandRegistry::list() const {
        std::vector<Command*> result;
        result.reserve(commands_.size());
        for (const auto& cmd : commands_) {
            result.push_back(cmd.get());
        }
        return result;
    }

    void print_global_help() {
        std::cout << PROJECT_NAME << " " << VERSION_STRING << "\n\n";
        std::cout << "Usage: cie <command> [OPTIONS] <paths...>\n\n";
        std::cout << "Commands:\n";
        for (const auto* cmd : CommandRegistry::instance().list()) {
            std::cout << "  " << std::left << std::setw(12) << cmd->name() << cmd->description() << "\n";
        }
        std::cout << "\nRun 'cie <command> --help' for command options.\n";
    }

    // ============================================================================
    // Argument Parser
    // ============================================================================

    ParseResult parse_arguments(
        const std::vector<std::string>& args,
        const std::vector<ArgDef>& defs
    ) {
        ParseResult result;

        std::vector<ArgDef> all_defs = defs;
        all_defs.push_back({"config", 'c', "Configuration file", false, true, "", "FILE"});

        std::unordered_map<std::string, const ArgDef*> long_map;
        std::unordered_map<char, const ArgDef*> short_map;

        for (const auto& def : all_defs) {
            long_map[def.name] = &def;
            if (def.short_name) {
                short_map[def.short_name] = &def;
            }
            if (!def.default_value.empty()) {
                result.args.set(def.name, def.default_value);
            }
        }

        bool options_ended = false;

        for (std::size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];

            if (arg.empty()) continue;

            if (arg == "--" && !options_ended) {
                options_ended = true;
                continue;
            }

            if (arg[0] != '-' || options_ended || arg.size() == 1) {
                result.args.add_positional(arg);
                continue;
            }

            if (arg[1] == '-') {
                std::string name = arg.substr(2);
                std::string value;

                if (auto eq_pos = name.find('='); eq_pos != std::string::npos) {
                    value = name.substr(eq_pos + 1);
                    name = name.substr(0, eq_pos);
                }

                auto it = long_map.find(name);
                if (it == long_map.end()) {
                    if (name == "help" || name == "verbose" || name == "quiet" || name == "json") {
                        result.args.set_flag(name);
                        continue;
                    }
                    result.error = "Unknown option: --" + name;
                    result.success = false;
                    return result;
                }

                if (const ArgDef* def = it->second; def->takes_value) {
                    if (value.empty() && i + 1 < args.size()) {
                        value = args[++i];
                    }
                    if (value.empty()) {
                        result.error = "Option --" + name + " requires a value";
                        result.success = false;
                        return result;
                    }
                    result.args.set(name, value);
                } else {
                    result.args.set_flag(name);
                }
                continue;
            }

            for (std::size_t j = 1; j < arg.size(); ++j) {
                const char c = arg[j];

                if (c == 'h') {
                    result.args.set_flag("help");
                    continue;
                }
                if (c == 'v') {
                    result.args.set_flag("verbose");
                    continue;
                }
                if (c == 'q') {
                    result.args.set_flag("quiet");
                    continue;
                }

                auto it = short_map.find(c);
                if (it == short_map.end()) {
                    result.error = std::string("Unknown option: -") + c;
                    result.success = false;
                    return result;
                }

                const ArgDef* def = it->second;
                if (!def->takes_value) {
                    result.args.set_flag(def->name);
                    continue;
                }

                std::string value;
                if (j + 1 < arg.size()) {
                    value = arg.substr(j + 1);
                } else if (i + 1 < args.size()) {
                    value = args[++i];
                }
                if (value.empty()) {
                    result.error = std::string("Option -") + c + " requires a value";
                    result.success = false;
                    return result;
                }
                result.args.set(def->name, value);
                break;  // Rest of the short options were the value
            }
        }

        return result;
    }

}  // namespace cie::cli
