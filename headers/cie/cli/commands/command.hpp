//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef CIE_COMMAND_HPP
#define CIE_COMMAND_HPP

/**
 * @file command.hpp
 * @brief Base class for CLI commands.
 *
 * Every command takes source files or directories as positional arguments,
 * ingests them into one corpus and prints a query response as text or as
 * the JSON envelope.
 */

#include "cie/core/config.hpp"
#include "cie/engine/analysis_engine.hpp"
#include "cie/result.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cie::cli
{
    /**
     * Command-line argument definition.
     */
    struct ArgDef {
        std::string name;           // Long name (--name)
        char short_name = 0;        // Short name (-n)
        std::string description;
        bool required = false;
        bool takes_value = true;    // false for flags
        std::string default_value;
        std::string value_name = "VALUE";
    };

    /**
     * Parsed command-line arguments.
     */
    class ParsedArgs {
    public:
        void set(const std::string& name, const std::string& value);
        void set_flag(const std::string& name);
        void add_positional(const std::string& value);

        [[nodiscard]] bool has(const std::string& name) const;
        [[nodiscard]] std::optional<std::string> get(const std::string& name) const;
        [[nodiscard]] std::string get_or(const std::string& name, const std::string& default_val) const;
        [[nodiscard]] std::optional<int> get_int(const std::string& name) const;
        [[nodiscard]] bool get_flag(const std::string& name) const;
        [[nodiscard]] const std::vector<std::string>& positional() const { return positional_; }

    private:
        std::unordered_map<std::string, std::string> args_;
        std::unordered_map<std::string, bool> flags_;
        std::vector<std::string> positional_;
    };

    enum class Verbosity {
        Quiet,
        Normal,
        Verbose
    };

    enum class OutputFormat {
        Text,
        JSON
    };

    /**
     * Base class for all CLI commands.
     */
    class Command {
    public:
        virtual ~Command() = default;

        [[nodiscard]] virtual std::string_view name() const noexcept = 0;

        [[nodiscard]] virtual std::string_view description() const noexcept = 0;

        [[nodiscard]] virtual std::string usage() const;

        [[nodiscard]] virtual std::vector<ArgDef> arguments() const { return {}; }

        /**
         * Executes the command.
         *
         * @return Exit code (0 = success).
         */
        [[nodiscard]] virtual int execute(const ParsedArgs& args) = 0;

        /**
         * @return Error message if invalid, empty if valid.
         */
        [[nodiscard]] virtual std::string validate(const ParsedArgs& args) const;

        void print_help() const;

    protected:
        /**
         * Applies --verbose, --quiet and --json.
         */
        void apply_common_flags(const ParsedArgs& args);

        /**
         * Loads --config (or the defaults) and installs the logger.
         */
        [[nodiscard]] Result<core::Config> load_config(const ParsedArgs& args) const;

        /**
         * Reads every source file named by the positional arguments and
         * ingests it into corpus_id.
         *
         * @return The ingested paths, in corpus order.
         */
        [[nodiscard]] Result<std::vector<std::string>> ingest_inputs(
            engine::AnalysisEngine& engine,
            const std::string& corpus_id,
            const ParsedArgs& args) const;

        /**
         * Prints the status line, the error and the diagnostics of a
         * text-mode response.
         */
        template<typename T>
        void print_response_header(const engine::Response<T>& response) const {
            print_verbose(std::string("status: ") + engine::to_string(response.status));
            if (response.error) {
                print_warning(response.error->to_string());
            }
            print_diagnostics(response.diagnostics);
        }

        void print_diagnostics(const std::vector<Diagnostic>& diagnostics) const;

        void set_verbosity(Verbosity v) { verbosity_ = v; }
        void set_output_format(OutputFormat f) { output_format_ = f; }

        void print(std::string_view msg) const;
        static void print_error(std::string_view msg);
        void print_warning(std::string_view msg) const;
        void print_verbose(std::string_view msg) const;

        [[nodiscard]] Verbosity verbosity() const { return verbosity_; }
        [[nodiscard]] bool is_verbose() const { return verbosity_ >= Verbosity::Verbose; }
        [[nodiscard]] bool is_json() const { return output_format_ == OutputFormat::JSON; }

    private:
        Verbosity verbosity_ = Verbosity::Normal;
        OutputFormat output_format_ = OutputFormat::Text;
    };

    /**
     * Registry for managing CLI commands.
     */
    class CommandRegistry {
    public:
        static CommandRegistry& instance();

        void register_command(std::unique_ptr<Command> cmd);

        [[nodiscard]] Command* find(std::string_view name) const;
        [[nodiscard]] std::vector<Command*> list() const;

    private:
        CommandRegistry() = default;
        std::vector<std::unique_ptr<Command>> commands_;
    };

    struct ParseResult {
        ParsedArgs args;
        std::string error;
        bool success = true;
    };

    /**
     * Parses command-line arguments for a command.
     *
     * @param args Command-line arguments (after command name).
     * @param defs Argument definitions.
     */
    [[nodiscard]] ParseResult parse_arguments(
        const std::vector<std::string>& args,
        const std::vector<ArgDef>& defs
    );

    /**
     * Prints the top-level usage with every registered command.
     */
    void print_global_help();

}  // namespace cie::cli

#endif //CIE_COMMAND_HPP
