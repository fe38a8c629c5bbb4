#pragma once

#include <toolscout/base/messages.h>
#include <toolscout/base/optional.h>
#include <toolscout/base/stringview.h>

#include <stddef.h>

#include <string>
#include <vector>

namespace toolscout
{
    // argv without the program name.
    std::vector<std::string> convert_argc_argv_to_arguments(int argc, const char* const* const argv);

    // Consumes command line arguments piece by piece, collecting an error for each malformed one.
    struct CmdParser
    {
        CmdParser() = default;
        explicit CmdParser(std::vector<std::string>&& inputs);

        // Consumes every --switch_name and sets `value`. Returns whether a well formed occurrence was seen;
        // --switch_name=x and repeats are errors.
        bool parse_switch(StringView switch_name, bool& value);

        // Consumes --option_name=value or --option_name value. Returns whether a value was stored. A repeat is an
        // error but still replaces the value; a missing value is an error.
        bool parse_option(StringView option_name, Optional<std::string>& value);

        // The first unconsumed argument not starting with "--", lowercased. --help and -h read as "help".
        Optional<std::string> extract_first_command_like_arg_lowercase();

        void enforce_no_remaining_args(StringView command_name);

        // Everything left, which must be exactly `arity` plain arguments; otherwise empty, with errors.
        std::vector<std::string> consume_remaining_args(StringView command_name, size_t arity);

        const std::vector<LocalizedString>& get_errors() const { return errors; }

        // Prints the errors and `usage` to stderr and fails, if there were any errors.
        void exit_with_errors(const LocalizedString& usage);

    private:
        struct Argument
        {
            std::string text;
            bool consumed;
        };

        void report_unknown_options();

        std::vector<Argument> arguments;
        std::vector<LocalizedString> errors;
    };
}
