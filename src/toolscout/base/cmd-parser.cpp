#include <toolscout/base/checks.h>
#include <toolscout/base/cmd-parser.h>
#include <toolscout/base/message_sinks.h>
#include <toolscout/base/strings.h>

#include <utility>

namespace
{
    using namespace toolscout;

    bool is_long_option(StringView text) { return text.starts_with("--"); }

    // For "--name" or "--name=value", what follows the name; anything else is no match.
    bool match_name(StringView text, StringView name, StringView& rest)
    {
        if (!is_long_option(text)) return false;
        const auto after_dashes = text.substr(2);
        if (!after_dashes.starts_with(name)) return false;
        rest = after_dashes.substr(name.size());
        return rest.empty() || rest[0] == '=';
    }

    char ascii_lower(char c) { return c >= 'A' && c <= 'Z' ? static_cast<char>(c + ('a' - 'A')) : c; }
}

namespace toolscout
{
    std::vector<std::string> convert_argc_argv_to_arguments(int argc, const char* const* const argv)
    {
        std::vector<std::string> result;
        for (int idx = 1; idx < argc; ++idx)
        {
            result.emplace_back(argv[idx]);
        }

        return result;
    }

    CmdParser::CmdParser(std::vector<std::string>&& inputs)
    {
        arguments.reserve(inputs.size());
        for (auto&& input : inputs)
        {
            arguments.push_back(Argument{std::move(input), false});
        }
    }

    bool CmdParser::parse_switch(StringView switch_name, bool& value)
    {
        size_t found = 0;
        for (auto&& argument : arguments)
        {
            StringView rest;
            if (argument.consumed || !match_name(argument.text, switch_name, rest)) continue;

            argument.consumed = true;
            if (!rest.empty())
            {
                errors.push_back(msg::format_error(msgCmdSwitchTakesNoValue, msg::option = switch_name));
            }
            else if (found++ == 1)
            {
                errors.push_back(msg::format_error(msgCmdDuplicateOption, msg::option = switch_name));
            }
        }

        if (found > 0) value = true;
        return found > 0;
    }

    bool CmdParser::parse_option(StringView option_name, Optional<std::string>& value)
    {
        size_t seen = 0;
        size_t found = 0;
        for (size_t idx = 0; idx < arguments.size(); ++idx)
        {
            StringView rest;
            if (arguments[idx].consumed || !match_name(arguments[idx].text, option_name, rest)) continue;

            arguments[idx].consumed = true;
            if (seen++ == 1)
            {
                errors.push_back(msg::format_error(msgCmdDuplicateOption, msg::option = option_name));
            }

            if (!rest.empty())
            {
                value.emplace(rest.substr(1).to_string());
                ++found;
                continue;
            }

            // the value is the next argument, if there is a plain one
            const bool has_next = idx + 1 < arguments.size() && !arguments[idx + 1].consumed &&
                                  !is_long_option(arguments[idx + 1].text);
            if (!has_next)
            {
                errors.push_back(msg::format_error(msgCmdOptionRequiresValue, msg::option = option_name));
                continue;
            }

            ++idx;
            arguments[idx].consumed = true;
            value.emplace(arguments[idx].text);
            ++found;
        }

        return found > 0;
    }

    Optional<std::string> CmdParser::extract_first_command_like_arg_lowercase()
    {
        for (auto&& argument : arguments)
        {
            if (argument.consumed) continue;

            std::string lowered;
            for (char c : argument.text)
            {
                lowered.push_back(ascii_lower(c));
            }

            if (lowered == "--help" || lowered == "-h")
            {
                argument.consumed = true;
                return std::string{"help"};
            }

            if (!is_long_option(lowered))
            {
                argument.consumed = true;
                return lowered;
            }
        }

        return nullopt;
    }

    void CmdParser::report_unknown_options()
    {
        for (auto&& argument : arguments)
        {
            if (argument.consumed || !is_long_option(argument.text)) continue;
            argument.consumed = true;
            const auto name = Strings::split_once(StringView{argument.text}.substr(2), '=').first;
            errors.push_back(msg::format_error(msgCmdUnknownOption, msg::option = name));
        }
    }

    void CmdParser::enforce_no_remaining_args(StringView command_name)
    {
        const auto ignored = consume_remaining_args(command_name, 0);
        (void)ignored;
    }

    std::vector<std::string> CmdParser::consume_remaining_args(StringView command_name, size_t arity)
    {
        const auto errors_before = errors.size();
        report_unknown_options();

        std::vector<std::string> remaining;
        for (auto&& argument : arguments)
        {
            if (argument.consumed) continue;
            argument.consumed = true;
            remaining.push_back(argument.text);
        }

        if (remaining.size() != arity)
        {
            errors.push_back(msg::format_error(msgCmdWrongArgumentCount,
                                               msg::command_name = command_name,
                                               msg::expected = arity,
                                               msg::actual = remaining.size()));
        }

        if (errors.size() != errors_before) remaining.clear();
        return remaining;
    }

    void CmdParser::exit_with_errors(const LocalizedString& usage)
    {
        if (errors.empty()) return;

        for (auto&& error : errors)
        {
            stderr_sink.println(Color::error, error);
        }

        stderr_sink.println(usage);
        Checks::exit_fail(TOOLSCOUT_LINE_INFO);
    }
}
