#include <toolscout/base/checks.h>
#include <toolscout/base/cmd-parser.h>
#include <toolscout/base/files.h>
#include <toolscout/base/message_sinks.h>
#include <toolscout/base/messages.h>
#include <toolscout/base/system.debug.h>
#include <toolscout/base/system.h>

#include <toolscout/commands.h>

#include <locale.h>

#include <cstdlib>

using namespace toolscout;

namespace
{
    [[noreturn]] void invalid_command(StringView command_name)
    {
        msg::println_error(msgInvalidCommand, msg::command_name = command_name);
        Checks::exit_fail(TOOLSCOUT_LINE_INFO);
    }

    bool debug_requested_by_environment()
    {
        const auto maybe_debug = get_environment_variable(EnvironmentVariableDebug);
        const auto debug = maybe_debug.get();
        return debug && *debug == "1";
    }
}

namespace toolscout::Checks
{
    // Implements link seam from checks.h
    void on_final_cleanup_and_exit() { }
}

int main(const int argc, const char* const* const argv)
{
    if (argc == 0) std::abort();

    static const char* const utf8_locales[] = {
        "C.UTF-8",
        "POSIX.UTF-8",
        "en_US.UTF-8",
    };

    for (const char* utf8_locale : utf8_locales)
    {
        if (::setlocale(LC_ALL, utf8_locale))
        {
            break;
        }
    }

    CmdParser args(convert_argc_argv_to_arguments(argc, argv));
    bool debug = false;
    args.parse_switch("debug", debug);
    if (debug || debug_requested_by_environment())
    {
        Debug::g_debugging = true;
    }

    const auto maybe_command = args.extract_first_command_like_arg_lowercase();
    const auto command = maybe_command.get();
    if (!command)
    {
        args.exit_with_errors(msg::format(msgUsageText));
        stderr_sink.println(msg::format(msgUsageText));
        Checks::exit_fail(TOOLSCOUT_LINE_INFO);
    }

    Debug::println("Running command ", *command);
    if (const auto registration = choose_command(*command))
    {
        registration->function(args, real_filesystem);
    }

    invalid_command(*command);
}
