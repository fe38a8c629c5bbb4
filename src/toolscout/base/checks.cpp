#include <toolscout/base/checks.h>
#include <toolscout/base/path.h>
#include <toolscout/base/system.debug.h>

#include <stdio.h>
#include <stdlib.h>

#include <atomic>
#include <iterator>

namespace toolscout
{
    void LineInfo::to_string(std::string& out) const
    {
        fmt::format_to(std::back_inserter(out), "{}({})", Path{file_name}.filename(), line_number);
    }

    std::string LineInfo::to_string() const { return adapt_to_string(*this); }
}

namespace
{
    using namespace toolscout;

    void write_internal_error(const LineInfo& line_info, const LocalizedString& text)
    {
        auto report = internal_error_prefix();
        report.append_raw(line_info.to_string()).append_raw(": ").append(text).append_raw("\n");
        msg::write_unlocalized_text_to_stderr(Color::error, report);
    }
}

namespace toolscout::Checks
{
    void exit_with_code(const LineInfo& line_info, int exit_code)
    {
        static std::atomic<bool> exiting{false};
        if (exiting.exchange(true))
        {
            // an exit path reentered itself through on_final_cleanup_and_exit
            std::abort();
        }

        Debug::println("exit code ", exit_code, " from ", line_info.function_name, " at ", line_info);
        on_final_cleanup_and_exit();
        fflush(nullptr);
        std::exit(exit_code);
    }

    void unreachable(const LineInfo& line_info)
    {
        write_internal_error(line_info, msg::format(msgChecksUnreachableCode));
#ifndef NDEBUG
        std::abort();
#else
        exit_fail(line_info);
#endif
    }

    void check_exit(const LineInfo& line_info, bool expression)
    {
        if (expression) return;
        write_internal_error(line_info, msg::format(msgChecksFailedCheck));
        exit_fail(line_info);
    }

    void msg_exit_with_message(const LineInfo& line_info, const LocalizedString& error_message)
    {
        auto text = error_message;
        text.append_raw("\n");
        msg::write_unlocalized_text_to_stderr(Color::none, text);
        exit_fail(line_info);
    }

    void msg_exit_with_error(const LineInfo& line_info, const LocalizedString& message)
    {
        msg::println_error(message);
        exit_fail(line_info);
    }
}
