#pragma once

#include <toolscout/base/fmt.h>
#include <toolscout/base/messages.h>

#include <stdlib.h>

#include <string>

namespace toolscout
{
    // Where in the source a check or exit happened.
    struct LineInfo
    {
        int line_number;
        const char* file_name;
        const char* function_name;

        void to_string(std::string& out) const;
        std::string to_string() const;
    };
}

#define TOOLSCOUT_LINE_INFO                                                                                            \
    ::toolscout::LineInfo { __LINE__, __FILE__, __func__ }

TOOLSCOUT_FORMAT_WITH_TO_STRING(toolscout::LineInfo);

namespace toolscout::Checks
{
    // Link seam: runs once, just before the process exits through this namespace.
    void on_final_cleanup_and_exit();

    [[noreturn]] void exit_with_code(const LineInfo& line_info, int exit_code);
    [[noreturn]] inline void exit_fail(const LineInfo& line_info) { exit_with_code(line_info, EXIT_FAILURE); }
    [[noreturn]] inline void exit_success(const LineInfo& line_info) { exit_with_code(line_info, EXIT_SUCCESS); }

    // A broken internal assumption; aborts in debug builds.
    [[noreturn]] void unreachable(const LineInfo& line_info);

    void check_exit(const LineInfo& line_info, bool expression);

    // Prints error_message to stderr as is and fails.
    [[noreturn]] void msg_exit_with_message(const LineInfo& line_info, const LocalizedString& error_message);

    // Prints "error: " and message to stderr and fails.
    [[noreturn]] void msg_exit_with_error(const LineInfo& line_info, const LocalizedString& message);
    template<class... Tags, class... Values>
    [[noreturn]] void msg_exit_with_error(const LineInfo& line_info,
                                          msg::MessageT<Tags...> message,
                                          msg::TagArg<type_identity_t<Tags>, Values>... args)
    {
        msg_exit_with_error(line_info, msg::format(message, args...));
    }
}
