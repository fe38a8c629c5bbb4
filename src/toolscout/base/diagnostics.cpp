#include <toolscout/base/diagnostics.h>
#include <toolscout/base/strings.h>

#include <utility>

namespace toolscout
{
    void BufferedDiagnosticContext::report_error(LocalizedString message) { errors.push_back(std::move(message)); }

    void BufferedDiagnosticContext::statusln(LocalizedString message) { status_sink.println(message); }

    void BufferedDiagnosticContext::print_to(MessageSink& sink) const
    {
        for (auto&& error : errors)
        {
            sink.print(Color::error, "error");
            sink.print(Color::none, ": ");
            sink.println(error);
        }
    }

    std::string BufferedDiagnosticContext::to_string() const
    {
        std::string result;
        for (auto&& error : errors)
        {
            if (!result.empty()) result.push_back('\n');
            Strings::append(result, error_prefix(), error);
        }

        return result;
    }
}
