#pragma once

#include <toolscout/base/message_sinks.h>
#include <toolscout/base/messages.h>

#include <string>
#include <vector>

namespace toolscout
{
    // Where resolvers send their errors and progress. Errors are kept for the caller to decide on;
    // status lines are meant to be shown as they happen.
    struct DiagnosticContext
    {
        virtual void report_error(LocalizedString message) = 0;
        virtual void statusln(LocalizedString message) = 0;

        template<class... Tags, class... Values>
        void report_error(msg::MessageT<Tags...> message, msg::TagArg<type_identity_t<Tags>, Values>... args)
        {
            report_error(msg::format(message, args...));
        }

    protected:
        ~DiagnosticContext() = default;
    };

    // Keeps errors in order and forwards status lines to status_sink.
    struct BufferedDiagnosticContext final : DiagnosticContext
    {
        explicit BufferedDiagnosticContext(MessageSink& status_sink) : status_sink(status_sink) { }

        using DiagnosticContext::report_error;
        void report_error(LocalizedString message) override;
        void statusln(LocalizedString message) override;

        // Each error on its own line behind a colored "error: ".
        void print_to(MessageSink& sink) const;
        std::string to_string() const;

        bool empty() const noexcept { return errors.empty(); }

        MessageSink& status_sink;
        std::vector<LocalizedString> errors;
    };
}
