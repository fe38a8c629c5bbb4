#pragma once

#include <toolscout/base/messages.h>
#include <toolscout/base/stringview.h>

namespace toolscout
{
    // A destination for console text.
    struct MessageSink
    {
        virtual void print(Color c, StringView text) = 0;

        void println(const LocalizedString& text) { println(Color::none, text); }
        void println(Color c, const LocalizedString& text)
        {
            print(c, text);
            print(Color::none, "\n");
        }

        MessageSink(const MessageSink&) = delete;
        MessageSink& operator=(const MessageSink&) = delete;

    protected:
        MessageSink() = default;
        ~MessageSink() = default;
    };

    extern MessageSink& null_sink;
    extern MessageSink& stderr_sink;
}
