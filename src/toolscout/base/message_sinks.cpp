#include <toolscout/base/message_sinks.h>

namespace
{
    using namespace toolscout;

    struct NullSink final : MessageSink
    {
        void print(Color, StringView) override { }
    };

    struct StderrSink final : MessageSink
    {
        void print(Color c, StringView text) override { msg::write_unlocalized_text_to_stderr(c, text); }
    };

    NullSink null_sink_instance;
    StderrSink stderr_sink_instance;
}

namespace toolscout
{
    MessageSink& null_sink = null_sink_instance;
    MessageSink& stderr_sink = stderr_sink_instance;
}
