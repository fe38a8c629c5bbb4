#pragma once

#include <toolscout/base/messages.h>
#include <toolscout/base/strings.h>

#include <atomic>

namespace toolscout::Debug
{
    // Set by --debug or TOOLSCOUT_DEBUG=1.
    extern std::atomic<bool> g_debugging;

    // A "[DEBUG] " line on stderr, only while debugging.
    template<class... Args>
    void println(const Args&... args)
    {
        if (!g_debugging) return;
        auto line = Strings::concat("[DEBUG] ", args...);
        line.push_back('\n');
        msg::write_unlocalized_text_to_stderr(Color::none, line);
    }
}
