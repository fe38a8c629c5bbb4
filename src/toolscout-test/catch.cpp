#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <toolscout/base/checks.h>
#include <toolscout/base/system.debug.h>
#include <toolscout/base/system.h>

namespace toolscout::Checks
{
    void on_final_cleanup_and_exit() { }
}

int main(int argc, char** argv)
{
    if (toolscout::get_environment_variable("TOOLSCOUT_DEBUG").value_or("") == "1")
    {
        toolscout::Debug::g_debugging = true;
    }

    // keep the developer's xpm install out of the command tests
    toolscout::set_environment_variable("TOOLSCOUT_XPM_ROOT", toolscout::nullopt);

    return Catch::Session().run(argc, argv);
}
