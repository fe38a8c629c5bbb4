#include <toolscout/base/checks.h>
#include <toolscout/base/strings.h>
#include <toolscout/base/system.debug.h>
#include <toolscout/base/system.h>

#include <stdlib.h>

namespace toolscout
{
    Optional<std::string> get_environment_variable(StringView name)
    {
        const auto value = ::getenv(name.to_string().c_str());
        if (value) return std::string{value};
        return nullopt;
    }

    void set_environment_variable(StringView name, const Optional<std::string>& value)
    {
        const auto key = name.to_string();
        const auto new_value = value.get();
        const int result = new_value ? ::setenv(key.c_str(), new_value->c_str(), 1) : ::unsetenv(key.c_str());
        Checks::check_exit(TOOLSCOUT_LINE_INFO, result == 0);
    }

    const std::vector<std::string>& get_path_entries()
    {
        static const std::vector<std::string> entries = [] {
            const auto path = get_environment_variable("PATH");
            auto result = Strings::split_paths(path.value_or(""));
            Debug::println("PATH has ", result.size(), " entries");
            return result;
        }();
        return entries;
    }
}

namespace toolscout::Debug
{
    std::atomic<bool> g_debugging(false);
}
