#pragma once

#include <toolscout/base/optional.h>
#include <toolscout/base/stringview.h>

#include <string>
#include <vector>

namespace toolscout
{
    Optional<std::string> get_environment_variable(StringView name);

    // nullopt removes the variable.
    void set_environment_variable(StringView name, const Optional<std::string>& value);

    // PATH as split by Strings::split_paths, read once per process.
    const std::vector<std::string>& get_path_entries();
}
