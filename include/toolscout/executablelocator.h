#pragma once

#include <toolscout/base/files.h>
#include <toolscout/base/optional.h>
#include <toolscout/base/path.h>
#include <toolscout/base/stringview.h>

#include <string>
#include <vector>

namespace toolscout
{
    struct ExecutableLocator
    {
        virtual ~ExecutableLocator() = default;

        // Resolves `candidate` to an executable file, or nullopt. Candidates containing a directory separator name
        // the file directly; bare names are looked up in the search path.
        virtual Optional<Path> locate(StringView candidate) const = 0;
    };

    // Resolves like `which`: direct paths must be executable regular files, bare names take the first hit on PATH.
    struct PathExecutableLocator final : ExecutableLocator
    {
        explicit PathExecutableLocator(const ReadOnlyFilesystem& fs);
        PathExecutableLocator(const ReadOnlyFilesystem& fs, std::vector<std::string> search_path);

        virtual Optional<Path> locate(StringView candidate) const override;

    private:
        Optional<Path> locate_direct(const Path& candidate) const;

        const ReadOnlyFilesystem& m_fs;
        std::vector<std::string> m_search_path;
    };
}
