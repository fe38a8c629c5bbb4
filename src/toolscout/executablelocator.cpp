#include <toolscout/base/system.debug.h>
#include <toolscout/base/system.h>

#include <toolscout/executablelocator.h>

#include <utility>

namespace toolscout
{
    PathExecutableLocator::PathExecutableLocator(const ReadOnlyFilesystem& fs)
        : m_fs(fs), m_search_path(get_path_entries())
    {
    }

    PathExecutableLocator::PathExecutableLocator(const ReadOnlyFilesystem& fs, std::vector<std::string> search_path)
        : m_fs(fs), m_search_path(std::move(search_path))
    {
    }

    Optional<Path> PathExecutableLocator::locate(StringView candidate) const
    {
        if (candidate.empty())
        {
            return nullopt;
        }

        if (candidate.contains('/'))
        {
            return locate_direct(candidate);
        }

        for (auto&& directory : m_search_path)
        {
            const auto full = Path{directory} / candidate;
            if (auto found = locate_direct(full))
            {
                return found;
            }
        }

        Debug::println(candidate, " was not found on the search path");
        return nullopt;
    }

    Optional<Path> PathExecutableLocator::locate_direct(const Path& candidate) const
    {
        if (!m_fs.is_executable(candidate))
        {
            Debug::println(candidate, " is not an executable file");
            return nullopt;
        }

        std::error_code ec;
        auto absolute = m_fs.absolute(candidate, ec);
        if (ec)
        {
            Debug::println("could not make ", candidate, " absolute: ", ec.message());
            return nullopt;
        }

        return absolute.lexically_normal();
    }
}
