#pragma once

#include <catch2/catch.hpp>

#include <toolscout/base/files.h>
#include <toolscout/base/fmt.h>
#include <toolscout/base/message_sinks.h>
#include <toolscout/base/messages.h>
#include <toolscout/base/optional.h>
#include <toolscout/base/path.h>
#include <toolscout/base/strings.h>

#include <toolscout/executablelocator.h>
#include <toolscout/xpmversion.h>

#include <iomanip>
#include <map>
#include <ostream>
#include <set>
#include <string>
#include <vector>

#define CHECK_EC(ec)                                                                                                   \
    do                                                                                                                 \
    {                                                                                                                  \
        if (ec)                                                                                                        \
        {                                                                                                              \
            FAIL(ec.message());                                                                                        \
        }                                                                                                              \
    } while (0)

namespace Catch
{
    template<>
    struct StringMaker<toolscout::LocalizedString>
    {
        static const std::string convert(const toolscout::LocalizedString& value)
        {
            return "LL\"" + value.data() + "\"";
        }
    };

    template<>
    struct StringMaker<toolscout::Path>
    {
        static const std::string convert(const toolscout::Path& value) { return "\"" + value.native() + "\""; }
    };

    template<>
    struct StringMaker<toolscout::XpmToolVersion>
    {
        static const std::string convert(const toolscout::XpmToolVersion& value)
        {
            return fmt::format("{} (\"{}\")", value, value.source_name);
        }
    };

    template<>
    struct StringMaker<toolscout::DirectoryEntry>
    {
        static const std::string convert(const toolscout::DirectoryEntry& value)
        {
            return fmt::format("{{\"{}\", {}}}", value.name, value.type);
        }
    };
}

namespace toolscout
{
    inline std::ostream& operator<<(std::ostream& os, const LocalizedString& value)
    {
        return os << "LL" << std::quoted(value.data());
    }

    inline std::ostream& operator<<(std::ostream& os, const Path& value) { return os << value.native(); }

    template<class T>
    inline auto operator<<(std::ostream& os, const Optional<T>& value) -> decltype(os << *(value.get()))
    {
        if (auto v = value.get())
        {
            return os << *v;
        }
        else
        {
            return os << "nullopt";
        }
    }
}

namespace toolscout::Test
{
    // An in-memory tree: directories map to their listings, executables are the set of paths that may be run.
    // Paths are compared exactly as spelled.
    struct MockFilesystem final : ReadOnlyFilesystem
    {
        std::map<std::string, std::vector<DirectoryEntry>> directories;
        std::set<std::string> regular_files;
        std::set<std::string> executables;
        Path working_directory = "/work";

        // Adds `name` to the listing of `parent`, registering nested directories and files so status() agrees.
        void add_directory(const Path& parent, StringView name);
        void add_file(const Path& parent, StringView name, bool executable);

        virtual std::vector<DirectoryEntry> read_directory(const Path& dir, std::error_code& ec) const override;
        virtual FileType status(const Path& target, std::error_code& ec) const override;
        virtual bool is_executable(const Path& target) const override;
        virtual Path absolute(const Path& target, std::error_code& ec) const override;
    };

    // Resolves only the candidates registered in `resolutions`, recording every query in order.
    struct MockExecutableLocator final : ExecutableLocator
    {
        std::map<std::string, Path> resolutions;
        mutable std::vector<std::string> queries;

        virtual Optional<Path> locate(StringView candidate) const override;
    };

    // Keeps everything printed, without colors.
    struct RecordingSink final : MessageSink
    {
        std::string text;

        void print(Color, StringView s) override { s.to_string(text); }
    };

    // A fresh directory under the system temporary directory, created once per test run.
    const Path& base_temporary_directory();

    void make_directory(const Path& target);
    void make_file(const Path& target, bool executable);
    void make_symlink(const Path& target, const Path& link);
    void remove_all(const Path& target);
}
