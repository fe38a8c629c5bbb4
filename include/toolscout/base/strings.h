#pragma once

#include <toolscout/base/optional.h>
#include <toolscout/base/stringview.h>

#include <iterator>
#include <string>
#include <utility>
#include <vector>

namespace toolscout::Strings::details
{
    template<class T>
    void append_one(std::string& into, const T& value)
    {
        fmt::format_to(std::back_inserter(into), "{}", value);
    }

    inline void append_one(std::string& into, char c) { into.push_back(c); }
    inline void append_one(std::string& into, const char* text) { into.append(text); }
    inline void append_one(std::string& into, const std::string& text) { into.append(text); }
    inline void append_one(std::string& into, StringView text) { text.to_string(into); }
}

namespace toolscout::Strings
{
    template<class... Args>
    std::string& append(std::string& into, const Args&... args)
    {
        (details::append_one(into, args), ...);
        return into;
    }

    template<class... Args>
    [[nodiscard]] std::string concat(const Args&... args)
    {
        std::string result;
        append(result, args...);
        return result;
    }

    template<class Container>
    std::string join(StringView delimiter, const Container& items)
    {
        std::string result;
        bool first = true;
        for (auto&& item : items)
        {
            if (!first) delimiter.to_string(result);
            first = false;
            details::append_one(result, item);
        }

        return result;
    }

    // Splits at the first `delimiter`; without one, the second part is empty.
    std::pair<StringView, StringView> split_once(StringView s, char delimiter) noexcept;

    // Splits a colon separated directory list. An empty entry means the working directory and becomes ".";
    // an empty list has no entries.
    std::vector<std::string> split_paths(StringView s);

    // The value of the leading decimal digits, ignoring what follows. Values too large for an int clamp to INT_MAX.
    Optional<int> parse_leading_int(StringView s);
}
