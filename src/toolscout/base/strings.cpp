#include <toolscout/base/strings.h>

#include <limits.h>

#include <algorithm>

namespace toolscout
{
    std::pair<StringView, StringView> Strings::split_once(StringView s, char delimiter) noexcept
    {
        const auto split_point = std::find(s.begin(), s.end(), delimiter);
        if (split_point == s.end())
        {
            return {s, StringView{}};
        }

        return {StringView{s.begin(), split_point}, StringView{split_point + 1, s.end()}};
    }

    std::vector<std::string> Strings::split_paths(StringView s)
    {
        std::vector<std::string> result;
        if (s.empty()) return result;

        auto first = s.begin();
        for (;;)
        {
            const auto colon = std::find(first, s.end(), ':');
            if (first == colon)
            {
                result.emplace_back(".");
            }
            else
            {
                result.emplace_back(first, colon);
            }

            if (colon == s.end()) return result;
            first = colon + 1;
        }
    }

    Optional<int> Strings::parse_leading_int(StringView s)
    {
        auto first = s.begin();
        if (first == s.end() || *first < '0' || *first > '9')
        {
            return nullopt;
        }

        int value = 0;
        for (; first != s.end() && *first >= '0' && *first <= '9'; ++first)
        {
            const int digit = *first - '0';
            if (value > (INT_MAX - digit) / 10)
            {
                return INT_MAX;
            }

            value = value * 10 + digit;
        }

        return value;
    }
}
