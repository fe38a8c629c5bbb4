#include <toolscout/base/stringview.h>

#include <string.h>

#include <algorithm>

namespace toolscout
{
    bool StringView::starts_with(StringView prefix) const noexcept
    {
        return prefix.size() <= m_count && std::equal(prefix.begin(), prefix.end(), m_first);
    }

    bool StringView::contains(char c) const noexcept { return std::find(begin(), end(), c) != end(); }

    bool operator==(StringView lhs, StringView rhs) noexcept
    {
        if (lhs.size() != rhs.size())
        {
            return false;
        }

        // an empty view may hold a null pointer, which memcmp must not see
        return lhs.empty() || memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
    }
}
