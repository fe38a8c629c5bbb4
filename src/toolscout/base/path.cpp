#include <toolscout/base/path.h>

#include <algorithm>
#include <vector>

namespace
{
    using namespace toolscout;

    bool is_separator(char c) noexcept { return c == '/'; }

    // Start of the last component, after any leading separators of an absolute path.
    const char* last_component(const char* first, const char* last) noexcept
    {
        const auto after_root = std::find_if_not(first, last, is_separator);
        while (last != after_root && !is_separator(*(last - 1)))
        {
            --last;
        }

        return last;
    }
}

namespace toolscout
{
    Path& Path::operator/=(StringView component)
    {
        if (!component.empty() && is_separator(component[0]))
        {
            m_text = component.to_string();
        }
        else
        {
            if (!m_text.empty() && !is_separator(m_text.back())) m_text.push_back('/');
            component.to_string(m_text);
        }

        return *this;
    }

    Path Path::lexically_normal() const
    {
        if (m_text.empty()) return {};

        const auto first = m_text.data();
        const auto last = first + m_text.size();
        const bool rooted = is_separator(*first);

        std::vector<StringView> kept;
        auto cursor = first;
        while (cursor != last)
        {
            cursor = std::find_if_not(cursor, last, is_separator);
            const auto end = std::find_if(cursor, last, is_separator);
            const StringView component{cursor, end};
            cursor = end;

            if (component.empty() || component == ".") continue;
            if (component == "..")
            {
                if (!kept.empty() && kept.back() != "..")
                {
                    kept.pop_back();
                    continue;
                }

                // the parent of the root is the root
                if (rooted) continue;
            }

            kept.push_back(component);
        }

        std::string result = rooted ? "/" : "";
        for (size_t idx = 0; idx != kept.size(); ++idx)
        {
            if (idx != 0) result.push_back('/');
            kept[idx].to_string(result);
        }

        if (is_separator(last[-1]) && !kept.empty() && kept.back() != "..") result.push_back('/');
        if (result.empty()) result = ".";
        return result;
    }

    StringView Path::parent_path() const noexcept
    {
        const auto first = m_text.data();
        const auto after_root = std::find_if_not(first, first + m_text.size(), is_separator);
        auto end = last_component(first, first + m_text.size());
        while (end != after_root && is_separator(*(end - 1)))
        {
            --end;
        }

        return StringView{first, end};
    }

    StringView Path::filename() const noexcept
    {
        const auto last = m_text.data() + m_text.size();
        return StringView{last_component(m_text.data(), last), last};
    }
}
