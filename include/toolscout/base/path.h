#pragma once

#include <toolscout/base/fmt.h>
#include <toolscout/base/stringview.h>

#include <string>
#include <utility>

namespace toolscout
{
    // A POSIX path; only lexical operations, nothing here touches the filesystem.
    struct Path
    {
        Path() = default;
        Path(StringView text) : m_text(text.to_string()) { }
        Path(const std::string& text) : m_text(text) { }
        Path(std::string&& text) : m_text(std::move(text)) { }
        Path(const char* text) : m_text(text) { }

        const std::string& native() const noexcept { return m_text; }
        const char* c_str() const noexcept { return m_text.c_str(); }
        bool empty() const noexcept { return m_text.empty(); }
        operator StringView() const noexcept { return m_text; }

        // An absolute `component` replaces the whole path.
        Path& operator/=(StringView component);
        Path operator/(StringView component) const
        {
            Path result = *this;
            result /= component;
            return result;
        }

        // Drops "." components and folds "dir/.." pairs; an empty result becomes ".".
        Path lexically_normal() const;

        StringView parent_path() const noexcept;
        StringView filename() const noexcept;
        bool is_absolute() const noexcept { return !m_text.empty() && m_text[0] == '/'; }

    private:
        std::string m_text;
    };
}

TOOLSCOUT_FORMAT_AS(toolscout::Path, toolscout::StringView);
