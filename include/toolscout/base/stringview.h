#pragma once

#include <toolscout/base/fmt.h>

#include <stddef.h>
#include <string.h>

#include <string>

namespace toolscout
{
    // A non-owning view of characters; not necessarily null terminated.
    struct StringView
    {
        constexpr StringView() noexcept = default;
        StringView(const std::string& text) noexcept : m_first(text.data()), m_count(text.size()) { }
        StringView(const char* text) noexcept : m_first(text), m_count(strlen(text)) { }
        constexpr StringView(const char* first, size_t count) noexcept : m_first(first), m_count(count) { }
        constexpr StringView(const char* first, const char* last) noexcept
            : m_first(first), m_count(static_cast<size_t>(last - first))
        {
        }

        constexpr const char* data() const noexcept { return m_first; }
        constexpr size_t size() const noexcept { return m_count; }
        constexpr bool empty() const noexcept { return m_count == 0; }
        constexpr const char* begin() const noexcept { return m_first; }
        constexpr const char* end() const noexcept { return m_first + m_count; }
        constexpr char operator[](size_t idx) const noexcept { return m_first[idx]; }

        // The tail starting at `offset`; empty when `offset` is past the end.
        constexpr StringView substr(size_t offset) const noexcept
        {
            return offset < m_count ? StringView{m_first + offset, m_count - offset} : StringView{};
        }

        bool starts_with(StringView prefix) const noexcept;
        bool contains(char c) const noexcept;

        std::string to_string() const { return std::string(m_first, m_count); }
        void to_string(std::string& out) const { out.append(m_first, m_count); }

    private:
        const char* m_first = nullptr;
        size_t m_count = 0;
    };

    // Free functions so that anything convertible to StringView, like Path, compares too.
    bool operator==(StringView lhs, StringView rhs) noexcept;
    inline bool operator!=(StringView lhs, StringView rhs) noexcept { return !(lhs == rhs); }

    // A string literal, so always null terminated and alive for the whole program.
    struct StringLiteral : StringView
    {
        template<size_t N>
        constexpr StringLiteral(const char (&text)[N]) noexcept : StringView(text, N - 1)
        {
        }

        constexpr const char* c_str() const noexcept { return data(); }
    };
}

template<>
struct fmt::formatter<toolscout::StringView> : fmt::formatter<fmt::string_view>
{
    template<class Context>
    auto format(toolscout::StringView text, Context& ctx) const
    {
        return fmt::formatter<fmt::string_view>::format(fmt::string_view{text.data(), text.size()}, ctx);
    }
};

TOOLSCOUT_FORMAT_AS(toolscout::StringLiteral, toolscout::StringView);
