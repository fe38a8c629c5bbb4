#pragma once

#include <toolscout/base/checks.h>

#include <new>
#include <type_traits>
#include <utility>

namespace toolscout
{
    struct NullOpt
    {
        explicit constexpr NullOpt(int) noexcept { }
    };

    inline constexpr NullOpt nullopt{0};

    // Either a T or nothing.
    template<class T>
    struct Optional
    {
        static_assert(!std::is_reference_v<T>);

        constexpr Optional() noexcept : m_placeholder(), m_engaged(false) { }
        constexpr Optional(NullOpt) noexcept : m_placeholder(), m_engaged(false) { }
        Optional(const T& value) : m_value(value), m_engaged(true) { }
        Optional(T&& value) : m_value(std::move(value)), m_engaged(true) { }

        Optional(const Optional& other) : m_placeholder(), m_engaged(false)
        {
            if (other.m_engaged) emplace(other.m_value);
        }

        Optional(Optional&& other) noexcept(std::is_nothrow_move_constructible_v<T>) : m_placeholder(), m_engaged(false)
        {
            if (other.m_engaged) emplace(std::move(other.m_value));
        }

        Optional& operator=(const Optional& other)
        {
            if (this != &other)
            {
                if (other.m_engaged)
                {
                    emplace(other.m_value);
                }
                else
                {
                    clear();
                }
            }

            return *this;
        }

        Optional& operator=(Optional&& other) noexcept
        {
            if (this != &other)
            {
                if (other.m_engaged)
                {
                    emplace(std::move(other.m_value));
                }
                else
                {
                    clear();
                }
            }

            return *this;
        }

        ~Optional() { clear(); }

        template<class... Args>
        T& emplace(Args&&... args)
        {
            clear();
            ::new (static_cast<void*>(&m_value)) T(std::forward<Args>(args)...);
            m_engaged = true;
            return m_value;
        }

        void clear() noexcept
        {
            if (!m_engaged) return;
            m_value.~T();
            m_engaged = false;
        }

        constexpr bool has_value() const noexcept { return m_engaged; }
        constexpr explicit operator bool() const noexcept { return m_engaged; }

        T* get() & noexcept { return m_engaged ? &m_value : nullptr; }
        const T* get() const& noexcept { return m_engaged ? &m_value : nullptr; }
        T* get() && = delete;
        const T* get() const&& = delete;

        template<class U>
        T value_or(U&& fallback) const&
        {
            if (m_engaged) return m_value;
            return static_cast<T>(std::forward<U>(fallback));
        }

        template<class U>
        T value_or(U&& fallback) &&
        {
            if (m_engaged) return std::move(m_value);
            return static_cast<T>(std::forward<U>(fallback));
        }

        const T& value_or_exit(const LineInfo& line_info) const&
        {
            Checks::check_exit(line_info, m_engaged);
            return m_value;
        }

        T&& value_or_exit(const LineInfo& line_info) &&
        {
            Checks::check_exit(line_info, m_engaged);
            return std::move(m_value);
        }

        friend bool operator==(const Optional& lhs, const Optional& rhs)
        {
            if (lhs.m_engaged != rhs.m_engaged) return false;
            return !lhs.m_engaged || lhs.m_value == rhs.m_value;
        }
        friend bool operator!=(const Optional& lhs, const Optional& rhs) { return !(lhs == rhs); }

    private:
        union
        {
            char m_placeholder;
            T m_value;
        };
        bool m_engaged;
    };
}
