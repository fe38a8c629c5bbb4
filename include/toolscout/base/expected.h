#pragma once

#include <toolscout/base/checks.h>
#include <toolscout/base/fmt.h>
#include <toolscout/base/messages.h>

#include <new>
#include <type_traits>
#include <utility>

namespace toolscout
{
    // Holds either a T or an Error. Error must be formattable so that value_or_exit can report it.
    template<class T, class Error>
    struct ExpectedT
    {
        static_assert(!std::is_same_v<T, Error>, "a value must be distinguishable from an error");

        // Implicit, so that functions can return either a value or an error directly.
        template<class U,
                 std::enable_if_t<!std::is_convertible_v<U, Error> && std::is_convertible_v<U, T>, int> = 0>
        ExpectedT(U&& value) : m_value(std::forward<U>(value)), m_failed(false)
        {
        }

        template<class E,
                 std::enable_if_t<std::is_convertible_v<E, Error> && !std::is_convertible_v<E, T>, long> = 0>
        ExpectedT(E&& error) : m_error(std::forward<E>(error)), m_failed(true)
        {
        }

        ExpectedT(const ExpectedT& other) : m_failed(other.m_failed)
        {
            if (m_failed)
            {
                ::new (static_cast<void*>(&m_error)) Error(other.m_error);
            }
            else
            {
                ::new (static_cast<void*>(&m_value)) T(other.m_value);
            }
        }

        ExpectedT(ExpectedT&& other) : m_failed(other.m_failed)
        {
            if (m_failed)
            {
                ::new (static_cast<void*>(&m_error)) Error(std::move(other.m_error));
            }
            else
            {
                ::new (static_cast<void*>(&m_value)) T(std::move(other.m_value));
            }
        }

        ExpectedT& operator=(const ExpectedT&) = delete;

        ExpectedT& operator=(ExpectedT&& other) noexcept
        {
            if (this != &other)
            {
                destroy();
                m_failed = other.m_failed;
                if (m_failed)
                {
                    ::new (static_cast<void*>(&m_error)) Error(std::move(other.m_error));
                }
                else
                {
                    ::new (static_cast<void*>(&m_value)) T(std::move(other.m_value));
                }
            }

            return *this;
        }

        ~ExpectedT() { destroy(); }

        constexpr bool has_value() const noexcept { return !m_failed; }
        constexpr explicit operator bool() const noexcept { return !m_failed; }

        T* get() noexcept { return m_failed ? nullptr : &m_value; }
        const T* get() const noexcept { return m_failed ? nullptr : &m_value; }

        const Error& error() const
        {
            if (!m_failed) Checks::unreachable(TOOLSCOUT_LINE_INFO);
            return m_error;
        }

        const T& value_or_exit(const LineInfo& line_info) const&
        {
            if (m_failed) fail(line_info);
            return m_value;
        }

        T&& value_or_exit(const LineInfo& line_info) &&
        {
            if (m_failed) fail(line_info);
            return std::move(m_value);
        }

    private:
        [[noreturn]] void fail(const LineInfo& line_info) const
        {
            Checks::msg_exit_with_error(line_info, LocalizedString::from_raw(fmt::format("{}", m_error)));
        }

        void destroy() noexcept
        {
            if (m_failed)
            {
                m_error.~Error();
            }
            else
            {
                m_value.~T();
            }
        }

        union
        {
            T m_value;
            Error m_error;
        };
        bool m_failed;
    };
}
