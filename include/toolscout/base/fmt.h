#pragma once

#include <fmt/format.h>

#include <string>

// Formats Type by converting it to Base, which must already be formattable.
#define TOOLSCOUT_FORMAT_AS(Type, Base)                                                                                \
    template<>                                                                                                         \
    struct fmt::formatter<Type> : fmt::formatter<Base>                                                                 \
    {                                                                                                                  \
        template<class Context>                                                                                        \
        auto format(const Type& value, Context& ctx) const                                                             \
        {                                                                                                              \
            return fmt::formatter<Base>::format(static_cast<Base>(value), ctx);                                        \
        }                                                                                                              \
    }

// Formats Type through its to_string(std::string&) member.
#define TOOLSCOUT_FORMAT_WITH_TO_STRING(Type)                                                                          \
    template<>                                                                                                         \
    struct fmt::formatter<Type> : fmt::formatter<fmt::string_view>                                                     \
    {                                                                                                                  \
        template<class Context>                                                                                        \
        auto format(const Type& value, Context& ctx) const                                                             \
        {                                                                                                              \
            std::string text;                                                                                          \
            value.to_string(text);                                                                                     \
            return fmt::formatter<fmt::string_view>::format(fmt::string_view{text}, ctx);                              \
        }                                                                                                              \
    }

// Formats an enumeration through a free to_string_literal(Type) found by argument dependent lookup.
#define TOOLSCOUT_FORMAT_WITH_TO_STRING_LITERAL_NONMEMBER(Type)                                                        \
    template<>                                                                                                         \
    struct fmt::formatter<Type> : fmt::formatter<fmt::string_view>                                                     \
    {                                                                                                                  \
        template<class Context>                                                                                        \
        auto format(const Type& value, Context& ctx) const                                                             \
        {                                                                                                              \
            const auto literal = to_string_literal(value);                                                             \
            return fmt::formatter<fmt::string_view>::format(fmt::string_view{literal.data(), literal.size()}, ctx);    \
        }                                                                                                              \
    }

template<class T>
std::string adapt_to_string(const T& value)
{
    std::string text;
    value.to_string(text);
    return text;
}
