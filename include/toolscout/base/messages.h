#pragma once

#include <toolscout/base/fmt.h>
#include <toolscout/base/stringview.h>

#include <stddef.h>

#include <string>
#include <type_traits>
#include <utility>

namespace toolscout
{
    template<class T>
    struct type_identity
    {
        using type = T;
    };

    template<class T>
    using type_identity_t = typename type_identity<T>::type;

    // The digit selecting a bright ANSI color, or none for plain text.
    enum class Color : char
    {
        none = 0,
        error = '1',
    };

    namespace msg
    {
        // A message from message-data.inc.h; Tags are the named arguments it requires, in order.
        template<class... Tags>
        struct MessageT
        {
            const char* text;
        };

        template<class Tag, class Value>
        struct TagArg
        {
            const Value& value;
        };

        template<class Tag>
        struct TagArg<Tag, StringView>
        {
            StringView value;
        };

        // Anything string-like is passed to fmt as a StringView.
        template<class T>
        using arg_storage_t = std::conditional_t<std::is_convertible_v<const T&, StringView>, StringView, T>;

        namespace detail
        {
            template<class... Tags>
            MessageT<Tags...> message_of(Tags...);

            void vformat_to(std::string& out, const char* text, fmt::format_args args);

            template<class... NamedArgs>
            void format_named_to(std::string& out, const char* text, const NamedArgs&... named)
            {
                vformat_to(out, text, fmt::make_format_args(named...));
            }
        }
    }

    // Text ready to be shown to the user, either formatted from a message or already final.
    struct LocalizedString
    {
        LocalizedString() = default;

        static LocalizedString from_raw(StringView text);

        const std::string& data() const noexcept { return m_text; }
        operator StringView() const noexcept { return m_text; }
        bool empty() const noexcept { return m_text.empty(); }

        LocalizedString& append_raw(StringView text);
        LocalizedString& append(const LocalizedString& other);

        template<class... Tags, class... Values>
        LocalizedString& append(msg::MessageT<Tags...> message, msg::TagArg<type_identity_t<Tags>, Values>... args)
        {
            msg::detail::format_named_to(m_text, message.text, fmt::arg(Tags::name, args.value)...);
            return *this;
        }

        friend bool operator==(const LocalizedString& lhs, const LocalizedString& rhs) noexcept
        {
            return lhs.m_text == rhs.m_text;
        }
        friend bool operator!=(const LocalizedString& lhs, const LocalizedString& rhs) noexcept
        {
            return !(lhs == rhs);
        }

    private:
        std::string m_text;
    };

    LocalizedString error_prefix();
    LocalizedString internal_error_prefix();
}

namespace toolscout::msg
{
#define DECLARE_MSG_ARG(NAME, EXAMPLE)                                                                                 \
    struct NAME##_t                                                                                                    \
    {                                                                                                                  \
        static constexpr const char* name = #NAME;                                                                     \
        template<class T>                                                                                              \
        TagArg<NAME##_t, arg_storage_t<T>> operator=(const T& value) const noexcept                                    \
        {                                                                                                              \
            return {value};                                                                                            \
        }                                                                                                              \
    };                                                                                                                 \
    inline constexpr NAME##_t NAME{};

#include <toolscout/base/message-args.inc.h>
#undef DECLARE_MSG_ARG

    template<class... Tags, class... Values>
    LocalizedString format(MessageT<Tags...> message, TagArg<type_identity_t<Tags>, Values>... args)
    {
        LocalizedString result;
        result.append(message, args...);
        return result;
    }

    // format() behind "error: ".
    template<class... Tags, class... Values>
    LocalizedString format_error(MessageT<Tags...> message, TagArg<type_identity_t<Tags>, Values>... args)
    {
        auto result = error_prefix();
        result.append(message, args...);
        return result;
    }

    void write_unlocalized_text_to_stdout(Color c, StringView text);
    void write_unlocalized_text_to_stderr(Color c, StringView text);

    // stdout, one line
    void println(const LocalizedString& text);
    template<class... Tags, class... Values>
    void println(MessageT<Tags...> message, TagArg<type_identity_t<Tags>, Values>... args)
    {
        println(format(message, args...));
    }

    // stderr, one line behind a colored "error: "
    void println_error(const LocalizedString& text);
    template<class... Tags, class... Values>
    void println_error(MessageT<Tags...> message, TagArg<type_identity_t<Tags>, Values>... args)
    {
        println_error(format(message, args...));
    }
}

namespace toolscout
{
#define DECLARE_MESSAGE(NAME, ARGS, ...)                                                                               \
    inline constexpr decltype(::toolscout::msg::detail::message_of ARGS) msg##NAME{__VA_ARGS__};

#include <toolscout/base/message-data.inc.h>
#undef DECLARE_MESSAGE
}

TOOLSCOUT_FORMAT_AS(toolscout::LocalizedString, toolscout::StringView);
