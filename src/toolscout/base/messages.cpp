#include <toolscout/base/checks.h>
#include <toolscout/base/messages.h>

#include <errno.h>
#include <stdlib.h>
#include <unistd.h>

#include <iterator>

namespace toolscout
{
    LocalizedString LocalizedString::from_raw(StringView text)
    {
        LocalizedString result;
        result.append_raw(text);
        return result;
    }

    LocalizedString& LocalizedString::append_raw(StringView text)
    {
        text.to_string(m_text);
        return *this;
    }

    LocalizedString& LocalizedString::append(const LocalizedString& other)
    {
        m_text.append(other.m_text);
        return *this;
    }

    LocalizedString error_prefix() { return LocalizedString::from_raw("error: "); }
    LocalizedString internal_error_prefix() { return LocalizedString::from_raw("internal error: "); }
}

namespace toolscout::msg
{
    void detail::vformat_to(std::string& out, const char* text, fmt::format_args args)
    {
        try
        {
            fmt::vformat_to(std::back_inserter(out), fmt::string_view{text}, args);
        }
        catch (const fmt::format_error& ex)
        {
            auto report = internal_error_prefix();
            report.append_raw(fmt::format("could not format \"{}\": {}\n", text, ex.what()));
            write_unlocalized_text_to_stderr(Color::error, report);
            Checks::exit_fail(TOOLSCOUT_LINE_INFO);
        }
    }

    namespace
    {
        struct Stream
        {
            int fd;
            bool is_a_tty;

            void put(const char* first, size_t count) const
            {
                while (count != 0)
                {
                    const auto written = ::write(fd, first, count);
                    if (written < 0)
                    {
                        if (errno == EINTR) continue;
                        // nowhere left to report this
                        ::_exit(EXIT_FAILURE);
                    }

                    first += written;
                    count -= static_cast<size_t>(written);
                }
            }

            void put(Color c, StringView text) const
            {
                if (text.empty()) return;
                if (!is_a_tty || c == Color::none)
                {
                    put(text.data(), text.size());
                    return;
                }

                const char start[] = {'\033', '[', '9', static_cast<char>(c), 'm'};
                put(start, sizeof(start));
                put(text.data(), text.size());
                put("\033[0m", 4);
            }
        };

        const Stream& out_stream()
        {
            static const Stream stream{STDOUT_FILENO, ::isatty(STDOUT_FILENO) != 0};
            return stream;
        }

        const Stream& err_stream()
        {
            static const Stream stream{STDERR_FILENO, ::isatty(STDERR_FILENO) != 0};
            return stream;
        }
    }

    void write_unlocalized_text_to_stdout(Color c, StringView text) { out_stream().put(c, text); }
    void write_unlocalized_text_to_stderr(Color c, StringView text) { err_stream().put(c, text); }

    void println(const LocalizedString& text)
    {
        out_stream().put(Color::none, text);
        out_stream().put(Color::none, "\n");
    }

    void println_error(const LocalizedString& text)
    {
        const auto& err = err_stream();
        err.put(Color::error, "error");
        err.put(Color::none, ": ");
        err.put(Color::none, text);
        err.put(Color::none, "\n");
    }
}
