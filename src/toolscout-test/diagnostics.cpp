#include <toolscout-test/util.h>

#include <toolscout/base/diagnostics.h>
#include <toolscout/base/message_sinks.h>
#include <toolscout/base/messages.h>

using namespace toolscout;

TEST_CASE ("messages substitute named arguments", "[messages]")
{
    CHECK(msg::format(msgNoToolFound, msg::tool_name = "openocd", msg::path = Path{"/xpm/openocd"}) ==
          LocalizedString::from_raw("no tool found: /xpm/openocd contains no usable openocd version"));
    CHECK(msg::format_error(msgUnknownTool, msg::tool_name = "gdb").data() ==
          "error: unknown tool 'gdb'. Run 'toolscout list' to see the built-in tools.");

    const size_t expected = 2;
    CHECK(msg::format(msgCmdWrongArgumentCount,
                      msg::command_name = std::string("check"),
                      msg::expected = expected,
                      msg::actual = 3)
              .data() == "'check' requires 2 argument(s), but 3 were provided");
}

TEST_CASE ("LocalizedString appends", "[messages]")
{
    LocalizedString s = LocalizedString::from_raw("a");
    CHECK_FALSE(s.empty());
    s.append_raw(": ").append(LocalizedString::from_raw("b ")).append(msgAvailableTools);
    CHECK(s.data() == "a: b Built-in tools:");
    CHECK(fmt::format("[{}]", s) == "[a: b Built-in tools:]");
    CHECK(LocalizedString{}.empty());
    CHECK(LocalizedString::from_raw("x") != LocalizedString::from_raw("y"));
}

TEST_CASE ("sinks print text with a trailing newline", "[messages]")
{
    Test::RecordingSink sink;
    sink.println(LocalizedString::from_raw("plain"));
    sink.println(Color::error, LocalizedString::from_raw("colored"));
    CHECK(sink.text == "plain\ncolored\n");

    null_sink.println(LocalizedString::from_raw("dropped"));
}

TEST_CASE ("BufferedDiagnosticContext keeps errors and forwards status", "[diagnostics]")
{
    Test::RecordingSink status;
    BufferedDiagnosticContext bdc{status};
    bdc.statusln(LocalizedString::from_raw("working"));
    CHECK(bdc.empty());
    CHECK(status.text == "working\n");

    bdc.report_error(LocalizedString::from_raw("first"));
    bdc.report_error(msgEmptyToolPath, msg::tool_name = "make");
    CHECK_FALSE(bdc.empty());
    REQUIRE(bdc.errors.size() == 2);
    CHECK(bdc.errors[1].data() == "the path for make is empty");
    CHECK(bdc.to_string() == "error: first\nerror: the path for make is empty");
    CHECK(status.text == "working\n");

    Test::RecordingSink printed;
    bdc.print_to(printed);
    CHECK(printed.text == "error: first\nerror: the path for make is empty\n");
}
