#include <toolscout-test/util.h>

#include <toolscout/base/cmd-parser.h>

using namespace toolscout;

namespace
{
    std::vector<LocalizedString> localized(const std::vector<std::string>& strings)
    {
        std::vector<LocalizedString> result;
        for (auto&& str : strings)
        {
            result.emplace_back(LocalizedString::from_raw(str));
        }

        return result;
    }
}

TEST_CASE ("Arguments can be converted from argc/argv", "[cmd_parser]")
{
    const char* argv[] = {"a.out", "a", "b"};
    CHECK(convert_argc_argv_to_arguments(3, argv) == std::vector<std::string>{"a", "b"});
    CHECK(convert_argc_argv_to_arguments(1, argv).empty());
}

TEST_CASE ("Arguments can be parsed as switches", "[cmd_parser]")
{
    CmdParser uut{{"check", "--debug", "--last-alternate-match", "--debugger", "make"}};

    bool debug = false;
    CHECK(uut.parse_switch("debug", debug));
    CHECK(debug);

    bool last_alternate_match = false;
    CHECK(uut.parse_switch("last-alternate-match", last_alternate_match));
    CHECK(last_alternate_match);

    bool missing = false;
    CHECK_FALSE(uut.parse_switch("missing", missing));
    CHECK_FALSE(missing);

    CHECK(uut.get_errors().empty());
    CHECK(uut.extract_first_command_like_arg_lowercase().value_or_exit(TOOLSCOUT_LINE_INFO) == "check");
    CHECK(uut.consume_remaining_args("check", 1).empty());
    CHECK(uut.get_errors() == localized({"error: unrecognized option --debugger"}));
}

TEST_CASE ("Switches reject values and duplicates", "[cmd_parser]")
{
    CmdParser uut{{"--debug=1", "--flag", "--flag"}};
    bool debug = false;
    CHECK_FALSE(uut.parse_switch("debug", debug));
    CHECK_FALSE(debug);
    bool flag = false;
    CHECK(uut.parse_switch("flag", flag));
    CHECK(flag);
    CHECK(uut.get_errors() == localized({"error: the switch --debug does not accept a value",
                                         "error: the option --flag was specified more than once"}));
}

TEST_CASE ("Arguments can be parsed as options", "[cmd_parser]")
{
    SECTION ("equals form")
    {
        CmdParser uut{{"managed", "--xpm-root=/opt/xpm", "openocd"}};
        Optional<std::string> xpm_root;
        CHECK(uut.parse_option("xpm-root", xpm_root));
        CHECK(xpm_root.value_or_exit(TOOLSCOUT_LINE_INFO) == "/opt/xpm");
        CHECK(uut.extract_first_command_like_arg_lowercase().value_or_exit(TOOLSCOUT_LINE_INFO) == "managed");
        CHECK(uut.consume_remaining_args("managed", 1) == std::vector<std::string>{"openocd"});
        CHECK(uut.get_errors().empty());
    }

    SECTION ("separate value")
    {
        CmdParser uut{{"--xpm-root", "/opt/xpm", "newest", "make"}};
        Optional<std::string> xpm_root;
        CHECK(uut.parse_option("xpm-root", xpm_root));
        CHECK(xpm_root.value_or_exit(TOOLSCOUT_LINE_INFO) == "/opt/xpm");
        CHECK(uut.extract_first_command_like_arg_lowercase().value_or_exit(TOOLSCOUT_LINE_INFO) == "newest");
        CHECK(uut.consume_remaining_args("newest", 1) == std::vector<std::string>{"make"});
        CHECK(uut.get_errors().empty());
    }

    SECTION ("empty value")
    {
        CmdParser uut{{"--xpm-root="}};
        Optional<std::string> xpm_root;
        CHECK(uut.parse_option("xpm-root", xpm_root));
        CHECK(xpm_root.value_or_exit(TOOLSCOUT_LINE_INFO).empty());
    }

    SECTION ("missing value")
    {
        CmdParser uut{{"--xpm-root", "--debug"}};
        Optional<std::string> xpm_root;
        CHECK_FALSE(uut.parse_option("xpm-root", xpm_root));
        CHECK_FALSE(xpm_root.has_value());
        CHECK(uut.get_errors() == localized({"error: the option --xpm-root requires a value"}));

        bool debug = false;
        CHECK(uut.parse_switch("debug", debug));
        CHECK(debug);
    }

    SECTION ("a failed repeat keeps the earlier value")
    {
        CmdParser uut{{"--xpm-root=/a", "--xpm-root"}};
        Optional<std::string> xpm_root;
        CHECK(uut.parse_option("xpm-root", xpm_root));
        CHECK(xpm_root.value_or_exit(TOOLSCOUT_LINE_INFO) == "/a");
        CHECK(uut.get_errors() == localized({"error: the option --xpm-root was specified more than once",
                                             "error: the option --xpm-root requires a value"}));
    }

    SECTION ("duplicates keep the last value")
    {
        CmdParser uut{{"--xpm-root=/a", "--xpm-root=/b"}};
        Optional<std::string> xpm_root;
        CHECK(uut.parse_option("xpm-root", xpm_root));
        CHECK(xpm_root.value_or_exit(TOOLSCOUT_LINE_INFO) == "/b");
        CHECK(uut.get_errors() == localized({"error: the option --xpm-root was specified more than once"}));
    }
}

TEST_CASE ("Commands are extracted in lowercase", "[cmd_parser]")
{
    CmdParser uut{{"--debug", "MaNaGeD", "Arm-None-Eabi"}};
    CHECK(uut.extract_first_command_like_arg_lowercase().value_or_exit(TOOLSCOUT_LINE_INFO) == "managed");
    CHECK(uut.extract_first_command_like_arg_lowercase().value_or_exit(TOOLSCOUT_LINE_INFO) == "arm-none-eabi");
    CHECK_FALSE(uut.extract_first_command_like_arg_lowercase().has_value());

    CmdParser help{{"--HELP"}};
    CHECK(help.extract_first_command_like_arg_lowercase().value_or_exit(TOOLSCOUT_LINE_INFO) == "help");
    CmdParser short_help{{"-h"}};
    CHECK(short_help.extract_first_command_like_arg_lowercase().value_or_exit(TOOLSCOUT_LINE_INFO) == "help");
}

TEST_CASE ("Remaining arguments are checked", "[cmd_parser]")
{
    SECTION ("wrong count")
    {
        CmdParser uut{{"one", "two"}};
        CHECK(uut.consume_remaining_args("check", 3).empty());
        CHECK(uut.get_errors() == localized({"error: 'check' requires 3 argument(s), but 2 were provided"}));
    }

    SECTION ("no arguments")
    {
        CmdParser uut{{"extra"}};
        uut.enforce_no_remaining_args("list");
        CHECK(uut.get_errors() == localized({"error: 'list' requires 0 argument(s), but 1 were provided"}));
    }

    SECTION ("unknown option with a value")
    {
        CmdParser uut{{"--unknown=value"}};
        uut.enforce_no_remaining_args("help");
        CHECK(uut.get_errors() == localized({"error: unrecognized option --unknown"}));
    }

    SECTION ("clean")
    {
        CmdParser uut{{"a", "b"}};
        CHECK(uut.consume_remaining_args("check", 2) == std::vector<std::string>{"a", "b"});
        CHECK(uut.get_errors().empty());
    }
}
