DECLARE_MESSAGE(AvailableTools, (), "Built-in tools:")
DECLARE_MESSAGE(ChecksFailedCheck, (), "toolscout has crashed; no additional details are available.")
DECLARE_MESSAGE(ChecksUnreachableCode, (), "unreachable code was reached")
DECLARE_MESSAGE(CmdDuplicateOption, (msg::option), "the option --{option} was specified more than once")
DECLARE_MESSAGE(CmdOptionRequiresValue, (msg::option), "the option --{option} requires a value")
DECLARE_MESSAGE(CmdSwitchTakesNoValue, (msg::option), "the switch --{option} does not accept a value")
DECLARE_MESSAGE(CmdUnknownOption, (msg::option), "unrecognized option --{option}")
DECLARE_MESSAGE(CmdWrongArgumentCount,
                (msg::command_name, msg::expected, msg::actual),
                "'{command_name}' requires {expected} argument(s), but {actual} were provided")
DECLARE_MESSAGE(EmptyToolPath, (msg::tool_name), "the path for {tool_name} is empty")
DECLARE_MESSAGE(InvalidCommand, (msg::command_name), "invalid command: {command_name}. Run 'toolscout help' for usage.")
DECLARE_MESSAGE(MissingPackageName,
                (msg::tool_name),
                "{tool_name} has no xpm package name, so no managed installation can exist")
DECLARE_MESSAGE(NewestToolVersion, (msg::tool_name, msg::version, msg::path), "{tool_name} {version} in {path}")
DECLARE_MESSAGE(NoToolFound, (msg::tool_name, msg::path), "no tool found: {path} contains no usable {tool_name} version")
DECLARE_MESSAGE(ResolvingToolPath, (msg::tool_name, msg::path), "resolving {tool_name} from {path}")
DECLARE_MESSAGE(ScanningToolVersions, (msg::path), "scanning tool versions in {path}")
DECLARE_MESSAGE(SkippingVersionDirectory, (msg::path), "ignoring {path} because its name does not start with a real version")
DECLARE_MESSAGE(ToolDirectoryMissing, (msg::path, msg::error_msg), "failed to list tool versions in {path}: {error_msg}")
DECLARE_MESSAGE(ToolExecutableNotFound, (msg::tool_name, msg::path), "{tool_name} was not found at {path}")
DECLARE_MESSAGE(UnknownTool, (msg::tool_name), "unknown tool '{tool_name}'. Run 'toolscout list' to see the built-in tools.")
DECLARE_MESSAGE(UsageText,
                (),
                "usage: toolscout [--debug] <command> [<args>]\n"
                "\n"
                "commands:\n"
                "  managed <tool> [--xpm-root=<dir>]        print the newest managed executable path\n"
                "  newest <tool> [--xpm-root=<dir>]         print the newest installed version\n"
                "  check <tool> <path> [--last-alternate-match]\n"
                "                                           validate a user supplied tool path\n"
                "  list                                     print the built-in tool definitions\n"
                "  help                                     print this message\n"
                "\n"
                "The xpm root defaults to the TOOLSCOUT_XPM_ROOT environment variable.")
DECLARE_MESSAGE(XpmRootRequired, (msg::env_var), "no xpm root was given; pass --xpm-root=<dir> or set {env_var}")
