DECLARE_MSG_ARG(actual, "2")
DECLARE_MSG_ARG(command_name, "managed")
DECLARE_MSG_ARG(env_var, "TOOLSCOUT_XPM_ROOT")
DECLARE_MSG_ARG(error_msg, "No such file or directory")
DECLARE_MSG_ARG(expected, "1")
DECLARE_MSG_ARG(option, "xpm-root")
DECLARE_MSG_ARG(path, "/home/user/.local/xPacks")
DECLARE_MSG_ARG(tool_name, "arm-none-eabi")
DECLARE_MSG_ARG(version, "12.2.1-1.2.1")
