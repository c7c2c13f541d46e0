DECLARE_MSG_ARG(actual, "")
DECLARE_MSG_ARG(command_line, "java -jar pdfbox-app-3.0.3.jar ExtractText -console input.pdf")
DECLARE_MSG_ARG(command_name, "extract-text")
DECLARE_MSG_ARG(count, "42")
DECLARE_MSG_ARG(env_var, "PDFBOX_CACHE_DIR")
DECLARE_MSG_ARG(error_msg, "File Not Found")
DECLARE_MSG_ARG(exit_code, "127")
DECLARE_MSG_ARG(expected, "")
DECLARE_MSG_ARG(lower, "42")
DECLARE_MSG_ARG(option, "password")
DECLARE_MSG_ARG(path, "/home/user/.cache/pdfbox")
DECLARE_MSG_ARG(sha, "7cdbe3a1b6c5c5b7b3b8d0dd0b3a4c0b2a3f0c4a")
DECLARE_MSG_ARG(system_api, "posix_spawnp")
DECLARE_MSG_ARG(upper, "42")
DECLARE_MSG_ARG(url, "https://archive.apache.org/dist/pdfbox/")
DECLARE_MSG_ARG(value, "")
DECLARE_MSG_ARG(version, "3.0.3")
