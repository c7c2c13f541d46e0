#include <pdfbox/base/checks.h>
#include <pdfbox/base/cmd-parser.h>
#include <pdfbox/base/files.h>
#include <pdfbox/base/messages.h>
#include <pdfbox/base/system.debug.h>
#include <pdfbox/base/system.h>

#include <pdfbox/commands.h>
#include <pdfbox/settings.h>

#include <locale.h>
#include <stdlib.h>

using namespace pdfbox;

namespace
{
    [[noreturn]] void invalid_command(StringView command_name)
    {
        msg::write_unlocalized_text_to_stderr(
            Color::error,
            LocalizedString::from_raw(ErrorPrefix)
                .append(msgInvalidCommand, msg::command_name = command_name)
                .append_raw('\n'));
        msg::write_unlocalized_text_to_stderr(Color::none, get_usage());
        Checks::exit_fail(PDFBOX_LINE_INFO);
    }

    [[noreturn]] void inner(const Filesystem& fs, CmdParser& args, const PdfBoxSettings& settings)
    {
        auto maybe_command = args.extract_first_command_like_arg_lowercase();
        const auto command = maybe_command.get();
        if (!command)
        {
            msg::write_unlocalized_text_to_stderr(Color::none, get_usage());
            Checks::exit_fail(PDFBOX_LINE_INFO);
        }

        if (const auto registration = find_command(*command))
        {
            Debug::println("command: ", registration->metadata.name);
            registration->function(args, settings, fs);
        }

        invalid_command(*command);
    }
}

int main(const int argc, const char* const* const argv)
{
    if (argc == 0) abort();

    static const char* const utf8_locales[] = {
        "C.UTF-8",
        "POSIX.UTF-8",
        "en_US.UTF-8",
    };

    for (const char* utf8_locale : utf8_locales)
    {
        if (::setlocale(LC_ALL, utf8_locale))
        {
            break;
        }
    }

    auto settings = PdfBoxSettings::from_environment();
    CmdParser args{convert_argc_argv_to_arguments(argc, argv)};
    parse_global_options(args, settings);
    Debug::g_debugging = settings.debug;
    if (settings.debug)
    {
        Debug::println("archive url: ", settings.archive_url);
        if (auto jar_path = settings.jar_path.get())
        {
            Debug::println("artifact override: ", *jar_path);
        }
    }

    inner(get_real_filesystem(), args, settings);
}
