#pragma once

#include <pdfbox/base/fwd/cmd-parser.h>
#include <pdfbox/base/fwd/files.h>
#include <pdfbox/base/fwd/messages.h>

#include <pdfbox/base/optional.h>
#include <pdfbox/base/stringview.h>

#include <pdfbox/settings.h>

#include <stddef.h>

namespace pdfbox
{
    struct CommandMetadata
    {
        StringLiteral name;
        const msg::MessageT<>& synopsis;
        StringLiteral example;
        size_t minimum_arity;
        size_t maximum_arity;
    };

    using CommandFn = void (*)(CmdParser& args, const PdfBoxSettings& settings, const Filesystem& fs);

    struct CommandRegistration
    {
        const CommandMetadata& metadata;
        CommandFn function;
    };

    extern const CommandMetadata CommandExtractTextMetadata;
    [[noreturn]] void command_extract_text_and_exit(CmdParser& args,
                                                    const PdfBoxSettings& settings,
                                                    const Filesystem& fs);

    extern const CommandMetadata CommandSplitMetadata;
    [[noreturn]] void command_split_and_exit(CmdParser& args, const PdfBoxSettings& settings, const Filesystem& fs);

    extern const CommandMetadata CommandMergeMetadata;
    [[noreturn]] void command_merge_and_exit(CmdParser& args, const PdfBoxSettings& settings, const Filesystem& fs);

    extern const CommandMetadata CommandDebugMetadata;
    [[noreturn]] void command_debug_and_exit(CmdParser& args, const PdfBoxSettings& settings, const Filesystem& fs);

    extern const CommandMetadata CommandToImageMetadata;
    [[noreturn]] void command_to_image_and_exit(CmdParser& args, const PdfBoxSettings& settings, const Filesystem& fs);

    extern const CommandMetadata CommandResolveMetadata;
    [[noreturn]] void command_resolve_and_exit(CmdParser& args, const PdfBoxSettings& settings, const Filesystem& fs);

    extern const CommandMetadata CommandListVersionsMetadata;
    [[noreturn]] void command_list_versions_and_exit(CmdParser& args,
                                                     const PdfBoxSettings& settings,
                                                     const Filesystem& fs);

    extern const CommandMetadata CommandHelpMetadata;
    [[noreturn]] void command_help_and_exit(CmdParser& args, const PdfBoxSettings& settings, const Filesystem& fs);

    extern const CommandMetadata CommandVersionMetadata;
    [[noreturn]] void command_version_and_exit(CmdParser& args, const PdfBoxSettings& settings, const Filesystem& fs);

    // nullptr if no command has that name.
    const CommandRegistration* find_command(StringView name);

    // The global options, followed by one line per command.
    LocalizedString get_usage();

    // Parses --debug, --jar, --java, --cache-dir, --archive-url and --pdfbox-version over settings.
    void parse_global_options(CmdParser& args, PdfBoxSettings& settings);
}
