#include <pdfbox/base/checks.h>
#include <pdfbox/base/cmd-parser.h>
#include <pdfbox/base/curl.h>
#include <pdfbox/base/diagnostics.h>
#include <pdfbox/base/downloads.h>
#include <pdfbox/base/files.h>
#include <pdfbox/base/message_sinks.h>
#include <pdfbox/base/strings.h>
#include <pdfbox/base/system.process.h>

#include <pdfbox/artifactcache.h>
#include <pdfbox/catalog.h>
#include <pdfbox/commands.h>
#include <pdfbox/tool.h>
#include <pdfbox/versions.h>

#include <stdint.h>

#include <algorithm>

using namespace pdfbox;

namespace
{
    template<class T>
    T unwrap_or_exit(ExpectedP<T>&& maybe_value, const LineInfo& line_info)
    {
        if (auto value = maybe_value.get())
        {
            return std::move(*value);
        }

        msg::write_unlocalized_text_to_stderr(
            Color::error, error_prefix().append_raw(maybe_value.error().to_string()).append_raw('\n'));
        Checks::exit_fail(line_info);
    }

    std::vector<std::string> consume_positionals(CmdParser& args, const CommandMetadata& metadata)
    {
        auto results = args.consume_positionals(metadata.name, metadata.minimum_arity, metadata.maximum_arity);
        args.exit_with_errors(LocalizedString::from_raw(metadata.example));
        return results;
    }

    Optional<int> parse_int_option(CmdParser& args, StringView option_name, const LocalizedString& help_text)
    {
        Optional<std::string> text;
        args.parse_option(option_name, text, help_text);
        if (auto t = text.get())
        {
            auto value = Strings::strto<int>(*t);
            if (!value)
            {
                Checks::msg_exit_with_error(
                    PDFBOX_LINE_INFO, msgOptionRequiresAnInteger, msg::option = option_name, msg::value = *t);
            }

            return value;
        }

        return nullopt;
    }

    PdfBox create_tool(const PdfBoxSettings& settings, const Filesystem& fs)
    {
        return unwrap_or_exit(PdfBox::create(settings, fs, get_curl_http_client(), stderr_sink), PDFBOX_LINE_INFO);
    }

    // Echoes the child's combined output and exits with its exit code.
    [[noreturn]] void wait_and_exit(RunningProcess&& process)
    {
        auto maybe_result = process.wait_and_capture(console_diagnostic_context);
        if (auto result = maybe_result.get())
        {
            msg::write_unlocalized_text_to_stdout(Color::none, result->output);
            Checks::exit_with_code(PDFBOX_LINE_INFO, result->exit_code);
        }

        Checks::exit_fail(PDFBOX_LINE_INFO);
    }

    void parse_password(CmdParser& args, Optional<std::string>& password)
    {
        args.parse_option("password", password, msg::format(msgHelpPassword));
    }

    constexpr CommandRegistration command_table[] = {
        {CommandExtractTextMetadata, command_extract_text_and_exit},
        {CommandSplitMetadata, command_split_and_exit},
        {CommandMergeMetadata, command_merge_and_exit},
        {CommandDebugMetadata, command_debug_and_exit},
        {CommandToImageMetadata, command_to_image_and_exit},
        {CommandResolveMetadata, command_resolve_and_exit},
        {CommandListVersionsMetadata, command_list_versions_and_exit},
        {CommandHelpMetadata, command_help_and_exit},
        {CommandVersionMetadata, command_version_and_exit},
    };
}

namespace pdfbox
{
    const CommandMetadata CommandExtractTextMetadata{
        "extract-text",
        msgHelpExtractTextCommand,
        "pdfbox extract-text input.pdf [output.txt]",
        1,
        2,
    };

    void command_extract_text_and_exit(CmdParser& args, const PdfBoxSettings& settings, const Filesystem& fs)
    {
        ExtractTextOptions options;
        parse_password(args, options.password);
        args.parse_option("encoding", options.encoding, msg::format(msgHelpEncoding));
        args.parse_switch("html", options.html, msg::format(msgHelpHtml));
        args.parse_switch("sort", options.sort, msg::format(msgHelpSort));
        args.parse_switch("ignore-beads", options.ignore_beads, msg::format(msgHelpIgnoreBeads));
        options.start_page = parse_int_option(args, "start-page", msg::format(msgHelpStartPage));
        options.end_page = parse_int_option(args, "end-page", msg::format(msgHelpEndPage));
        args.parse_switch("always-next", options.always_next, msg::format(msgHelpAlwaysNext));
        const auto paths = consume_positionals(args, CommandExtractTextMetadata);

        const auto tool = create_tool(settings, fs);
        if (paths.size() == 1)
        {
            const auto text = unwrap_or_exit(tool.extract_text(paths[0], options), PDFBOX_LINE_INFO);
            msg::write_unlocalized_text_to_stdout(Color::none, text);
            Checks::exit_success(PDFBOX_LINE_INFO);
        }

        wait_and_exit(unwrap_or_exit(tool.extract_text_to_file(paths[0], paths[1], options), PDFBOX_LINE_INFO));
    }

    const CommandMetadata CommandSplitMetadata{
        "split",
        msgHelpSplitCommand,
        "pdfbox split --split=1 input.pdf",
        1,
        1,
    };

    void command_split_and_exit(CmdParser& args, const PdfBoxSettings& settings, const Filesystem& fs)
    {
        SplitOptions options;
        parse_password(args, options.password);
        options.start_page = parse_int_option(args, "start-page", msg::format(msgHelpStartPage));
        options.end_page = parse_int_option(args, "end-page", msg::format(msgHelpEndPage));
        options.split = parse_int_option(args, "split", msg::format(msgHelpSplit));
        const auto paths = consume_positionals(args, CommandSplitMetadata);

        wait_and_exit(unwrap_or_exit(create_tool(settings, fs).split(paths[0], options), PDFBOX_LINE_INFO));
    }

    const CommandMetadata CommandMergeMetadata{
        "merge",
        msgHelpMergeCommand,
        "pdfbox merge --output=merged.pdf first.pdf second.pdf",
        0,
        SIZE_MAX,
    };

    void command_merge_and_exit(CmdParser& args, const PdfBoxSettings& settings, const Filesystem& fs)
    {
        std::string target = DefaultMergeTarget.to_string();
        args.parse_option("output", target, msg::format(msgHelpMergeOutput));
        const auto sources = consume_positionals(args, CommandMergeMetadata);

        const auto tool = create_tool(settings, fs);
        wait_and_exit(unwrap_or_exit(tool.merge(sources, target), PDFBOX_LINE_INFO));
    }

    const CommandMetadata CommandDebugMetadata{
        "debug",
        msgHelpDebugCommand,
        "pdfbox debug --view-structure input.pdf",
        1,
        1,
    };

    void command_debug_and_exit(CmdParser& args, const PdfBoxSettings& settings, const Filesystem& fs)
    {
        DebugOptions options;
        parse_password(args, options.password);
        args.parse_switch("view-structure", options.view_structure, msg::format(msgHelpViewStructure));
        const auto paths = consume_positionals(args, CommandDebugMetadata);

        wait_and_exit(unwrap_or_exit(create_tool(settings, fs).debug(paths[0], options), PDFBOX_LINE_INFO));
    }

    const CommandMetadata CommandToImageMetadata{
        "to-image",
        msgHelpToImageCommand,
        "pdfbox to-image --image-type=png --dpi=72 input.pdf",
        1,
        1,
    };

    void command_to_image_and_exit(CmdParser& args, const PdfBoxSettings& settings, const Filesystem& fs)
    {
        ToImageOptions options;
        parse_password(args, options.password);
        args.parse_option("image-type", options.image_type, msg::format(msgHelpImageType));
        args.parse_option("output-prefix", options.output_prefix, msg::format(msgHelpOutputPrefix));
        options.start_page = parse_int_option(args, "start-page", msg::format(msgHelpStartPage));
        options.end_page = parse_int_option(args, "end-page", msg::format(msgHelpEndPage));
        options.page = parse_int_option(args, "page", msg::format(msgHelpPage));
        options.dpi = parse_int_option(args, "dpi", msg::format(msgHelpDpi));
        args.parse_option("color", options.color, msg::format(msgHelpColor));
        Optional<std::string> cropbox;
        if (args.parse_option("cropbox", cropbox, msg::format(msgHelpCropbox)))
        {
            options.cropbox = Strings::split(cropbox.value_or_exit(PDFBOX_LINE_INFO), ',');
        }

        args.parse_switch("time", options.time, msg::format(msgHelpTime));
        const auto paths = consume_positionals(args, CommandToImageMetadata);

        wait_and_exit(unwrap_or_exit(create_tool(settings, fs).to_image(paths[0], options), PDFBOX_LINE_INFO));
    }

    const CommandMetadata CommandResolveMetadata{
        "resolve",
        msgHelpResolveCommand,
        "pdfbox resolve --list",
        0,
        0,
    };

    void command_resolve_and_exit(CmdParser& args, const PdfBoxSettings& settings, const Filesystem& fs)
    {
        bool list = false;
        args.parse_switch("list", list, msg::format(msgHelpList));
        (void)consume_positionals(args, CommandResolveMetadata);

        const auto& http = get_curl_http_client();
        if (!list)
        {
            const auto path =
                unwrap_or_exit(resolve_artifact_path(fs, http, stderr_sink, settings), PDFBOX_LINE_INFO);
            msg::write_unlocalized_text_to_stdout(Color::none, Strings::concat(path, '\n'));
            Checks::exit_success(PDFBOX_LINE_INFO);
        }

        auto cache_dir = unwrap_or_exit(determine_cache_dir(settings), PDFBOX_LINE_INFO);
        const ArtifactCache cache{fs, http, stderr_sink, std::move(cache_dir), settings.archive_url};
        const auto artifacts = unwrap_or_exit(cache.scan(), PDFBOX_LINE_INFO);
        if (artifacts.empty())
        {
            stderr_sink.println(msgNoCachedArtifacts, msg::path = cache.cache_dir());
        }

        for (auto&& artifact : artifacts)
        {
            msg::write_unlocalized_text_to_stdout(
                Color::none, fmt::format("{} {}\n", artifact.version.original_string, artifact.path));
        }

        Checks::exit_success(PDFBOX_LINE_INFO);
    }

    const CommandMetadata CommandListVersionsMetadata{
        "list-versions",
        msgHelpListVersionsCommand,
        "pdfbox list-versions",
        0,
        0,
    };

    void command_list_versions_and_exit(CmdParser& args, const PdfBoxSettings& settings, const Filesystem&)
    {
        (void)consume_positionals(args, CommandListVersionsMetadata);

        const VersionCatalog catalog{get_curl_http_client(), stderr_sink, settings.archive_url};
        const auto versions = unwrap_or_exit(catalog.fetch_versions(), PDFBOX_LINE_INFO);
        std::vector<DotVersion> parsed;
        for (auto&& version : versions)
        {
            auto maybe_parsed = DotVersion::try_parse(version);
            if (auto v = maybe_parsed.get())
            {
                parsed.push_back(std::move(*v));
            }
            else
            {
                msg::println_warning(maybe_parsed.error());
            }
        }

        std::sort(parsed.begin(), parsed.end());
        for (auto&& version : parsed)
        {
            msg::write_unlocalized_text_to_stdout(Color::none, Strings::concat(version.original_string, '\n'));
        }

        Checks::exit_success(PDFBOX_LINE_INFO);
    }

    const CommandMetadata CommandHelpMetadata{
        "help",
        msgHelpHelpCommand,
        "pdfbox help extract-text",
        0,
        1,
    };

    void command_help_and_exit(CmdParser& args, const PdfBoxSettings&, const Filesystem&)
    {
        const auto topics = consume_positionals(args, CommandHelpMetadata);
        if (topics.empty())
        {
            msg::write_unlocalized_text_to_stdout(Color::none, get_usage());
            Checks::exit_success(PDFBOX_LINE_INFO);
        }

        const auto command = find_command(topics[0]);
        if (!command)
        {
            Checks::msg_exit_with_error(PDFBOX_LINE_INFO, msgInvalidCommand, msg::command_name = topics[0]);
        }

        auto text = msg::format(command->metadata.synopsis);
        text.append_raw('\n').append(msgHelpExampleCommand).append_raw('\n');
        text.append_indent().append_raw(command->metadata.example).append_raw('\n');
        msg::write_unlocalized_text_to_stdout(Color::none, text);
        Checks::exit_success(PDFBOX_LINE_INFO);
    }

    const CommandMetadata CommandVersionMetadata{
        "version",
        msgHelpVersionCommand,
        "pdfbox version",
        0,
        0,
    };

    void command_version_and_exit(CmdParser& args, const PdfBoxSettings&, const Filesystem&)
    {
        (void)consume_positionals(args, CommandVersionMetadata);
        msg::println(msgVersionCommandHeader, msg::version = PDFBOX_VERSION_AS_STRING);
        Checks::exit_success(PDFBOX_LINE_INFO);
    }

    const CommandRegistration* find_command(StringView name)
    {
        for (auto&& registration : command_table)
        {
            if (registration.metadata.name == name)
            {
                return &registration;
            }
        }

        return nullptr;
    }

    LocalizedString get_usage()
    {
        HelpTableFormatter table;
        table.text(msg::format(msgUsageHeader));
        table.blank();
        table.header(msg::format(msgHelpCommandsHeader));
        for (auto&& registration : command_table)
        {
            table.format(registration.metadata.name, msg::format(registration.metadata.synopsis));
        }

        table.blank();
        table.header(msg::format(msgHelpGlobalOptionsHeader));
        table.format("--debug", msg::format(msgHelpDebug));
        table.format("--jar=<path>", msg::format(msgHelpJar, msg::env_var = EnvironmentVariableJar));
        table.format("--java=<path>", msg::format(msgHelpJava, msg::env_var = EnvironmentVariableJava));
        table.format("--cache-dir=<path>", msg::format(msgHelpCacheDir, msg::env_var = EnvironmentVariableCacheDir));
        table.format("--archive-url=<url>",
                     msg::format(msgHelpArchiveUrl, msg::env_var = EnvironmentVariableArchiveUrl));
        table.format("--pdfbox-version=<version>",
                     msg::format(msgHelpPdfBoxVersion, msg::env_var = EnvironmentVariableVersion));
        return LocalizedString::from_raw(std::move(table.m_str));
    }

    void parse_global_options(CmdParser& args, PdfBoxSettings& settings)
    {
        args.parse_switch("debug", settings.debug, msg::format(msgHelpDebug));
        args.parse_option(
            "jar", settings.jar_path, msg::format(msgHelpJar, msg::env_var = EnvironmentVariableJar));
        args.parse_option(
            "java", settings.java_path, msg::format(msgHelpJava, msg::env_var = EnvironmentVariableJava));
        args.parse_option(
            "cache-dir", settings.cache_dir, msg::format(msgHelpCacheDir, msg::env_var = EnvironmentVariableCacheDir));
        args.parse_option("archive-url",
                          settings.archive_url,
                          msg::format(msgHelpArchiveUrl, msg::env_var = EnvironmentVariableArchiveUrl));
        args.parse_option("pdfbox-version",
                          settings.pinned_version,
                          msg::format(msgHelpPdfBoxVersion, msg::env_var = EnvironmentVariableVersion));
    }
}
