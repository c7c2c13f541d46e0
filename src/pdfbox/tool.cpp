#include <pdfbox/base/files.h>
#include <pdfbox/base/message_sinks.h>
#include <pdfbox/base/system.debug.h>

#include <pdfbox/artifactcache.h>
#include <pdfbox/tool.h>

namespace pdfbox
{
    CommandSpec extract_text_spec(StringView input_path, StringView output_path, const ExtractTextOptions& options)
    {
        CommandSpec spec{"ExtractText"};
        spec.option("password", options.password)
            .option("encoding", options.encoding)
            .flag("html", options.html)
            .flag("sort", options.sort)
            .flag("ignoreBeads", options.ignore_beads)
            .option("startPage", options.start_page)
            .option("endPage", options.end_page)
            .flag("alwaysNext", options.always_next)
            .flag("console", output_path.empty())
            .positional(input_path)
            .positional(output_path);
        return spec;
    }

    CommandSpec split_spec(StringView input_path, const SplitOptions& options)
    {
        CommandSpec spec{"PDFSplit"};
        spec.option("password", options.password)
            .option("startPage", options.start_page)
            .option("endPage", options.end_page)
            .option("split", options.split)
            .positional(input_path);
        return spec;
    }

    ExpectedP<CommandSpec> merge_spec(const std::vector<std::string>& sources, StringView target)
    {
        if (sources.size() < 2)
        {
            return PdfBoxError{PdfBoxErrorKind::InvalidArgument,
                               msg::format(msgMergeNeedsTwoSources, msg::count = sources.size())};
        }

        CommandSpec spec{"PDFMerger"};
        spec.positionals(sources).positional(target.empty() ? StringView{DefaultMergeTarget} : target);
        return spec;
    }

    CommandSpec debug_spec(StringView input_path, const DebugOptions& options)
    {
        CommandSpec spec{"PDFDebugger"};
        spec.positional(input_path).option("password", options.password).flag("viewstructure", options.view_structure);
        return spec;
    }

    ExpectedP<CommandSpec> to_image_spec(StringView input_path, const ToImageOptions& options)
    {
        if (!options.cropbox.empty() && options.cropbox.size() != 4)
        {
            return PdfBoxError{PdfBoxErrorKind::InvalidArgument,
                               msg::format(msgCropboxNeedsFourValues, msg::count = options.cropbox.size())};
        }

        CommandSpec spec{"PDFToImage"};
        spec.positional(input_path)
            .option("password", options.password)
            .option("imageType", options.image_type)
            .option("outputPrefix", options.output_prefix)
            .option("startPage", options.start_page)
            .option("endPage", options.end_page)
            .option("page", options.page)
            .option("dpi", options.dpi)
            .option("color", options.color)
            .option("cropbox", options.cropbox)
            .flag("time", options.time);
        return spec;
    }

    ExpectedP<Path> find_runtime(const Filesystem& fs, const PdfBoxSettings& settings)
    {
        if (auto java_path = settings.java_path.get())
        {
            Path override_path{*java_path};
            if (!fs.is_regular_file(override_path))
            {
                return PdfBoxError{PdfBoxErrorKind::Config,
                                   msg::format(msgRuntimeOverrideNotFound,
                                               msg::path = override_path,
                                               msg::env_var = format_environment_variable(EnvironmentVariableJava))};
            }

            return override_path;
        }

        auto candidates = fs.find_from_PATH(RuntimeExecutableName);
        if (candidates.empty())
        {
            return PdfBoxError{PdfBoxErrorKind::Config,
                               msg::format(msgRuntimeNotFound, msg::value = RuntimeExecutableName)};
        }

        return std::move(candidates.front());
    }

    PdfBox::PdfBox(Path runtime, Path artifact, MessageSink& status_sink)
        : m_runner(std::move(runtime), std::move(artifact), status_sink)
    {
    }

    ExpectedP<PdfBox> PdfBox::create(const PdfBoxSettings& settings,
                                     const Filesystem& fs,
                                     const HttpClient& http,
                                     MessageSink& status_sink)
    {
        auto maybe_runtime = find_runtime(fs, settings);
        auto runtime = maybe_runtime.get();
        if (!runtime)
        {
            return std::move(maybe_runtime).error();
        }

        auto maybe_artifact = resolve_artifact_path(fs, http, status_sink, settings);
        auto artifact = maybe_artifact.get();
        if (!artifact)
        {
            return std::move(maybe_artifact).error();
        }

        Debug::println("runtime: ", *runtime);
        Debug::println("artifact: ", *artifact);
        return PdfBox{std::move(*runtime), std::move(*artifact), status_sink};
    }

    ExpectedP<std::string> PdfBox::extract_text(StringView input_path, const ExtractTextOptions& options) const
    {
        return m_runner.run_and_capture(extract_text_spec(input_path, StringView{}, options));
    }

    ExpectedP<RunningProcess> PdfBox::extract_text_to_file(StringView input_path,
                                                           StringView output_path,
                                                           const ExtractTextOptions& options) const
    {
        return m_runner.spawn(extract_text_spec(input_path, output_path, options));
    }

    ExpectedP<RunningProcess> PdfBox::split(StringView input_path, const SplitOptions& options) const
    {
        return m_runner.spawn(split_spec(input_path, options));
    }

    ExpectedP<RunningProcess> PdfBox::merge(const std::vector<std::string>& sources, StringView target) const
    {
        return spawn(merge_spec(sources, target));
    }

    ExpectedP<RunningProcess> PdfBox::debug(StringView input_path, const DebugOptions& options) const
    {
        return m_runner.spawn(debug_spec(input_path, options));
    }

    ExpectedP<RunningProcess> PdfBox::to_image(StringView input_path, const ToImageOptions& options) const
    {
        return spawn(to_image_spec(input_path, options));
    }

    ExpectedP<RunningProcess> PdfBox::spawn(const ExpectedP<CommandSpec>& spec) const
    {
        if (auto s = spec.get())
        {
            return m_runner.spawn(*s);
        }

        return spec.error();
    }
}
