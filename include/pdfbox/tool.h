#pragma once

#include <pdfbox/base/fwd/downloads.h>
#include <pdfbox/base/fwd/files.h>
#include <pdfbox/base/fwd/messages.h>

#include <pdfbox/base/optional.h>
#include <pdfbox/base/path.h>
#include <pdfbox/base/stringview.h>
#include <pdfbox/base/system.process.h>

#include <pdfbox/commandrunner.h>
#include <pdfbox/errors.h>
#include <pdfbox/settings.h>

#include <string>
#include <vector>

namespace pdfbox
{
    inline constexpr StringLiteral RuntimeExecutableName = "java";
    inline constexpr StringLiteral DefaultMergeTarget = "merged.pdf";

    struct ExtractTextOptions
    {
        Optional<std::string> password;
        Optional<std::string> encoding;
        bool html = false;
        bool sort = false;
        bool ignore_beads = false;
        Optional<int> start_page;
        Optional<int> end_page;
        bool always_next = false;
    };

    struct SplitOptions
    {
        Optional<std::string> password;
        Optional<int> start_page;
        Optional<int> end_page;
        // pages per output document
        Optional<int> split;
    };

    struct DebugOptions
    {
        Optional<std::string> password;
        bool view_structure = false;
    };

    struct ToImageOptions
    {
        Optional<std::string> password;
        Optional<std::string> image_type;
        Optional<std::string> output_prefix;
        Optional<int> start_page;
        Optional<int> end_page;
        Optional<int> page;
        Optional<int> dpi;
        Optional<std::string> color;
        // x1 y1 x2 y2, or empty
        std::vector<std::string> cropbox;
        bool time = false;
    };

    // With an empty output_path, -console is added so the text is written to standard output.
    CommandSpec extract_text_spec(StringView input_path, StringView output_path, const ExtractTextOptions& options);
    CommandSpec split_spec(StringView input_path, const SplitOptions& options);
    // InvalidArgument with fewer than two sources.
    ExpectedP<CommandSpec> merge_spec(const std::vector<std::string>& sources, StringView target);
    CommandSpec debug_spec(StringView input_path, const DebugOptions& options);
    // InvalidArgument unless the cropbox is empty or has exactly four values.
    ExpectedP<CommandSpec> to_image_spec(StringView input_path, const ToImageOptions& options);

    // The runtime override if configured (it must be an existing file), otherwise the first java on PATH.
    ExpectedP<Path> find_runtime(const Filesystem& fs, const PdfBoxSettings& settings);

    // The entry point: one method per PDFBox command line tool. The artifact and runtime are fixed at construction.
    struct PdfBox
    {
        PdfBox(Path runtime, Path artifact, MessageSink& status_sink);

        // Resolves the runtime, then the artifact (which may download it).
        static ExpectedP<PdfBox> create(const PdfBoxSettings& settings,
                                        const Filesystem& fs,
                                        const HttpClient& http,
                                        MessageSink& status_sink);

        const Path& runtime() const noexcept { return m_runner.runtime(); }
        const Path& artifact() const noexcept { return m_runner.artifact(); }
        const CommandRunner& runner() const noexcept { return m_runner; }

        // Returns the extracted text.
        ExpectedP<std::string> extract_text(StringView input_path, const ExtractTextOptions& options = {}) const;
        ExpectedP<RunningProcess> extract_text_to_file(StringView input_path,
                                                       StringView output_path,
                                                       const ExtractTextOptions& options = {}) const;

        ExpectedP<RunningProcess> split(StringView input_path, const SplitOptions& options = {}) const;
        ExpectedP<RunningProcess> merge(const std::vector<std::string>& sources,
                                        StringView target = DefaultMergeTarget) const;
        // Opens the interactive debugger; the returned process lives until its window is closed.
        ExpectedP<RunningProcess> debug(StringView input_path, const DebugOptions& options = {}) const;
        // Writes one image per page, named <prefix><page>.<image type>.
        ExpectedP<RunningProcess> to_image(StringView input_path, const ToImageOptions& options = {}) const;

    private:
        ExpectedP<RunningProcess> spawn(const ExpectedP<CommandSpec>& spec) const;

        CommandRunner m_runner;
    };
}
