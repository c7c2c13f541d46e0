#include <pdfbox/base/checks.h>
#include <pdfbox/base/diagnostics.h>

#include <algorithm>
#include <system_error>

namespace
{
    using namespace pdfbox;

    StringLiteral kind_word(DiagKind kind)
    {
        switch (kind)
        {
            case DiagKind::Error: return "error";
            case DiagKind::Warning: return "warning";
            case DiagKind::Note: return "note";
            default: Checks::unreachable(PDFBOX_LINE_INFO);
        }
    }

    struct NullDiagnosticContext final : DiagnosticContext
    {
        void report(DiagnosticLine&&) override { }
        void statusln(const LocalizedString&) override { }
    };

    NullDiagnosticContext null_diagnostic_context_instance;

    // stdout carries the output of the java process.
    PrintingDiagnosticContext console_diagnostic_context_instance{stderr_sink};
}

namespace pdfbox
{
    void DiagnosticContext::report_system_error(StringLiteral system_api_name, int error_value)
    {
        report_error(msgSystemApiErrorMessage,
                     msg::system_api = system_api_name,
                     msg::exit_code = error_value,
                     msg::error_msg = std::system_category().message(error_value));
    }

    void DiagnosticLine::print_to(MessageSink& sink) const
    {
        const Color color = m_kind == DiagKind::Error ? Color::error
                            : m_kind == DiagKind::Warning ? Color::warning
                                                          : Color::none;
        sink.write_line(color, to_string());
    }

    std::string DiagnosticLine::to_string() const
    {
        std::string result;
        to_string(result);
        return result;
    }

    void DiagnosticLine::to_string(std::string& target) const
    {
        if (auto origin = m_origin.get())
        {
            target.append(*origin);
            target.append(": ");
        }

        const auto word = kind_word(m_kind);
        target.append(word.data(), word.size());
        target.append(": ");
        target.append(m_message.data());
    }

    void PrintingDiagnosticContext::report(DiagnosticLine&& line) { line.print_to(m_sink); }
    void PrintingDiagnosticContext::statusln(const LocalizedString& message) { m_sink.println(message); }

    void BufferedDiagnosticContext::report(DiagnosticLine&& line) { lines.push_back(std::move(line)); }
    void BufferedDiagnosticContext::statusln(const LocalizedString& message) { status_sink.println(message); }

    std::string BufferedDiagnosticContext::to_string() const
    {
        std::string result;
        for (const auto& line : lines)
        {
            if (!result.empty())
            {
                result.push_back('\n');
            }

            line.to_string(result);
        }

        return result;
    }

    bool BufferedDiagnosticContext::any_errors() const noexcept
    {
        return std::any_of(
            lines.begin(), lines.end(), [](const DiagnosticLine& line) { return line.kind() == DiagKind::Error; });
    }

    DiagnosticContext& null_diagnostic_context = null_diagnostic_context_instance;
    DiagnosticContext& console_diagnostic_context = console_diagnostic_context_instance;
}
