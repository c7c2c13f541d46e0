#pragma once

#include <pdfbox/base/fwd/diagnostics.h>

#include <pdfbox/base/message_sinks.h>
#include <pdfbox/base/messages.h>
#include <pdfbox/base/optional.h>

#include <string>
#include <utility>
#include <vector>

namespace pdfbox
{
    struct DiagnosticLine
    {
        DiagnosticLine(DiagKind kind, LocalizedString message) : m_kind(kind), m_message(std::move(message)) { }

        // origin is usually a file path or URL.
        DiagnosticLine(DiagKind kind, StringView origin, LocalizedString message)
            : m_kind(kind), m_origin(origin.to_string()), m_message(std::move(message))
        {
        }

        // Writes the line with the kind word colored.
        void print_to(MessageSink& sink) const;
        std::string to_string() const;
        void to_string(std::string& target) const;

        DiagKind kind() const noexcept { return m_kind; }
        const LocalizedString& message_text() const noexcept { return m_message; }

    private:
        DiagKind m_kind;
        Optional<std::string> m_origin;
        LocalizedString m_message;
    };

    // Functions that can fail take a DiagnosticContext& and return an Optional or bool; the context decides whether
    // a failure is printed or kept for the caller.
    struct DiagnosticContext
    {
        virtual void report(DiagnosticLine&& line) = 0;

        void report_error(LocalizedString message) { report(DiagnosticLine{DiagKind::Error, std::move(message)}); }

        template<PDFBOX_DECL_MSG_TEMPLATE>
        void report_error(PDFBOX_DECL_MSG_ARGS)
        {
            report_error(msg::format(PDFBOX_EXPAND_MSG_ARGS));
        }

        // system_api_name failed with the errno style code error_value.
        void report_system_error(StringLiteral system_api_name, int error_value);

        // Progress information ("Downloading ..."), shown even when errors are handled by the caller.
        virtual void statusln(const LocalizedString& message) = 0;

    protected:
        ~DiagnosticContext() = default;
    };

    struct PrintingDiagnosticContext final : DiagnosticContext
    {
        explicit PrintingDiagnosticContext(MessageSink& sink) : m_sink(sink) { }

        void report(DiagnosticLine&& line) override;
        void statusln(const LocalizedString& message) override;

    private:
        MessageSink& m_sink;
    };

    // Keeps diagnostics for the caller to inspect; status lines still go to status_sink.
    struct BufferedDiagnosticContext final : DiagnosticContext
    {
        explicit BufferedDiagnosticContext(MessageSink& status_sink) : status_sink(status_sink) { }

        void report(DiagnosticLine&& line) override;
        void statusln(const LocalizedString& message) override;

        // One diagnostic per line, without a trailing newline.
        std::string to_string() const;

        bool any_errors() const noexcept;
        bool empty() const noexcept { return lines.empty(); }

        MessageSink& status_sink;
        std::vector<DiagnosticLine> lines;
    };
}

PDFBOX_FORMAT_WITH_TO_STRING(pdfbox::DiagnosticLine);
