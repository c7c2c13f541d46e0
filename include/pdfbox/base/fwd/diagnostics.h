#pragma once

namespace pdfbox
{
    // Rendered as "<origin>: <kind>: <message>", the origin being optional.
    enum class DiagKind
    {
        Error,
        Warning,
        Note,
    };

    struct DiagnosticLine;
    struct DiagnosticContext;
    struct PrintingDiagnosticContext;
    struct BufferedDiagnosticContext;

    extern DiagnosticContext& console_diagnostic_context;
    extern DiagnosticContext& null_diagnostic_context;
}
