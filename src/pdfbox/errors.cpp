#include <pdfbox/base/checks.h>
#include <pdfbox/base/diagnostics.h>
#include <pdfbox/base/strings.h>

#include <pdfbox/errors.h>

namespace pdfbox
{
    StringLiteral to_string_literal(PdfBoxErrorKind kind) noexcept
    {
        switch (kind)
        {
            case PdfBoxErrorKind::Config: return "ConfigError";
            case PdfBoxErrorKind::Network: return "NetworkError";
            case PdfBoxErrorKind::VersionParse: return "VersionParseError";
            case PdfBoxErrorKind::Resolution: return "ResolutionError";
            case PdfBoxErrorKind::Integrity: return "IntegrityError";
            case PdfBoxErrorKind::Execution: return "ExecutionError";
            case PdfBoxErrorKind::InvalidArgument: return "InvalidArgument";
            default: Checks::unreachable(PDFBOX_LINE_INFO);
        }
    }

    PdfBoxError PdfBoxError::from_diagnostics(PdfBoxErrorKind kind, const BufferedDiagnosticContext& bdc)
    {
        return PdfBoxError{kind, LocalizedString::from_raw(bdc.to_string())};
    }

    std::string PdfBoxError::to_string() const
    {
        std::string result;
        to_string(result);
        return result;
    }

    void PdfBoxError::to_string(std::string& out) const
    {
        Strings::append(out, to_string_literal(kind), ": ", message.data());
    }

    const LocalizedString& expected_error_message(const PdfBoxError& error) noexcept { return error.message; }
}
