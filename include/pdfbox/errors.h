#pragma once

#include <pdfbox/base/fwd/diagnostics.h>

#include <pdfbox/fwd/errors.h>

#include <pdfbox/base/expected.h>
#include <pdfbox/base/fmt.h>
#include <pdfbox/base/messages.h>
#include <pdfbox/base/stringview.h>

#include <string>

namespace pdfbox
{
    // "ConfigError", "NetworkError", ...
    StringLiteral to_string_literal(PdfBoxErrorKind kind) noexcept;

    struct PdfBoxError
    {
        PdfBoxError(PdfBoxErrorKind kind, const LocalizedString& message) : kind(kind), message(message) { }
        PdfBoxError(PdfBoxErrorKind kind, LocalizedString&& message) : kind(kind), message(std::move(message)) { }

        // Classifies everything reported to bdc as a single error of the given kind.
        static PdfBoxError from_diagnostics(PdfBoxErrorKind kind, const BufferedDiagnosticContext& bdc);

        PdfBoxErrorKind kind;
        LocalizedString message;

        std::string to_string() const;
        void to_string(std::string& out) const;

        friend bool operator==(const PdfBoxError& lhs, const PdfBoxError& rhs) noexcept
        {
            return lhs.kind == rhs.kind && lhs.message == rhs.message;
        }
        friend bool operator!=(const PdfBoxError& lhs, const PdfBoxError& rhs) noexcept { return !(lhs == rhs); }
    };

    const LocalizedString& expected_error_message(const PdfBoxError& error) noexcept;
}

PDFBOX_FORMAT_WITH_TO_STRING(pdfbox::PdfBoxError);
