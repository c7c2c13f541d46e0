#pragma once

#include <pdfbox/base/fwd/expected.h>

namespace pdfbox
{
    enum class PdfBoxErrorKind
    {
        Config,
        Network,
        VersionParse,
        Resolution,
        Integrity,
        Execution,
        InvalidArgument,
    };

    struct PdfBoxError;

    template<class T>
    using ExpectedP = ExpectedT<T, PdfBoxError>;
}
