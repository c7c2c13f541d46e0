#pragma once

namespace pdfbox
{
    struct StringView;
    struct ZStringView;
    struct StringLiteral;
}
