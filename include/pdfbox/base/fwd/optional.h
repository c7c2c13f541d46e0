#pragma once

namespace pdfbox
{
    struct NullOpt;

    template<class T>
    struct Optional;
}
