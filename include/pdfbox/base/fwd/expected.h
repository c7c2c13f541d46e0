#pragma once

#include <pdfbox/base/fwd/messages.h>

namespace pdfbox
{
    template<class T, class Error>
    struct ExpectedT;

    template<class T>
    using ExpectedL = ExpectedT<T, LocalizedString>;
}
