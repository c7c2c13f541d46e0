#pragma once

#include <pdfbox/base/fwd/fmt.h>

#include <string>

namespace pdfbox
{
    struct LineInfo
    {
        int line_number;
        const char* file_name;
        const char* function_name;

        std::string to_string() const;
    };
}

#define PDFBOX_LINE_INFO                                                                                               \
    pdfbox::LineInfo { __LINE__, __FILE__, __func__ }

PDFBOX_FORMAT_WITH_TO_STRING(pdfbox::LineInfo);
