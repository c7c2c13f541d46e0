#pragma once

namespace pdfbox
{
    struct CmdParser;
}
