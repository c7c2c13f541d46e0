#pragma once

namespace pdfbox
{
    enum class EchoInDebug
    {
        Show,
        Hide
    };

    struct Command;
    struct ExitCodeAndOutput;
    struct RunningProcess;

    using ExitCodeIntegral = int;
}
