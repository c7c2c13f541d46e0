#pragma once

namespace pdfbox
{
    struct Path;
    struct FilePointer;
    struct ReadFilePointer;
    struct WriteFilePointer;
    struct Filesystem;
}
