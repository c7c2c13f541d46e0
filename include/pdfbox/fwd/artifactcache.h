#pragma once

namespace pdfbox
{
    struct CachedArtifact;
    struct ArtifactCache;
}
