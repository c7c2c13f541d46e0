#pragma once

#include <pdfbox/base/optional.h>
#include <pdfbox/base/stringview.h>

#include <string>

namespace pdfbox
{
    inline constexpr StringLiteral EnvironmentVariableJar = "PDFBOX";
    inline constexpr StringLiteral EnvironmentVariableJava = "PDFBOX_JAVA";
    inline constexpr StringLiteral EnvironmentVariableCacheDir = "PDFBOX_CACHE_DIR";
    inline constexpr StringLiteral EnvironmentVariableArchiveUrl = "PDFBOX_ARCHIVE_URL";
    inline constexpr StringLiteral EnvironmentVariableVersion = "PDFBOX_VERSION";
    inline constexpr StringLiteral EnvironmentVariableDebug = "PDFBOX_DEBUG";

    struct PdfBoxSettings
    {
        // An artifact to use as-is, skipping the cache and the network.
        Optional<std::string> jar_path;
        // The runtime; otherwise the first java on PATH.
        Optional<std::string> java_path;
        // Otherwise the platform cache root joined with "pdfbox".
        Optional<std::string> cache_dir;
        std::string archive_url;
        // Only this exact version is taken from the cache or the catalog.
        Optional<std::string> pinned_version;
        bool debug = false;

        PdfBoxSettings();

        // Reads PDFBOX, PDFBOX_JAVA, PDFBOX_CACHE_DIR, PDFBOX_ARCHIVE_URL, PDFBOX_VERSION and PDFBOX_DEBUG.
        // Empty values count as unset.
        static PdfBoxSettings from_environment();
    };
}
