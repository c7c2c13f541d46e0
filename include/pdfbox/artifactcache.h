#pragma once

#include <pdfbox/base/fwd/downloads.h>
#include <pdfbox/base/fwd/files.h>
#include <pdfbox/base/fwd/messages.h>

#include <pdfbox/fwd/artifactcache.h>

#include <pdfbox/base/optional.h>
#include <pdfbox/base/path.h>

#include <pdfbox/errors.h>
#include <pdfbox/settings.h>
#include <pdfbox/versions.h>

#include <string>
#include <vector>

namespace pdfbox
{
    inline constexpr StringLiteral CacheDirectoryName = "pdfbox";

    // A checksum verified artifact on disk.
    struct CachedArtifact
    {
        DotVersion version;
        Path path;
    };

    // The configured cache directory, else the platform cache root joined with "pdfbox".
    ExpectedP<Path> determine_cache_dir(const PdfBoxSettings& settings);

    // Decides which artifact file an invocation uses, downloading and verifying one when the cache is empty.
    struct ArtifactCache
    {
        ArtifactCache(const Filesystem& fs,
                      const HttpClient& http,
                      MessageSink& status_sink,
                      Path cache_dir,
                      std::string archive_url,
                      Optional<std::string> pinned_version = nullopt);

        const Path& cache_dir() const noexcept { return m_cache_dir; }

        // Every pdfbox-app-<version>.jar in the cache directory, ascending by version. Files whose version does not
        // parse are skipped with a warning. A missing cache directory is empty.
        ExpectedP<std::vector<CachedArtifact>> scan() const;

        // The greatest cached version, or with a pinned version, that version if it is cached.
        ExpectedP<Optional<CachedArtifact>> find_latest_cached() const;

        // Resolves the catalog, downloads the chosen artifact and its checksum, verifies the artifact and moves it
        // into the cache under its final name.
        ExpectedP<CachedArtifact> download_latest() const;

        // find_latest_cached(), falling back to download_latest(); never downloads a cached version.
        ExpectedP<Path> resolve() const;

    private:
        bool verify_download(DiagnosticContext& context,
                             const Path& downloaded,
                             StringView checksum_url,
                             StringView checksum_text) const;

        const Filesystem& m_fs;
        const HttpClient& m_http;
        MessageSink& m_status_sink;
        Path m_cache_dir;
        std::string m_archive_url;
        Optional<std::string> m_pinned_version;
    };

    // The artifact override if one is configured (ConfigError if it does not exist; no network access or cache
    // scan), otherwise ArtifactCache::resolve() over determine_cache_dir(settings).
    ExpectedP<Path> resolve_artifact_path(const Filesystem& fs,
                                          const HttpClient& http,
                                          MessageSink& status_sink,
                                          const PdfBoxSettings& settings);
}
