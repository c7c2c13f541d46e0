#include <pdfbox/base/diagnostics.h>
#include <pdfbox/base/downloads.h>
#include <pdfbox/base/files.h>
#include <pdfbox/base/hash.h>
#include <pdfbox/base/message_sinks.h>
#include <pdfbox/base/strings.h>
#include <pdfbox/base/system.debug.h>
#include <pdfbox/base/system.h>

#include <pdfbox/artifact.h>
#include <pdfbox/artifactcache.h>
#include <pdfbox/catalog.h>

#include <algorithm>

namespace
{
    using namespace pdfbox;

    PdfBoxError filesystem_error(PdfBoxErrorKind kind,
                                 const std::error_code& ec,
                                 StringView call_name,
                                 std::initializer_list<StringView> args)
    {
        return PdfBoxError{kind, format_filesystem_call_error(ec, call_name, args)};
    }
}

namespace pdfbox
{
    ExpectedP<Path> determine_cache_dir(const PdfBoxSettings& settings)
    {
        if (auto configured = settings.cache_dir.get())
        {
            return Path{*configured};
        }

        auto maybe_root = get_platform_cache_root();
        if (auto root = maybe_root.get())
        {
            return *root / CacheDirectoryName;
        }

        return PdfBoxError{PdfBoxErrorKind::Config, std::move(maybe_root).error()};
    }

    ArtifactCache::ArtifactCache(const Filesystem& fs,
                                 const HttpClient& http,
                                 MessageSink& status_sink,
                                 Path cache_dir,
                                 std::string archive_url,
                                 Optional<std::string> pinned_version)
        : m_fs(fs)
        , m_http(http)
        , m_status_sink(status_sink)
        , m_cache_dir(std::move(cache_dir))
        , m_archive_url(std::move(archive_url))
        , m_pinned_version(std::move(pinned_version))
    {
    }

    ExpectedP<std::vector<CachedArtifact>> ArtifactCache::scan() const
    {
        std::error_code ec;
        auto files = m_fs.get_regular_files_non_recursive(m_cache_dir, ec);
        if (ec)
        {
            return filesystem_error(PdfBoxErrorKind::Config, ec, "get_regular_files_non_recursive", {m_cache_dir});
        }

        std::vector<CachedArtifact> result;
        for (auto&& file : files)
        {
            auto maybe_version_text = version_from_artifact_file_name(file.filename());
            auto version_text = maybe_version_text.get();
            if (!version_text)
            {
                continue;
            }

            auto maybe_version = DotVersion::try_parse(*version_text);
            if (auto version = maybe_version.get())
            {
                result.push_back(CachedArtifact{std::move(*version), std::move(file)});
            }
            else
            {
                m_status_sink.println(msg::format_warning(msgSkippingUnparseableArtifact, msg::path = file));
            }
        }

        std::sort(result.begin(), result.end(), [](const CachedArtifact& lhs, const CachedArtifact& rhs) {
            return lhs.version < rhs.version;
        });
        Debug::println("found ", result.size(), " cached artifacts in ", m_cache_dir);
        return result;
    }

    ExpectedP<Optional<CachedArtifact>> ArtifactCache::find_latest_cached() const
    {
        auto maybe_artifacts = scan();
        auto artifacts = maybe_artifacts.get();
        if (!artifacts)
        {
            return std::move(maybe_artifacts).error();
        }

        if (auto pinned = m_pinned_version.get())
        {
            for (auto&& artifact : *artifacts)
            {
                if (artifact.version.original_string == *pinned)
                {
                    return Optional<CachedArtifact>{std::move(artifact)};
                }
            }

            return Optional<CachedArtifact>{};
        }

        if (artifacts->empty())
        {
            return Optional<CachedArtifact>{};
        }

        return Optional<CachedArtifact>{std::move(artifacts->back())};
    }

    bool ArtifactCache::verify_download(DiagnosticContext& context,
                                        const Path& downloaded,
                                        StringView checksum_url,
                                        StringView checksum_text) const
    {
        auto maybe_expected_hash = parse_sha512_checksum_text(checksum_text);
        auto expected_hash = maybe_expected_hash.get();
        if (!expected_hash)
        {
            context.report_error(msgChecksumUnparseable, msg::url = checksum_url);
            return false;
        }

        auto maybe_actual_hash = Hash::get_file_hash_required(context, m_fs, downloaded, Hash::Algorithm::Sha512);
        auto actual_hash = maybe_actual_hash.get();
        if (!actual_hash)
        {
            return false;
        }

        if (!Strings::case_insensitive_ascii_equals(*expected_hash, *actual_hash))
        {
            context.report(
                DiagnosticLine{DiagKind::Error, downloaded, msg::format(msgDownloadFailedHashMismatch, msg::url = checksum_url)});
            context.report(DiagnosticLine{DiagKind::Note,
                                          msg::format(msgDownloadFailedHashMismatchExpectedHash, msg::sha = *expected_hash)});
            context.report(DiagnosticLine{DiagKind::Note,
                                          msg::format(msgDownloadFailedHashMismatchActualHash, msg::sha = *actual_hash)});
            return false;
        }

        return true;
    }

    ExpectedP<CachedArtifact> ArtifactCache::download_latest() const
    {
        std::error_code ec;
        m_fs.create_directories(m_cache_dir, ec);
        if (ec)
        {
            return filesystem_error(PdfBoxErrorKind::Config, ec, "create_directories", {m_cache_dir});
        }

        auto maybe_versions = VersionCatalog{m_http, m_status_sink, m_archive_url}.fetch_versions();
        auto versions = maybe_versions.get();
        if (!versions)
        {
            return std::move(maybe_versions).error();
        }

        auto maybe_urls = ArtifactResolver{m_archive_url, m_pinned_version}.resolve(*versions);
        auto urls = maybe_urls.get();
        if (!urls)
        {
            return std::move(maybe_urls).error();
        }

        auto maybe_version = DotVersion::try_parse(urls->version);
        auto version = maybe_version.get();
        if (!version)
        {
            return PdfBoxError{PdfBoxErrorKind::VersionParse, std::move(maybe_version).error()};
        }

        const auto final_path = m_cache_dir / artifact_file_name(urls->version);
        // the process id keeps concurrent downloads from sharing a temporary file
        TempFileDeleter part_file{m_fs, final_path + fmt::format(".{}.part", get_process_id())};

        {
            BufferedDiagnosticContext bdc{m_status_sink};
            bdc.statusln(msg::format(msgDownloadingArtifact, msg::url = urls->artifact_url, msg::path = final_path));
            if (!m_http.download_file(bdc, urls->artifact_url, part_file.path))
            {
                return PdfBoxError::from_diagnostics(PdfBoxErrorKind::Network, bdc);
            }
        }

        std::string checksum_text;
        {
            BufferedDiagnosticContext bdc{m_status_sink};
            auto maybe_checksum_text = m_http.get_text(bdc, urls->checksum_url);
            if (auto text = maybe_checksum_text.get())
            {
                checksum_text = std::move(*text);
            }
            else
            {
                return PdfBoxError::from_diagnostics(PdfBoxErrorKind::Network, bdc);
            }
        }

        {
            BufferedDiagnosticContext bdc{m_status_sink};
            if (!verify_download(bdc, part_file.path, urls->checksum_url, checksum_text))
            {
                return PdfBoxError::from_diagnostics(PdfBoxErrorKind::Integrity, bdc);
            }
        }

        m_fs.rename(part_file.path, final_path, ec);
        if (ec)
        {
            return filesystem_error(PdfBoxErrorKind::Config, ec, "rename", {part_file.path, final_path});
        }

        Debug::println("cached ", final_path);
        return CachedArtifact{std::move(*version), final_path};
    }

    ExpectedP<Path> ArtifactCache::resolve() const
    {
        auto maybe_cached = find_latest_cached();
        auto cached = maybe_cached.get();
        if (!cached)
        {
            return std::move(maybe_cached).error();
        }

        if (auto artifact = cached->get())
        {
            Debug::println("using cached artifact ", artifact->path);
            return artifact->path;
        }

        return download_latest().map([](const CachedArtifact& artifact) { return artifact.path; });
    }

    ExpectedP<Path> resolve_artifact_path(const Filesystem& fs,
                                          const HttpClient& http,
                                          MessageSink& status_sink,
                                          const PdfBoxSettings& settings)
    {
        if (auto jar_path = settings.jar_path.get())
        {
            Path override_path{*jar_path};
            std::error_code ec;
            if (!fs.exists(override_path, ec) || ec)
            {
                return PdfBoxError{PdfBoxErrorKind::Config,
                                   msg::format(msgArtifactOverrideNotFound,
                                               msg::path = override_path,
                                               msg::env_var = format_environment_variable(EnvironmentVariableJar))};
            }

            return override_path;
        }

        auto maybe_cache_dir = determine_cache_dir(settings);
        auto cache_dir = maybe_cache_dir.get();
        if (!cache_dir)
        {
            return std::move(maybe_cache_dir).error();
        }

        return ArtifactCache{fs, http, status_sink, std::move(*cache_dir), settings.archive_url, settings.pinned_version}
            .resolve();
    }
}
