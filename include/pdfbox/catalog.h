#pragma once

#include <pdfbox/base/fwd/downloads.h>
#include <pdfbox/base/fwd/messages.h>

#include <pdfbox/errors.h>

#include <pdfbox/base/stringview.h>

#include <set>
#include <string>

namespace pdfbox
{
    inline constexpr StringLiteral default_archive_url = "https://archive.apache.org/dist/pdfbox/";

    // Returns whether candidate is one or more dot separated numeric groups, optionally followed by a qualifier
    // introduced by '-', '.' or '+' and made of letters, digits, '.', '-' and '+', that also parses as a DotVersion.
    bool is_catalog_version(StringView candidate);

    // Extracts the href targets of every <a> tag in html that name a version, with leading and trailing '/'
    // removed. Markup errors never fail; unrecognized constructs are skipped.
    std::set<std::string> parse_catalog_versions(StringView html);

    // The remote directory listing of available versions.
    struct VersionCatalog
    {
        VersionCatalog(const HttpClient& http, MessageSink& status_sink, std::string base_url);

        const std::string& base_url() const noexcept { return m_base_url; }

        // Fails with NetworkError if the listing cannot be fetched, or ResolutionError if it names no versions.
        ExpectedP<std::set<std::string>> fetch_versions() const;

    private:
        const HttpClient& m_http;
        MessageSink& m_status_sink;
        std::string m_base_url;
    };
}
