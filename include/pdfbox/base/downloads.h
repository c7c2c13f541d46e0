#pragma once

#include <pdfbox/base/fwd/downloads.h>

#include <pdfbox/base/diagnostics.h>
#include <pdfbox/base/files.h>
#include <pdfbox/base/optional.h>
#include <pdfbox/base/path.h>
#include <pdfbox/base/stringview.h>

#include <string>
#include <vector>

namespace pdfbox
{
    // Joins base and relative with exactly one '/'.
    std::string url_join(StringView base, StringView relative);

    std::string url_encode_spaces(StringView url);

    // Plain GET retrieval; failures are reported to the context and returned as disengaged values.
    struct HttpClient
    {
        // Returns the response body of a GET to url.
        virtual Optional<std::string> get_text(DiagnosticContext& context, StringView url) const = 0;

        // Writes the response body of a GET to url into target, replacing any existing file.
        virtual bool download_file(DiagnosticContext& context, StringView url, const Path& target) const = 0;

    protected:
        ~HttpClient() = default;
    };

    struct CurlHttpClient final : HttpClient
    {
        CurlHttpClient(const Filesystem& fs, std::vector<std::string> headers = {});

        virtual Optional<std::string> get_text(DiagnosticContext& context, StringView url) const override;
        virtual bool download_file(DiagnosticContext& context, StringView url, const Path& target) const override;

    private:
        const Filesystem& m_fs;
        std::vector<std::string> m_headers;
    };

    const HttpClient& get_curl_http_client();
}
