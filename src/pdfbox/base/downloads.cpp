#include <pdfbox/base/curl.h>
#include <pdfbox/base/downloads.h>
#include <pdfbox/base/files.h>
#include <pdfbox/base/strings.h>
#include <pdfbox/base/system.debug.h>

using namespace pdfbox;

namespace
{
    void set_common_curl_easy_options(const CurlEasyHandle& easy_handle,
                                      StringView url,
                                      const CurlHeaders& request_headers)
    {
        CURL* curl = easy_handle.get();
        curl_easy_setopt(curl, CURLOPT_USERAGENT, pdfbox_curl_user_agent);
        curl_easy_setopt(curl, CURLOPT_URL, url_encode_spaces(url).c_str());
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, request_headers.get());
        // request headers are for the origin server, not for a proxy CONNECT
        curl_easy_setopt(curl, CURLOPT_HEADEROPT, CURLHEADER_SEPARATE);
        curl_apply_ca_overrides(curl);
    }

    size_t write_file_callback(void* contents, size_t size, size_t nmemb, void* param)
    {
        if (!param) return 0;
        return static_cast<WriteFilePointer*>(param)->write(contents, 1, size * nmemb);
    }

    size_t write_string_callback(void* contents, size_t size, size_t nmemb, void* param)
    {
        if (!param) return 0;
        static_cast<std::string*>(param)->append(static_cast<const char*>(contents), size * nmemb);
        return size * nmemb;
    }

    // Runs the configured transfer and reports any transport or HTTP failure to context.
    bool perform_transfer(DiagnosticContext& context, CURL* curl, StringView url)
    {
        Debug::println("GET ", url);
        auto curl_code = curl_easy_perform(curl);
        if (curl_code != CURLE_OK)
        {
            context.report_error(msg::format(msgCurlFailedGeneric, msg::exit_code = static_cast<int>(curl_code))
                                     .append_raw(fmt::format(" ({}).", curl_easy_strerror(curl_code))));
            context.report(DiagnosticLine{DiagKind::Note, msg::format(msgDownloadFailedUrl, msg::url = url)});
            return false;
        }

        long response_code = -1;
        auto get_info_code = curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response_code);
        if (get_info_code != CURLE_OK)
        {
            context.report_error(msg::format(msgCurlFailedGeneric, msg::exit_code = static_cast<int>(get_info_code))
                                     .append_raw(fmt::format(" ({}).", curl_easy_strerror(get_info_code))));
            return false;
        }

        Debug::println("GET ", url, " -> ", static_cast<long long>(response_code));
        if ((response_code >= 200 && response_code < 400) || (url.starts_with("file://") && response_code == 0))
        {
            return true;
        }

        context.report_error(
            msg::format(msgCurlFailedHttpResponse, msg::exit_code = static_cast<int>(response_code), msg::url = url));
        return false;
    }
}

namespace pdfbox
{
    std::string url_join(StringView base, StringView relative)
    {
        std::string result = base.to_string();
        while (!result.empty() && result.back() == '/')
        {
            result.pop_back();
        }

        auto first = relative.begin();
        const auto last = relative.end();
        while (first != last && *first == '/')
        {
            ++first;
        }

        result.push_back('/');
        result.append(first, last);
        return result;
    }

    std::string url_encode_spaces(StringView url) { return Strings::replace_all(url, StringLiteral{" "}, "%20"); }

    CurlHttpClient::CurlHttpClient(const Filesystem& fs, std::vector<std::string> headers)
        : m_fs(fs), m_headers(std::move(headers))
    {
    }

    Optional<std::string> CurlHttpClient::get_text(DiagnosticContext& context, StringView url) const
    {
        if (get_curl_global_init_status() != CURLE_OK)
        {
            context.report_error(
                msg::format(msgCurlFailedGeneric, msg::exit_code = static_cast<int>(get_curl_global_init_status())));
            return nullopt;
        }

        CurlHeaders request_headers(m_headers);
        CurlEasyHandle handle;
        CURL* curl = handle.get();
        set_common_curl_easy_options(handle, url, request_headers);
        std::string body;
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &write_string_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, static_cast<void*>(&body));
        if (!perform_transfer(context, curl, url))
        {
            return nullopt;
        }

        return body;
    }

    bool CurlHttpClient::download_file(DiagnosticContext& context, StringView url, const Path& target) const
    {
        if (get_curl_global_init_status() != CURLE_OK)
        {
            context.report_error(
                msg::format(msgCurlFailedGeneric, msg::exit_code = static_cast<int>(get_curl_global_init_status())));
            return false;
        }

        // Create directory in advance, otherwise curl will create it in 750 mode on unix style file systems.
        const auto dir = target.parent_path();
        if (!dir.empty())
        {
            std::error_code ec;
            m_fs.create_directories(dir, ec);
            if (ec)
            {
                context.report_error(format_filesystem_call_error(ec, "create_directories", {dir}));
                return false;
            }
        }

        std::error_code ec;
        auto fileptr = m_fs.open_for_write(target, ec);
        if (ec)
        {
            context.report_error(format_filesystem_call_error(ec, "fopen", {target}));
            return false;
        }

        CurlHeaders request_headers(m_headers);
        CurlEasyHandle handle;
        CURL* curl = handle.get();
        set_common_curl_easy_options(handle, url, request_headers);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &write_file_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, static_cast<void*>(&fileptr));
        if (!perform_transfer(context, curl, url))
        {
            return false;
        }

        ec = fileptr.close();
        if (ec)
        {
            context.report_error(format_filesystem_call_error(ec, "fclose", {target}));
            return false;
        }

        return true;
    }

    const HttpClient& get_curl_http_client()
    {
        static const CurlHttpClient s_client{get_real_filesystem()};
        return s_client;
    }
}
