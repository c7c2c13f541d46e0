#include <pdfbox/base/checks.h>
#include <pdfbox/base/curl.h>
#include <pdfbox/base/system.h>

namespace
{
    struct CurlGlobalInit
    {
        CurlGlobalInit() : status(curl_global_init(CURL_GLOBAL_DEFAULT)) { }
        CurlGlobalInit(const CurlGlobalInit&) = delete;
        CurlGlobalInit& operator=(const CurlGlobalInit&) = delete;
        ~CurlGlobalInit() { curl_global_cleanup(); }

        const CURLcode status;
    };
}

namespace pdfbox
{
    CURLcode get_curl_global_init_status() noexcept
    {
        static const CurlGlobalInit global_init;
        return global_init.status;
    }

    void curl_apply_ca_overrides(CURL* curl)
    {
        // curl copies string options, so the temporaries may go away afterwards
        const auto ca_file = get_environment_variable("SSL_CERT_FILE");
        if (auto file = ca_file.get(); file && !file->empty())
        {
            curl_easy_setopt(curl, CURLOPT_CAINFO, file->c_str());
        }

        const auto ca_dir = get_environment_variable("SSL_CERT_DIR");
        if (auto dir = ca_dir.get(); dir && !dir->empty())
        {
            curl_easy_setopt(curl, CURLOPT_CAPATH, dir->c_str());
        }
    }

    CurlEasyHandle::CurlEasyHandle() : m_handle(curl_easy_init())
    {
        Checks::check_exit(PDFBOX_LINE_INFO, m_handle != nullptr, "curl_easy_init failed");
    }

    CurlHeaders::CurlHeaders(const std::vector<std::string>& headers)
    {
        curl_slist* list = nullptr;
        for (const auto& header : headers)
        {
            list = curl_slist_append(list, header.c_str());
            Checks::check_exit(PDFBOX_LINE_INFO, list != nullptr, "curl_slist_append failed");
        }

        m_list.reset(list);
    }
}
