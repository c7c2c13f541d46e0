#pragma once

#include <curl/curl.h>

#include <memory>
#include <string>
#include <vector>

namespace pdfbox
{
    // The result of the process-wide curl_global_init, performed on first use.
    CURLcode get_curl_global_init_status() noexcept;

    // Points curl at $SSL_CERT_FILE and $SSL_CERT_DIR when they are set.
    void curl_apply_ca_overrides(CURL* curl);

    struct CurlEasyCleanup
    {
        void operator()(CURL* curl) const noexcept { curl_easy_cleanup(curl); }
    };

    struct CurlSlistCleanup
    {
        void operator()(curl_slist* list) const noexcept { curl_slist_free_all(list); }
    };

    struct CurlEasyHandle
    {
        CurlEasyHandle();

        CURL* get() const noexcept { return m_handle.get(); }

    private:
        std::unique_ptr<CURL, CurlEasyCleanup> m_handle;
    };

    // Request headers in the "Name: value" form.
    struct CurlHeaders
    {
        explicit CurlHeaders(const std::vector<std::string>& headers);

        curl_slist* get() const noexcept { return m_list.get(); }

    private:
        std::unique_ptr<curl_slist, CurlSlistCleanup> m_list;
    };

    constexpr char pdfbox_curl_user_agent[] = "pdfbox-cxx/" PDFBOX_VERSION_AS_STRING " (curl)";
}
