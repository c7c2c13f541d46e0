#pragma once

namespace pdfbox
{
    struct HttpClient;
    struct CurlHttpClient;
}
