#include <pdfbox-test/util.h>

#include <pdfbox/base/strings.h>
#include <pdfbox/base/system.h>

#include <sys/stat.h>

#include <atomic>

namespace pdfbox::Test
{
    const Path& base_temporary_directory() noexcept
    {
        const static Path BASE_TEMPORARY_DIRECTORY =
            Path{get_environment_variable("TMPDIR").value_or("/tmp")} / "pdfbox-test";
        return BASE_TEMPORARY_DIRECTORY;
    }

    TemporaryDirectory::TemporaryDirectory(StringView name)
    {
        static std::atomic<int> counter{0};
        path = base_temporary_directory() / fmt::format("{}-{}-{}", name, get_process_id(), counter.fetch_add(1));
        auto& fs = get_real_filesystem();
        fs.remove_all(path, PDFBOX_LINE_INFO);
        fs.create_directories(path, PDFBOX_LINE_INFO);
    }

    TemporaryDirectory::~TemporaryDirectory() { get_real_filesystem().remove_all(path, IgnoreErrors{}); }

    Optional<std::string> FakeHttpClient::get_text(DiagnosticContext& context, StringView url) const
    {
        requests.push_back(url.to_string());
        auto it = responses.find(url.to_string());
        if (it == responses.end())
        {
            context.report_error(msgCurlFailedHttpResponse, msg::exit_code = 404, msg::url = url);
            return nullopt;
        }

        return it->second;
    }

    bool FakeHttpClient::download_file(DiagnosticContext& context, StringView url, const Path& target) const
    {
        auto maybe_body = get_text(context, url);
        if (auto body = maybe_body.get())
        {
            std::error_code ec;
            m_fs.write_contents(target, *body, ec);
            if (ec)
            {
                context.report_error(format_filesystem_call_error(ec, "write_contents", {target}));
                return false;
            }

            return true;
        }

        return false;
    }

    std::string make_text_pdf(const std::vector<std::string>& pages)
    {
        std::vector<std::string> objects;
        std::string kids;
        const size_t first_page_object = 4;
        for (size_t idx = 0; idx < pages.size(); ++idx)
        {
            Strings::append(kids, first_page_object + idx * 2, " 0 R ");
        }

        objects.push_back("<< /Type /Catalog /Pages 2 0 R >>");
        objects.push_back(fmt::format("<< /Type /Pages /Kids [{}] /Count {} >>", kids, pages.size()));
        objects.push_back("<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica >>");
        for (size_t idx = 0; idx < pages.size(); ++idx)
        {
            const auto content_object = first_page_object + idx * 2 + 1;
            objects.push_back(fmt::format("<< /Type /Page /Parent 2 0 R /MediaBox [0 0 612 792] "
                                          "/Resources << /Font << /F1 3 0 R >> >> /Contents {} 0 R >>",
                                          content_object));
            const auto stream = fmt::format("BT /F1 12 Tf 72 720 Td ({}) Tj ET", pages[idx]);
            objects.push_back(fmt::format("<< /Length {} >>\nstream\n{}\nendstream", stream.size(), stream));
        }

        std::string result = "%PDF-1.4\n";
        std::vector<size_t> offsets;
        for (size_t idx = 0; idx < objects.size(); ++idx)
        {
            offsets.push_back(result.size());
            Strings::append(result, idx + 1, " 0 obj\n", objects[idx], "\nendobj\n");
        }

        const auto xref_offset = result.size();
        Strings::append(result, "xref\n0 ", objects.size() + 1, "\n0000000000 65535 f \n");
        for (auto offset : offsets)
        {
            result.append(fmt::format("{:010} 00000 n \n", offset));
        }

        Strings::append(result,
                        "trailer\n<< /Size ",
                        objects.size() + 1,
                        " /Root 1 0 R >>\nstartxref\n",
                        xref_offset,
                        "\n%%EOF\n");
        return result;
    }

    Path write_shell_script(const Path& dir, StringView name, StringView body)
    {
        auto script = dir / name;
        get_real_filesystem().write_contents(script, Strings::concat("#!/bin/sh\n", body, '\n'), PDFBOX_LINE_INFO);
        REQUIRE(::chmod(script.c_str(), 0755) == 0);
        return script;
    }

    std::string make_listing_html(const std::vector<std::string>& hrefs)
    {
        std::string result = "<!DOCTYPE HTML PUBLIC \"-//W3C//DTD HTML 3.2 Final//EN\">\n<html>\n<head>\n"
                             "<title>Index of /dist/pdfbox</title>\n</head>\n<body>\n<h1>Index of /dist/pdfbox</h1>\n"
                             "<pre><a href=\"?C=N;O=D\">Name</a> <a href=\"/dist/\">Parent Directory</a>\n";
        for (auto&& href : hrefs)
        {
            Strings::append(result, "<a href=\"", href, "\">", href, "</a>  2024-08-09 07:29    -\n");
        }

        result.append("<a href=\"KEYS\">KEYS</a>\n</pre>\n</body></html>\n");
        return result;
    }
}
