#pragma once

#include <catch2/catch.hpp>

#include <pdfbox/base/fwd/files.h>

#include <pdfbox/base/diagnostics.h>
#include <pdfbox/base/downloads.h>
#include <pdfbox/base/files.h>
#include <pdfbox/base/fmt.h>
#include <pdfbox/base/messages.h>
#include <pdfbox/base/optional.h>
#include <pdfbox/base/path.h>

#include <pdfbox/errors.h>
#include <pdfbox/versions.h>

#include <iomanip>
#include <map>
#include <string>
#include <vector>

#define CHECK_EC(ec)                                                                                                   \
    do                                                                                                                 \
    {                                                                                                                  \
        if (ec)                                                                                                        \
        {                                                                                                              \
            FAIL(ec.message());                                                                                        \
        }                                                                                                              \
    } while (0)

namespace Catch
{
    template<>
    struct StringMaker<pdfbox::LocalizedString>
    {
        static const std::string convert(const pdfbox::LocalizedString& value) { return "LL\"" + value.data() + "\""; }
    };

    template<>
    struct StringMaker<pdfbox::Path>
    {
        static const std::string convert(const pdfbox::Path& value) { return "\"" + value.native() + "\""; }
    };

    template<>
    struct StringMaker<pdfbox::DotVersion>
    {
        static const std::string convert(const pdfbox::DotVersion& value) { return value.to_string(); }
    };

    template<>
    struct StringMaker<pdfbox::PdfBoxError>
    {
        static const std::string convert(const pdfbox::PdfBoxError& value) { return value.to_string(); }
    };

    template<>
    struct StringMaker<pdfbox::PdfBoxErrorKind>
    {
        static const std::string convert(pdfbox::PdfBoxErrorKind value)
        {
            return pdfbox::to_string_literal(value).to_string();
        }
    };
}

namespace pdfbox
{
    inline std::ostream& operator<<(std::ostream& os, const LocalizedString& value)
    {
        return os << "LL" << std::quoted(value.data());
    }

    inline std::ostream& operator<<(std::ostream& os, const Path& value) { return os << value.native(); }

    template<class T>
    inline auto operator<<(std::ostream& os, const Optional<T>& value) -> decltype(os << *(value.get()))
    {
        if (auto v = value.get())
        {
            return os << *v;
        }
        else
        {
            return os << "nullopt";
        }
    }
}

namespace pdfbox::Test
{
    const Path& base_temporary_directory() noexcept;

    // A fresh, empty directory under base_temporary_directory(), removed on destruction.
    struct TemporaryDirectory
    {
        explicit TemporaryDirectory(StringView name);
        TemporaryDirectory(const TemporaryDirectory&) = delete;
        TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;
        ~TemporaryDirectory();

        Path path;
    };

    // Serves canned responses and counts requests. URLs without a response fail with HTTP 404.
    struct FakeHttpClient final : HttpClient
    {
        explicit FakeHttpClient(const Filesystem& fs) : m_fs(fs) { }

        virtual Optional<std::string> get_text(DiagnosticContext& context, StringView url) const override;
        virtual bool download_file(DiagnosticContext& context, StringView url, const Path& target) const override;

        std::map<std::string, std::string> responses;
        mutable std::vector<std::string> requests;

    private:
        const Filesystem& m_fs;
    };

    // Writes an executable /bin/sh script named `name` into `dir`.
    Path write_shell_script(const Path& dir, StringView name, StringView body);

    // A minimal PDF with one page per entry of `pages`, each showing its text as one line.
    std::string make_text_pdf(const std::vector<std::string>& pages);

    // An Apache style directory listing with one link per entry of `hrefs`.
    std::string make_listing_html(const std::vector<std::string>& hrefs);
}
