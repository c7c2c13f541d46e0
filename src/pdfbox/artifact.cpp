#include <pdfbox/base/downloads.h>
#include <pdfbox/base/parse.h>
#include <pdfbox/base/strings.h>

#include <pdfbox/artifact.h>
#include <pdfbox/versions.h>

#include <algorithm>

namespace
{
    using namespace pdfbox;

    constexpr size_t sha512_hex_length = 128;

    bool is_sha512_hex(StringView sv)
    {
        return sv.size() == sha512_hex_length &&
               std::all_of(sv.begin(), sv.end(), [](char ch) { return ParserBase::is_hex_digit(ch); });
    }
}

namespace pdfbox
{
    std::string artifact_file_name(StringView version)
    {
        return Strings::concat(ArtifactFilePrefix, version, ArtifactFileSuffix);
    }

    Optional<StringView> version_from_artifact_file_name(StringView file_name) noexcept
    {
        if (file_name.size() <= ArtifactFilePrefix.size() + ArtifactFileSuffix.size() ||
            !file_name.starts_with(ArtifactFilePrefix) || !file_name.ends_with(ArtifactFileSuffix))
        {
            return nullopt;
        }

        return file_name.substr(ArtifactFilePrefix.size(),
                                file_name.size() - ArtifactFilePrefix.size() - ArtifactFileSuffix.size());
    }

    Optional<std::string> parse_sha512_checksum_text(StringView text)
    {
        const auto trimmed = Strings::trim(text);
        const auto first_token_end =
            std::find_if(trimmed.begin(), trimmed.end(), [](char ch) { return ParserBase::is_whitespace(ch); });
        const StringView first_token{trimmed.begin(), first_token_end};
        if (is_sha512_hex(first_token))
        {
            return Strings::ascii_to_lowercase(first_token);
        }

        // <file name>: 1234ABCD 5678EF01 ...
        const auto colon = std::find(trimmed.begin(), trimmed.end(), ':');
        if (colon == trimmed.end())
        {
            return nullopt;
        }

        std::string digest;
        for (auto it = colon + 1; it != trimmed.end(); ++it)
        {
            if (ParserBase::is_whitespace(*it))
            {
                continue;
            }

            if (!ParserBase::is_hex_digit(*it))
            {
                return nullopt;
            }

            digest.push_back(*it);
        }

        if (digest.size() != sha512_hex_length)
        {
            return nullopt;
        }

        Strings::inplace_ascii_to_lowercase(digest);
        return digest;
    }

    ArtifactResolver::ArtifactResolver(std::string base_url, Optional<std::string> pinned_version)
        : m_base_url(std::move(base_url)), m_pinned_version(std::move(pinned_version))
    {
    }

    ArtifactUrls ArtifactResolver::urls_for(StringView version) const
    {
        ArtifactUrls result;
        result.version = version.to_string();
        result.artifact_url = url_join(url_join(m_base_url, version), artifact_file_name(version));
        result.checksum_url = Strings::concat(result.artifact_url, ChecksumUrlSuffix);
        return result;
    }

    ExpectedP<std::string> ArtifactResolver::select_version(const std::set<std::string>& versions) const
    {
        if (versions.empty())
        {
            return PdfBoxError{PdfBoxErrorKind::Resolution, msg::format(msgNoVersionsToResolve, msg::url = m_base_url)};
        }

        if (auto pinned = m_pinned_version.get())
        {
            if (versions.count(*pinned) != 0)
            {
                return *pinned;
            }

            return PdfBoxError{PdfBoxErrorKind::Resolution,
                               msg::format(msgPinnedVersionNotInCatalog, msg::version = *pinned, msg::url = m_base_url)};
        }

        Optional<DotVersion> best;
        for (auto&& candidate : versions)
        {
            auto maybe_parsed = DotVersion::try_parse(candidate);
            auto parsed = maybe_parsed.get();
            if (!parsed)
            {
                return PdfBoxError{PdfBoxErrorKind::VersionParse, std::move(maybe_parsed).error()};
            }

            auto current_best = best.get();
            if (!current_best || *current_best < *parsed)
            {
                best = std::move(*parsed);
            }
        }

        return best.value_or_exit(PDFBOX_LINE_INFO).original_string;
    }

    ExpectedP<ArtifactUrls> ArtifactResolver::resolve(const std::set<std::string>& versions) const
    {
        return select_version(versions).map([this](const std::string& version) { return urls_for(version); });
    }
}
