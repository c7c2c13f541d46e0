#pragma once

#include <pdfbox/base/fwd/optional.h>

#include <pdfbox/errors.h>

#include <pdfbox/base/optional.h>
#include <pdfbox/base/stringview.h>

#include <set>
#include <string>

namespace pdfbox
{
    inline constexpr StringLiteral ArtifactFilePrefix = "pdfbox-app-";
    inline constexpr StringLiteral ArtifactFileSuffix = ".jar";
    inline constexpr StringLiteral ChecksumUrlSuffix = ".sha512";

    // pdfbox-app-<version>.jar
    std::string artifact_file_name(StringView version);

    // The <version> part of a file name of the form pdfbox-app-<version>.jar, or nullopt for any other name.
    Optional<StringView> version_from_artifact_file_name(StringView file_name) noexcept;

    // Extracts the SHA-512 digest, lowercased, from the text of a checksum file. Accepts a bare hex digest,
    // sha512sum output "<hex>  <file name>", and gpg --print-md output "<file name>: <HEX in groups>" which may
    // wrap across lines. Returns nullopt for anything else.
    Optional<std::string> parse_sha512_checksum_text(StringView text);

    struct ArtifactUrls
    {
        std::string version;
        std::string artifact_url;
        std::string checksum_url;
    };

    // Chooses a version from a catalog and derives where its artifact lives. Performs no I/O.
    struct ArtifactResolver
    {
        explicit ArtifactResolver(std::string base_url, Optional<std::string> pinned_version = nullopt);

        const std::string& base_url() const noexcept { return m_base_url; }
        const Optional<std::string>& pinned_version() const noexcept { return m_pinned_version; }

        // <base>/<version>/pdfbox-app-<version>.jar and the same with .sha512 appended
        ArtifactUrls urls_for(StringView version) const;

        // Selects the greatest version under version ordering, or exactly the pinned version when one is set.
        // An empty set or a missing pinned version fails with ResolutionError; a malformed version string fails
        // with VersionParseError.
        ExpectedP<std::string> select_version(const std::set<std::string>& versions) const;

        ExpectedP<ArtifactUrls> resolve(const std::set<std::string>& versions) const;

    private:
        std::string m_base_url;
        Optional<std::string> m_pinned_version;
    };
}
