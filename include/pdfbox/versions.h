#pragma once

#include <pdfbox/base/fwd/optional.h>
#include <pdfbox/base/fwd/stringview.h>

#include <pdfbox/fwd/versions.h>

#include <pdfbox/base/expected.h>
#include <pdfbox/base/fmt.h>
#include <pdfbox/base/optional.h>

#include <stdint.h>

#include <string>
#include <vector>

namespace pdfbox
{
    // Maps the sign of a three way comparison.
    VerComp int_to_vercomp(int comparison_result);

    // A dotted numeric version with an optional pre-release qualifier and optional build metadata:
    // 2.0.27, 3.0.0-RC1, 3.0.0-alpha2, 3.0.0.beta1, 2.0.0+build.5
    struct DotVersion
    {
        DotVersion() noexcept { }

        std::string original_string;
        std::string version_string;
        std::string prerelease_string;

        std::vector<uint64_t> version;
        std::vector<std::string> identifiers;

        const std::string& to_string() const noexcept { return original_string; }
        void to_string(std::string& out) const { out.append(original_string); }

        friend bool operator==(const DotVersion& lhs, const DotVersion& rhs);
        friend bool operator!=(const DotVersion& lhs, const DotVersion& rhs) { return !(lhs == rhs); }
        friend bool operator<(const DotVersion& lhs, const DotVersion& rhs);
        friend bool operator>(const DotVersion& lhs, const DotVersion& rhs) { return rhs < lhs; }
        friend bool operator>=(const DotVersion& lhs, const DotVersion& rhs) { return !(lhs < rhs); }
        friend bool operator<=(const DotVersion& lhs, const DotVersion& rhs) { return !(rhs < lhs); }

        static ExpectedL<DotVersion> try_parse(StringView str);
    };

    VerComp compare(const DotVersion& a, const DotVersion& b);
}

PDFBOX_FORMAT_WITH_TO_STRING(pdfbox::DotVersion);
