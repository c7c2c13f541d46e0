#pragma once

#include <pdfbox/base/fwd/files.h>

#include <pdfbox/base/diagnostics.h>
#include <pdfbox/base/optional.h>
#include <pdfbox/base/stringview.h>

#include <memory>
#include <string>

namespace pdfbox::Hash
{
    // Outcome of hashing a file; hash is set only on Success.
    enum class HashPrognosis
    {
        Success,
        FileNotFound,
        OtherError,
    };

    struct HashResult
    {
        HashPrognosis prognosis = HashPrognosis::Success;
        std::string hash;
    };

    enum class Algorithm
    {
        Sha512,
    };

    // Incremental digest; lowercase hex output.
    struct Hasher
    {
        virtual void add_bytes(const void* start, const void* end) noexcept = 0;

        // Finishes the digest. Call clear() before reusing the hasher.
        virtual std::string get_hash() = 0;
        virtual void clear() noexcept = 0;
        virtual ~Hasher() = default;
    };

    std::unique_ptr<Hasher> get_hasher_for(Algorithm algo);

    std::string get_string_hash(StringView s, Algorithm algo);

    // A missing file is FileNotFound and is not reported; read failures are reported to context as OtherError.
    HashResult get_file_hash(DiagnosticContext& context, const Filesystem& fs, const Path& path, Algorithm algo);

    // Like get_file_hash, but every failure is reported to context.
    Optional<std::string> get_file_hash_required(DiagnosticContext& context,
                                                 const Filesystem& fs,
                                                 const Path& path,
                                                 Algorithm algo);
}
