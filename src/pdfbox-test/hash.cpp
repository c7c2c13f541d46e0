#include <pdfbox-test/util.h>

#include <pdfbox/base/hash.h>

#include <algorithm>
#include <string>

using namespace pdfbox;

namespace
{
    constexpr StringLiteral empty_digest = "cf83e1357eefb8bdf1542850d66d8007d620e4050b5715dc83f4a921d36ce9ce47d0d13c5d85f2b0"
                                           "ff8318d2877eec2f63b931bd47417a81a538327af927da3e";
    constexpr StringLiteral abc_digest = "ddaf35a193617abacc417349ae20413112e6fa4e89a97ea20a9eeee64b55d39a2192992a274fc1a8"
                                         "36ba3c23a3feebbd454d4423643ce80e2a9ac94fa54ca49f";
}

TEST_CASE ("SHA512 known answers", "[hash]")
{
    CHECK(Hash::get_string_hash("", Hash::Algorithm::Sha512) == empty_digest);
    CHECK(Hash::get_string_hash("abc", Hash::Algorithm::Sha512) == abc_digest);
    CHECK(Hash::get_string_hash("The quick brown fox jumps over the lazy dog", Hash::Algorithm::Sha512) ==
          "07e547d9586f6a73f73fbac0435ed76951218fb7d0c8d788a309d785436bbb642e93a252a954f23912547d1e8a3b5ed6e1bfd709"
          "7821233fa0538f3db854fee6");
    // two blocks
    CHECK(Hash::get_string_hash("abcdefghbcdefghicdefghijdefghijkefghijklfghijklmghijklmnhijklmnoijklmnopjklmnopqklm"
                                "nopqrlmnopqrsmnopqrstnopqrstu",
                                Hash::Algorithm::Sha512) ==
          "8e959b75dae313da8cf4f72814fc143f8f7779c6eb9f7fa17299aeadb6889018501d289e4900f7e4331b99dec4b5433ac7d329ee"
          "b6dd26545e96e55b874be909");
}

TEST_CASE ("SHA512 incremental input", "[hash]")
{
    std::string data;
    for (int idx = 0; idx < 1000; ++idx)
    {
        data.push_back(static_cast<char>(idx * 7));
    }

    const auto whole = Hash::get_string_hash(data, Hash::Algorithm::Sha512);
    auto hasher = Hash::get_hasher_for(Hash::Algorithm::Sha512);
    for (size_t chunk : {1u, 63u, 127u, 128u, 129u, 552u})
    {
        hasher->clear();
        for (size_t offset = 0; offset < data.size(); offset += chunk)
        {
            const auto last = std::min(data.size(), offset + chunk);
            hasher->add_bytes(data.data() + offset, data.data() + last);
        }

        CHECK(hasher->get_hash() == whole);
    }
}

TEST_CASE ("hash files", "[hash]")
{
    auto& fs = get_real_filesystem();
    Test::TemporaryDirectory temp{"hash"};
    const auto file = temp.path / "abc.txt";
    fs.write_contents(file, "abc", PDFBOX_LINE_INFO);

    BufferedDiagnosticContext bdc{null_sink};
    auto result = Hash::get_file_hash(bdc, fs, file, Hash::Algorithm::Sha512);
    CHECK(result.prognosis == Hash::HashPrognosis::Success);
    CHECK(result.hash == abc_digest);
    CHECK(bdc.empty());

    const auto missing = temp.path / "missing.txt";
    result = Hash::get_file_hash(bdc, fs, missing, Hash::Algorithm::Sha512);
    CHECK(result.prognosis == Hash::HashPrognosis::FileNotFound);
    CHECK(result.hash.empty());
    CHECK(bdc.empty());

    CHECK(!Hash::get_file_hash_required(bdc, fs, missing, Hash::Algorithm::Sha512).has_value());
    CHECK(bdc.any_errors());
    CHECK(bdc.to_string() == missing.native() + ": error: file not found");
}
