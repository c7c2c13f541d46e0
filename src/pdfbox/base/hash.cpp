#include <pdfbox/base/checks.h>
#include <pdfbox/base/files.h>
#include <pdfbox/base/hash.h>
#include <pdfbox/base/strings.h>

#include <stdint.h>
#include <string.h>

#include <algorithm>
#include <system_error>

namespace pdfbox::Hash
{
    using uchar = unsigned char;

    namespace
    {
        constexpr uint64_t sha512_round_constants[80] = {
            0x428a2f98d728ae22, 0x7137449123ef65cd, 0xb5c0fbcfec4d3b2f, 0xe9b5dba58189dbbc, 0x3956c25bf348b538,
            0x59f111f1b605d019, 0x923f82a4af194f9b, 0xab1c5ed5da6d8118, 0xd807aa98a3030242, 0x12835b0145706fbe,
            0x243185be4ee4b28c, 0x550c7dc3d5ffb4e2, 0x72be5d74f27b896f, 0x80deb1fe3b1696b1, 0x9bdc06a725c71235,
            0xc19bf174cf692694, 0xe49b69c19ef14ad2, 0xefbe4786384f25e3, 0x0fc19dc68b8cd5b5, 0x240ca1cc77ac9c65,
            0x2de92c6f592b0275, 0x4a7484aa6ea6e483, 0x5cb0a9dcbd41fbd4, 0x76f988da831153b5, 0x983e5152ee66dfab,
            0xa831c66d2db43210, 0xb00327c898fb213f, 0xbf597fc7beef0ee4, 0xc6e00bf33da88fc2, 0xd5a79147930aa725,
            0x06ca6351e003826f, 0x142929670a0e6e70, 0x27b70a8546d22ffc, 0x2e1b21385c26c926, 0x4d2c6dfc5ac42aed,
            0x53380d139d95b3df, 0x650a73548baf63de, 0x766a0abb3c77b2a8, 0x81c2c92e47edaee6, 0x92722c851482353b,
            0xa2bfe8a14cf10364, 0xa81a664bbc423001, 0xc24b8b70d0f89791, 0xc76c51a30654be30, 0xd192e819d6ef5218,
            0xd69906245565a910, 0xf40e35855771202a, 0x106aa07032bbd1b8, 0x19a4c116b8d2d0c8, 0x1e376c085141ab53,
            0x2748774cdf8eeb99, 0x34b0bcb5e19b48a8, 0x391c0cb3c5c95a63, 0x4ed8aa4ae3418acb, 0x5b9cca4f7763e373,
            0x682e6ff3d6b2b8a3, 0x748f82ee5defb2fc, 0x78a5636f43172f60, 0x84c87814a1f0ab72, 0x8cc702081a6439ec,
            0x90befffa23631e28, 0xa4506cebde82bde9, 0xbef9a3f7b2c67915, 0xc67178f2e372532b, 0xca273eceea26619c,
            0xd186b8c721c0c207, 0xeada7dd6cde0eb1e, 0xf57d4f7fee6ed178, 0x06f067aa72176fba, 0x0a637dc5a2c898a6,
            0x113f9804bef90dae, 0x1b710b35131c471b, 0x28db77f523047d84, 0x32caab7b40c72493, 0x3c9ebe0a15c9bebc,
            0x431d67c49c100d4c, 0x4cc5d4becb3e42b6, 0x597f299cfc657e2a, 0x5fcb6fab3ad6faec, 0x6c44198c4a475817,
        };

        constexpr uint64_t sha512_initial_state[8] = {
            0x6a09e667f3bcc908,
            0xbb67ae8584caa73b,
            0x3c6ef372fe94f82b,
            0xa54ff53a5f1d36f1,
            0x510e527fade682d1,
            0x9b05688c2b3e6c1f,
            0x1f83d9abfb41bd6b,
            0x5be0cd19137e2179,
        };

        constexpr uint64_t ror64(uint64_t x, int n) noexcept { return (x >> n) | (x << (64 - n)); }

        void append_hex(std::string& target, uint64_t value)
        {
            static constexpr char hex_digits[] = "0123456789abcdef";
            for (int shift = 60; shift >= 0; shift -= 4)
            {
                target.push_back(hex_digits[(value >> shift) & 0xF]);
            }
        }

        // FIPS 180-4 SHA-512
        struct Sha512Hasher final : Hasher
        {
            Sha512Hasher() noexcept { clear(); }

            virtual void add_bytes(const void* start, const void* end) noexcept override
            {
                auto first = static_cast<const uchar*>(start);
                const auto last = static_cast<const uchar*>(end);
                m_message_length += static_cast<uint64_t>(last - first);
                while (first != last)
                {
                    const auto to_copy = std::min(static_cast<size_t>(last - first), chunk_size - m_chunk_length);
                    memcpy(m_chunk + m_chunk_length, first, to_copy);
                    m_chunk_length += to_copy;
                    first += to_copy;
                    if (m_chunk_length == chunk_size)
                    {
                        process_full_chunk();
                        m_chunk_length = 0;
                    }
                }
            }

            virtual std::string get_hash() override
            {
                // the length is stored in bits, in a 128 bit big endian field; the high half is always 0 here
                const uint64_t message_bits = m_message_length * 8;
                m_chunk[m_chunk_length++] = 0x80;
                if (m_chunk_length > chunk_size - 16)
                {
                    memset(m_chunk + m_chunk_length, 0, chunk_size - m_chunk_length);
                    process_full_chunk();
                    m_chunk_length = 0;
                }

                memset(m_chunk + m_chunk_length, 0, chunk_size - m_chunk_length);
                for (int idx = 0; idx < 8; ++idx)
                {
                    m_chunk[chunk_size - 1 - idx] = static_cast<uchar>(message_bits >> (idx * 8));
                }

                process_full_chunk();

                std::string result;
                result.reserve(128);
                for (auto word : m_state)
                {
                    append_hex(result, word);
                }

                return result;
            }

            virtual void clear() noexcept override
            {
                memcpy(m_state, sha512_initial_state, sizeof(m_state));
                m_chunk_length = 0;
                m_message_length = 0;
            }

        private:
            static constexpr size_t chunk_size = 128;

            void process_full_chunk() noexcept
            {
                uint64_t words[80];
                for (size_t idx = 0; idx < 16; ++idx)
                {
                    uint64_t word = 0;
                    for (size_t byte = 0; byte < 8; ++byte)
                    {
                        word = (word << 8) | m_chunk[idx * 8 + byte];
                    }

                    words[idx] = word;
                }

                for (size_t idx = 16; idx < 80; ++idx)
                {
                    const auto w15 = words[idx - 15];
                    const auto w2 = words[idx - 2];
                    const auto s0 = ror64(w15, 1) ^ ror64(w15, 8) ^ (w15 >> 7);
                    const auto s1 = ror64(w2, 19) ^ ror64(w2, 61) ^ (w2 >> 6);
                    words[idx] = words[idx - 16] + s0 + words[idx - 7] + s1;
                }

                uint64_t a = m_state[0];
                uint64_t b = m_state[1];
                uint64_t c = m_state[2];
                uint64_t d = m_state[3];
                uint64_t e = m_state[4];
                uint64_t f = m_state[5];
                uint64_t g = m_state[6];
                uint64_t h = m_state[7];

                for (size_t idx = 0; idx < 80; ++idx)
                {
                    const auto S1 = ror64(e, 14) ^ ror64(e, 18) ^ ror64(e, 41);
                    const auto ch = (e & f) ^ (~e & g);
                    const auto temp1 = h + S1 + ch + sha512_round_constants[idx] + words[idx];
                    const auto S0 = ror64(a, 28) ^ ror64(a, 34) ^ ror64(a, 39);
                    const auto maj = (a & b) ^ (a & c) ^ (b & c);
                    const auto temp2 = S0 + maj;

                    h = g;
                    g = f;
                    f = e;
                    e = d + temp1;
                    d = c;
                    c = b;
                    b = a;
                    a = temp1 + temp2;
                }

                m_state[0] += a;
                m_state[1] += b;
                m_state[2] += c;
                m_state[3] += d;
                m_state[4] += e;
                m_state[5] += f;
                m_state[6] += g;
                m_state[7] += h;
            }

            uint64_t m_state[8];
            uchar m_chunk[chunk_size];
            size_t m_chunk_length;
            uint64_t m_message_length;
        };
    }

    std::unique_ptr<Hasher> get_hasher_for(Algorithm algo)
    {
        switch (algo)
        {
            case Algorithm::Sha512: return std::make_unique<Sha512Hasher>();
            default: Checks::unreachable(PDFBOX_LINE_INFO);
        }
    }

    std::string get_string_hash(StringView s, Algorithm algo)
    {
        auto hasher = get_hasher_for(algo);
        hasher->add_bytes(s.begin(), s.end());
        return hasher->get_hash();
    }

    HashResult get_file_hash(DiagnosticContext& context, const Filesystem& fs, const Path& path, Algorithm algo)
    {
        HashResult result;
        std::error_code ec;
        auto file = fs.open_for_read(path, ec);
        if (ec)
        {
            if (ec == std::errc::no_such_file_or_directory)
            {
                result.prognosis = HashPrognosis::FileNotFound;
                return result;
            }

            result.prognosis = HashPrognosis::OtherError;
            context.report_error(format_filesystem_call_error(ec, "open_for_read", {path}));
            return result;
        }

        auto hasher = get_hasher_for(algo);
        constexpr std::size_t buffer_size = 1024 * 32;
        char buffer[buffer_size];
        for (;;)
        {
            const auto this_read = file.read(buffer, 1, buffer_size);
            hasher->add_bytes(buffer, buffer + this_read);
            if (this_read != buffer_size)
            {
                break;
            }
        }

        if (file.error())
        {
            result.prognosis = HashPrognosis::OtherError;
            context.report_error(msgHashFileFailureToRead, msg::path = path);
            return result;
        }

        result.hash = hasher->get_hash();
        return result;
    }

    Optional<std::string> get_file_hash_required(DiagnosticContext& context,
                                                 const Filesystem& fs,
                                                 const Path& path,
                                                 Algorithm algo)
    {
        auto result = get_file_hash(context, fs, path, algo);
        switch (result.prognosis)
        {
            case HashPrognosis::Success: return std::move(result.hash);
            case HashPrognosis::FileNotFound:
                context.report(DiagnosticLine{DiagKind::Error, path, msg::format(msgFileNotFound)});
                return nullopt;
            case HashPrognosis::OtherError: return nullopt;
            default: Checks::unreachable(PDFBOX_LINE_INFO);
        }
    }
}
