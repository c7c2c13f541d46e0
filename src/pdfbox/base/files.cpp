#include <pdfbox/base/checks.h>
#include <pdfbox/base/files.h>
#include <pdfbox/base/strings.h>
#include <pdfbox/base/system.debug.h>
#include <pdfbox/base/system.h>

#include <errno.h>
#include <unistd.h>

#include <algorithm>
#include <filesystem>
#include <utility>

namespace
{
    using namespace pdfbox;

    namespace stdfs = std::filesystem;

    std::error_code last_errno() { return std::error_code(errno, std::generic_category()); }

    stdfs::path to_stdfs(const Path& p) { return stdfs::path(p.native()); }

    template<class Fn>
    auto or_exit(LineInfo li, StringView call_name, std::initializer_list<StringView> args, Fn fn)
    {
        std::error_code ec;
        auto result = fn(ec);
        if (ec)
        {
            Checks::msg_exit_with_message(li, format_filesystem_call_error(ec, call_name, args));
        }

        return result;
    }

    struct RealFilesystem final : Filesystem
    {
        std::string read_contents(const Path& file_path, std::error_code& ec) const override
        {
            std::string contents;
            ReadFilePointer file{file_path, ec};
            if (ec)
            {
                return contents;
            }

            char buffer[32 * 1024];
            size_t this_read;
            while ((this_read = file.read(buffer, 1, sizeof(buffer))) != 0)
            {
                contents.append(buffer, this_read);
            }

            ec = file.error();
            return contents;
        }

        void write_contents(const Path& file_path, StringView data, std::error_code& ec) const override
        {
            WriteFilePointer file{file_path, ec};
            if (ec)
            {
                return;
            }

            if (file.write(data.data(), 1, data.size()) != data.size())
            {
                ec = file.error();
                if (!ec) ec = std::make_error_code(std::errc::io_error);
                return;
            }

            ec = file.close();
        }

        std::vector<Path> get_regular_files_non_recursive(const Path& dir, std::error_code& ec) const override
        {
            std::vector<Path> files;
            stdfs::directory_iterator it{to_stdfs(dir), ec};
            for (; !ec && it != stdfs::directory_iterator{}; it.increment(ec))
            {
                std::error_code status_ec;
                if (it->is_regular_file(status_ec))
                {
                    files.emplace_back(it->path().native());
                }
            }

            if (ec)
            {
                files.clear();
                return files;
            }

            std::sort(files.begin(), files.end(), [](const Path& lhs, const Path& rhs) {
                return lhs.native() < rhs.native();
            });
            return files;
        }

        bool exists(const Path& target, std::error_code& ec) const override
        {
            const auto status = stdfs::status(to_stdfs(target), ec);
            if (ec == std::errc::no_such_file_or_directory || status.type() == stdfs::file_type::not_found)
            {
                ec.clear();
                return false;
            }

            return !ec;
        }

        bool is_regular_file(const Path& target) const override
        {
            std::error_code ec;
            return stdfs::is_regular_file(to_stdfs(target), ec);
        }

        std::vector<Path> find_from_PATH(StringView stem) const override
        {
            std::vector<Path> found;
            if (stem.empty())
            {
                return found;
            }

            for (const auto& directory : Strings::split(get_environment_variable("PATH").value_or(""), ':'))
            {
                Path candidate = Path{directory} / stem;
                const bool seen = std::any_of(
                    found.begin(), found.end(), [&](const Path& p) { return p.native() == candidate.native(); });
                if (!seen && is_regular_file(candidate) && ::access(candidate.c_str(), X_OK) == 0)
                {
                    Debug::println("found ", candidate, " on PATH");
                    found.push_back(std::move(candidate));
                }
            }

            return found;
        }

        ReadFilePointer open_for_read(const Path& file_path, std::error_code& ec) const override
        {
            return ReadFilePointer{file_path, ec};
        }

        WriteFilePointer open_for_write(const Path& file_path, std::error_code& ec) const override
        {
            return WriteFilePointer{file_path, ec};
        }

        void rename(const Path& old_path, const Path& new_path, std::error_code& ec) const override
        {
            stdfs::rename(to_stdfs(old_path), to_stdfs(new_path), ec);
        }

        bool remove(const Path& target, std::error_code& ec) const override
        {
            return stdfs::remove(to_stdfs(target), ec);
        }

        void remove_all(const Path& base, std::error_code& ec) const override
        {
            stdfs::remove_all(to_stdfs(base), ec);
        }

        bool create_directories(const Path& new_directory, std::error_code& ec) const override
        {
            return stdfs::create_directories(to_stdfs(new_directory), ec);
        }
    };

    const RealFilesystem real_filesystem_instance{};
}

namespace pdfbox
{
    LocalizedString format_filesystem_call_error(const std::error_code& ec,
                                                 StringView call_name,
                                                 std::initializer_list<StringView> args)
    {
        std::vector<std::string> quoted;
        for (const auto& arg : args)
        {
            quoted.push_back(Strings::concat('"', arg, '"'));
        }

        return LocalizedString::from_raw(
            Strings::concat(call_name, '(', Strings::join(", ", quoted), "): ", ec.message()));
    }

    FilePointer::FilePointer(FilePointer&& other) noexcept
        : m_fs(std::exchange(other.m_fs, nullptr)), m_path(std::move(other.m_path))
    {
    }

    FilePointer& FilePointer::operator=(FilePointer&& other) noexcept
    {
        if (this != &other)
        {
            close();
            m_fs = std::exchange(other.m_fs, nullptr);
            m_path = std::move(other.m_path);
        }

        return *this;
    }

    FilePointer::~FilePointer() { close(); }

    std::error_code FilePointer::error() const noexcept
    {
        if (m_fs && ::ferror(m_fs))
        {
            return std::make_error_code(std::errc::io_error);
        }

        return {};
    }

    std::error_code FilePointer::close() noexcept
    {
        if (!m_fs)
        {
            return {};
        }

        std::error_code ec = error();
        errno = 0;
        if (::fclose(std::exchange(m_fs, nullptr)) != 0 && !ec)
        {
            ec = errno != 0 ? last_errno() : std::make_error_code(std::errc::io_error);
        }

        return ec;
    }

    ReadFilePointer::ReadFilePointer(const Path& file_path, std::error_code& ec)
        : FilePointer(::fopen(file_path.c_str(), "rb"), file_path)
    {
        ec = m_fs ? std::error_code{} : last_errno();
    }

    size_t ReadFilePointer::read(void* buffer, size_t element_size, size_t element_count) const noexcept
    {
        return ::fread(buffer, element_size, element_count, m_fs);
    }

    WriteFilePointer::WriteFilePointer(const Path& file_path, std::error_code& ec)
        : FilePointer(::fopen(file_path.c_str(), "wb"), file_path)
    {
        ec = m_fs ? std::error_code{} : last_errno();
    }

    size_t WriteFilePointer::write(const void* buffer, size_t element_size, size_t element_count) const noexcept
    {
        return ::fwrite(buffer, element_size, element_count, m_fs);
    }

    std::string Filesystem::read_contents(const Path& file_path, LineInfo li) const
    {
        return or_exit(li, "read_contents", {file_path}, [&](std::error_code& ec) {
            return read_contents(file_path, ec);
        });
    }

    void Filesystem::write_contents(const Path& file_path, StringView data, LineInfo li) const
    {
        or_exit(li, "write_contents", {file_path}, [&](std::error_code& ec) {
            write_contents(file_path, data, ec);
            return true;
        });
    }

    std::vector<Path> Filesystem::get_regular_files_non_recursive(const Path& dir, LineInfo li) const
    {
        return or_exit(li, "get_regular_files_non_recursive", {dir}, [&](std::error_code& ec) {
            return get_regular_files_non_recursive(dir, ec);
        });
    }

    bool Filesystem::exists(const Path& target, LineInfo li) const
    {
        return or_exit(li, "exists", {target}, [&](std::error_code& ec) { return exists(target, ec); });
    }

    void Filesystem::remove_all(const Path& base, LineInfo li) const
    {
        or_exit(li, "remove_all", {base}, [&](std::error_code& ec) {
            remove_all(base, ec);
            return true;
        });
    }

    bool Filesystem::create_directories(const Path& new_directory, LineInfo li) const
    {
        return or_exit(li, "create_directories", {new_directory}, [&](std::error_code& ec) {
            return create_directories(new_directory, ec);
        });
    }

    const Filesystem& get_real_filesystem() { return real_filesystem_instance; }

    void close_mark_invalid(int& fd) noexcept
    {
        if (fd >= 0)
        {
            Checks::check_exit(PDFBOX_LINE_INFO, ::close(fd) == 0);
            fd = -1;
        }
    }

    TempFileDeleter::~TempFileDeleter() { m_fs.remove(path, IgnoreErrors{}); }
}
