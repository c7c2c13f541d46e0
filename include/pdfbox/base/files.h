#pragma once

#include <pdfbox/base/fwd/files.h>

#include <pdfbox/base/lineinfo.h>
#include <pdfbox/base/messages.h>
#include <pdfbox/base/path.h>
#include <pdfbox/base/stringview.h>

#include <stdio.h>

#include <initializer_list>
#include <string>
#include <system_error>
#include <vector>

namespace pdfbox
{
    // call_name("arg1", "arg2"): <ec.message()>
    LocalizedString format_filesystem_call_error(const std::error_code& ec,
                                                 StringView call_name,
                                                 std::initializer_list<StringView> args);

    // Passed where a std::error_code& is expected to discard the error.
    struct IgnoreErrors
    {
        operator std::error_code&() { return ec; }

    private:
        std::error_code ec;
    };

    // Owns a FILE*; the destructor closes it without reporting errors, so writers call close() themselves.
    struct FilePointer
    {
        FilePointer() = default;
        FilePointer(const FilePointer&) = delete;
        FilePointer(FilePointer&& other) noexcept;
        FilePointer& operator=(const FilePointer&) = delete;
        FilePointer& operator=(FilePointer&& other) noexcept;
        ~FilePointer();

        explicit operator bool() const noexcept { return m_fs != nullptr; }
        const Path& path() const noexcept { return m_path; }

        // The sticky error indicator of the stream, as EIO.
        std::error_code error() const noexcept;

        // Flushes buffered data and closes; any failure of either is returned.
        std::error_code close() noexcept;

    protected:
        FilePointer(FILE* fs, const Path& path) : m_fs(fs), m_path(path) { }

        FILE* m_fs = nullptr;
        Path m_path;
    };

    struct ReadFilePointer : FilePointer
    {
        ReadFilePointer() = default;
        ReadFilePointer(const Path& file_path, std::error_code& ec);

        size_t read(void* buffer, size_t element_size, size_t element_count) const noexcept;
    };

    struct WriteFilePointer : FilePointer
    {
        WriteFilePointer() = default;
        // Truncates an existing file.
        WriteFilePointer(const Path& file_path, std::error_code& ec);

        size_t write(const void* buffer, size_t element_size, size_t element_count) const noexcept;
    };

    // Filesystem access used by the artifact cache and the tool; every operation has an error_code form and a form
    // that exits with a message naming the failed call.
    struct Filesystem
    {
        virtual std::string read_contents(const Path& file_path, std::error_code& ec) const = 0;
        std::string read_contents(const Path& file_path, LineInfo li) const;

        // Replaces the file's contents.
        virtual void write_contents(const Path& file_path, StringView data, std::error_code& ec) const = 0;
        void write_contents(const Path& file_path, StringView data, LineInfo li) const;

        // Sorted by name.
        virtual std::vector<Path> get_regular_files_non_recursive(const Path& dir, std::error_code& ec) const = 0;
        std::vector<Path> get_regular_files_non_recursive(const Path& dir, LineInfo li) const;

        // A missing target is not an error.
        virtual bool exists(const Path& target, std::error_code& ec) const = 0;
        bool exists(const Path& target, LineInfo li) const;

        virtual bool is_regular_file(const Path& target) const = 0;

        // Every executable regular file named stem in the directories of $PATH, in $PATH order.
        virtual std::vector<Path> find_from_PATH(StringView stem) const = 0;

        virtual ReadFilePointer open_for_read(const Path& file_path, std::error_code& ec) const = 0;
        virtual WriteFilePointer open_for_write(const Path& file_path, std::error_code& ec) const = 0;

        // Atomically replaces new_path when both are on the same filesystem.
        virtual void rename(const Path& old_path, const Path& new_path, std::error_code& ec) const = 0;

        // Returns whether target existed.
        virtual bool remove(const Path& target, std::error_code& ec) const = 0;

        virtual void remove_all(const Path& base, std::error_code& ec) const = 0;
        void remove_all(const Path& base, LineInfo li) const;

        // Returns whether the last component was created.
        virtual bool create_directories(const Path& new_directory, std::error_code& ec) const = 0;
        bool create_directories(const Path& new_directory, LineInfo li) const;

    protected:
        ~Filesystem() = default;
    };

    const Filesystem& get_real_filesystem();

    // Closes fd, if valid, and sets it to -1.
    void close_mark_invalid(int& fd) noexcept;

    // Removes path when destroyed, ignoring errors.
    struct TempFileDeleter
    {
        TempFileDeleter(const Filesystem& fs, const Path& path) : path(path), m_fs(fs) { }
        TempFileDeleter(const TempFileDeleter&) = delete;
        TempFileDeleter& operator=(const TempFileDeleter&) = delete;
        ~TempFileDeleter();

        Path path;

    private:
        const Filesystem& m_fs;
    };
}
