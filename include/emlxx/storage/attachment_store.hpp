/*

attachment_store.hpp
--------------------

Writing attachment files below an output directory without ever replacing an existing file.

*/

#pragma once

#include <cerrno>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <emlxx/detail/error_detail.hpp>
#include <emlxx/detail/result.hpp>
#include <emlxx/detail/sanitize.hpp>

namespace emlxx::storage
{

class attachment_store
{
public:
    /// Attempts at finding a free name when a concurrent writer takes the chosen one first
    static constexpr int MAX_WRITE_ATTEMPTS = 16;

    explicit attachment_store(std::filesystem::path root)
        : root_(std::move(root))
    {
    }

    const std::filesystem::path& root() const
    {
        return root_;
    }

    /**
    Creating a directory with all its ancestors; an existing directory is not an error.
    **/
    static result_void ensure_directory(const std::filesystem::path& dir)
    {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec || !std::filesystem::is_directory(dir))
        {
            detail::error_detail info;
            info.add_path("path", dir).add("op", "create_directories");
            if (ec)
                info.add_ec("errc", ec);
            return fail(error_code::file_system_error, "Cannot create directory: " + detail::path_utf8(dir), info.str());
        }
        return ok();
    }

    /**
    First free path for a name in a directory: `name`, then `stem_1.ext`, `stem_2.ext` and so on.
    **/
    static std::filesystem::path resolve_collision(const std::filesystem::path& dir, std::string_view name)
    {
        auto candidate = dir / detail::utf8_path(name);
        if (!exists(candidate))
            return candidate;

        auto file = detail::utf8_path(name);
        auto stem = detail::path_utf8(file.stem());
        auto ext = detail::path_utf8(file.extension());
        for (unsigned long counter = 1; ; ++counter)
        {
            candidate = dir / detail::utf8_path(stem + "_" + std::to_string(counter) + ext);
            if (!exists(candidate))
                return candidate;
        }
    }

    /**
    Writing octets to a file that must not exist yet.

    @return `file_exists` when the path is taken, `file_system_error` when opening or writing fails. A partially written file is removed.
    **/
    static result_void write_new_file(const std::filesystem::path& path, std::string_view octets)
    {
#ifdef _WIN32
        std::unique_ptr<std::FILE, int (*)(std::FILE*)> file(_wfopen(path.c_str(), L"wbx"), &std::fclose);
#else
        std::unique_ptr<std::FILE, int (*)(std::FILE*)> file(std::fopen(path.c_str(), "wbx"), &std::fclose);
#endif
        if (!file)
        {
            const int err = errno;
            auto info = detail::error_detail().add_path("path", path).add("op", "open")
                .add_ec("errc", std::error_code(err, std::generic_category())).str();
            if (err == EEXIST)
                return fail(error_code::file_exists, "File already exists: " + detail::path_utf8(path), std::move(info));
            return fail(error_code::file_system_error, "Cannot create file: " + detail::path_utf8(path), std::move(info));
        }

        bool written = octets.empty() || std::fwrite(octets.data(), 1, octets.size(), file.get()) == octets.size();
        written = std::fclose(file.release()) == 0 && written;
        if (!written)
        {
            std::error_code ec;
            std::filesystem::remove(path, ec);
            return fail(error_code::file_system_error, "Cannot write file: " + detail::path_utf8(path),
                detail::error_detail().add_path("path", path).add("op", "write").str());
        }
        return ok();
    }

    /**
    Storing an attachment under a free name in a directory below the root.

    @param sub_dir Directory relative to the root, empty for the root itself.
    @param name    Sanitized filename.
    @param octets  Attachment content.
    @return        Path of the written file.
    **/
    result<std::filesystem::path> store(const std::filesystem::path& sub_dir, std::string_view name, std::string_view octets) const
    {
        auto dir = sub_dir.empty() ? root_ : root_ / sub_dir;
        auto created = ensure_directory(dir);
        if (!created)
            return fail<std::filesystem::path>(std::move(created.error()));

        for (int attempt = 0; attempt < MAX_WRITE_ATTEMPTS; ++attempt)
        {
            auto target = resolve_collision(dir, name);
            auto written = write_new_file(target, octets);
            if (written)
                return target;
            if (!written.error().is(error_code::file_exists))
                return fail<std::filesystem::path>(std::move(written.error()));
        }
        return fail<std::filesystem::path>(error_code::file_system_error, "No free file name for " + std::string(name),
            detail::error_detail().add_path("path", dir).add_int("attempts", MAX_WRITE_ATTEMPTS).str());
    }

private:
    static bool exists(const std::filesystem::path& p)
    {
        std::error_code ec;
        return std::filesystem::exists(std::filesystem::symlink_status(p, ec));
    }

    std::filesystem::path root_;
};

} // namespace emlxx::storage
