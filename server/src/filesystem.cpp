#include "landrive/server/filesystem.hpp"

#include <chrono>
#include <filesystem>

#include <spdlog/spdlog.h>

namespace landrive::server
{

    namespace
    {

        std::int64_t to_unix_time(const std::filesystem::file_time_type &time)
        {
            using namespace std::chrono;
            const auto sctp = time_point_cast<seconds>(time - std::filesystem::file_time_type::clock::now() +
                                                       std::chrono::system_clock::now());
            return static_cast<std::int64_t>(sctp.time_since_epoch().count());
        }

    } // namespace

    Filesystem::Filesystem(const std::filesystem::path &root) : sandbox_(root) {}

    const std::filesystem::path &Filesystem::root() const noexcept
    {
        return sandbox_.root();
    }

    std::vector<landrive::protocol::Entry> Filesystem::list_directory(const std::string &path) const
    {
        const auto target = sandbox_.resolve(path);
        if (!std::filesystem::exists(target))
        {
            std::filesystem::create_directories(target);
        }
        if (!std::filesystem::is_directory(target))
        {
            throw FilesystemError(landrive::ErrorCode::NotFound, "Target is not a directory");
        }

        std::vector<landrive::protocol::Entry> entries;
        for (const auto &entry : std::filesystem::directory_iterator(target))
        {
            std::error_code ec;
            auto item = entry_from_directory_entry(entry, ec);
            if (ec)
            {
                // Removed between enumeration and stat.
                spdlog::debug("Skipping {}: {}", entry.path().filename().string(), ec.message());
                continue;
            }
            entries.push_back(std::move(item));
        }
        return entries;
    }

    void Filesystem::create_directory(const std::string &path, const std::string &dirname) const
    {
        const auto target = sandbox_.resolve_child(path, dirname);
        if (std::filesystem::exists(target) && !std::filesystem::is_directory(target))
        {
            throw FilesystemError(landrive::ErrorCode::AlreadyExists, "A file with that name already exists");
        }
        std::filesystem::create_directories(target);
    }

    bool Filesystem::remove_entry(const std::string &path, const std::string &filename) const
    {
        const auto target = sandbox_.resolve_child(path, filename);
        if (target == sandbox_.root())
        {
            throw FilesystemError(landrive::ErrorCode::AccessDenied, "Refusing to remove the storage root");
        }
        const auto status = std::filesystem::symlink_status(target);
        if (!std::filesystem::exists(status))
        {
            throw FilesystemError(landrive::ErrorCode::NotFound, "Path does not exist");
        }
        if (std::filesystem::is_directory(status))
        {
            std::filesystem::remove_all(target);
            return true;
        }
        std::filesystem::remove(target);
        return false;
    }

    std::filesystem::path Filesystem::upload_target(const std::string &path, const std::string &filename) const
    {
        const auto directory = sandbox_.resolve(path);
        if (!std::filesystem::is_directory(directory))
        {
            throw FilesystemError(landrive::ErrorCode::NotFound, "Target directory does not exist");
        }
        const auto target = sandbox_.resolve_child(path, filename);
        if (std::filesystem::is_directory(target))
        {
            throw FilesystemError(landrive::ErrorCode::AlreadyExists, "A directory with that name already exists");
        }
        return target;
    }

    std::filesystem::path Filesystem::download_source(const std::string &path, const std::string &filename) const
    {
        const auto source = sandbox_.resolve_child(path, filename);
        if (!std::filesystem::is_regular_file(source))
        {
            throw FilesystemError(landrive::ErrorCode::NotFound, "File not found");
        }
        return source;
    }

    landrive::protocol::Entry Filesystem::entry_from_directory_entry(const std::filesystem::directory_entry &entry,
                                                                     std::error_code &ec)
    {
        landrive::protocol::Entry item{};
        item.name = entry.path().filename().string();
        item.is_dir = entry.is_directory(ec);
        if (ec)
        {
            return item;
        }
        item.size = item.is_dir ? 0 : static_cast<std::uint64_t>(entry.file_size(ec));
        if (ec)
        {
            return item;
        }
        const auto modified = entry.last_write_time(ec);
        if (ec)
        {
            return item;
        }
        item.mtime = to_unix_time(modified);
        return item;
    }

} // namespace landrive::server
