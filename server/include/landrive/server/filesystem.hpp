#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "landrive/protocol.hpp"
#include "landrive/server/sandbox.hpp"

namespace landrive::server
{

    // File-system operations behind the protocol commands. Every path goes
    // through the sandbox before the disk is touched.
    class Filesystem
    {
    public:
        explicit Filesystem(const std::filesystem::path &root);

        const std::filesystem::path &root() const noexcept;

        const Sandbox &sandbox() const noexcept { return sandbox_; }

        // Creates the directory when it does not exist yet.
        std::vector<landrive::protocol::Entry> list_directory(const std::string &path) const;

        void create_directory(const std::string &path, const std::string &dirname) const;

        // Returns true when a directory tree was removed.
        bool remove_entry(const std::string &path, const std::string &filename) const;

        std::filesystem::path upload_target(const std::string &path, const std::string &filename) const;

        std::filesystem::path download_source(const std::string &path, const std::string &filename) const;

    private:
        Sandbox sandbox_;

        static landrive::protocol::Entry entry_from_directory_entry(const std::filesystem::directory_entry &entry,
                                                                    std::error_code &ec);
    };

} // namespace landrive::server
