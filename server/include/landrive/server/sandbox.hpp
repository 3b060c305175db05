#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

#include "landrive/error_codes.hpp"

namespace landrive::server
{

    class FilesystemError : public std::runtime_error
    {
    public:
        FilesystemError(landrive::ErrorCode code, std::string message);

        landrive::ErrorCode code() const noexcept { return code_; }

    private:
        landrive::ErrorCode code_;
    };

    // Confines client-supplied relative paths to one storage root. Every
    // resolution that lands outside the root throws AccessDenied.
    class Sandbox
    {
    public:
        explicit Sandbox(const std::filesystem::path &root);

        const std::filesystem::path &root() const noexcept { return root_; }

        std::filesystem::path resolve(std::string_view relative) const;

        // Resolves `name` inside the directory `relative`. The name must be
        // non-empty and must not be "." or "..".
        std::filesystem::path resolve_child(std::string_view relative, std::string_view name) const;

        bool contains(const std::filesystem::path &candidate) const;

    private:
        std::filesystem::path root_;
    };

} // namespace landrive::server
