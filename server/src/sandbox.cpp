#include "landrive/server/sandbox.hpp"

#include <algorithm>
#include <string>

namespace landrive::server
{

    namespace
    {
        constexpr std::string_view kSeparators = "/\\";

        std::string strip_separators(std::string_view relative)
        {
            const auto first = relative.find_first_not_of(kSeparators);
            if (first == std::string_view::npos)
            {
                return {};
            }
            const auto last = relative.find_last_not_of(kSeparators);
            return std::string(relative.substr(first, last - first + 1));
        }
    } // namespace

    FilesystemError::FilesystemError(landrive::ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    Sandbox::Sandbox(const std::filesystem::path &root)
    {
        std::filesystem::create_directories(root);
        root_ = std::filesystem::canonical(root);
    }

    std::filesystem::path Sandbox::resolve(std::string_view relative) const
    {
        const auto stripped = strip_separators(relative);
        if (stripped.empty())
        {
            return root_;
        }

        std::error_code ec;
        auto candidate = std::filesystem::weakly_canonical(root_ / stripped, ec);
        if (ec)
        {
            throw FilesystemError(landrive::ErrorCode::AccessDenied, "Path cannot be resolved");
        }
        if (!contains(candidate))
        {
            throw FilesystemError(landrive::ErrorCode::AccessDenied, "Path outside storage");
        }
        return candidate;
    }

    std::filesystem::path Sandbox::resolve_child(std::string_view relative, std::string_view name) const
    {
        if (name.empty() || name == "." || name == "..")
        {
            throw FilesystemError(landrive::ErrorCode::AccessDenied, "Invalid entry name");
        }
        std::string joined(relative);
        joined.push_back('/');
        joined.append(name);
        return resolve(joined);
    }

    bool Sandbox::contains(const std::filesystem::path &candidate) const
    {
        // Component-wise so that "<root>2/x" is not mistaken for "<root>/x".
        const auto mismatch = std::mismatch(root_.begin(), root_.end(), candidate.begin(), candidate.end());
        return mismatch.first == root_.end();
    }

} // namespace landrive::server
