#include "landrive/server/session.hpp"

#include <spdlog/spdlog.h>

namespace landrive::server
{

    void Session::handle_list(const nlohmann::json &json)
    {
        const auto request = json.get<landrive::protocol::ListRequest>();
        auto entries = services_.filesystem.list_directory(request.path);
        spdlog::info("Listing '{}' for {}: {} item(s)", request.path, remote_endpoint_, entries.size());
        // The unsandboxed path is echoed so the client can track where it is.
        reply(landrive::protocol::make_listing(std::move(entries), request.path));
    }

    void Session::handle_mkdir(const nlohmann::json &json)
    {
        const auto request = json.get<landrive::protocol::MkdirRequest>();
        services_.filesystem.create_directory(request.path, request.dirname);
        spdlog::info("Folder created: '{}' in '{}' by {}", request.dirname, request.path, remote_endpoint_);
        reply(landrive::protocol::make_success("Folder " + request.dirname + " created"));
    }

    void Session::handle_delete(const nlohmann::json &json)
    {
        const auto request = json.get<landrive::protocol::DeleteRequest>();
        const bool was_directory = services_.filesystem.remove_entry(request.path, request.filename);
        spdlog::info("Deleted {} '{}' in '{}' for {}", was_directory ? "folder" : "file", request.filename, request.path,
                     remote_endpoint_);
        reply(landrive::protocol::make_success("Deleted " + request.filename));
    }

} // namespace landrive::server
