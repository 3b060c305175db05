/**
 * LanDrive - Shared protocol schema and serialization helpers.
 *
 * Every message is one JSON object on its own line. Receivers interpret a
 * message by the fields it carries: an object with "items" is always a
 * listing, "ready" is the upload handshake and "success" with "size" is the
 * download handshake.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "landrive/error_codes.hpp"

namespace landrive::protocol
{

    class ProtocolError : public std::runtime_error
    {
    public:
        ProtocolError(landrive::ErrorCode code, std::string message);

        landrive::ErrorCode code() const noexcept { return code_; }

    private:
        landrive::ErrorCode code_;
    };

    enum class Command : std::uint8_t
    {
        List,
        Upload,
        Download,
        Delete,
        Mkdir
    };

    std::string_view to_string(Command command) noexcept;
    std::optional<Command> command_from_string(std::string_view value) noexcept;

    // Reads the "command" field without validating the rest of the request.
    std::optional<Command> peek_command(const nlohmann::json &json);

    enum class ResponseStatus : std::uint8_t
    {
        Success,
        Error,
        Ready
    };

    std::string_view to_string(ResponseStatus status) noexcept;
    std::optional<ResponseStatus> response_status_from_string(std::string_view value) noexcept;

    struct Entry
    {
        std::string name;
        bool is_dir{};
        std::uint64_t size{};
        std::int64_t mtime{};
    };

    void to_json(nlohmann::json &json, const Entry &entry);
    void from_json(const nlohmann::json &json, Entry &entry);

    struct ListRequest
    {
        std::string path;
    };

    void to_json(nlohmann::json &json, const ListRequest &request);
    void from_json(const nlohmann::json &json, ListRequest &request);

    struct UploadRequest
    {
        std::string filename;
        std::uint64_t size{};
        std::string path;
    };

    void to_json(nlohmann::json &json, const UploadRequest &request);
    void from_json(const nlohmann::json &json, UploadRequest &request);

    struct DownloadRequest
    {
        std::string filename;
        std::string path;
    };

    void to_json(nlohmann::json &json, const DownloadRequest &request);
    void from_json(const nlohmann::json &json, DownloadRequest &request);

    struct DeleteRequest
    {
        std::string filename;
        std::string path;
    };

    void to_json(nlohmann::json &json, const DeleteRequest &request);
    void from_json(const nlohmann::json &json, DeleteRequest &request);

    struct MkdirRequest
    {
        std::string dirname;
        std::string path;
    };

    void to_json(nlohmann::json &json, const MkdirRequest &request);
    void from_json(const nlohmann::json &json, MkdirRequest &request);

    struct Response
    {
        ResponseStatus status{ResponseStatus::Success};
        std::optional<std::string> message{};
        std::optional<std::vector<Entry>> items{};
        std::optional<std::string> current_path{};
        std::optional<std::uint64_t> size{};

        bool is_listing() const noexcept { return items.has_value(); }
        bool is_upload_ready() const noexcept { return status == ResponseStatus::Ready; }
        bool is_download_ready() const noexcept { return status == ResponseStatus::Success && size.has_value(); }
    };

    void to_json(nlohmann::json &json, const Response &response);
    void from_json(const nlohmann::json &json, Response &response);

    Response make_listing(std::vector<Entry> items, std::string current_path);
    Response make_success(std::string message);
    Response make_error(std::string message);
    Response make_upload_ready();
    Response make_download_ready(std::uint64_t size);

    // Parses one received line into a Response, throwing ProtocolError on
    // malformed JSON or an unknown status.
    Response decode_response(std::string_view line);

} // namespace landrive::protocol
