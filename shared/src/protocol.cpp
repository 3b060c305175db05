#include "landrive/protocol.hpp"

#include <array>
#include <stdexcept>

namespace landrive::protocol
{

    namespace
    {

        struct CommandMapping
        {
            Command command;
            std::string_view label;
        };

        constexpr std::array<CommandMapping, 5> kCommandMappings{{
            {Command::List, "LIST"},
            {Command::Upload, "UPLOAD"},
            {Command::Download, "DOWNLOAD"},
            {Command::Delete, "DELETE"},
            {Command::Mkdir, "MKDIR"},
        }};

        struct ResponseStatusMapping
        {
            ResponseStatus status;
            std::string_view label;
        };

        constexpr std::array<ResponseStatusMapping, 3> kStatusMappings{{
            {ResponseStatus::Success, "success"},
            {ResponseStatus::Error, "error"},
            {ResponseStatus::Ready, "ready"},
        }};

        std::string required_string(const nlohmann::json &json, const char *field)
        {
            const auto it = json.find(field);
            if (it == json.end() || !it->is_string())
            {
                throw ProtocolError(landrive::ErrorCode::InvalidPayload, std::string("Missing field: ") + field);
            }
            return it->get<std::string>();
        }

        std::string optional_path(const nlohmann::json &json)
        {
            const auto it = json.find("path");
            if (it == json.end() || it->is_null())
            {
                return {};
            }
            if (!it->is_string())
            {
                throw ProtocolError(landrive::ErrorCode::InvalidPayload, "Field path must be a string");
            }
            return it->get<std::string>();
        }

    } // namespace

    ProtocolError::ProtocolError(landrive::ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    std::string_view to_string(Command command) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.command == command)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<Command> command_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.label == value)
            {
                return mapping.command;
            }
        }
        return std::nullopt;
    }

    std::optional<Command> peek_command(const nlohmann::json &json)
    {
        if (!json.is_object())
        {
            return std::nullopt;
        }
        const auto it = json.find("command");
        if (it == json.end() || !it->is_string())
        {
            return std::nullopt;
        }
        return command_from_string(it->get_ref<const std::string &>());
    }

    std::string_view to_string(ResponseStatus status) noexcept
    {
        for (const auto &mapping : kStatusMappings)
        {
            if (mapping.status == status)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<ResponseStatus> response_status_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kStatusMappings)
        {
            if (mapping.label == value)
            {
                return mapping.status;
            }
        }
        return std::nullopt;
    }

    void to_json(nlohmann::json &json, const Entry &entry)
    {
        json = {
            {"name", entry.name},
            {"is_dir", entry.is_dir},
            {"size", entry.size},
            {"mtime", entry.mtime},
        };
    }

    void from_json(const nlohmann::json &json, Entry &entry)
    {
        entry.name = json.at("name").get<std::string>();
        entry.is_dir = json.value("is_dir", false);
        entry.size = json.value("size", 0ULL);
        // Older peers send fractional seconds.
        entry.mtime = static_cast<std::int64_t>(json.value("mtime", 0.0));
    }

    void to_json(nlohmann::json &json, const ListRequest &request)
    {
        json = {
            {"command", to_string(Command::List)},
            {"path", request.path},
        };
    }

    void from_json(const nlohmann::json &json, ListRequest &request)
    {
        request.path = optional_path(json);
    }

    void to_json(nlohmann::json &json, const UploadRequest &request)
    {
        json = {
            {"command", to_string(Command::Upload)},
            {"filename", request.filename},
            {"size", request.size},
            {"path", request.path},
        };
    }

    void from_json(const nlohmann::json &json, UploadRequest &request)
    {
        request.filename = required_string(json, "filename");
        const auto it = json.find("size");
        if (it == json.end() || !it->is_number_integer())
        {
            throw ProtocolError(landrive::ErrorCode::InvalidPayload, "Missing field: size");
        }
        if (!it->is_number_unsigned() && it->get<std::int64_t>() < 0)
        {
            throw ProtocolError(landrive::ErrorCode::InvalidPayload, "Field size must not be negative");
        }
        request.size = it->get<std::uint64_t>();
        request.path = optional_path(json);
    }

    void to_json(nlohmann::json &json, const DownloadRequest &request)
    {
        json = {
            {"command", to_string(Command::Download)},
            {"filename", request.filename},
            {"path", request.path},
        };
    }

    void from_json(const nlohmann::json &json, DownloadRequest &request)
    {
        request.filename = required_string(json, "filename");
        request.path = optional_path(json);
    }

    void to_json(nlohmann::json &json, const DeleteRequest &request)
    {
        json = {
            {"command", to_string(Command::Delete)},
            {"filename", request.filename},
            {"path", request.path},
        };
    }

    void from_json(const nlohmann::json &json, DeleteRequest &request)
    {
        request.filename = required_string(json, "filename");
        request.path = optional_path(json);
    }

    void to_json(nlohmann::json &json, const MkdirRequest &request)
    {
        json = {
            {"command", to_string(Command::Mkdir)},
            {"dirname", request.dirname},
            {"path", request.path},
        };
    }

    void from_json(const nlohmann::json &json, MkdirRequest &request)
    {
        request.dirname = required_string(json, "dirname");
        request.path = optional_path(json);
    }

    void to_json(nlohmann::json &json, const Response &response)
    {
        json = {{"status", to_string(response.status)}};
        if (response.message)
        {
            json["message"] = *response.message;
        }
        if (response.items)
        {
            json["items"] = *response.items;
        }
        if (response.current_path)
        {
            json["current_path"] = *response.current_path;
        }
        if (response.size)
        {
            json["size"] = *response.size;
        }
    }

    void from_json(const nlohmann::json &json, Response &response)
    {
        const auto status_label = json.at("status").get<std::string>();
        auto status = response_status_from_string(status_label);
        if (!status)
        {
            throw ProtocolError(landrive::ErrorCode::ProtocolDecodeError, "Unknown response status: " + status_label);
        }
        response.status = *status;
        if (auto it = json.find("message"); it != json.end() && it->is_string())
        {
            response.message = it->get<std::string>();
        }
        else
        {
            response.message.reset();
        }
        if (auto it = json.find("items"); it != json.end())
        {
            response.items = it->get<std::vector<Entry>>();
        }
        else
        {
            response.items.reset();
        }
        if (auto it = json.find("current_path"); it != json.end() && it->is_string())
        {
            response.current_path = it->get<std::string>();
        }
        else
        {
            response.current_path.reset();
        }
        if (auto it = json.find("size"); it != json.end() && it->is_number_unsigned())
        {
            response.size = it->get<std::uint64_t>();
        }
        else
        {
            response.size.reset();
        }
    }

    Response make_listing(std::vector<Entry> items, std::string current_path)
    {
        Response response;
        response.status = ResponseStatus::Success;
        response.items = std::move(items);
        response.current_path = std::move(current_path);
        return response;
    }

    Response make_success(std::string message)
    {
        Response response;
        response.status = ResponseStatus::Success;
        response.message = std::move(message);
        return response;
    }

    Response make_error(std::string message)
    {
        Response response;
        response.status = ResponseStatus::Error;
        response.message = std::move(message);
        return response;
    }

    Response make_upload_ready()
    {
        Response response;
        response.status = ResponseStatus::Ready;
        return response;
    }

    Response make_download_ready(std::uint64_t size)
    {
        Response response;
        response.status = ResponseStatus::Success;
        response.size = size;
        return response;
    }

    Response decode_response(std::string_view line)
    {
        nlohmann::json json;
        try
        {
            json = nlohmann::json::parse(line);
        }
        catch (const nlohmann::json::parse_error &ex)
        {
            throw ProtocolError(landrive::ErrorCode::ProtocolDecodeError, ex.what());
        }
        if (!json.is_object())
        {
            throw ProtocolError(landrive::ErrorCode::ProtocolDecodeError, "Response is not a JSON object");
        }
        try
        {
            return json.get<Response>();
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw ProtocolError(landrive::ErrorCode::ProtocolDecodeError, ex.what());
        }
    }

} // namespace landrive::protocol
