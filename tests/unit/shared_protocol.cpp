#include <array>
#include <cassert>
#include <iostream>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "landrive/error_codes.hpp"
#include "landrive/framing.hpp"
#include "landrive/protocol.hpp"

using namespace landrive;
using namespace landrive::protocol;

void run_server_component_tests();
void run_client_component_tests();

namespace
{

    template <typename Fn>
    bool throws_protocol_error(Fn &&fn, ErrorCode expected)
    {
        try
        {
            fn();
        }
        catch (const ProtocolError &ex)
        {
            return ex.code() == expected;
        }
        return false;
    }

    void test_command_names()
    {
        assert(to_string(Command::List) == "LIST");
        assert(to_string(Command::Mkdir) == "MKDIR");
        assert(command_from_string("UPLOAD") == Command::Upload);
        assert(command_from_string("DOWNLOAD") == Command::Download);
        assert(command_from_string("DELETE") == Command::Delete);
        assert(!command_from_string("list").has_value());
        assert(!command_from_string("RENAME").has_value());

        assert(peek_command(nlohmann::json{{"command", "LIST"}}) == Command::List);
        assert(!peek_command(nlohmann::json{{"command", 7}}).has_value());
        assert(!peek_command(nlohmann::json{{"path", ""}}).has_value());
        assert(!peek_command(nlohmann::json::array({"LIST"})).has_value());
    }

    void test_error_codes()
    {
        assert(to_string(ErrorCode::AccessDenied) == "access_denied");
        assert(to_int(ErrorCode::NotFound) == 5);
        assert(error_code_from_int(to_int(ErrorCode::TransferIncomplete)) == ErrorCode::TransferIncomplete);
        assert(error_code_from_int(999) == ErrorCode::InternalError);
    }

    void test_request_schemas()
    {
        const auto upload = nlohmann::json(UploadRequest{.filename = "a.bin", .size = 42, .path = "docs"});
        assert(upload.at("command") == "UPLOAD");
        assert(upload.at("filename") == "a.bin");
        assert(upload.at("size") == 42);
        assert(upload.at("path") == "docs");

        const auto mkdir = nlohmann::json(MkdirRequest{.dirname = "photos", .path = ""});
        assert(mkdir.at("command") == "MKDIR");
        assert(mkdir.at("dirname") == "photos");

        const auto parsed = nlohmann::json::parse(R"({"command":"UPLOAD","filename":"x","size":0})").get<UploadRequest>();
        assert(parsed.filename == "x");
        assert(parsed.size == 0);
        assert(parsed.path.empty());

        const auto list = nlohmann::json::parse(R"({"command":"LIST"})").get<ListRequest>();
        assert(list.path.empty());
        const auto list_null = nlohmann::json::parse(R"({"command":"LIST","path":null})").get<ListRequest>();
        assert(list_null.path.empty());
    }

    void test_request_validation()
    {
        assert(throws_protocol_error([]
                                     { (void)nlohmann::json::parse(R"({"command":"UPLOAD","size":3})").get<UploadRequest>(); },
                                     ErrorCode::InvalidPayload));
        assert(throws_protocol_error([]
                                     { (void)nlohmann::json::parse(R"({"command":"UPLOAD","filename":"a"})").get<UploadRequest>(); },
                                     ErrorCode::InvalidPayload));
        assert(throws_protocol_error([]
                                     { (void)nlohmann::json::parse(R"({"command":"UPLOAD","filename":"a","size":-1})").get<UploadRequest>(); },
                                     ErrorCode::InvalidPayload));
        assert(throws_protocol_error([]
                                     { (void)nlohmann::json::parse(R"({"command":"UPLOAD","filename":"a","size":1.5})").get<UploadRequest>(); },
                                     ErrorCode::InvalidPayload));
        assert(throws_protocol_error([]
                                     { (void)nlohmann::json::parse(R"({"command":"DELETE","filename":5})").get<DeleteRequest>(); },
                                     ErrorCode::InvalidPayload));
        assert(throws_protocol_error([]
                                     { (void)nlohmann::json::parse(R"({"command":"MKDIR","path":""})").get<MkdirRequest>(); },
                                     ErrorCode::InvalidPayload));
    }

    void test_response_fields()
    {
        const auto listing = nlohmann::json(make_listing({}, ""));
        assert(listing.at("status") == "success");
        assert(listing.at("items").is_array());
        assert(listing.at("items").empty());
        assert(listing.at("current_path") == "");
        assert(!listing.contains("message"));
        assert(!listing.contains("size"));

        const auto ready = nlohmann::json(make_upload_ready());
        assert(ready == nlohmann::json({{"status", "ready"}}));

        const auto handshake = nlohmann::json(make_download_ready(8193));
        assert(handshake.at("status") == "success");
        assert(handshake.at("size") == 8193);
        assert(!handshake.contains("items"));

        const auto error = nlohmann::json(make_error("File not found"));
        assert(error == nlohmann::json({{"status", "error"}, {"message", "File not found"}}));
    }

    void test_response_interpretation()
    {
        // "items" decides, whatever else the object carries.
        const auto listing = decode_response(R"({"status":"error","message":"odd","items":[{"name":"a","is_dir":true,"size":0,"mtime":1700000000.75}]})");
        assert(listing.is_listing());
        assert(listing.items->size() == 1);
        assert(listing.items->front().name == "a");
        assert(listing.items->front().is_dir);
        assert(listing.items->front().mtime == 1700000000);

        const auto ready = decode_response(R"({"status":"ready"})");
        assert(ready.is_upload_ready());
        assert(!ready.is_download_ready());

        const auto download = decode_response(R"({"status":"success","size":0})");
        assert(download.is_download_ready());
        assert(*download.size == 0);

        const auto generic = decode_response(R"({"status":"success","message":"Upload complete"})");
        assert(!generic.is_listing());
        assert(!generic.is_download_ready());
        assert(generic.message == std::optional<std::string>("Upload complete"));
    }

    void test_response_decode_errors()
    {
        assert(throws_protocol_error([]
                                     { (void)decode_response("{not json"); },
                                     ErrorCode::ProtocolDecodeError));
        assert(throws_protocol_error([]
                                     { (void)decode_response("[1,2]"); },
                                     ErrorCode::ProtocolDecodeError));
        assert(throws_protocol_error([]
                                     { (void)decode_response(R"({"status":"maybe"})"); },
                                     ErrorCode::ProtocolDecodeError));
        assert(throws_protocol_error([]
                                     { (void)decode_response(R"({"message":"no status"})"); },
                                     ErrorCode::ProtocolDecodeError));
    }

    void test_encode_line()
    {
        const auto line = encode_line(nlohmann::json{{"command", "LIST"}, {"path", "a\nb"}});
        assert(!line.empty());
        assert(line.back() == '\n');
        // Embedded newlines are escaped, so the only raw '\n' is the delimiter.
        assert(line.find('\n') == line.size() - 1);
    }

    void test_line_buffer_split_reads()
    {
        LineBuffer buffer;
        buffer.append("{\"a\":");
        assert(!buffer.next_line().has_value());
        buffer.append("1}\n\n  \r\n{\"b\":2}\r\n{\"c\"");
        assert(buffer.next_line() == std::optional<std::string>("{\"a\":1}"));
        assert(buffer.next_line() == std::optional<std::string>("{\"b\":2}"));
        assert(!buffer.next_line().has_value());
        buffer.append(":3}\n");
        assert(buffer.next_line() == std::optional<std::string>("{\"c\":3}"));
        assert(buffer.buffered() == 0);
    }

    void test_line_buffer_payload_after_line()
    {
        LineBuffer buffer;
        buffer.append("{\"status\":\"success\",\"size\":5}\nAB\nCDtrailing");
        assert(buffer.next_line().has_value());
        std::array<char, 5> payload{};
        assert(buffer.take(std::span<char>(payload)) == 5);
        assert(std::string(payload.data(), payload.size()) == "AB\nCD");
        assert(buffer.buffered() == 8);
        buffer.clear();
        assert(buffer.buffered() == 0);
        assert(!buffer.next_line().has_value());
    }

    void test_line_buffer_limit()
    {
        LineBuffer buffer(16);
        buffer.append("0123456789");
        assert(throws_protocol_error([&]
                                     { buffer.append("0123456789"); },
                                     ErrorCode::ProtocolDecodeError));

        LineBuffer complete(16);
        complete.append("short\n0123456789");
        assert(complete.next_line() == std::optional<std::string>("short"));
    }

    void test_large_listing_line()
    {
        std::vector<Entry> items;
        for (int i = 0; i < 20000; ++i)
        {
            items.push_back(Entry{"holiday_photo_" + std::to_string(i) + ".jpg", false, 1234567,
                                  1700000000 + i});
        }
        const auto line = encode_line(make_listing(std::move(items), "photos/2024"));
        assert(line.size() > kMaxCommandLineLength);

        const auto feed = [&line](LineBuffer &buffer) -> std::optional<std::string>
        {
            for (std::size_t offset = 0; offset < line.size(); offset += 8192)
            {
                buffer.append(std::string_view(line).substr(offset, 8192));
                if (auto complete = buffer.next_line())
                {
                    return complete;
                }
            }
            return std::nullopt;
        };

        LineBuffer replies(kMaxReplyLineLength);
        const auto received = feed(replies);
        assert(received.has_value());
        const auto listing = decode_response(*received);
        assert(listing.items->size() == 20000);
        assert(listing.items->back().name == "holiday_photo_19999.jpg");
        assert(listing.current_path == std::optional<std::string>("photos/2024"));
        assert(replies.buffered() == 0);

        // The same bytes are far too long for a request line.
        LineBuffer commands(kMaxCommandLineLength);
        assert(throws_protocol_error([&]
                                     { feed(commands); },
                                     ErrorCode::ProtocolDecodeError));
    }

} // namespace

int main()
{
    try
    {
        test_command_names();
        test_error_codes();
        test_request_schemas();
        test_request_validation();
        test_response_fields();
        test_response_interpretation();
        test_response_decode_errors();
        test_encode_line();
        test_line_buffer_split_reads();
        test_line_buffer_payload_after_line();
        test_line_buffer_limit();
        test_large_listing_line();
        run_server_component_tests();
        run_client_component_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    std::cout << "All unit tests passed" << std::endl;
    return 0;
}
