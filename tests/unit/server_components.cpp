#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>

#include <algorithm>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include "landrive/server/filesystem.hpp"
#include "landrive/server/sandbox.hpp"
#include "landrive/server/session.hpp"
#include "landrive/server/session_manager.hpp"

using namespace landrive;
using namespace landrive::server;

namespace
{

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::filesystem::path fresh_directory(const std::string &name)
    {
        const auto path = std::filesystem::temp_directory_path() / name;
        cleanup_path(path);
        std::filesystem::create_directories(path);
        return path;
    }

    void write_file(const std::filesystem::path &path, const std::string &content)
    {
        std::ofstream file(path, std::ios::binary);
        file << content;
    }

    template <typename Fn>
    bool fails_with(Fn &&fn, ErrorCode expected)
    {
        try
        {
            fn();
        }
        catch (const FilesystemError &ex)
        {
            return ex.code() == expected;
        }
        return false;
    }

    void test_sandbox_resolution()
    {
        const auto base = fresh_directory("landrive_sandbox_test");
        const auto root_path = base / "root";
        Sandbox sandbox(root_path);
        assert(std::filesystem::is_directory(root_path));
        assert(sandbox.root() == std::filesystem::canonical(root_path));

        assert(sandbox.resolve("") == sandbox.root());
        assert(sandbox.resolve("/") == sandbox.root());
        assert(sandbox.resolve("/docs") == sandbox.root() / "docs");
        assert(sandbox.resolve("docs/2024/") == sandbox.root() / "docs" / "2024");
        assert(sandbox.resolve("docs/../music") == sandbox.root() / "music");
        assert(sandbox.resolve_child("docs", "a.txt") == sandbox.root() / "docs" / "a.txt");

        assert(fails_with([&]
                          { (void)sandbox.resolve(".."); },
                          ErrorCode::AccessDenied));
        assert(fails_with([&]
                          { (void)sandbox.resolve("docs/../../outside"); },
                          ErrorCode::AccessDenied));
        assert(fails_with([&]
                          { (void)sandbox.resolve_child("", ".."); },
                          ErrorCode::AccessDenied));
        assert(fails_with([&]
                          { (void)sandbox.resolve_child("", "."); },
                          ErrorCode::AccessDenied));
        assert(fails_with([&]
                          { (void)sandbox.resolve_child("docs", ""); },
                          ErrorCode::AccessDenied));
        assert(fails_with([&]
                          { (void)sandbox.resolve_child("..", "secret"); },
                          ErrorCode::AccessDenied));

        cleanup_path(base);
    }

    void test_sandbox_sibling_prefix()
    {
        const auto base = fresh_directory("landrive_sibling_test");
        Sandbox sandbox(base / "store");
        std::filesystem::create_directories(base / "store2");
        write_file(base / "store2" / "secret.txt", "nope");

        assert(!sandbox.contains(std::filesystem::canonical(base / "store2")));
        assert(sandbox.contains(sandbox.root()));
        assert(sandbox.contains(sandbox.root() / "nested" / "file"));
        assert(fails_with([&]
                          { (void)sandbox.resolve("../store2/secret.txt"); },
                          ErrorCode::AccessDenied));

        cleanup_path(base);
    }

    void test_sandbox_symlink_escape()
    {
        const auto base = fresh_directory("landrive_symlink_test");
        Sandbox sandbox(base / "root");
        std::filesystem::create_directories(base / "outside");
        write_file(base / "outside" / "data.txt", "private");

        std::error_code ec;
        std::filesystem::create_directory_symlink(base / "outside", sandbox.root() / "link", ec);
        if (!ec)
        {
            assert(fails_with([&]
                              { (void)sandbox.resolve("link/data.txt"); },
                              ErrorCode::AccessDenied));
        }

        cleanup_path(base);
    }

    void test_filesystem_listing()
    {
        const auto base = fresh_directory("landrive_listing_test");
        Filesystem filesystem(base / "root");

        assert(filesystem.list_directory("").empty());
        assert(std::filesystem::is_directory(filesystem.root()));

        // Listing a missing folder brings it into existence.
        assert(filesystem.list_directory("new/folder").empty());
        assert(std::filesystem::is_directory(filesystem.root() / "new" / "folder"));

        write_file(filesystem.root() / "hello.txt", "hello");
        auto entries = filesystem.list_directory("");
        std::sort(entries.begin(), entries.end(), [](const auto &lhs, const auto &rhs)
                  { return lhs.name < rhs.name; });
        assert(entries.size() == 2);
        assert(entries[0].name == "hello.txt");
        assert(!entries[0].is_dir);
        assert(entries[0].size == 5);
        assert(entries[0].mtime > 0);
        assert(entries[1].name == "new");
        assert(entries[1].is_dir);
        assert(entries[1].size == 0);

        assert(fails_with([&]
                          { (void)filesystem.list_directory("hello.txt"); },
                          ErrorCode::NotFound));
        assert(fails_with([&]
                          { (void)filesystem.list_directory("../.."); },
                          ErrorCode::AccessDenied));

        cleanup_path(base);
    }

    void test_filesystem_mutations()
    {
        const auto base = fresh_directory("landrive_mutation_test");
        Filesystem filesystem(base / "root");

        filesystem.create_directory("", "photos");
        write_file(filesystem.root() / "photos" / "cat.jpg", "meow");
        filesystem.create_directory("", "photos");
        assert(std::filesystem::exists(filesystem.root() / "photos" / "cat.jpg"));

        write_file(filesystem.root() / "notes", "x");
        assert(fails_with([&]
                          { filesystem.create_directory("", "notes"); },
                          ErrorCode::AlreadyExists));

        std::filesystem::create_directories(filesystem.root() / "photos" / "2024" / "summer");
        write_file(filesystem.root() / "photos" / "2024" / "summer" / "beach.jpg", "sand");
        assert(filesystem.remove_entry("", "photos"));
        assert(!std::filesystem::exists(filesystem.root() / "photos"));

        assert(!filesystem.remove_entry("", "notes"));
        assert(!std::filesystem::exists(filesystem.root() / "notes"));

        assert(fails_with([&]
                          { (void)filesystem.remove_entry("", "missing.txt"); },
                          ErrorCode::NotFound));
        assert(fails_with([&]
                          { (void)filesystem.remove_entry("", ".."); },
                          ErrorCode::AccessDenied));

        // A traversal attempt must not touch anything outside the root.
        write_file(base / "victim.txt", "keep me");
        assert(fails_with([&]
                          { (void)filesystem.remove_entry("..", "victim.txt"); },
                          ErrorCode::AccessDenied));
        assert(std::filesystem::exists(base / "victim.txt"));
        assert(fails_with([&]
                          { filesystem.create_directory("../..", "evil"); },
                          ErrorCode::AccessDenied));
        assert(!std::filesystem::exists(base.parent_path() / "evil"));

        cleanup_path(base);
    }

    void test_filesystem_transfer_paths()
    {
        const auto base = fresh_directory("landrive_transfer_paths_test");
        Filesystem filesystem(base / "root");
        std::filesystem::create_directories(filesystem.root() / "docs" / "folder");
        write_file(filesystem.root() / "docs" / "report.pdf", "pdf");

        assert(filesystem.upload_target("docs", "new.bin") == filesystem.root() / "docs" / "new.bin");
        assert(filesystem.download_source("docs", "report.pdf") == filesystem.root() / "docs" / "report.pdf");

        assert(fails_with([&]
                          { (void)filesystem.upload_target("missing", "a.bin"); },
                          ErrorCode::NotFound));
        assert(fails_with([&]
                          { (void)filesystem.upload_target("docs", "folder"); },
                          ErrorCode::AlreadyExists));
        assert(fails_with([&]
                          { (void)filesystem.upload_target("..", "escape.bin"); },
                          ErrorCode::AccessDenied));
        assert(fails_with([&]
                          { (void)filesystem.download_source("docs", "folder"); },
                          ErrorCode::NotFound));
        assert(fails_with([&]
                          { (void)filesystem.download_source("docs", "absent.txt"); },
                          ErrorCode::NotFound));

        cleanup_path(base);
    }

    void test_session_manager_registry()
    {
        const auto base = fresh_directory("landrive_registry_test");
        Filesystem filesystem(base / "root");
        SessionManager manager;
        std::vector<std::size_t> reported;
        manager.set_count_listener([&](std::size_t count)
                                   { reported.push_back(count); });

        asio::io_context io_context;
        const SessionServices services{filesystem, manager, std::chrono::seconds{300}};
        auto first = std::make_shared<Session>(asio::ip::tcp::socket(io_context), services);
        auto second = std::make_shared<Session>(asio::ip::tcp::socket(io_context), services);

        manager.add(first);
        manager.add(second);
        assert(manager.count() == 2);

        manager.remove(first.get());
        manager.remove(first.get());
        assert(manager.count() == 1);

        manager.close_all();
        io_context.run();
        assert(manager.count() == 0);
        assert((reported == std::vector<std::size_t>{1, 2, 1, 0}));

        // Destroying a session that already left the registry is harmless.
        first.reset();
        second.reset();
        assert(manager.count() == 0);

        cleanup_path(base);
    }

} // namespace

void run_server_component_tests()
{
    test_sandbox_resolution();
    test_sandbox_sibling_prefix();
    test_sandbox_symlink_escape();
    test_filesystem_listing();
    test_filesystem_mutations();
    test_filesystem_transfer_paths();
    test_session_manager_registry();
}
