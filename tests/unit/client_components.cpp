#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "landrive/client/config.hpp"
#include "landrive/client/console.hpp"
#include "landrive/client/share_link.hpp"
#include "landrive/client/socket_ownership.hpp"

using namespace landrive::client;

namespace
{

    template <typename Fn>
    bool throws_runtime_error(Fn &&fn)
    {
        try
        {
            fn();
        }
        catch (const std::runtime_error &)
        {
            return true;
        }
        return false;
    }

    void wait_until(const std::function<bool()> &predicate)
    {
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (!predicate())
        {
            assert(std::chrono::steady_clock::now() < deadline);
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }

    void test_ownership_basic()
    {
        SocketOwnership ownership;
        assert(ownership.holder() == SocketOwnership::Owner::None);

        auto listener = ownership.try_acquire_for_listener();
        assert(listener.has_value());
        assert(listener->owns());
        assert(ownership.holder() == SocketOwnership::Owner::Listener);
        assert(!ownership.try_acquire_for_listener().has_value());

        listener.reset();
        assert(ownership.holder() == SocketOwnership::Owner::None);

        {
            auto transfer = ownership.acquire_for_transfer();
            assert(ownership.holder() == SocketOwnership::Owner::Transfer);
            assert(!ownership.try_acquire_for_listener().has_value());

            auto moved = std::move(transfer);
            assert(!transfer.owns());
            assert(moved.owns());
            assert(ownership.holder() == SocketOwnership::Owner::Transfer);
        }
        assert(ownership.holder() == SocketOwnership::Owner::None);
    }

    void test_ownership_listener_yields_to_waiting_transfer()
    {
        SocketOwnership ownership;
        auto listener = ownership.try_acquire_for_listener();
        assert(listener.has_value());

        std::atomic<bool> transfer_running{false};
        std::atomic<bool> release_transfer{false};
        std::thread transfer([&]
                             {
            auto lease = ownership.acquire_for_transfer();
            transfer_running = true;
            while (!release_transfer) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            } });

        wait_until([&]
                   { return ownership.waiting_transfers() == 1; });
        assert(!transfer_running);

        listener->release();
        // A waiting transfer keeps the listener out even while the token is free.
        wait_until([&]
                   { return transfer_running.load(); });
        assert(ownership.holder() == SocketOwnership::Owner::Transfer);
        assert(!ownership.try_acquire_for_listener().has_value());

        release_transfer = true;
        transfer.join();
        assert(ownership.holder() == SocketOwnership::Owner::None);
        assert(ownership.try_acquire_for_listener().has_value());
    }

    void test_ownership_serializes_transfers()
    {
        SocketOwnership ownership;
        std::atomic<int> inside{0};
        std::atomic<int> max_inside{0};
        std::vector<std::thread> workers;
        for (int i = 0; i < 4; ++i)
        {
            workers.emplace_back([&]
                                 {
                for (int round = 0; round < 50; ++round) {
                    auto lease = ownership.acquire_for_transfer();
                    const int now = ++inside;
                    int seen = max_inside.load();
                    while (now > seen && !max_inside.compare_exchange_weak(seen, now)) {
                    }
                    --inside;
                } });
        }
        for (auto &worker : workers)
        {
            worker.join();
        }
        assert(max_inside == 1);
        assert(ownership.waiting_transfers() == 0);
    }

    void test_share_links()
    {
        assert(percent_encode("photos/my cat.jpg") == "photos/my%20cat.jpg");
        assert(percent_encode("a-b_c.d~e") == "a-b_c.d~e");
        assert(percent_encode("100%&?#") == "100%25%26%3F%23");
        assert(percent_encode("\xC3\xA4") == "%C3%A4");

        assert(build_share_url("192.168.1.20", 9000, "photos", "my cat.jpg") ==
               "http://192.168.1.20:9000/photos/my%20cat.jpg");
        assert(build_share_url("10.0.0.2", 9000, "", "a.txt") == "http://10.0.0.2:9000/a.txt");
        assert(build_share_url("10.0.0.2", 8080, "/docs/", "b.txt") == "http://10.0.0.2:8080/docs/b.txt");

        assert(is_loopback_host("127.0.0.1"));
        assert(is_loopback_host("localhost"));
        assert(is_loopback_host("::1"));
        assert(!is_loopback_host("192.168.1.20"));
        assert(!is_loopback_host("fileserver"));

        assert(!detect_lan_address().empty());
    }

    void test_endpoint_parsing()
    {
        const auto plain = parse_endpoint("192.168.0.7");
        assert(plain.host == "192.168.0.7");
        assert(plain.port == kDefaultPort);

        const auto with_port = parse_endpoint("nas.local:6000");
        assert(with_port.host == "nas.local");
        assert(with_port.port == 6000);

        assert(throws_runtime_error([]
                                    { (void)parse_endpoint(":5555"); }));
        assert(throws_runtime_error([]
                                    { (void)parse_endpoint("host:0"); }));
        assert(throws_runtime_error([]
                                    { (void)parse_endpoint("host:70000"); }));
        assert(throws_runtime_error([]
                                    { (void)parse_endpoint("host:12ab"); }));
    }

    void test_argument_parsing()
    {
        {
            char program[] = "landrive_client";
            char *argv[] = {program};
            const auto config = parse_arguments(1, argv);
            assert(!config.host.has_value());
            assert(config.port == 5555);
            assert(config.mirror_port == 9000);
            assert(config.connect_timeout == std::chrono::seconds(5));
            assert(config.transfer_timeout == std::chrono::seconds(10));
        }
        {
            char program[] = "landrive_client";
            char endpoint[] = "10.0.0.5:7000";
            char log_flag[] = "--log";
            char log_file[] = "client.log";
            char timeout_flag[] = "--transfer-timeout";
            char timeout[] = "2.5";
            char mirror_flag[] = "--mirror-port";
            char mirror[] = "8000";
            char *argv[] = {program, endpoint, log_flag, log_file, timeout_flag, timeout, mirror_flag, mirror};
            const auto config = parse_arguments(8, argv);
            assert(config.host == std::optional<std::string>("10.0.0.5"));
            assert(config.port == 7000);
            assert(config.log_path == std::optional<std::filesystem::path>("client.log"));
            assert(config.transfer_timeout == std::chrono::milliseconds(2500));
            assert(config.mirror_port == 8000);
        }
        {
            char program[] = "landrive_client";
            char unknown[] = "--verbose";
            char *argv[] = {program, unknown};
            assert(throws_runtime_error([&]
                                        { (void)parse_arguments(2, argv); }));
        }
        {
            char program[] = "landrive_client";
            char flag[] = "--connect-timeout";
            char *argv[] = {program, flag};
            assert(throws_runtime_error([&]
                                        { (void)parse_arguments(2, argv); }));
        }
        for (const std::string value : {"0", "-1", "0.0001", "0.0009", "nan", "inf", "1e9", "soon"})
        {
            char program[] = "landrive_client";
            char flag[] = "--transfer-timeout";
            std::string text = value;
            char *argv[] = {program, flag, text.data()};
            assert(throws_runtime_error([&]
                                        { (void)parse_arguments(3, argv); }));
        }
        {
            char program[] = "landrive_client";
            char flag[] = "--connect-timeout";
            char timeout[] = "0.001";
            char *argv[] = {program, flag, timeout};
            assert(parse_arguments(3, argv).connect_timeout == std::chrono::milliseconds(1));
        }
    }

    void test_console_helpers()
    {
        assert(format_size(0) == "0 B");
        assert(format_size(1023) == "1023 B");
        assert(format_size(1024) == "1.0 KB");
        assert(format_size(1536) == "1.5 KB");
        assert(format_size(1048576) == "1.0 MB");
        assert(format_size(10 * 1048576 + 104858) == "10.1 MB");

        assert(join_remote("", "docs") == "docs");
        assert(join_remote("docs", "2024") == "docs/2024");
        assert(join_remote("docs/", "/2024") == "docs/2024");
        assert(join_remote("docs", "") == "docs");

        assert(parent_remote("") == "");
        assert(parent_remote("docs") == "");
        assert(parent_remote("docs/2024") == "docs");
        assert(parent_remote("docs/2024/summer/") == "docs/2024");
    }

    void test_console_output_keeps_lines_whole()
    {
        std::ostringstream sink;
        ConsoleOutput output(sink);
        ConsoleObserver observer(output);

        constexpr int kLines = 500;
        std::thread engine_side([&]
                                {
                                    for (int i = 0; i < kLines; ++i)
                                    {
                                        observer.on_log("transfer step " + std::to_string(i), LogLevel::Info);
                                    }
                                });
        for (int i = 0; i < kLines; ++i)
        {
            output.write("/docs> ");
            output.line("prompt reply " + std::to_string(i));
        }
        engine_side.join();

        std::istringstream lines(sink.str());
        std::string line;
        int logs = 0;
        int replies = 0;
        while (std::getline(lines, line))
        {
            if (line.rfind("[info] transfer step ", 0) == 0)
            {
                ++logs;
                continue;
            }
            // An engine line may land between a prompt and its reply.
            auto reply = line;
            if (reply.rfind("/docs> ", 0) == 0)
            {
                reply.erase(0, 7);
            }
            if (reply.rfind("[info] transfer step ", 0) == 0)
            {
                ++logs;
                continue;
            }
            assert(reply.rfind("prompt reply ", 0) == 0);
            assert(reply.find('[') == std::string::npos);
            ++replies;
        }
        assert(logs == kLines);
        assert(replies == kLines);
    }

    void test_console_progress_steps()
    {
        std::ostringstream sink;
        ConsoleOutput output(sink);
        ConsoleObserver observer(output);
        for (const int percent : {0, 3, 9, 10, 15, 55, 59, 100})
        {
            observer.on_progress(percent);
        }
        observer.on_error("Download failed: File not found");
        assert(sink.str() == "[progress] 0%\n[progress] 10%\n[progress] 55%\n[progress] 100%\n"
                             "ERROR: Download failed: File not found\n");
    }

} // namespace

void run_client_component_tests()
{
    test_ownership_basic();
    test_ownership_listener_yields_to_waiting_transfer();
    test_ownership_serializes_transfers();
    test_share_links();
    test_endpoint_parsing();
    test_argument_parsing();
    test_console_helpers();
    test_console_output_keeps_lines_whole();
    test_console_progress_steps();
}
