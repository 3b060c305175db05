#include "landrive/client/console.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

#include "landrive/client/share_link.hpp"
#include "landrive/version.hpp"

namespace landrive::client
{

    namespace
    {

        std::string trim(const std::string &input)
        {
            const auto begin = input.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
            {
                return "";
            }
            const auto end = input.find_last_not_of(" \t\r\n");
            return input.substr(begin, end - begin + 1);
        }

        // Whitespace-separated, with "double quotes" for names that contain spaces.
        std::vector<std::string> split_tokens(const std::string &input)
        {
            std::vector<std::string> tokens;
            std::string current;
            bool quoted = false;
            bool has_token = false;
            for (const char ch : input)
            {
                if (ch == '"')
                {
                    quoted = !quoted;
                    has_token = true;
                    continue;
                }
                if (!quoted && std::isspace(static_cast<unsigned char>(ch)))
                {
                    if (has_token)
                    {
                        tokens.push_back(std::move(current));
                        current.clear();
                        has_token = false;
                    }
                    continue;
                }
                current.push_back(ch);
                has_token = true;
            }
            if (has_token)
            {
                tokens.push_back(std::move(current));
            }
            return tokens;
        }

        std::string to_upper(std::string value)
        {
            for (auto &ch : value)
            {
                ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
            }
            return value;
        }

        std::string_view level_tag(LogLevel level)
        {
            switch (level)
            {
            case LogLevel::Success:
                return "[ok] ";
            case LogLevel::Warning:
                return "[warning] ";
            case LogLevel::Error:
                return "[error] ";
            case LogLevel::Info:
                break;
            }
            return "[info] ";
        }

    } // namespace

    std::string format_size(std::uint64_t bytes)
    {
        std::ostringstream out;
        if (bytes >= 1024ULL * 1024ULL)
        {
            out << std::fixed << std::setprecision(1) << static_cast<double>(bytes) / (1024.0 * 1024.0) << " MB";
        }
        else if (bytes >= 1024ULL)
        {
            out << std::fixed << std::setprecision(1) << static_cast<double>(bytes) / 1024.0 << " KB";
        }
        else
        {
            out << bytes << " B";
        }
        return out.str();
    }

    std::string join_remote(const std::string &directory, const std::string &name)
    {
        std::string joined = directory;
        while (!joined.empty() && joined.back() == '/')
        {
            joined.pop_back();
        }
        auto child = name;
        while (!child.empty() && child.front() == '/')
        {
            child.erase(child.begin());
        }
        if (joined.empty())
        {
            return child;
        }
        if (child.empty())
        {
            return joined;
        }
        return joined + "/" + child;
    }

    std::string parent_remote(const std::string &path)
    {
        std::string trimmed = path;
        while (!trimmed.empty() && trimmed.back() == '/')
        {
            trimmed.pop_back();
        }
        const auto slash = trimmed.rfind('/');
        if (slash == std::string::npos)
        {
            return "";
        }
        return trimmed.substr(0, slash);
    }

    void ConsoleOutput::write(std::string_view text)
    {
        std::lock_guard lock(mutex_);
        out_ << text << std::flush;
    }

    void ConsoleOutput::line(std::string_view text)
    {
        std::lock_guard lock(mutex_);
        out_ << text << std::endl;
    }

    void ConsoleObserver::on_connection_changed(bool connected)
    {
        output_.line(connected ? "[status] connected" : "[status] disconnected");
    }

    void ConsoleObserver::on_listing(const std::vector<landrive::protocol::Entry> &entries,
                                     const std::string &current_path)
    {
        auto sorted = entries;
        std::sort(sorted.begin(), sorted.end(), [](const auto &lhs, const auto &rhs)
                  {
                      if (lhs.is_dir != rhs.is_dir)
                      {
                          return lhs.is_dir;
                      }
                      return lhs.name < rhs.name; });
        {
            std::lock_guard lock(mutex_);
            listing_ = sorted;
        }

        std::ostringstream out;
        out << "Location: /" << current_path;
        if (sorted.empty())
        {
            out << "\n  (empty)";
        }
        for (const auto &entry : sorted)
        {
            if (entry.is_dir)
            {
                out << "\n  [DIR]  " << entry.name;
            }
            else
            {
                out << "\n  [FILE] " << std::left << std::setw(40) << entry.name << ' ' << format_size(entry.size);
            }
        }
        output_.line(out.str());
    }

    void ConsoleObserver::on_log(const std::string &message, LogLevel level)
    {
        output_.line(std::string(level_tag(level)) + message);
    }

    void ConsoleObserver::on_progress(int percent)
    {
        {
            std::lock_guard lock(mutex_);
            // One line per 10% step.
            const int step = percent / 10;
            if (step == last_progress_ && percent != 100)
            {
                return;
            }
            last_progress_ = percent == 100 ? -1 : step;
        }
        output_.line("[progress] " + std::to_string(percent) + "%");
    }

    void ConsoleObserver::on_error(const std::string &message)
    {
        output_.line("ERROR: " + message);
    }

    std::vector<landrive::protocol::Entry> ConsoleObserver::last_listing() const
    {
        std::lock_guard lock(mutex_);
        return listing_;
    }

    ConsoleShell::ConsoleShell(ClientConfig config, Logger logger)
        : config_(std::move(config)),
          logger_(logger),
          engine_(EngineOptions{
                      .port = config_.port,
                      .connect_timeout = config_.connect_timeout,
                      .transfer_timeout = config_.transfer_timeout,
                  },
                  observer_, logger) {}

    ConsoleShell::~ConsoleShell()
    {
        engine_.stop();
        reap_transfers(true);
    }

    int ConsoleShell::run()
    {
        output_.line("LanDrive client " + std::string(landrive::version()) + " - type HELP for commands");
        engine_.start();
        if (config_.host)
        {
            engine_.connect_to(*config_.host, config_.port);
        }

        while (true)
        {
            output_.write("/" + engine_.current_path() + "> ");
            std::string line;
            if (!std::getline(std::cin, line))
            {
                output_.line("");
                break;
            }
            line = trim(line);
            if (line.empty())
            {
                continue;
            }
            logger_.log("cmd", line);
            reap_transfers(false);

            const auto tokens = split_tokens(line);
            if (tokens.empty())
            {
                continue;
            }
            const auto command = to_upper(tokens[0]);
            const std::vector<std::string> args(tokens.begin() + 1, tokens.end());

            if (command == "EXIT" || command == "QUIT")
            {
                break;
            }
            if (command == "HELP")
            {
                print_help();
                continue;
            }

            try
            {
                if (!dispatch(command, args))
                {
                    output_.line("ERROR: unknown command, type HELP");
                }
            }
            catch (const std::exception &ex)
            {
                output_.line(std::string("ERROR: ") + ex.what());
                logger_.warn("cmd", "command failed: ", ex.what());
            }
        }

        output_.line("Waiting for running transfers...");
        engine_.disconnect();
        reap_transfers(true);
        engine_.stop();
        return 0;
    }

    bool ConsoleShell::dispatch(const std::string &command, const std::vector<std::string> &args)
    {
        if (command == "CONNECT")
        {
            return handle_connect(args);
        }
        if (command == "DISCONNECT")
        {
            engine_.disconnect();
            return true;
        }
        if (command == "STATUS")
        {
            print_status();
            return true;
        }
        if (command == "LIST" || command == "LS")
        {
            engine_.request_listing(args.empty() ? engine_.current_path() : args[0]);
            return true;
        }
        if (command == "REFRESH")
        {
            engine_.request_listing(engine_.current_path());
            return true;
        }
        if (command == "CD")
        {
            return handle_cd(args);
        }
        if (command == "UP")
        {
            engine_.request_listing(parent_remote(engine_.current_path()));
            return true;
        }
        if (command == "PWD")
        {
            output_.line("/" + engine_.current_path());
            return true;
        }
        if (command == "MKDIR" || command == "DELETE")
        {
            if (args.size() != 1)
            {
                output_.line("Usage: " + command + " <name>");
                return true;
            }
            const auto path = engine_.current_path();
            const bool queued = command == "MKDIR" ? engine_.make_directory(args[0], path)
                                                   : engine_.delete_entry(args[0], path);
            if (queued)
            {
                engine_.request_listing(path);
            }
            return true;
        }
        if (command == "UPLOAD")
        {
            return handle_upload(args);
        }
        if (command == "DOWNLOAD")
        {
            return handle_download(args);
        }
        if (command == "SHARE")
        {
            return handle_share(args);
        }
        return false;
    }

    bool ConsoleShell::handle_connect(const std::vector<std::string> &args)
    {
        if (args.size() != 1)
        {
            output_.line("Usage: CONNECT <host[:port]>");
            return true;
        }
        const auto endpoint = parse_endpoint(args[0], config_.port);
        engine_.connect_to(endpoint.host, endpoint.port);
        return true;
    }

    bool ConsoleShell::handle_cd(const std::vector<std::string> &args)
    {
        if (args.size() != 1)
        {
            output_.line("Usage: CD <folder> | CD .. | CD /");
            return true;
        }
        const auto &target = args[0];
        if (target == "..")
        {
            engine_.request_listing(parent_remote(engine_.current_path()));
        }
        else if (target == "/")
        {
            engine_.request_listing("");
        }
        else if (target.front() == '/')
        {
            engine_.request_listing(join_remote("", target));
        }
        else
        {
            engine_.request_listing(join_remote(engine_.current_path(), target));
        }
        return true;
    }

    template <typename Work>
    void ConsoleShell::start_transfer(Work work)
    {
        auto done = std::make_shared<std::atomic<bool>>(false);
        std::thread thread([work = std::move(work), done]() mutable
                           {
                               work();
                               *done = true; });
        transfers_.push_back(Transfer{std::move(thread), std::move(done)});
    }

    void ConsoleShell::reap_transfers(bool wait_all)
    {
        auto it = transfers_.begin();
        while (it != transfers_.end())
        {
            if (wait_all || *it->done)
            {
                if (it->thread.joinable())
                {
                    it->thread.join();
                }
                it = transfers_.erase(it);
            }
            else
            {
                ++it;
            }
        }
    }

    bool ConsoleShell::handle_upload(const std::vector<std::string> &args)
    {
        if (args.empty() || args.size() > 2)
        {
            output_.line("Usage: UPLOAD <local file> [remote folder]");
            return true;
        }
        const std::filesystem::path local(args[0]);
        const auto remote_dir = args.size() == 2 ? join_remote("", args[1]) : engine_.current_path();
        start_transfer([this, local, remote_dir]
                       { engine_.upload(local, remote_dir); });
        return true;
    }

    bool ConsoleShell::handle_download(const std::vector<std::string> &args)
    {
        if (args.empty() || args.size() > 2)
        {
            output_.line("Usage: DOWNLOAD <remote file> [local path]");
            return true;
        }
        const auto filename = args[0];
        std::filesystem::path save_path = args.size() == 2 ? std::filesystem::path(args[1]) : std::filesystem::path(filename);
        std::error_code ec;
        if (std::filesystem::is_directory(save_path, ec))
        {
            save_path /= filename;
        }
        const auto remote_dir = engine_.current_path();
        start_transfer([this, filename, remote_dir, save_path]
                       { engine_.download(filename, remote_dir, save_path); });
        return true;
    }

    bool ConsoleShell::handle_share(const std::vector<std::string> &args)
    {
        if (args.size() != 1)
        {
            output_.line("Usage: SHARE <remote file>");
            return true;
        }
        const auto listing = observer_.last_listing();
        const auto it = std::find_if(listing.begin(), listing.end(), [&](const auto &entry)
                                     { return entry.name == args[0]; });
        if (it == listing.end() || it->is_dir)
        {
            output_.line("ERROR: Please select a file from the current listing to share");
            return true;
        }

        auto host = engine_.connected_host().value_or(config_.host.value_or("127.0.0.1"));
        if (is_loopback_host(host))
        {
            const auto lan = detect_lan_address();
            output_.line("[warning] '" + host + "' is not reachable from other devices, using " + lan);
            host = lan;
        }
        const auto url = build_share_url(host, config_.mirror_port, engine_.current_path(), it->name);
        logger_.log("share", url);
        output_.line(url);
        return true;
    }

    void ConsoleShell::print_status()
    {
        std::ostringstream out;
        if (engine_.is_connected())
        {
            out << "Connected to " << engine_.connected_host().value_or("?") << ", location /"
                << engine_.current_path();
        }
        else
        {
            out << "Not connected";
        }
        out << "\nRunning transfers: "
            << std::count_if(transfers_.begin(), transfers_.end(), [](const Transfer &transfer)
                             { return !*transfer.done; });
        output_.line(out.str());
    }

    void ConsoleShell::print_help()
    {
        output_.line(
            "Available commands:\n"
            "  HELP                        Show this help\n"
            "  EXIT                        Disconnect and exit\n"
            "  CONNECT <host[:port]>       Connect to a server\n"
            "  DISCONNECT                  Close the connection\n"
            "  STATUS                      Show connection state\n"
            "  LIST [path]                 List a folder (default: current)\n"
            "  REFRESH                     List the current folder again\n"
            "  CD <folder> | .. | /        Change the current folder\n"
            "  UP                          Go to the parent folder\n"
            "  PWD                         Print the current folder\n"
            "  MKDIR <name>                Create a folder here\n"
            "  DELETE <name>               Delete a file or folder here\n"
            "  UPLOAD <local> [folder]     Upload a file in the background\n"
            "  DOWNLOAD <name> [local]     Download a file in the background\n"
            "  SHARE <name>                Print a browser link for a file\n"
            "\nNames containing spaces can be \"quoted\".");
    }

} // namespace landrive::client
