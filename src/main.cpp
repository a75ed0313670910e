#include <iostream>
#include <fstream>
#include <iterator>
#include <future>
#include <optional>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <vector>
#include <unistd.h>

#include "fmt/format.h"

#include "ssdp_discovery.hpp"
#include "media_renderer.hpp"
#include "cast_error.hpp"
#include "config.hpp"
#include "logging.hpp"
#include "utils.hpp"

static std::string file_to_binary(const std::string& path)
{
    std::ifstream ifs {path, std::ios::binary};
    if(!ifs.good())
        throw std::invalid_argument {fmt::format("Unable to open {}", path)};
    return std::string {std::istreambuf_iterator<char> {ifs}, std::istreambuf_iterator<char> {}};
}

static void block_signals(sigset_t* sigset)
{
    sigemptyset(sigset);
    sigaddset(sigset, SIGINT);
    sigaddset(sigset, SIGTERM);
    pthread_sigmask(SIG_BLOCK, sigset, nullptr);

    // Renderers drop connections mid-transfer
    std::signal(SIGPIPE, SIG_IGN);
}

// Reads one line from stdin, nullopt on EOF or cancellation
static std::optional<std::string> read_line(const utils::cancel_token& token)
{
    for(;;)
    {
        utils::wait_status status = utils::wait_readable(STDIN_FILENO, std::chrono::milliseconds {1000}, token);
        if(status == utils::wait_status::cancelled)
            return std::nullopt;
        if(status == utils::wait_status::ready)
            break;
    }

    std::string line;
    if(!std::getline(std::cin, line))
        return std::nullopt;
    return std::string {utils::trim(line)};
}

static std::vector<upnp::upnp_device> get_devices(const config::renderer_config& cfg, const utils::cancel_token& token)
{
    fmt::print("Scanning network for media renderers...\n");
    discovery::discovery_result res = discovery::discover(cfg.discovery_timeout, token, cfg.description_timeout);
    return std::move(res.devices);
}

static std::optional<size_t> select_device(const std::vector<upnp::upnp_device>& devices, const utils::cancel_token& token)
{
    fmt::print("Detected {} device(s) in your local network.\n-------------------------------\n", devices.size());
    for(size_t i = 0; i < devices.size(); i++)
    {
        fmt::print("{} | {} {} {}\n", i, devices[i].to_string(), devices[i].manufacturer(), devices[i].model());
    }
    fmt::print("\nSelect the device you want to connect to:\n>> ");
    std::fflush(stdout);

    auto line = read_line(token);
    if(!line)
        return std::nullopt;

    size_t selected = 0;
    try {
        selected = std::stoul(*line);
    } catch(std::logic_error&) {
        selected = 0; // Default selection
    }
    if(selected >= devices.size())
        selected = 0;

    return selected;
}

static void print_help()
{
    fmt::print("Commands:\n"
        "  /discover              search the network again\n"
        "  /select                pick another device\n"
        "  /image <file.jpg>      show a JPEG file\n"
        "  /stream <file.jpg>     push a JPEG as the next stream frame\n"
        "  /video <url> [title]   let the device play a remote video\n"
        "  /stop                  stop playback\n"
        "  /quit                  exit\n");
}

static bool handle_command(const std::string& line, upnp::media_renderer& renderer, std::vector<upnp::upnp_device>& devices,
    std::optional<size_t>& selected, const config::renderer_config& cfg, const utils::cancel_token& token)
{
    std::string command = line.substr(0, line.find(' '));
    std::string arg;
    if(command.size() < line.size())
        arg = std::string {utils::trim(std::string_view {line}.substr(command.size()))};

    if(command == "/quit")
        return false;

    if(command == "/discover")
    {
        devices = get_devices(cfg, token);
        selected = devices.empty() ? std::nullopt : select_device(devices, token);
        return true;
    }
    if(command == "/select")
    {
        if(!devices.empty())
            selected = select_device(devices, token);
        return true;
    }

    if(!selected)
    {
        fmt::print("No device selected, use /discover\n");
        return true;
    }
    const upnp::upnp_device& device = devices[*selected];

    if(command == "/image")
    {
        renderer.display_jpeg(token, device, file_to_binary(arg));
    }
    else if(command == "/stream")
    {
        renderer.display_stream_frame(token, device, file_to_binary(arg));
    }
    else if(command == "/video")
    {
        std::string title;
        std::string url = arg.substr(0, arg.find(' '));
        if(url.size() < arg.size())
            title = std::string {utils::trim(std::string_view {arg}.substr(url.size()))};
        renderer.display_video(token, device, url, title);
    }
    else if(command == "/stop")
    {
        renderer.stop(token, device);
    }
    else
    {
        print_help();
    }

    return true;
}

int main(int argc, char** argv)
{
    config::renderer_config cfg;
    try {
        if(argc > 1)
            cfg = config::load_config(argv[1]);
    } catch(std::invalid_argument& err) {
        logging::error("{}", err.what());
        return EXIT_FAILURE;
    }
    logging::set_level(cfg.log_level);

    sigset_t sigset;
    utils::cancel_token token;
    block_signals(&sigset);
    std::future<int> signal_handler = std::async(std::launch::async, [&token, &sigset]()
    {
        int signum = 0;
        sigwait(&sigset, &signum);
        token.cancel();
        return signum;
    });

    int exit_code = EXIT_SUCCESS;
    try {
        upnp::media_renderer renderer {cfg};
        logging::info("Media server listening on {}", renderer.server_url());

        std::vector<upnp::upnp_device> devices = get_devices(cfg, token);
        std::optional<size_t> selected;
        if(devices.empty())
            fmt::print("No devices found, use /discover to search again.\n");
        else
            selected = select_device(devices, token);

        print_help();
        while(!token.cancelled())
        {
            fmt::print(">> ");
            std::fflush(stdout);

            auto line = read_line(token);
            if(!line)
                break;
            if(line->empty())
                continue;

            try {
                if(!handle_command(*line, renderer, devices, selected, cfg, token))
                    break;
            } catch(utils::cast_error& err) {
                logging::error("{} ({})", err.what(), utils::to_string(err.kind()));
            } catch(std::invalid_argument& err) {
                logging::error("{}", err.what());
            }
        }

        renderer.close();
    } catch(utils::cast_error& err) {
        logging::error("{} ({})", err.what(), utils::to_string(err.kind()));
        exit_code = EXIT_FAILURE;
    }

    fmt::print("Shutting down...\n");

    // Wake the signal thread if the session ended without a signal
    if(!token.cancelled())
        kill(getpid(), SIGTERM);
    signal_handler.get();

    return exit_code;
}
