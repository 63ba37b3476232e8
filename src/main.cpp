#include "streaming_session.hpp"
#include "content_server.hpp"
#include "torrent_source.hpp"
#include "progress_meter.hpp"
#include "session_error.hpp"
#include "string_utils.hpp"
#include "bt_engine.hpp"
#include "settings.hpp"
#include "log.hpp"

#include <csignal>
#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/program_options.hpp>

namespace po = boost::program_options;

using namespace flume;

namespace {

const char* usage = "Usage: flume [options] <torrent>\n\n"
                    "<torrent> is a magnet URI, a path to a .torrent file or an\n"
                    "http(s) URL of one.\n\n";

class status_screen
{
    streaming_session& session_;
    int port_;
    progress_meter meter_;
    time_point last_sample_time_ = clock::now();

public:
    status_screen(streaming_session& session, const int port)
        : session_(session), port_(port)
    {}

    void render()
    {
        const auto status = session_.status();
        const auto now = clock::now();
        const auto progress = meter_.sample(
                status.bytes_completed, status.total_length, now - last_sample_time_);
        last_sample_time_ = now;

        // Clear the screen and move the cursor to the top.
        std::printf("\033[2J\033[H");
        const std::string name = status.name.empty() ? "(fetching metadata)" : status.name;
        std::printf("%s\n%s\n", name.c_str(), std::string(name.size(), '=').c_str());
        if(status.failure) {
            std::printf("Failed: \t%s\n", status.failure.message().c_str());
        }
        if(status.is_ready) {
            std::printf("Stream: \thttp://localhost:%d\n", port_);
        }
        if(progress.bytes_completed > 0) {
            std::printf("Progress: \t%s / %s  %.2f%%\n",
                    util::to_human_readable_bytes(progress.bytes_completed).c_str(),
                    util::to_human_readable_bytes(progress.total_length).c_str(),
                    progress.percent);
        }
        if(!status.has_metadata || progress.bytes_completed < progress.total_length) {
            std::printf("Download speed: %s/s\n",
                    util::to_human_readable_bytes(progress.download_rate).c_str());
        }
        std::printf("Connections: \t%d\n", status.num_connections);
        std::fflush(stdout);
    }
};

void schedule_render(deadline_timer& timer, status_screen& screen)
{
    timer.expires_after(seconds(1));
    timer.async_wait([&timer, &screen](const error_code& error) {
        if(error) {
            return;
        }
        screen.render();
        schedule_render(timer, screen);
    });
}

} // namespace

int main(int argc, char** argv)
{
    settings s;
    std::string torrent;

    po::options_description options("Options");
    options.add_options()
        ("help,h", "print this help message")
        ("port,p", po::value<int>(&s.server.port)->default_value(8080),
            "the HTTP port the stream is served on")
        ("seed,s", po::bool_switch(&s.engine.seed),
            "upload to peers and keep seeding once complete")
        ("data-dir", po::value<std::string>(&s.engine.data_dir),
            "where pieces and fetched .torrent files are stored (default: temp dir)")
        ("log-dir", po::value<std::string>(&s.log_dir),
            "write log files to this directory")
        ("max-connections", po::value<int>(&s.engine.max_connections),
            "the maximum number of peer connections")
        ("peer-port", po::value<int>(&s.engine.listener_port),
            "the port incoming peer connections are accepted on when seeding");

    po::options_description hidden;
    hidden.add_options()("torrent", po::value<std::string>(&torrent));

    po::options_description all;
    all.add(options).add(hidden);
    po::positional_options_description positional;
    positional.add("torrent", 1);

    try {
        po::variables_map vm;
        po::store(po::command_line_parser(argc, argv)
                          .options(all)
                          .positional(positional)
                          .run(),
                vm);
        if(vm.count("help")) {
            std::cout << usage << options << '\n';
            return 0;
        }
        po::notify(vm);
        if(torrent.empty()) {
            std::cerr << usage << options << '\n';
            return 1;
        }
        fill_in_defaults(s);
        verify(s);
    } catch(const po::error& e) {
        std::cerr << "flume: " << e.what() << "\n\n" << usage << options << '\n';
        return 1;
    } catch(const std::invalid_argument& e) {
        std::cerr << "flume: invalid setting: " << e.what() << '\n';
        return 1;
    }

    if(!s.log_dir.empty()) {
        log::set_log_dir(s.log_dir);
    }

    std::unique_ptr<streaming_session> session;
    std::unique_ptr<content_server> server;
    try {
        session = std::make_unique<streaming_session>(
                std::make_unique<bt_engine>(s.engine), s);
        session->start(torrent_source::parse(torrent));
        server = std::make_unique<content_server>(*session, s.server);
        server->start();
    } catch(const system_error& e) {
        std::cerr << "flume: error " << construction_step(e.code()) << ": "
                  << e.code().message() << '\n';
        if(session) {
            session->close();
        }
        log::flush();
        return 1;
    }

    asio::io_context ios;
    status_screen screen(*session, server->port());
    deadline_timer render_timer(ios);
    asio::signal_set signals(ios, SIGINT, SIGTERM);
    signals.async_wait([&](const error_code& error, int) {
        if(!error) {
            render_timer.cancel();
        }
    });
    screen.render();
    schedule_render(render_timer, screen);
    ios.run();

    std::printf("\nshutting down...\n");
    server->stop();
    session->close();
    log::flush();
    return 0;
}
