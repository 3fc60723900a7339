// mbk-tool - merged-block archive scanner and stream downloader

#include "block_range.h"
#include "cancel.h"
#include "config.h"
#include "constants.h"
#include "continuity.h"
#include "downloader.h"
#include "errors.h"
#include "logging.h"
#include "object_store.h"
#include "printer.h"
#include "scanner.h"
#include "tcp_stream_client.h"

#include <pthread.h>
#include <signal.h>

#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace mbk;

// ============================================================================
// Utility Functions
// ============================================================================

static void print_usage() {
    std::cerr << R"(
mbk-tool - Merged-block archive scanner and stream downloader

USAGE:
  mbk-tool [global options] <command> <args...> [options]

COMMANDS:
  check-merged-blocks <source-store> <dest-store> <range>
                    Scan bundles and write .broken / .missing markers
  download-from-stream <endpoint> <range> <dest-store>
                    Stream final blocks and write them as bundles
  stream-client <endpoint> <range>
                    Print the blocks of a stream

RANGES:
  A:B               blocks [A, B)
  A:+N              blocks [A, A+N)
  A:                from A with no stop

OPTIONS:
  --bundle-size=<n>        Blocks per bundle (default 100)
  --retry-delay-ms=<n>     Wait between reconnects (default 4000)
  --block-type=<t>         Payload model: header | final
  --final-blocks-only      stream-client: only final blocks
  --print-cursor-only      stream-client: print "step - cursor" lines
  --output=<fmt>           stream-client: text | json
  --cursor=<c>             Start the stream from this cursor

GLOBAL OPTIONS:
  --conf=<path>            key=value config file
  --log-level=<lvl>        trace | debug | info | warn | error | fatal
  --log-file=<path>        Also log to this file
  --json-log               Log as JSON lines
  --no-color               Plain console output
  --help                   Show this help
  --version                Print the version

EXAMPLES:
  # Check an archive between blocks 0 and 1,000,000
  mbk-tool check-merged-blocks ./merged ./markers 0:1000000

  # Download final blocks into bundles of 100
  mbk-tool download-from-stream localhost:9000 5000: ./merged

)";
}

static bool has_prefix(const std::string& s, const char* p) {
    return s.rfind(p, 0) == 0;
}

// Signals are blocked in every thread; this one waits for them and cancels.
// The thread shares ownership of the token, so a late signal after main
// returns still finds it alive.
static void start_signal_thread(std::shared_ptr<CancelToken> cancel) {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &set, nullptr);
    std::thread([set, cancel]() {
        int sig = 0;
        if (sigwait(&set, &sig) == 0) {
            LOG_CLI(logging::Level::WARN, "received signal " + std::to_string(sig) + ", shutting down");
            cancel->cancel();
        }
    }).detach();
}

// ============================================================================
// Commands
// ============================================================================

static int cmd_check(const std::vector<std::string>& args, const Config& cfg, CancelToken& cancel) {
    if (args.size() != 3) {
        std::cerr << "ERROR: check-merged-blocks needs <source-store> <dest-store> <range>\n";
        return 2;
    }
    BlockRange range = BlockRange::parse(args[2]);
    ScanReport report = check_merged_blocks(args[0], args[1], cfg.bundle_size, range, &cancel);

    std::cout << "Bundles checked:      " << report.bundles_checked << "\n";
    std::cout << "Blocks read:          " << report.blocks_read << "\n";
    std::cout << "Broken bundles:       " << report.broken << "\n";
    std::cout << "Missing bundles:      " << report.missing << "\n";
    if (report.marker_write_failures > 0) {
        std::cout << "Marker write errors:  " << report.marker_write_failures << "\n";
    }
    for (const auto& m : report.markers) {
        std::cout << "  " << m.key() << "\n";
    }
    return 0;
}

static int cmd_download(const std::vector<std::string>& args, const Config& cfg,
                        const std::string& cursor, CancelToken& cancel) {
    if (args.size() != 3) {
        std::cerr << "ERROR: download-from-stream needs <endpoint> <range> <dest-store>\n";
        return 2;
    }
    Endpoint ep = Endpoint::parse(args[0]);
    DownloadOptions opts;
    opts.range = BlockRange::parse(args[1]);
    opts.bundle_size = cfg.bundle_size;
    opts.retry_delay = std::chrono::milliseconds(cfg.retry_delay_ms);
    opts.block_type = cfg.block_type;
    opts.first_streamable_block = cfg.first_streamable_block;
    opts.cursor = cursor;

    auto dest = open_store(args[2]);
    TcpBlockStreamClient client(ep, cfg.connect_timeout_ms, cfg.recv_timeout_ms, &cancel);
    Downloader downloader(client, *dest, opts, &cancel);
    DownloadReport report = downloader.run();

    std::cout << "Blocks:      " << report.blocks << "\n";
    std::cout << "Bundles:     " << report.bundles_flushed << "\n";
    std::cout << "Reconnects:  " << report.reconnects << "\n";
    if (!report.last_block_id.empty()) {
        std::cout << "Last block:  #" << report.last_block_number << " ("
                  << report.last_block_id << ")\n";
        std::cout << "Last cursor: " << report.last_cursor << "\n";
    }
    return 0;
}

static int cmd_stream(const std::vector<std::string>& args, const Config& cfg,
                      const std::string& cursor, bool final_only, const PrintOptions& popts,
                      CancelToken& cancel) {
    if (args.size() != 2) {
        std::cerr << "ERROR: stream-client needs <endpoint> <range>\n";
        return 2;
    }
    Endpoint ep = Endpoint::parse(args[0]);
    BlockRange range = BlockRange::parse(args[1]);
    if (range.start < 0) {
        throw PreconditionError("stream-client needs a non-negative start block");
    }

    StreamRequest req;
    req.start_block_num = range.start_block();
    req.stop_block_num = range.stop_block_or(0);
    req.final_blocks_only = final_only;
    req.cursor = cursor;

    TcpBlockStreamClient client(ep, cfg.connect_timeout_ms, cfg.recv_timeout_ms, &cancel);
    BlockNormalizer normalizer(cfg.block_type, cfg.first_streamable_block);
    uint64_t n = print_stream(client, req, normalizer, popts, std::cout, &cancel);
    LOG_CLI(logging::Level::INFO, "printed " + std::to_string(n) + " responses");
    return 0;
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char** argv) {
    std::string conf_path;
    std::string command;
    std::vector<std::string> positional;
    std::vector<std::pair<std::string, std::string>> overrides;
    std::string cursor;
    bool final_only = false;
    PrintOptions popts;
    std::string output = "text";

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (has_prefix(arg, "--conf=")) {
            conf_path = arg.substr(7);
        } else if (has_prefix(arg, "--bundle-size=")) {
            overrides.emplace_back("bundle_size", arg.substr(14));
        } else if (has_prefix(arg, "--retry-delay-ms=")) {
            overrides.emplace_back("retry_delay_ms", arg.substr(17));
        } else if (has_prefix(arg, "--block-type=")) {
            overrides.emplace_back("block_type", arg.substr(13));
        } else if (has_prefix(arg, "--log-level=")) {
            overrides.emplace_back("log_level", arg.substr(12));
        } else if (has_prefix(arg, "--log-file=")) {
            overrides.emplace_back("log_file", arg.substr(11));
        } else if (arg == "--json-log") {
            overrides.emplace_back("json_log", "true");
        } else if (arg == "--no-color") {
            overrides.emplace_back("color", "false");
        } else if (has_prefix(arg, "--cursor=")) {
            cursor = arg.substr(9);
        } else if (has_prefix(arg, "--output=")) {
            output = arg.substr(9);
        } else if (arg == "--final-blocks-only") {
            final_only = true;
        } else if (arg == "--print-cursor-only") {
            popts.cursor_only = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (arg == "--version") {
            std::cout << "mbk-tool " << MBK_VERSION_MAJOR << "." << MBK_VERSION_MINOR << "."
                      << MBK_VERSION_PATCH << "\n";
            return 0;
        } else if (arg.size() > 1 && arg[0] == '-' && arg[1] == '-') {
            std::cerr << "ERROR: Unknown option: " << arg << "\n";
            print_usage();
            return 2;
        } else if (command.empty()) {
            command = arg;
        } else {
            positional.push_back(arg);
        }
    }

    if (command.empty()) {
        std::cerr << "ERROR: No command specified\n";
        print_usage();
        return 2;
    }

    // Configuration: file, then environment, then flags
    Config cfg;
    std::string err;
    if (!conf_path.empty() && !load_config(conf_path, cfg, err)) {
        std::cerr << "ERROR: " << err << "\n";
        return 2;
    }
    if (!apply_env_overrides(cfg, err)) {
        std::cerr << "ERROR: " << err << "\n";
        return 2;
    }
    for (const auto& [key, value] : overrides) {
        if (!set_config_value(cfg, key, value, err)) {
            std::cerr << "ERROR: " << err << "\n";
            return 2;
        }
    }
    if (!parse_output_format(output, popts.format)) {
        std::cerr << "ERROR: invalid --output \"" << output << "\"\n";
        return 2;
    }
    popts.queue_depth = cfg.print_queue_depth;
    if (!configure_logging(cfg, err)) {
        std::cerr << "ERROR: " << err << "\n";
        return 2;
    }

    signal(SIGPIPE, SIG_IGN);
    auto shared_cancel = std::make_shared<CancelToken>();
    start_signal_thread(shared_cancel);
    CancelToken& cancel = *shared_cancel;

    // Execute command
    try {
        if (command == "check-merged-blocks") {
            return cmd_check(positional, cfg, cancel);
        } else if (command == "download-from-stream") {
            return cmd_download(positional, cfg, cursor, cancel);
        } else if (command == "stream-client") {
            return cmd_stream(positional, cfg, cursor, final_only, popts, cancel);
        } else {
            std::cerr << "ERROR: Unknown command: " << command << "\n";
            print_usage();
            return 2;
        }
    } catch (const CancelledError& e) {
        LOG_CLI(logging::Level::WARN, std::string("interrupted: ") + e.what());
        return 1;
    } catch (const Error& e) {
        LOG_CLI(logging::Level::ERROR, e.what());
        return 1;
    }
}
