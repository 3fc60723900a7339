#pragma once
#include <cstdint>
#include <string>

#include "constants.h"

namespace mbk {

struct Config {
    uint64_t    bundle_size{MBK_DEFAULT_BUNDLE_SIZE};
    int64_t     retry_delay_ms{MBK_RETRY_DELAY_MS};
    int         connect_timeout_ms{MBK_CONNECT_TIMEOUT_MS};
    int         recv_timeout_ms{0};  // 0 waits forever
    size_t      print_queue_depth{MBK_PRINT_QUEUE_DEPTH};
    uint64_t    first_streamable_block{0};
    std::string block_type{"header"};

    std::string log_level{"info"};
    std::string log_file;
    bool        json_log{false};
    bool        color{true};
};

// Sets one key. Unknown keys and unparsable values fail with err.
bool set_config_value(Config& cfg, const std::string& key, const std::string& value,
                      std::string& err);

// key=value lines, '#' comments and blank lines ignored.
bool load_config(const std::string& path, Config& cfg, std::string& err);

// MBK_<KEY> environment overrides (e.g. MBK_BUNDLE_SIZE, MBK_RETRY_DELAY_MS).
bool apply_env_overrides(Config& cfg, std::string& err);

// Applies log_level, log_file, json_log and color to the global logger.
bool configure_logging(const Config& cfg, std::string& err);

} // namespace mbk
