#include "config.h"
#include "logging.h"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <limits>

namespace mbk {

static std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

static bool parse_u64(const std::string& v, uint64_t& out) {
    if (v.empty()) return false;
    try {
        size_t used = 0;
        if (v[0] == '-') return false;
        out = std::stoull(v, &used);
        return used == v.size();
    } catch (const std::exception&) {
        return false;
    }
}

static bool parse_bool(const std::string& v, bool& out) {
    if (v == "1" || v == "true" || v == "yes" || v == "on") { out = true; return true; }
    if (v == "0" || v == "false" || v == "no" || v == "off") { out = false; return true; }
    return false;
}

bool set_config_value(Config& cfg, const std::string& key, const std::string& value,
                      std::string& err) {
    uint64_t n = 0;
    auto need_u64 = [&](uint64_t max) {
        if (!parse_u64(value, n) || n > max) {
            err = "invalid value \"" + value + "\" for " + key;
            return false;
        }
        return true;
    };

    if (key == "bundle_size") {
        if (!need_u64(std::numeric_limits<uint32_t>::max())) return false;
        if (n == 0) { err = "bundle_size must be greater than zero"; return false; }
        cfg.bundle_size = n;
    } else if (key == "retry_delay_ms") {
        if (!need_u64(24ull * 3600 * 1000)) return false;
        cfg.retry_delay_ms = static_cast<int64_t>(n);
    } else if (key == "connect_timeout_ms") {
        if (!need_u64(std::numeric_limits<int>::max())) return false;
        cfg.connect_timeout_ms = static_cast<int>(n);
    } else if (key == "recv_timeout_ms") {
        if (!need_u64(std::numeric_limits<int>::max())) return false;
        cfg.recv_timeout_ms = static_cast<int>(n);
    } else if (key == "print_queue_depth") {
        if (!need_u64(4096)) return false;
        if (n == 0) { err = "print_queue_depth must be greater than zero"; return false; }
        cfg.print_queue_depth = static_cast<size_t>(n);
    } else if (key == "first_streamable_block") {
        if (!need_u64(std::numeric_limits<uint64_t>::max())) return false;
        cfg.first_streamable_block = n;
    } else if (key == "block_type") {
        if (value != "header" && value != "final") {
            err = "invalid block_type \"" + value + "\"";
            return false;
        }
        cfg.block_type = value;
    } else if (key == "log_level") {
        logging::Level lvl;
        if (!logging::parse_level(value, lvl)) {
            err = "invalid log_level \"" + value + "\"";
            return false;
        }
        cfg.log_level = value;
    } else if (key == "log_file") {
        cfg.log_file = value;
    } else if (key == "json_log") {
        if (!parse_bool(value, cfg.json_log)) { err = "invalid value for json_log"; return false; }
    } else if (key == "color") {
        if (!parse_bool(value, cfg.color)) { err = "invalid value for color"; return false; }
    } else {
        err = "unknown config key \"" + key + "\"";
        return false;
    }
    return true;
}

bool load_config(const std::string& path, Config& cfg, std::string& err) {
    std::ifstream f(path);
    if (!f) {
        err = "cannot open config file " + path;
        return false;
    }
    std::string line;
    int lineno = 0;
    while (std::getline(f, line)) {
        ++lineno;
        std::string t = trim(line);
        if (t.empty() || t[0] == '#') continue;
        size_t eq = t.find('=');
        if (eq == std::string::npos) {
            err = path + ":" + std::to_string(lineno) + ": expected key=value";
            return false;
        }
        std::string k = trim(t.substr(0, eq));
        std::string v = trim(t.substr(eq + 1));
        if (!set_config_value(cfg, k, v, err)) {
            err = path + ":" + std::to_string(lineno) + ": " + err;
            return false;
        }
    }
    return true;
}

bool apply_env_overrides(Config& cfg, std::string& err) {
    static const char* keys[] = {
        "bundle_size", "retry_delay_ms", "connect_timeout_ms", "recv_timeout_ms",
        "print_queue_depth", "first_streamable_block", "block_type",
        "log_level", "log_file", "json_log", "color", nullptr
    };
    for (int i = 0; keys[i] != nullptr; ++i) {
        std::string env = "MBK_";
        for (const char* p = keys[i]; *p; ++p) {
            env += static_cast<char>(std::toupper(static_cast<unsigned char>(*p)));
        }
        const char* v = std::getenv(env.c_str());
        if (!v || !*v) continue;
        if (!set_config_value(cfg, keys[i], v, err)) {
            err = env + ": " + err;
            return false;
        }
    }
    return true;
}

bool configure_logging(const Config& cfg, std::string& err) {
    auto& logger = logging::Logger::instance();
    logging::Level lvl;
    if (!logging::parse_level(cfg.log_level, lvl)) {
        err = "invalid log_level \"" + cfg.log_level + "\"";
        return false;
    }
    logger.set_level(lvl);
    logger.set_color_output(cfg.color);
    logger.set_json_format(cfg.json_log);
    if (!cfg.log_file.empty()) {
        if (!logger.open_log_file(cfg.log_file)) {
            err = "cannot open log file " + cfg.log_file;
            return false;
        }
        logger.set_file_output(true);
    }
    return true;
}

} // namespace mbk
