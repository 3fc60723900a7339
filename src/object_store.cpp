#include "object_store.h"
#include "constants.h"
#include "errors.h"
#include "logging.h"

#include <algorithm>
#include <filesystem>
#include <fstream>

#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace mbk {

static inline void flush_path(const std::string& p) {
    int fd = ::open(p.c_str(), O_RDWR | O_CLOEXEC);
    if (fd >= 0) { ::fsync(fd); ::close(fd); }
}

LocalObjectStore::LocalObjectStore(const std::string& dir, bool fsync_writes)
    : dir_(dir), fsync_writes_(fsync_writes) {
    while (dir_.size() > 1 && dir_.back() == '/') dir_.pop_back();
}

void LocalObjectStore::walk_from(const std::string& prefix, const std::string& start_key,
                                 const Visitor& visit) {
    std::error_code ec;
    fs::directory_iterator it(dir_, ec);
    if (ec) {
        throw StoreError("unable to list " + dir_ + ": " + ec.message());
    }

    std::vector<std::string> keys;
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) break;
        if (!it->is_regular_file(ec)) continue;
        std::string name = it->path().filename().string();
        if (name.compare(0, prefix.size(), prefix) != 0) continue;
        if (name < start_key) continue;
        keys.push_back(std::move(name));
    }
    if (ec) {
        throw StoreError("listing " + dir_ + " failed: " + ec.message());
    }
    std::sort(keys.begin(), keys.end());

    LOG_STORE(logging::Level::TRACE, "walking " + std::to_string(keys.size()) +
              " keys in " + dir_ + " from \"" + start_key + "\"");
    for (const auto& k : keys) {
        if (!visit(k)) return;
    }
}

std::unique_ptr<std::istream> LocalObjectStore::open(const std::string& key) {
    auto f = std::make_unique<std::ifstream>(path_of(key), std::ios::binary);
    if (!f->is_open()) {
        throw StoreError("unable to open object " + key + " in " + dir_);
    }
    return f;
}

bool LocalObjectStore::write(const std::string& key, const std::vector<uint8_t>& data,
                             std::string& err) {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        err = "cannot create " + dir_ + ": " + ec.message();
        return false;
    }

    // Atomic write - write to .tmp then rename
    const std::string final_path = path_of(key);
    const std::string temp_path = final_path + TMP_SUFFIX;
    {
        std::ofstream f(temp_path, std::ios::binary | std::ios::trunc);
        if (!f) {
            err = "cannot create " + temp_path;
            return false;
        }
        if (!data.empty()) {
            f.write(reinterpret_cast<const char*>(data.data()),
                    static_cast<std::streamsize>(data.size()));
        }
        f.flush();
        if (!f) {
            err = "short write to " + temp_path;
            return false;
        }
    }
    if (fsync_writes_) flush_path(temp_path);

    fs::rename(temp_path, final_path, ec);
    if (ec) {
        err = "rename " + temp_path + " failed: " + ec.message();
        fs::remove(temp_path, ec);
        return false;
    }
    return true;
}

bool LocalObjectStore::exists(const std::string& key) {
    std::error_code ec;
    return fs::is_regular_file(path_of(key), ec);
}

std::unique_ptr<ObjectStore> open_store(const std::string& url) {
    static const std::string kFileScheme = "file://";
    if (url.empty()) throw PreconditionError("empty store location");

    std::string path = url;
    if (url.compare(0, kFileScheme.size(), kFileScheme) == 0) {
        path = url.substr(kFileScheme.size());
    } else if (url.find("://") != std::string::npos) {
        throw PreconditionError("unsupported store scheme in \"" + url + "\"");
    }
    if (path.empty()) throw PreconditionError("empty store path in \"" + url + "\"");
    return std::make_unique<LocalObjectStore>(path);
}

} // namespace mbk
