#include "marker_writer.h"
#include "logging.h"

#include <exception>

namespace mbk {

bool MarkerWriter::write(const Marker& m) {
    const std::string key = m.key();
    LOG_SCAN(logging::Level::INFO, std::string("found ") + marker_kind_name(m.kind) +
             " file, writing " + key + " to " + dest_.describe());

    std::string err;
    bool ok = false;
    try {
        ok = dest_.write(key, {}, err);
    } catch (const std::exception& e) {
        err = e.what();
    }
    if (!ok) {
        failed_++;
        LOG_SCAN(logging::Level::ERROR, "unable to write marker " + key + ": " + err);
        return false;
    }
    written_.push_back(m);
    return true;
}

} // namespace mbk
