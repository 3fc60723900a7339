#include "bundle_walker.h"
#include "cancel.h"
#include "constants.h"
#include "logging.h"

namespace mbk {

static bool has_suffix(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

void BundleWalker::walk(const Visitor& visit, const CancelToken* cancel) {
    store_.walk_from("", start_key_, [&](const std::string& key) {
        if (cancel) cancel->throw_if_cancelled();

        if (has_suffix(key, TMP_SUFFIX)) {
            skipped_++;
            return true;
        }
        auto idx = BundleIndex::parse(key);
        if (!idx) {
            LOG_SCAN(logging::Level::DEBUG, "skipping non-bundle object " + key);
            skipped_++;
            return true;
        }
        return visit(*idx, key);
    });
}

} // namespace mbk
