#pragma once
#include <cstdint>
#include <vector>

#include "bundle.h"
#include "object_store.h"

namespace mbk {

// Writes empty marker objects. A failed write is logged and counted but
// never stops the scan; callers needing a complete marker set must check
// failed() or verify the destination themselves.
class MarkerWriter {
public:
    explicit MarkerWriter(ObjectStore& dest) : dest_(dest) {}

    bool write(const Marker& m);

    const std::vector<Marker>& written() const { return written_; }
    uint64_t failed() const { return failed_; }

private:
    ObjectStore& dest_;
    std::vector<Marker> written_;
    uint64_t failed_{0};
};

} // namespace mbk
