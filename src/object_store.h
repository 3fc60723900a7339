#pragma once
#include <cstdint>
#include <functional>
#include <istream>
#include <memory>
#include <string>
#include <vector>

namespace mbk {

// Flat key/value object namespace (bundles, markers).
class ObjectStore {
public:
    // Return false to stop the walk early.
    using Visitor = std::function<bool(const std::string& key)>;

    virtual ~ObjectStore() = default;

    // Visits keys starting with prefix and >= start_key, in ascending
    // lexical order. Throws StoreError when the listing fails.
    virtual void walk_from(const std::string& prefix, const std::string& start_key,
                           const Visitor& visit) = 0;

    // Throws StoreError when the object cannot be opened.
    virtual std::unique_ptr<std::istream> open(const std::string& key) = 0;

    // Whole-object write, visible to readers only once complete.
    // Returns false (with err) on failure.
    virtual bool write(const std::string& key, const std::vector<uint8_t>& data,
                       std::string& err) = 0;

    virtual bool exists(const std::string& key) = 0;

    virtual std::string describe() const = 0;
};

// Directory-backed store. Writes go to "<key>.tmp" and are renamed into place.
//
// walk_from() is not lazy: readdir order is unspecified, so the matching
// names are collected and sorted before the first visit. Memory grows with
// the number of keys >= start_key (one short string per bundle).
class LocalObjectStore : public ObjectStore {
public:
    // fsync_writes: fsync the temporary file before the rename
    explicit LocalObjectStore(const std::string& dir, bool fsync_writes = true);

    void walk_from(const std::string& prefix, const std::string& start_key,
                   const Visitor& visit) override;
    std::unique_ptr<std::istream> open(const std::string& key) override;
    bool write(const std::string& key, const std::vector<uint8_t>& data,
               std::string& err) override;
    bool exists(const std::string& key) override;
    std::string describe() const override { return "file://" + dir_; }

    const std::string& dir() const { return dir_; }

private:
    std::string path_of(const std::string& key) const { return dir_ + "/" + key; }

    std::string dir_;
    bool fsync_writes_;
};

// Accepts "<path>" or "file://<path>". Throws PreconditionError on other schemes.
std::unique_ptr<ObjectStore> open_store(const std::string& url);

} // namespace mbk
