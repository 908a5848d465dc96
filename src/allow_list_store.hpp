#pragma once

#include <ostream>
#include <string>
#include <vector>

namespace relay_guard {

// Backing storage for the allow-list. Entries are CIDR strings; the store does
// not validate them.
class AllowListStore {
public:
    virtual ~AllowListStore() = default;

    // Missing or unreadable storage yields an empty list and a note on `log`.
    virtual std::vector<std::string> load(std::ostream& log) = 0;

    // Replaces the stored list wholesale. Throws std::runtime_error on failure.
    virtual void save(const std::vector<std::string>& entries) = 0;
};

// JSON array of strings on disk, e.g. ["10.0.0.0/24", "192.168.1.7/32"].
// save() writes a temporary sibling and renames it over the target.
class JsonAllowListStore : public AllowListStore {
public:
    explicit JsonAllowListStore(std::string path);

    std::vector<std::string> load(std::ostream& log) override;
    void save(const std::vector<std::string>& entries) override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace relay_guard
