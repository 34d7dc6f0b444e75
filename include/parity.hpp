#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// Parity root catalog: everything the server may serve lives directly under the
// parity root. Entries are rebuilt from the filesystem on every request.
namespace parity {

struct Entry {
    std::string name;  // file name, invalid UTF-8 replaced by U+FFFD
    std::filesystem::path path;
    uint32_t length;   // truncated for files of 4 GiB and more
};

// Builds an entry for one regular file. Throws protocol::IoError otherwise.
Entry file_entry(const std::filesystem::path& path);

// Regular files directly under `root`, in directory enumeration order.
// Throws protocol::IoError if `root` cannot be listed.
std::vector<Entry> scan(const std::filesystem::path& root);

// Re-scans `root`; nullopt when `index` is past the end.
std::optional<Entry> resolve_by_index(const std::filesystem::path& root, uint64_t index);

// Resolves `root / name`. Returns nullopt when the canonical path escapes the
// canonical root; throws protocol::IoError when it stays inside but is not a
// regular file.
std::optional<Entry> resolve_by_name(const std::filesystem::path& root, const std::string& name);

// Component-wise prefix test on already canonical paths.
bool is_within(const std::filesystem::path& root, const std::filesystem::path& candidate);

} // namespace parity
