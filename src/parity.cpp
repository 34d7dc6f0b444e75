#include "parity.hpp"
#include "protocol/codec.hpp"
#include "protocol/errors.hpp"
#include "logger.hpp"
#include <algorithm>
#include <iterator>
#include <limits>
#include <system_error>

namespace fs = std::filesystem;

namespace parity {

namespace {

uint32_t clamp_length(const fs::path& path, uintmax_t size) {
    if (size > std::numeric_limits<uint32_t>::max()) {
        logging::warn("File exceeds 4 GiB, length field truncated: " + path.string());
    }
    return static_cast<uint32_t>(size);
}

// Names go out as text frames, so they must be valid UTF-8 whatever bytes the
// filesystem holds.
std::string entry_name(const fs::path& path) {
    return protocol::to_valid_utf8(path.filename().string());
}

} // namespace

Entry file_entry(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw protocol::IoError("Path is not a file: " + path.string());
    }
    uintmax_t size = fs::file_size(path, ec);
    if (ec) {
        throw protocol::IoError("Could not stat " + path.string() + ": " + ec.message());
    }
    return Entry{entry_name(path), path, clamp_length(path, size)};
}

std::vector<Entry> scan(const fs::path& root) {
    std::vector<Entry> entries;

    std::error_code ec;
    fs::directory_iterator it(root, ec);
    if (ec) {
        throw protocol::IoError("Could not read parity root " + root.string() + ": " + ec.message());
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec)) continue;

        uintmax_t size = it->file_size(entry_ec);
        if (entry_ec) {
            throw protocol::IoError("Could not stat " + it->path().string() + ": " + entry_ec.message());
        }
        entries.push_back(Entry{entry_name(it->path()), it->path(), clamp_length(it->path(), size)});
    }
    if (ec) {
        throw protocol::IoError("Could not read parity root " + root.string() + ": " + ec.message());
    }

    logging::debug("Scanned " + root.string() + ": " + std::to_string(entries.size()) + " file(s)");
    return entries;
}

std::optional<Entry> resolve_by_index(const fs::path& root, uint64_t index) {
    std::vector<Entry> entries = scan(root);
    if (index >= entries.size()) {
        return std::nullopt;
    }
    return entries[static_cast<size_t>(index)];
}

std::optional<Entry> resolve_by_name(const fs::path& root, const std::string& name) {
    std::error_code ec;
    fs::path canonical_root = fs::canonical(root, ec);
    if (ec) {
        throw protocol::IoError("Could not canonicalize parity root " + root.string() + ": " + ec.message());
    }

    fs::path candidate = fs::weakly_canonical(canonical_root / fs::u8path(name), ec);
    if (ec) {
        throw protocol::IoError("Could not canonicalize " + name + ": " + ec.message());
    }

    if (!is_within(canonical_root, candidate)) {
        logging::warn("Rejected path outside parity root: " + candidate.string());
        return std::nullopt;
    }
    return file_entry(candidate);
}

bool is_within(const fs::path& root, const fs::path& candidate) {
    // "/data/" and "/data" must compare equal, so drop the empty trailing element.
    auto root_end = root.end();
    if (root_end != root.begin() && std::prev(root_end)->empty()) {
        --root_end;
    }
    auto mismatch = std::mismatch(root.begin(), root_end, candidate.begin(), candidate.end());
    return mismatch.first == root_end;
}

} // namespace parity
