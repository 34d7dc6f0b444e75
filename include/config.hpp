#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace config {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

constexpr uint16_t DEFAULT_PORT = 49160;

struct ServerProfile {
    std::string name;
    std::string parity_root = "{home}/oxideux/source";
    uint16_t port = DEFAULT_PORT;
    std::string mask = "0.0.0.0";
};

struct ClientProfile {
    std::string name;
    std::string parity_root = "{download}";   // download directory
    uint16_t port = DEFAULT_PORT;
    std::string ipv4 = "localhost";
};

// What the core needs to run: a directory plus where to listen / connect.
struct ResolvedProfile {
    std::filesystem::path parity_root;
    std::string host;
    uint16_t port;
};

// The profile name is the key in the "profiles" object, not a field.
void to_json(nlohmann::json& j, const ServerProfile& profile);
void from_json(const nlohmann::json& j, ServerProfile& profile);
void to_json(nlohmann::json& j, const ClientProfile& profile);
void from_json(const nlohmann::json& j, ClientProfile& profile);

// ─── Well-known directories ─────────────────────────────────────────────────

std::filesystem::path home_dir();
std::filesystem::path config_dir();     // $XDG_CONFIG_HOME or ~/.config
std::filesystem::path appdata_dir();    // $XDG_DATA_HOME or ~/.local/share
std::filesystem::path download_dir();   // $XDG_DOWNLOAD_DIR or ~/Downloads

// Expands a leading "~", "{home}", "{config}", "{appdata}" or "{download}".
std::string fill_path_placeholders(const std::string& path);

// ─── Validation ─────────────────────────────────────────────────────────────

// Each returns an error description, or nullopt when the value is acceptable.
std::optional<std::string> validate_directory(const std::string& path);
std::optional<std::string> validate_port(uint16_t port);
std::optional<std::string> validate_ipv4(const std::string& address);

std::vector<std::string> validate(const ServerProfile& profile);
std::vector<std::string> validate(const ClientProfile& profile);

// Throws ConfigError listing every validation problem.
ResolvedProfile resolve(const ServerProfile& profile);
ResolvedProfile resolve(const ClientProfile& profile);

// ─── Profile store ──────────────────────────────────────────────────────────

// One JSON file of the form {"profiles": {"<name>": {...}}}. Every call reads
// the file again, so edits by other processes are picked up.
class ProfileStore {
public:
    explicit ProfileStore(std::filesystem::path file);

    static std::filesystem::path server_config(const std::filesystem::path& config_root);
    static std::filesystem::path client_config(const std::filesystem::path& config_root);

    // Creates the file holding only `default_profile` if it does not exist yet.
    // Returns true if the file was created.
    bool init(const ServerProfile& default_profile) const;
    bool init(const ClientProfile& default_profile) const;

    std::vector<std::string> names() const;
    bool contains(const std::string& name) const;

    // Placeholders in parity_root are expanded on load. An unknown name throws
    // ConfigError listing the profiles that do exist.
    ServerProfile get_server(const std::string& name) const;
    ClientProfile get_client(const std::string& name) const;

    // Inserts or replaces.
    void save(const ServerProfile& profile) const;
    void save(const ClientProfile& profile) const;

    // Like save(), but throws ConfigError if the name is taken.
    void create(const ServerProfile& profile) const;
    void create(const ClientProfile& profile) const;

    void rename(const std::string& name, const std::string& new_name) const;
    void erase(const std::string& name) const;

    const std::filesystem::path& path() const { return file_; }

private:
    void require(const std::string& name) const;
    bool init_file(const std::string& name, const nlohmann::json& profile) const;
    nlohmann::json load() const;
    void store(const nlohmann::json& root) const;
    const nlohmann::json& profile_object(const nlohmann::json& root, const std::string& name) const;
    void put(const std::string& name, const nlohmann::json& profile, bool replace) const;

    std::filesystem::path file_;
};

} // namespace config
