#include "config.hpp"
#include "logger.hpp"
#include <cstdlib>
#include <fstream>
#include <limits>
#include <system_error>
#include <utility>
#include <boost/asio/ip/address_v4.hpp>

namespace fs = std::filesystem;

namespace config {

namespace {

std::string env_or_empty(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

// XDG variables must hold absolute paths to be honoured.
fs::path xdg_dir(const char* variable, const fs::path& fallback) {
    fs::path value = env_or_empty(variable);
    if (!value.empty() && value.is_absolute()) {
        return value;
    }
    return fallback;
}

std::string join_errors(const std::vector<std::string>& errors) {
    std::string out;
    for (const auto& error : errors) {
        if (!out.empty()) out += " ";
        out += error;
    }
    return out;
}

uint16_t port_from_json(const nlohmann::json& j) {
    const nlohmann::json& value = j.at("port");
    if (!value.is_number_unsigned() || value.get<uint64_t>() > std::numeric_limits<uint16_t>::max()) {
        throw ConfigError("Expected key 'port' to be a number between 0 and 65535");
    }
    return value.get<uint16_t>();
}

} // namespace

// ─── JSON mapping ───────────────────────────────────────────────────────────

void to_json(nlohmann::json& j, const ServerProfile& profile) {
    j = nlohmann::json{
        {"parity_root", profile.parity_root},
        {"port", profile.port},
        {"mask", profile.mask}
    };
}

void from_json(const nlohmann::json& j, ServerProfile& profile) {
    j.at("parity_root").get_to(profile.parity_root);
    profile.port = port_from_json(j);
    j.at("mask").get_to(profile.mask);
}

void to_json(nlohmann::json& j, const ClientProfile& profile) {
    j = nlohmann::json{
        {"parity_root", profile.parity_root},
        {"port", profile.port},
        {"ipv4", profile.ipv4}
    };
}

void from_json(const nlohmann::json& j, ClientProfile& profile) {
    j.at("parity_root").get_to(profile.parity_root);
    profile.port = port_from_json(j);
    j.at("ipv4").get_to(profile.ipv4);
}

// ─── Well-known directories ─────────────────────────────────────────────────

fs::path home_dir() {
    std::string home = env_or_empty("HOME");
    if (home.empty()) {
        throw ConfigError("Home directory could not be retrieved.");
    }
    return home;
}

fs::path config_dir() {
    return xdg_dir("XDG_CONFIG_HOME", home_dir() / ".config");
}

fs::path appdata_dir() {
    return xdg_dir("XDG_DATA_HOME", home_dir() / ".local" / "share");
}

fs::path download_dir() {
    return xdg_dir("XDG_DOWNLOAD_DIR", home_dir() / "Downloads");
}

std::string fill_path_placeholders(const std::string& path) {
    struct Placeholder {
        const char* token;
        fs::path (*resolve)();
    };
    static const Placeholder placeholders[] = {
        {"{home}", home_dir},
        {"{config}", config_dir},
        {"{appdata}", appdata_dir},
        {"{download}", download_dir},
    };

    if (path == "~" || path.rfind("~/", 0) == 0) {
        return home_dir().string() + path.substr(1);
    }
    for (const auto& placeholder : placeholders) {
        std::string token = placeholder.token;
        if (path.rfind(token, 0) == 0) {
            return placeholder.resolve().string() + path.substr(token.size());
        }
    }
    return path;
}

// ─── Validation ─────────────────────────────────────────────────────────────

std::optional<std::string> validate_directory(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return "Non-existent directory";
    }
    if (!fs::is_directory(path, ec)) {
        return "Is not directory";
    }
    return std::nullopt;
}

std::optional<std::string> validate_port(uint16_t port) {
    if (port < 1024) {
        return "Invalid port: " + std::to_string(port);
    }
    return std::nullopt;
}

std::optional<std::string> validate_ipv4(const std::string& address) {
    if (address == "localhost") {
        return std::nullopt;
    }
    boost::system::error_code ec;
    boost::asio::ip::make_address_v4(address, ec);
    if (ec) {
        return "Invalid IPv4: " + address;
    }
    return std::nullopt;
}

std::vector<std::string> validate(const ServerProfile& profile) {
    std::vector<std::string> errors;
    if (auto e = validate_directory(profile.parity_root)) errors.push_back("Parity root: " + *e + ".");
    if (auto e = validate_port(profile.port)) errors.push_back("Port: " + *e + ".");
    if (auto e = validate_ipv4(profile.mask)) errors.push_back("Mask: " + *e + ".");
    return errors;
}

std::vector<std::string> validate(const ClientProfile& profile) {
    std::vector<std::string> errors;
    if (auto e = validate_directory(profile.parity_root)) errors.push_back("Parity root: " + *e + ".");
    if (auto e = validate_port(profile.port)) errors.push_back("Port: " + *e + ".");
    if (auto e = validate_ipv4(profile.ipv4)) errors.push_back("IPv4: " + *e + ".");
    return errors;
}

ResolvedProfile resolve(const ServerProfile& profile) {
    std::vector<std::string> errors = validate(profile);
    if (!errors.empty()) {
        throw ConfigError(join_errors(errors) + " Due to " + std::to_string(errors.size()) +
                          " previous error(s), the server may not be started.");
    }
    return ResolvedProfile{profile.parity_root, profile.mask, profile.port};
}

ResolvedProfile resolve(const ClientProfile& profile) {
    std::vector<std::string> errors = validate(profile);
    if (!errors.empty()) {
        throw ConfigError(join_errors(errors) + " Due to " + std::to_string(errors.size()) +
                          " previous error(s), the client may not be started.");
    }
    return ResolvedProfile{profile.parity_root, profile.ipv4, profile.port};
}

// ─── ProfileStore ───────────────────────────────────────────────────────────

ProfileStore::ProfileStore(fs::path file) : file_(std::move(file)) {}

fs::path ProfileStore::server_config(const fs::path& config_root) {
    return config_root / "oxideux" / "server_config.json";
}

fs::path ProfileStore::client_config(const fs::path& config_root) {
    return config_root / "oxideux" / "client_config.json";
}

bool ProfileStore::init(const ServerProfile& default_profile) const {
    return init_file(default_profile.name, default_profile);
}

bool ProfileStore::init(const ClientProfile& default_profile) const {
    return init_file(default_profile.name, default_profile);
}

bool ProfileStore::init_file(const std::string& name, const nlohmann::json& profile) const {
    std::error_code ec;
    if (fs::exists(file_, ec)) {
        return false;
    }
    if (file_.has_parent_path()) {
        fs::create_directories(file_.parent_path(), ec);
        if (ec) {
            throw ConfigError("Couldn't initialize path: " + file_.parent_path().string() + ": " + ec.message());
        }
    }
    nlohmann::json root = {{"profiles", nlohmann::json::object()}};
    root["profiles"][name] = profile;
    store(root);
    logging::info("Created config file " + file_.string());
    return true;
}

std::vector<std::string> ProfileStore::names() const {
    nlohmann::json root = load();
    std::vector<std::string> names;
    for (const auto& item : root["profiles"].items()) {
        if (item.key().empty()) continue;
        names.push_back(item.key());
    }
    return names;
}

bool ProfileStore::contains(const std::string& name) const {
    nlohmann::json root = load();
    return root["profiles"].contains(name);
}

ServerProfile ProfileStore::get_server(const std::string& name) const {
    require(name);
    nlohmann::json root = load();
    ServerProfile profile;
    try {
        profile = profile_object(root, name).get<ServerProfile>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("Malformed profile '" + name + "': " + e.what());
    }
    profile.name = name;
    profile.parity_root = fill_path_placeholders(profile.parity_root);
    return profile;
}

ClientProfile ProfileStore::get_client(const std::string& name) const {
    require(name);
    nlohmann::json root = load();
    ClientProfile profile;
    try {
        profile = profile_object(root, name).get<ClientProfile>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("Malformed profile '" + name + "': " + e.what());
    }
    profile.name = name;
    profile.parity_root = fill_path_placeholders(profile.parity_root);
    return profile;
}

void ProfileStore::require(const std::string& name) const {
    if (contains(name)) {
        return;
    }
    std::string known;
    for (const auto& other : names()) {
        known += known.empty() ? other : ", " + other;
    }
    throw ConfigError("Unknown profile '" + name + "' in " + file_.string() +
                      ". Known profiles: " + (known.empty() ? "none" : known));
}

void ProfileStore::save(const ServerProfile& profile) const {
    put(profile.name, profile, true);
}

void ProfileStore::save(const ClientProfile& profile) const {
    put(profile.name, profile, true);
}

void ProfileStore::create(const ServerProfile& profile) const {
    put(profile.name, profile, false);
}

void ProfileStore::create(const ClientProfile& profile) const {
    put(profile.name, profile, false);
}

void ProfileStore::rename(const std::string& name, const std::string& new_name) const {
    if (new_name.empty()) {
        throw ConfigError("Profile name cannot be empty");
    }
    nlohmann::json root = load();
    nlohmann::json& profiles = root["profiles"];
    if (profiles.contains(new_name)) {
        throw ConfigError("Profile '" + new_name + "' already exists");
    }
    nlohmann::json profile = profile_object(root, name);
    profiles[new_name] = profile;
    profiles.erase(name);
    store(root);
}

void ProfileStore::erase(const std::string& name) const {
    nlohmann::json root = load();
    if (root["profiles"].erase(name) == 0) {
        throw ConfigError("Profile '" + name + "' does not exist");
    }
    store(root);
}

void ProfileStore::put(const std::string& name, const nlohmann::json& profile, bool replace) const {
    if (name.empty()) {
        throw ConfigError("Profile name cannot be empty");
    }
    nlohmann::json root = load();
    if (!replace && root["profiles"].contains(name)) {
        throw ConfigError("Profile '" + name + "' already exists");
    }
    root["profiles"][name] = profile;
    store(root);
}

nlohmann::json ProfileStore::load() const {
    std::ifstream file(file_);
    if (!file.is_open()) {
        throw ConfigError("Could not open config file: " + file_.string());
    }

    nlohmann::json root;
    try {
        root = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Could not parse " + file_.string() + ": " + e.what());
    }

    if (!root.is_object() || !root.contains("profiles") || !root["profiles"].is_object()) {
        throw ConfigError("Could not get config root object from " + file_.string());
    }
    return root;
}

void ProfileStore::store(const nlohmann::json& root) const {
    std::ofstream file(file_, std::ios::trunc);
    if (!file.is_open()) {
        throw ConfigError("Could not write config file: " + file_.string());
    }
    file << root.dump(4) << "\n";
    if (!file) {
        throw ConfigError("Could not write config file: " + file_.string());
    }
}

const nlohmann::json& ProfileStore::profile_object(const nlohmann::json& root, const std::string& name) const {
    const nlohmann::json& profiles = root.at("profiles");
    auto it = profiles.find(name);
    if (it == profiles.end()) {
        throw ConfigError("Profile '" + name + "' does not exist");
    }
    if (!it->is_object()) {
        throw ConfigError("Expected profile '" + name + "' to be an object");
    }
    return *it;
}

} // namespace config
