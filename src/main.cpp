#include <cstdint>
#include <exception>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <filesystem>
#include "config.hpp"
#include "logger.hpp"
#include "networking.hpp"

namespace fs = std::filesystem;

namespace {

constexpr int EXIT_USAGE = 2;

struct Options {
    std::vector<std::string> args;   // positional
    std::string profile = "default";
    std::optional<fs::path> config_dir;
};

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " <command> [options]\n"
              << "Commands:\n"
              << "  serve                         Serve the profile's parity root\n"
              << "  count                         Ask the server how many files it offers\n"
              << "  fetch-index N                 Download the file at index N\n"
              << "  fetch NAME                    Download a file by name\n"
              << "  fetch-all                     Download every file\n"
              << "  disconnect                    Open and immediately end a session\n"
              << "  profile (server|client) list\n"
              << "  profile (server|client) show NAME\n"
              << "  profile (server|client) create NAME\n"
              << "  profile (server|client) rename OLD NEW\n"
              << "  profile (server|client) erase NAME\n"
              << "  profile (server|client) set NAME FIELD VALUE\n"
              << "  profile (server|client) path\n"
              << "Options:\n"
              << "  --profile NAME                Profile to use (default: default)\n"
              << "  --config-dir DIR              Config root (default: $XDG_CONFIG_HOME or ~/.config)\n"
              << "  --log-level LEVEL             debug, info, warn or error\n";
}

std::optional<Options> parse_args(int argc, char* argv[]) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            return std::nullopt;
        }
        if (arg == "--profile" && i + 1 < argc) {
            opts.profile = argv[++i];
        } else if (arg == "--config-dir" && i + 1 < argc) {
            opts.config_dir = fs::path(argv[++i]);
        } else if (arg == "--log-level" && i + 1 < argc) {
            std::string value = argv[++i];
            auto level = logging::parse_level(value);
            if (!level) {
                std::cerr << "Unknown log level: " << value << "\n";
                return std::nullopt;
            }
            logging::Logger::get().set_level(*level);
        } else if (arg.rfind("--", 0) == 0) {
            std::cerr << "Unknown or incomplete option: " << arg << "\n";
            return std::nullopt;
        } else {
            opts.args.push_back(arg);
        }
    }
    if (opts.args.empty()) {
        return std::nullopt;
    }
    return opts;
}

fs::path config_root(const Options& opts) {
    return opts.config_dir ? *opts.config_dir : config::config_dir();
}

config::ProfileStore server_store(const Options& opts) {
    config::ProfileStore store(config::ProfileStore::server_config(config_root(opts)));
    config::ServerProfile defaults;
    defaults.name = "default";
    store.init(defaults);
    return store;
}

config::ProfileStore client_store(const Options& opts) {
    config::ProfileStore store(config::ProfileStore::client_config(config_root(opts)));
    config::ClientProfile defaults;
    defaults.name = "default";
    store.init(defaults);
    return store;
}

void print_progress(const std::string& name, uint64_t done, uint64_t total, double speed_mbps) {
    int percent = (total > 0) ? static_cast<int>((done * 100.0) / total) : 100;
    std::cout << "\r" << name << ": " << percent << "% | "
              << std::fixed << std::setprecision(1) << speed_mbps << " MB/s | "
              << networking::format_size(done) << "/" << networking::format_size(total) << "    "
              << std::flush;
    if (done == total) {
        std::cout << "\n";
    }
}

// ─── serve ──────────────────────────────────────────────────────────────────

int run_server(const Options& opts) {
    config::ServerProfile profile = server_store(opts).get_server(opts.profile);
    config::ResolvedProfile resolved = config::resolve(profile);

    networking::Server server(resolved.host, resolved.port, resolved.parity_root);
    server.bind();
    server.run();
    return 0;
}

// ─── client requests ────────────────────────────────────────────────────────

std::optional<protocol::Request> request_from_args(const std::vector<std::string>& args) {
    const std::string& command = args[0];
    if (command == "count" && args.size() == 1) return protocol::Request::get_file_count();
    if (command == "fetch-all" && args.size() == 1) return protocol::Request::download_all_files();
    if (command == "disconnect" && args.size() == 1) return protocol::Request::disconnect();
    if (command == "fetch" && args.size() == 2) return protocol::Request::download_file_by_name(args[1]);
    if (command == "fetch-index" && args.size() == 2) {
        try {
            size_t consumed = 0;
            unsigned long long index = std::stoull(args[1], &consumed);
            if (consumed == args[1].size() && args[1][0] != '-') {
                return protocol::Request::download_file_by_index(index);
            }
        } catch (const std::exception&) {
            std::cerr << "Invalid index: " << args[1] << "\n";
            return std::nullopt;
        }
        std::cerr << "Invalid index: " << args[1] << "\n";
    }
    return std::nullopt;
}

int run_client(const Options& opts, const protocol::Request& request) {
    config::ClientProfile profile = client_store(opts).get_client(opts.profile);
    config::ResolvedProfile resolved = config::resolve(profile);

    boost::asio::io_context io_context;
    boost::asio::ip::tcp::socket socket = networking::connect(io_context, resolved.host, resolved.port);
    std::cout << "Established connection to " << resolved.host << ":" << resolved.port << "\n"
              << "Parity root: " << resolved.parity_root.string() << "\n";

    networking::ClientCallbacks callbacks;
    callbacks.on_status = [](const std::string& status) { std::cout << status << "\n"; };
    callbacks.on_progress = print_progress;

    networking::ClientReport report =
        networking::issue_request(std::move(socket), request, resolved.parity_root, callbacks);

    if (!report.ok()) {
        std::cerr << "Client terminated (ERROR): " << networking::to_string(report.error)
                  << ": " << report.message << "\n";
        return 1;
    }
    if (request.tag == protocol::RequestTag::GET_FILE_COUNT && report.file_count) {
        std::cout << "There are " << *report.file_count << " files\n";
    }
    for (const auto& file : report.files) {
        std::cout << "Downloaded " << file.string() << "\n";
    }
    std::cout << "Client terminated (OK)\n";
    return 0;
}

// ─── profile management ─────────────────────────────────────────────────────

template <typename Profile>
void print_profile(const Profile& profile, const std::string& host_label, const std::string& host,
                   const std::vector<std::string>& errors) {
    for (const auto& error : errors) {
        std::cout << "! " << error << "\n";
    }
    std::cout << "Profile: " << profile.name << "\n"
              << "Parity root: " << profile.parity_root << "\n"
              << "Port: " << profile.port << "\n"
              << host_label << ": " << host << "\n";
}

std::optional<uint16_t> parse_port(const std::string& text) {
    try {
        size_t consumed = 0;
        unsigned long value = std::stoul(text, &consumed);
        if (consumed == text.size() && value <= 65535 && text[0] != '-') {
            return static_cast<uint16_t>(value);
        }
    } catch (const std::exception&) {
    }
    return std::nullopt;
}

// Applies one field change after validating it. Returns an error message on refusal.
std::optional<std::string> set_field(std::string& parity_root, uint16_t& port, std::string& host,
                                     const std::string& host_field, const std::string& field,
                                     const std::string& value) {
    if (field == "parity_root") {
        std::string expanded = config::fill_path_placeholders(value);
        if (auto e = config::validate_directory(expanded)) return *e;
        parity_root = expanded;
    } else if (field == "port") {
        auto parsed = parse_port(value);
        if (!parsed) return "Invalid port: " + value;
        if (auto e = config::validate_port(*parsed)) return *e;
        port = *parsed;
    } else if (field == host_field) {
        if (auto e = config::validate_ipv4(value)) return *e;
        host = value;
    } else {
        return "Unknown field: " + field + " (expected parity_root, port or " + host_field + ")";
    }
    return std::nullopt;
}

int run_profile_command(const Options& opts) {
    const auto& args = opts.args;
    if (args.size() < 3 || (args[1] != "server" && args[1] != "client")) {
        return EXIT_USAGE;
    }
    bool server = args[1] == "server";
    config::ProfileStore store = server ? server_store(opts) : client_store(opts);
    const std::string& action = args[2];

    if (action == "path" && args.size() == 3) {
        std::cout << store.path().string() << "\n";
        return 0;
    }
    if (action == "list" && args.size() == 3) {
        for (const auto& name : store.names()) {
            std::cout << name << "\n";
        }
        return 0;
    }
    if (action == "show" && args.size() == 4) {
        if (server) {
            auto profile = store.get_server(args[3]);
            print_profile(profile, "Mask", profile.mask, config::validate(profile));
        } else {
            auto profile = store.get_client(args[3]);
            print_profile(profile, "IPv4", profile.ipv4, config::validate(profile));
        }
        return 0;
    }
    if (action == "create" && args.size() == 4) {
        if (server) {
            config::ServerProfile profile;
            profile.name = args[3];
            store.create(profile);
        } else {
            config::ClientProfile profile;
            profile.name = args[3];
            store.create(profile);
        }
        std::cout << "Profile '" << args[3] << "' created.\n";
        return 0;
    }
    if (action == "rename" && args.size() == 5) {
        store.rename(args[3], args[4]);
        std::cout << "Profile '" << args[3] << "' renamed to '" << args[4] << "'.\n";
        return 0;
    }
    if (action == "erase" && args.size() == 4) {
        store.erase(args[3]);
        std::cout << "Profile '" << args[3] << "' erased.\n";
        return 0;
    }
    if (action == "set" && args.size() == 6) {
        std::optional<std::string> refusal;
        if (server) {
            auto profile = store.get_server(args[3]);
            refusal = set_field(profile.parity_root, profile.port, profile.mask, "mask", args[4], args[5]);
            if (!refusal) store.save(profile);
        } else {
            auto profile = store.get_client(args[3]);
            refusal = set_field(profile.parity_root, profile.port, profile.ipv4, "ipv4", args[4], args[5]);
            if (!refusal) store.save(profile);
        }
        if (refusal) {
            std::cerr << "Not saved: " << *refusal << "\n";
            return 1;
        }
        std::cout << "Profile successfully saved.\n";
        return 0;
    }
    return EXIT_USAGE;
}

} // namespace

int main(int argc, char* argv[]) {
    std::optional<Options> opts = parse_args(argc, argv);
    if (!opts) {
        print_usage(argv[0]);
        return EXIT_USAGE;
    }

    try {
        const std::string& command = opts->args[0];
        int status;
        if (command == "serve" && opts->args.size() == 1) {
            status = run_server(*opts);
        } else if (command == "profile") {
            status = run_profile_command(*opts);
        } else if (auto request = request_from_args(opts->args)) {
            status = run_client(*opts, *request);
        } else {
            status = EXIT_USAGE;
        }

        if (status == EXIT_USAGE) {
            print_usage(argv[0]);
        }
        return status;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
