#include "panxfer/api/drive_client.hpp"
#include "panxfer/auth/auth_context.hpp"
#include "panxfer/core/config.hpp"
#include "panxfer/core/logging.hpp"
#include "panxfer/engine.hpp"
#include "panxfer/events/components.hpp"
#include "panxfer/events/event_bus.hpp"
#include "panxfer/events/progress.hpp"
#include "panxfer/events/progress_channel.hpp"
#include "panxfer/network/curl_transport.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [--config FILE] [--token TOKEN] <command> [args]\n"
              << "\n"
              << "Commands:\n"
              << "  login <user> <password>\n"
              << "  ls [folder_id]\n"
              << "  upload <folder_id> <path>\n"
              << "  download <file_id> <save_path> [folder_id]\n"
              << "  mkdir <parent_id> <name>\n"
              << "  rm <file_id>\n"
              << "  share <file_id>... [--pwd PASSWORD]\n"
              << "\n"
              << "The token may also come from PANXFER_TOKEN.\n";
}

std::optional<std::int64_t> parse_id(const std::string& text) {
    try {
        std::size_t consumed = 0;
        const auto value = std::stoll(text, &consumed);
        if (consumed != text.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

int report_failure(const panxfer::Error& error) {
    std::cerr << error.describe() << "\n";
    return 1;
}

void render_progress(const panxfer::events::ProgressEvent& event) {
    if (event.is_terminal()) {
        std::cout << "\r[" << panxfer::events::to_string(event.status) << "] " << event.id << " "
                  << event.bytes_transferred << " bytes";
        if (!event.message.empty()) {
            std::cout << " " << event.message;
        }
        std::cout << std::endl;
        return;
    }
    std::cout << "\r[" << panxfer::events::to_string(event.status) << "] " << event.id << " "
              << event.percent << "%" << std::flush;
}

std::string kind_label(panxfer::api::FileKind kind) {
    return kind == panxfer::api::FileKind::Folder ? "dir " : "file";
}

} // namespace

int main(int argc, char* argv[]) {
    std::optional<fs::path> config_path;
    std::string token;
    if (const char* env_token = std::getenv("PANXFER_TOKEN")) {
        token = env_token;
    }

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_path = fs::path(argv[++i]);
        } else if ((arg == "-t" || arg == "--token") && i + 1 < argc) {
            token = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            args.push_back(std::move(arg));
        }
    }
    if (args.empty()) {
        print_usage(argv[0]);
        return 2;
    }

    panxfer::core::ClientConfig config;
    if (config_path) {
        auto loaded = panxfer::core::load_config(*config_path);
        if (loaded.is_error()) {
            return report_failure(loaded.error());
        }
        config = std::move(loaded.value());
    }
    panxfer::core::setup_logging(config.log_level);

    panxfer::auth::AuthContext auth;
    if (!token.empty()) {
        // Accept both the raw token and a full header value
        auth.set_credential(token.rfind("Bearer ", 0) == 0 ? token : "Bearer " + token);
    }

    panxfer::network::CurlTransport transport(config);
    panxfer::api::DriveClient drive(transport, config, auth);

    const std::string& command = args[0];

    if (command == "login") {
        if (args.size() != 3) {
            print_usage(argv[0]);
            return 2;
        }
        auto signed_in = drive.sign_in(args[1], args[2]);
        if (signed_in.is_error()) {
            return report_failure(signed_in.error());
        }
        std::cout << auth.current_credential() << "\n";
        return 0;
    }

    if (command == "ls") {
        std::int64_t folder = 0;
        if (args.size() > 1) {
            auto parsed = parse_id(args[1]);
            if (!parsed) {
                std::cerr << "Invalid folder id: " << args[1] << "\n";
                return 2;
            }
            folder = *parsed;
        }
        auto listing = drive.list_directory(folder);
        if (listing.is_error()) {
            return report_failure(listing.error());
        }
        for (const auto& entry : listing.value()) {
            std::cout << kind_label(entry.kind) << "  " << entry.id << "  " << entry.size << "  " << entry.name << "\n";
        }
        return 0;
    }

    if (command == "mkdir" || command == "rm") {
        const std::size_t expected = command == "mkdir" ? 3 : 2;
        auto id = args.size() == expected ? parse_id(args[1]) : std::nullopt;
        if (!id) {
            print_usage(argv[0]);
            return 2;
        }
        auto done = command == "mkdir" ? drive.create_folder(*id, args[2]) : drive.trash(*id);
        if (done.is_error()) {
            return report_failure(done.error());
        }
        return 0;
    }

    if (command == "share") {
        std::vector<std::int64_t> ids;
        std::string password;
        for (std::size_t i = 1; i < args.size(); ++i) {
            if (args[i] == "--pwd" && i + 1 < args.size()) {
                password = args[++i];
                continue;
            }
            auto id = parse_id(args[i]);
            if (!id) {
                std::cerr << "Invalid file id: " << args[i] << "\n";
                return 2;
            }
            ids.push_back(*id);
        }
        auto link = drive.share(ids, password);
        if (link.is_error()) {
            return report_failure(link.error());
        }
        std::cout << link.value().url << "\n";
        if (!link.value().password.empty()) {
            std::cout << "password: " << link.value().password << "\n";
        }
        return 0;
    }

    if (command != "upload" && command != "download") {
        std::cerr << "Unknown command: " << command << "\n";
        print_usage(argv[0]);
        return 2;
    }

    panxfer::events::EventBus bus;
    panxfer::events::LoggerComponent logger(bus);
    panxfer::events::StatsComponent stats(bus);
    panxfer::events::ProgressChannel console(&render_progress);
    const auto bus_sink = panxfer::events::make_bus_sink(bus);
    const auto console_sink = console.sink();
    const panxfer::events::ProgressSink sink = [&](const panxfer::events::ProgressEvent& event) {
        bus_sink(event);
        console_sink(event);
    };

    panxfer::TransferEngine engine(config, auth, transport);
    int status = 0;

    if (command == "upload") {
        auto folder = args.size() == 3 ? parse_id(args[1]) : std::nullopt;
        if (!folder) {
            print_usage(argv[0]);
            return 2;
        }
        auto uploaded = engine.upload(*folder, fs::path(args[2]), sink);
        console.close();
        if (uploaded.is_error()) {
            status = report_failure(uploaded.error());
        } else {
            std::cout << "file id " << uploaded.value().file_id
                      << (uploaded.value().reused ? " (instant upload)" : "") << "\n";
        }
    } else {
        auto file_id = args.size() >= 3 ? parse_id(args[1]) : std::nullopt;
        auto folder = args.size() == 4 ? parse_id(args[3]) : std::optional<std::int64_t>(0);
        if (!file_id || !folder || args.size() > 4) {
            print_usage(argv[0]);
            return 2;
        }
        auto listing = drive.list_directory(*folder);
        if (listing.is_error()) {
            return report_failure(listing.error());
        }
        std::optional<panxfer::api::FileEntry> target;
        for (const auto& entry : listing.value()) {
            if (entry.id == *file_id) {
                target = entry;
                break;
            }
        }
        if (!target) {
            std::cerr << "No entry " << *file_id << " in folder " << *folder << "\n";
            return 1;
        }
        auto downloaded = engine.download(*target, fs::path(args[2]), sink);
        console.close();
        if (downloaded.is_error()) {
            status = report_failure(downloaded.error());
        }
    }

    stats.print_stats();
    return status;
}
