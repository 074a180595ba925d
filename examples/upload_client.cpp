#include "vidup/core/config.hpp"
#include "vidup/core/logging.hpp"
#include "vidup/events/components.hpp"
#include "vidup/events/event_bus.hpp"
#include "vidup/events/events.hpp"
#include "vidup/network/http_upload_api.hpp"
#include "vidup/upload/media_source.hpp"
#include "vidup/upload/resume_negotiator.hpp"
#include "vidup/upload/session_journal.hpp"
#include "vidup/upload/upload_controller.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using vidup::upload::UploadController;

namespace {

// Set while a transfer loop runs so Ctrl-C can pause it at the next chunk
std::atomic<UploadController*> g_active_controller{nullptr};

void handle_interrupt(int) {
    if (auto* controller = g_active_controller.load()) {
        controller->pause();
        return;
    }
    std::_Exit(130);
}

struct Options {
    std::string command;
    std::vector<std::string> positional;
    vidup::upload::UploadMetadata metadata;
    std::string key;
    std::optional<std::string> config_path;
    std::optional<std::string> host;
    std::optional<uint16_t> port;
    std::optional<std::uint64_t> chunk_size;
    std::optional<std::uint64_t> threshold;
    std::optional<std::string> journal_dir;
    std::optional<std::string> log_level;
    bool wait_ready = true;
};

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options] <command> [args]\n"
              << "Commands:\n"
              << "  upload <file>               Start a new resumable upload\n"
              << "  resume <session_id> <file>  Continue an existing session\n"
              << "  resume-key <key> <file>     Continue the session stored under a journal key\n"
              << "  status <session_id>         Show the server-side offset\n"
              << "  journal                     List journalled uploads\n"
              << "Options:\n"
              << "  --config <file>             JSON client configuration\n"
              << "  -H, --host <host>           Server host\n"
              << "  -p, --port <port>           Server port\n"
              << "  --title <text>              Video title\n"
              << "  --description <text>        Video description\n"
              << "  --key <key>                 Journal key (default: file name)\n"
              << "  --journal <dir>             Journal directory\n"
              << "  --chunk-size <bytes>        Override chunk size\n"
              << "  --threshold <bytes>         Override resumable threshold\n"
              << "  --no-wait                   Do not poll processing status after finish\n"
              << "  --log-level <level>         trace|debug|info|warn|error|off\n"
              << "Ctrl-C pauses the running upload after the in-flight chunk.\n";
}

std::optional<Options> parse_args(int argc, char* argv[]) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument("missing value for " + arg);
            }
            return argv[++i];
        };

        if (arg == "--config") {
            options.config_path = next();
        } else if (arg == "-H" || arg == "--host") {
            options.host = next();
        } else if (arg == "-p" || arg == "--port") {
            options.port = static_cast<uint16_t>(std::stoi(next()));
        } else if (arg == "--title") {
            options.metadata.title = next();
        } else if (arg == "--description") {
            options.metadata.description = next();
        } else if (arg == "--key") {
            options.key = next();
        } else if (arg == "--journal") {
            options.journal_dir = next();
        } else if (arg == "--chunk-size") {
            options.chunk_size = std::stoull(next());
        } else if (arg == "--threshold") {
            options.threshold = std::stoull(next());
        } else if (arg == "--no-wait") {
            options.wait_ready = false;
        } else if (arg == "--log-level") {
            options.log_level = next();
        } else if (arg == "-h" || arg == "--help") {
            return std::nullopt;
        } else if (options.command.empty()) {
            options.command = arg;
        } else {
            options.positional.push_back(arg);
        }
    }
    if (options.command.empty()) {
        return std::nullopt;
    }
    return options;
}

std::shared_ptr<vidup::upload::MediaSource> open_source(const std::string& path) {
    auto source = vidup::upload::FileMediaSource::open(path);
    if (source.is_error()) {
        spdlog::error("{}", source.error());
        return nullptr;
    }
    return std::shared_ptr<vidup::upload::MediaSource>(std::move(source.value()));
}

int report(const UploadController& controller, const vidup::upload::UploadResult<void>& result) {
    if (result.is_error()) {
        std::cerr << "Upload failed: " << result.error().describe() << "\n";
        if (!controller.session().session_id.empty()) {
            std::cerr << "Resume later with: resume " << controller.session().session_id << " <file>\n";
        }
        return 1;
    }
    if (controller.status() == vidup::upload::UploadStatus::Paused) {
        std::cout << "Paused at " << controller.session().offset << "/" << controller.session().total_size
                  << " bytes (" << controller.percent() << "%). Session: "
                  << controller.session().session_id << "\n";
        return 0;
    }
    std::cout << "Upload complete. Video id: " << controller.video_id() << "\n";
    return 0;
}

void wait_until_ready(vidup::network::HttpUploadApi& api, const std::string& session_id) {
    for (int attempt = 0; attempt < 30; ++attempt) {
        auto state = api.query_processing(session_id);
        if (state.is_error()) {
            spdlog::warn("Processing status unavailable: {}", state.error());
            return;
        }
        spdlog::info("Processing status: {}", vidup::upload::to_string(state.value()));
        if (state.value() != vidup::upload::ProcessingState::Processing) {
            return;
        }
        std::this_thread::sleep_for(std::chrono::seconds(2));
    }
}

int run_transfer(UploadController& controller,
                 const std::function<vidup::upload::UploadResult<void>()>& step) {
    g_active_controller.store(&controller);
    auto result = step();
    g_active_controller.store(nullptr);
    return report(controller, result);
}

} // namespace

int main(int argc, char* argv[]) {
    std::optional<Options> parsed;
    try {
        parsed = parse_args(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Invalid arguments: " << e.what() << "\n";
        return 1;
    }
    if (!parsed) {
        print_usage(argv[0]);
        return 1;
    }
    Options options = *parsed;

    vidup::ClientConfig config;
    if (options.config_path) {
        auto loaded = vidup::load_client_config(*options.config_path);
        if (loaded.is_error()) {
            std::cerr << "Failed to load config: " << loaded.error() << "\n";
            return 1;
        }
        config = loaded.value();
    }
    if (options.host) config.host = *options.host;
    if (options.port) config.port = *options.port;
    if (options.chunk_size) config.chunk_size = *options.chunk_size;
    if (options.threshold) config.resumable_threshold = *options.threshold;
    if (options.journal_dir) config.journal_dir = *options.journal_dir;
    if (options.log_level) config.log_level = *options.log_level;

    auto logging = vidup::configure_logging(config.log_level);
    if (logging.is_error()) {
        std::cerr << logging.error() << "\n";
        return 1;
    }

    vidup::events::EventBus event_bus;
    vidup::events::LoggerComponent logger(event_bus);
    vidup::events::MetricsComponent metrics(event_bus);
    event_bus.subscribe<vidup::events::UploadProgressEvent>([](const vidup::events::UploadProgressEvent& e) {
        std::cout << "\r" << e.percent << "% (" << e.offset << "/" << e.total_size << ")" << std::flush;
        if (e.offset == e.total_size) {
            std::cout << "\n";
        }
    });

    vidup::network::HttpUploadApi api(config);

    std::unique_ptr<vidup::upload::SessionJournal> journal;
    if (!config.journal_dir.empty()) {
        journal = std::make_unique<vidup::upload::SessionJournal>(config.journal_dir);
    }

    std::signal(SIGINT, handle_interrupt);

    int exit_code = 1;
    const auto& args = options.positional;

    if (options.command == "upload" && args.size() == 1) {
        auto source = open_source(args[0]);
        if (!source) {
            return 1;
        }
        UploadController controller(api, event_bus, config.upload_config());
        if (journal) {
            controller.attach_journal(journal.get(), options.key.empty() ? source->name() : options.key);
        }
        exit_code = run_transfer(controller, [&] {
            return controller.start_upload(source, options.metadata);
        });
        if (exit_code == 0 && controller.status() == vidup::upload::UploadStatus::Completed && options.wait_ready) {
            wait_until_ready(api, controller.session().session_id);
        }
    } else if ((options.command == "resume" || options.command == "resume-key") && args.size() == 2) {
        auto source = open_source(args[1]);
        if (!source) {
            return 1;
        }
        vidup::upload::ResumeNegotiator negotiator(api, event_bus, config.upload_config(), journal.get());
        auto controller = options.command == "resume"
            ? negotiator.resume(args[0], source, options.metadata)
            : negotiator.resume_from_journal(args[0], source, options.metadata);
        if (controller.is_error()) {
            std::cerr << "Resume failed: " << controller.error().describe() << "\n";
            return 1;
        }
        UploadController& active = *controller.value();
        if (journal && options.command == "resume") {
            active.attach_journal(journal.get(), options.key.empty() ? source->name() : options.key);
        }
        exit_code = run_transfer(active, [&] { return active.resume(); });
        if (exit_code == 0 && active.status() == vidup::upload::UploadStatus::Completed && options.wait_ready) {
            wait_until_ready(api, active.session().session_id);
        }
    } else if (options.command == "status" && args.size() == 1) {
        auto status = api.query_session(args[0]);
        if (status.is_error()) {
            std::cerr << "Status query failed: " << status.error() << "\n";
            return 1;
        }
        const auto& s = status.value();
        std::cout << s.file_name << ": " << s.start_offset << "/" << s.file_size << " bytes ("
                  << vidup::upload::ProgressReporter::percent(s.start_offset, s.file_size) << "%)\n";
        exit_code = 0;
    } else if (options.command == "journal") {
        if (!journal) {
            std::cerr << "No journal directory configured (use --journal)\n";
            return 1;
        }
        for (const auto& entry : journal->list()) {
            std::cout << entry.key << "  " << entry.session_id << "  " << entry.file_name << "  "
                      << entry.offset << "/" << entry.total_size << "  "
                      << vidup::upload::to_string(entry.status) << "\n";
        }
        exit_code = 0;
    } else {
        print_usage(argv[0]);
        return 1;
    }

    metrics.print_stats();
    return exit_code;
}
