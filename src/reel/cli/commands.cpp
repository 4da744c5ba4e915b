// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/cli/commands.hpp>
#include <reel/cli/progress_bar.hpp>
#include <reel/core/coordinator.hpp>
#include <reel/core/error.hpp>
#include <reel/core/http_session.hpp>
#include <reel/core/url.hpp>
#include <reel/store/json_catalog.hpp>
#include <reel/version.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <map>
#include <mutex>
#include <set>

namespace reel::cli {

namespace fs = std::filesystem;
namespace chrono = std::chrono;

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void on_sigint(int) {
    g_interrupted = 1;
}

// curl_global_init / curl_global_cleanup for the lifetime of a command
struct CurlGlobal {
    CurlGlobal() { core::HttpSession::global_init(); }
    ~CurlGlobal() { core::HttpSession::global_cleanup(); }

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

// Terminal output for coordinator events. Events arrive on worker threads.
class Display {
public:
    Display(bool quiet, bool verbose) : quiet_(quiet), verbose_(verbose) {}

    [[nodiscard]] core::CoordinatorEvents events() {
        core::CoordinatorEvents ev;
        ev.on_unit_state = [this](const core::UnitEvent& e) { unit_state(e); };
        ev.on_item_progress = [this](const core::ItemProgress& p) { item_progress(p); };
        ev.on_item_completed = [this](const std::string& item_id) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (verbose_) {
                clear_line();
                spdlog::info("Item {} complete", item_id);
            }
        };
        return ev;
    }

    void finish() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (quiet_ || !drawn_) return;
        if (bar_.total() > 0) {
            bar_.finish();
        } else {
            spinner_.finish();
        }
    }

private:
    void unit_state(const core::UnitEvent& e) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (e.state == core::UnitState::error) {
            clear_line();
            spdlog::warn("{} failed: {}", e.target_path, e.error.message());
        } else if (verbose_) {
            clear_line();
            spdlog::info("{}: {} ({})", fs::path(e.target_path).filename().string(),
                         core::to_string(e.state), ProgressBar::format_bytes(e.bytes_done));
        }
    }

    void item_progress(const core::ItemProgress& p) {
        std::lock_guard<std::mutex> lock(mutex_);
        items_[p.item_id] = p;
        if (quiet_) return;

        // One line for everything in flight
        std::uint64_t done = 0;
        std::int64_t total = 0;
        for (const auto& [id, item] : items_) {
            done += item.bytes_done;
            if (item.bytes_total < 0 || total < 0) {
                total = core::UNKNOWN_SIZE;
            } else {
                total += item.bytes_total;
            }
        }

        drawn_ = true;
        if (total > 0) {
            bar_.total(static_cast<std::uint64_t>(total));
            bar_.update(done);
        } else {
            spinner_.update(ProgressBar::format_bytes(done));
        }
    }

    void clear_line() {
        if (!quiet_ && drawn_) {
            bar_.clear();
        }
    }

    bool quiet_;
    bool verbose_;
    bool drawn_{false};
    ProgressBar bar_{0, "Downloading"};
    Spinner spinner_;
    std::map<std::string, core::ItemProgress> items_;
    std::mutex mutex_;
};

// Wait for the coordinator to drain. The first Ctrl-C pauses everything.
bool run_until_idle(core::TaskCoordinator& coordinator) {
    bool interrupted = false;
    while (!coordinator.wait_idle_for(chrono::milliseconds(100))) {
        if (g_interrupted && !interrupted) {
            interrupted = true;
            spdlog::info("Interrupted, pausing transfers (partial files are kept)");
            coordinator.pause_all();
        }
    }
    return interrupted || g_interrupted != 0;
}

// Print one line per item and report whether all of them completed
bool print_summary(const core::TaskCoordinator& coordinator, bool quiet) {
    bool all_completed = true;
    for (const auto& item_id : coordinator.items()) {
        auto p = coordinator.progress(item_id);
        if (!p) continue;
        all_completed = all_completed && p->completed;
        if (quiet) continue;

        std::cout << item_id << ": " << p->completed_units << "/" << p->total_units << " done";
        if (p->stopped_units > 0) std::cout << ", " << p->stopped_units << " stopped";
        if (p->failed_units > 0) std::cout << ", " << p->failed_units << " failed";
        std::cout << ", " << ProgressBar::format_bytes(p->bytes_done) << std::endl;
    }
    return all_completed;
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) noexcept {
    CliArgs args;

    auto value_of = [&](int& i, std::string_view option) -> const char* {
        if (i + 1 < argc) {
            return argv[++i];
        }
        args.errors.push_back(std::string(option) + " needs a value");
        return nullptr;
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }

        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "-i" || arg == "--info") {
            args.info = true;
        } else if (arg == "--resume") {
            args.resume = true;
        } else if (arg == "-d" || arg == "--directory") {
            if (auto v = value_of(i, arg)) args.output_dir = v;
        } else if (arg == "-I" || arg == "--item") {
            if (auto v = value_of(i, arg)) args.item_id = v;
        } else if (arg == "--catalog") {
            if (auto v = value_of(i, arg)) args.catalog_path = v;
        } else if (arg == "--config") {
            if (auto v = value_of(i, arg)) args.config_path = v;
        } else if (arg == "-c" || arg == "--concurrency") {
            if (auto v = value_of(i, arg)) {
                char* end = nullptr;
                unsigned long n = std::strtoul(v, &end, 10);
                if (end == v || *end != '\0' || n == 0) {
                    args.errors.push_back("invalid concurrency: " + std::string(v));
                } else {
                    args.concurrency = static_cast<std::uint32_t>(n);
                }
            }
        } else if (arg.starts_with("-")) {
            args.errors.push_back("unknown option: " + arg);
        } else {
            args.urls.push_back(arg);
        }
    }

    return args;
}

std::expected<core::EngineConfig, std::error_code> load_config(const CliArgs& args) noexcept {
    core::EngineConfig config;
    if (!args.config_path.empty()) {
        auto loaded = core::EngineConfig::load(args.config_path);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        config = std::move(*loaded);
    }

    if (args.concurrency > 0) {
        config.concurrency_cap = args.concurrency;
    }
    if (!args.catalog_path.empty()) {
        config.catalog_path = args.catalog_path;
    }

    if (auto ec = config.validate()) {
        return std::unexpected(ec);
    }
    return config;
}

//=============================================================================
// Commands
//=============================================================================

std::expected<std::vector<core::ResourceSpec>, std::error_code>
plan_resources(const std::vector<std::string>& urls, const fs::path& dir) noexcept {
    try {
        std::vector<std::string> names;
        names.reserve(urls.size());
        std::map<std::string, std::set<std::string>> sources;   // File name -> distinct URLs
        for (const auto& url : urls) {
            auto parsed = core::Url::parse(url);
            if (!parsed) {
                std::cerr << "Error: invalid URL " << url << ": " << parsed.error().message() << std::endl;
                return std::unexpected(parsed.error());
            }
            names.push_back(parsed->filename());
            sources[names.back()].insert(url);
        }

        std::vector<core::ResourceSpec> resources;
        resources.reserve(urls.size());
        std::map<std::string, std::string> chosen;   // URL -> file name
        std::set<std::string> used;
        for (std::size_t i = 0; i < urls.size(); ++i) {
            const auto& url = urls[i];
            auto known = chosen.find(url);
            if (known == chosen.end()) {
                const std::string prefix = std::to_string(i + 1) + "-";
                std::string name = names[i];
                if (sources[name].size() > 1) {
                    name = prefix + name;
                }
                while (used.contains(name)) {
                    name = prefix + name;
                }
                used.insert(name);
                known = chosen.emplace(url, std::move(name)).first;
            }
            resources.push_back({url, (dir / known->second).string(), known->second});
        }
        return resources;
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

CliResult download(const CliArgs& args, const core::EngineConfig& config) noexcept {
    if (args.urls.empty()) {
        return std::unexpected(make_error_code(core::TransferErrc::invalid_url));
    }

    try {
        const fs::path dir = args.output_dir.empty() ? fs::current_path() : fs::path(args.output_dir);

        auto planned = plan_resources(args.urls, dir);
        if (!planned) {
            return std::unexpected(planned.error());
        }
        const auto& resources = *planned;
        const std::string item_id = args.item_id.empty() ? resources.front().track_ref : args.item_id;

        auto catalog = store::JsonCatalog::open(config.catalog_path);
        if (!catalog) {
            std::cerr << "Error: can't open catalog " << config.catalog_path << ": "
                      << catalog.error().message() << std::endl;
            return std::unexpected(catalog.error());
        }

        CurlGlobal curl;
        core::HttpSession session(core::HttpOptions::from(config));
        Display display(args.quiet, args.verbose);
        core::TaskCoordinator coordinator(config, session, **catalog, display.events());

        std::signal(SIGINT, on_sigint);

        if (auto ec = coordinator.enqueue_item(item_id, resources)) {
            std::cerr << "Error: " << ec.message() << std::endl;
            return std::unexpected(ec);
        }
        spdlog::debug("Item {}: {} resources into {}", item_id, resources.size(), dir.string());

        const bool interrupted = run_until_idle(coordinator);
        display.finish();
        const bool completed = print_summary(coordinator, args.quiet);
        coordinator.shutdown();

        if (interrupted) {
            std::cout << "Paused. Run again with --resume to continue." << std::endl;
            return EXIT_INTERRUPTED;
        }
        return completed ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return std::unexpected(std::make_error_code(std::errc::io_error));
    }
}

CliResult resume(const CliArgs& args, const core::EngineConfig& config) noexcept {
    try {
        auto catalog = store::JsonCatalog::open(config.catalog_path);
        if (!catalog) {
            std::cerr << "Error: can't open catalog " << config.catalog_path << ": "
                      << catalog.error().message() << std::endl;
            return std::unexpected(catalog.error());
        }

        CurlGlobal curl;
        core::HttpSession session(core::HttpOptions::from(config));
        Display display(args.quiet, args.verbose);
        core::TaskCoordinator coordinator(config, session, **catalog, display.events());

        std::signal(SIGINT, on_sigint);

        auto restored = coordinator.restore();
        if (!restored) {
            std::cerr << "Error: " << restored.error().message() << std::endl;
            return std::unexpected(restored.error());
        }
        if (*restored == 0) {
            if (!args.quiet) {
                std::cout << "Nothing to resume in " << config.catalog_path << std::endl;
            }
            return 0;
        }
        spdlog::info("Resuming {} items", *restored);

        const bool interrupted = run_until_idle(coordinator);
        display.finish();
        const bool completed = print_summary(coordinator, args.quiet);
        coordinator.shutdown();

        if (interrupted) {
            return EXIT_INTERRUPTED;
        }
        return completed ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return std::unexpected(std::make_error_code(std::errc::io_error));
    }
}

CliResult info(const std::string& url, const core::EngineConfig& config) noexcept {
    CurlGlobal curl;
    core::HttpSession session(core::HttpOptions::from(config));
    auto response = session.head(url);

    if (!response) {
        std::cout << "Error: " << response.error().message() << std::endl;
        return std::unexpected(response.error());
    }

    std::cout << "URL: " << url << std::endl;
    std::cout << "Status: " << response->status_code << std::endl;
    std::cout << "Content-Type: " << response->content_type << std::endl;
    if (response->content_length >= 0) {
        std::cout << "Content-Length: " << response->content_length << " ("
                  << ProgressBar::format_bytes(static_cast<std::uint64_t>(response->content_length)) << ")"
                  << std::endl;
    } else {
        std::cout << "Content-Length: unknown" << std::endl;
    }
    std::cout << "Accepts-Ranges: " << (response->accepts_ranges ? "yes" : "no") << std::endl;

    return 0;
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "reel " << reel::version.to_string() << " - resumable offline content downloader\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <URL>...\n";
    std::cout << "  " << program_name << " --resume [OPTIONS]\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help               Show this help message\n";
    std::cout << "  -v, --version            Show version information\n";
    std::cout << "  -V, --verbose            Log every unit transition\n";
    std::cout << "  -q, --quiet              No progress bar, errors only\n";
    std::cout << "  -d, --directory <DIR>    Save into DIR (default: current directory)\n";
    std::cout << "  -I, --item <ID>          Item id for the URLs (default: first file name)\n";
    std::cout << "  -c, --concurrency <N>    Transfers running at once (default: "
              << core::DEFAULT_CONCURRENCY_CAP << ")\n";
    std::cout << "      --catalog <FILE>     Catalog file (default: " << core::DEFAULT_CATALOG_PATH << ")\n";
    std::cout << "      --config <FILE>      JSON engine configuration\n";
    std::cout << "      --resume             Continue all unfinished items from the catalog\n";
    std::cout << "  -i, --info               Show resource info without downloading\n";
    std::cout << "\n";
    std::cout << "Ctrl-C pauses all transfers; partial files are kept for --resume.\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " -d album https://example.com/01.mp3 https://example.com/02.mp3\n";
    std::cout << "  " << program_name << " --resume\n";
}

void print_version() noexcept {
    std::cout << "reel " << reel::version.to_string() << " (built " << reel::BUILD_DATE << ")" << std::endl;
    std::cout << "Built with C++23, libcurl, spdlog, nlohmann::json\n";
}

} // namespace reel::cli
