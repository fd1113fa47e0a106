#include "config.hpp"
#include "clock.hpp"
#include "event_bus.hpp"
#include "event.hpp"
#include "runtime.hpp"
#include "state/unified_diff.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <vector>

static void print_usage() {
    std::cout << "Usage: tollgate [options] <command> [args]\n"
              << "\n"
              << "Commands:\n"
              << "  review TASK_ID       Show dry-run state, safety checks and proposed diffs\n"
              << "  quota                Show the remaining quota estimate\n"
              << "  cache get KEY        Print the cached value for KEY\n"
              << "  cache invalidate KEY Remove KEY from every cache tier\n"
              << "  purge                Remove expired cache entries\n"
              << "\n"
              << "Options:\n"
              << "  --config PATH        Use PATH instead of ~/.tollgate/config.json\n"
              << "  -v, --verbose        Log cache hits and misses to stderr\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Exit status of review: 0 all checks passed, 2 checks failed or missing,\n"
              << "1 task not found.\n"
              << "\n"
              << "Environment variables:\n"
              << "  REDIS_URL            Shared store URL (redis://[:password@]host[:port][/db])\n"
              << "  RATE_LIMIT_REQUESTS  Calls allowed per period\n"
              << "  RATE_LIMIT_PERIOD    Quota period in seconds\n"
              << "  TOLLGATE_CACHE_DIR   Directory of the disk cache tier\n";
}

static int run_review(tollgate::Runtime& rt, const std::string& task_id) {
    auto state = rt.tracker().get_state(task_id);
    if (!state) {
        std::cerr << "Task not found: " << task_id << "\n";
        return 1;
    }

    std::cout << "Task: " << state->task_id << "\n"
              << "Mode: " << (state->dry_run ? "dry run" : "live") << "\n"
              << "Safety checks:\n";
    if (state->safety_checks.empty()) {
        std::cout << "  (none recorded)\n";
    }
    for (const auto& [name, passed] : state->safety_checks) {
        std::cout << "  " << (passed ? "PASS " : "FAIL ") << name << "\n";
    }

    std::cout << "Proposed changes: " << state->diffs.size() << "\n";
    for (const auto& diff : state->diffs) {
        std::cout << "\n";
        if (diff.metadata.contains("tool") && diff.metadata["tool"].is_string()) {
            std::cout << "# " << diff.path << " (via "
                      << diff.metadata["tool"].get<std::string>() << ")\n";
        }
        std::string rendered = tollgate::unified_diff(diff.original, diff.proposed, diff.path);
        std::cout << (rendered.empty() ? "(no changes)\n" : rendered);
    }

    return state->all_checks_passed() ? 0 : 2;
}

static int run_cache(tollgate::Runtime& rt, const std::vector<std::string>& args) {
    if (args.size() != 2) {
        print_usage();
        return 1;
    }
    const std::string& action = args[0];
    const std::string& key = args[1];

    if (action == "get") {
        auto value = rt.cache().get(key);
        if (!value) {
            std::cerr << "Miss: " << key << "\n";
            return 1;
        }
        std::cout << value->dump(2) << "\n";
        return 0;
    }
    if (action == "invalidate") {
        rt.cache().invalidate(key);
        std::cout << "Invalidated " << key << "\n";
        return 0;
    }

    std::cerr << "Unknown cache action: " << action << "\n";
    return 1;
}

int main(int argc, char* argv[]) try {
    std::string config_path;
    bool verbose = false;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else if (argv[i][0] == '-') {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        } else {
            positional.emplace_back(argv[i]);
        }
    }

    if (positional.empty()) {
        print_usage();
        return 1;
    }

    auto config = config_path.empty() ? tollgate::Config::load()
                                      : tollgate::Config::load_from(config_path);

    tollgate::SystemClock clock;
    tollgate::EventBus bus;
    if (verbose) {
        tollgate::subscribe<tollgate::CacheHitEvent>(bus,
            [](const tollgate::CacheHitEvent& ev) {
                std::cerr << "[cache] hit " << ev.key << " in " << ev.tier << "\n";
            });
        tollgate::subscribe<tollgate::CacheMissEvent>(bus,
            [](const tollgate::CacheMissEvent& ev) {
                std::cerr << "[cache] miss " << ev.key << "\n";
            });
    }

    auto rt = tollgate::Runtime::create(config, clock, &bus);

    const std::string& command = positional[0];
    std::vector<std::string> args(positional.begin() + 1, positional.end());

    if (command == "review" && args.size() == 1) {
        return run_review(*rt, args[0]);
    } else if (command == "quota" && args.empty()) {
        std::cout << "Remaining: " << rt->limiter().remaining_estimate()
                  << " of " << config.quota.requests << " per "
                  << config.quota.period << "s"
                  << (rt->limiter().coordinated() ? " (shared)" : " (local)") << "\n";
        return 0;
    } else if (command == "cache") {
        return run_cache(*rt, args);
    } else if (command == "purge" && args.empty()) {
        uint32_t removed = rt->cache().purge_expired();
        std::cout << "Purged " << removed << " expired entries\n";
        return 0;
    }

    std::cerr << "Unknown command: " << command << "\n";
    print_usage();
    return 1;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
