#include "config/config_loader.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "limiter/store_factory.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <format>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace ratekeeper;
using json = nlohmann::json;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitStore = 2;

void print_usage() {
    std::cerr <<
        "Usage: ratekeeper-admin [--config <file>] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  status <resource> [user|background]\n"
        "  wait-time <resource> [user|background]\n"
        "  record <resource> [user|background]\n"
        "  acquire <resource> [user|background]\n"
        "  reset <resource>\n"
        "  clear\n"
        "  cooldown-set <origin> <until_ms>\n"
        "  cooldown-get <origin>\n"
        "  cooldown-clear <origin>\n"
        "  stats\n";
}

class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

json status_to_json(const std::string& resource, const RateLimitStatus& status) {
    json out = {
        {"resource", resource},
        {"remaining", status.remaining},
        {"limit", status.limit},
        {"reset_time_ms", status.reset_time_ms},
    };
    if (status.adaptive) {
        const auto& a = *status.adaptive;
        out["adaptive"] = {
            {"user_reserved", a.user_reserved},
            {"background_max", a.background_max},
            {"background_paused", a.background_paused},
            {"recent_user_activity", a.recent_user_activity},
            {"reason", a.reason},
        };
    }
    return out;
}

json stats_to_json(const StoreStats& stats, const std::vector<ResourceUsage>& resources) {
    json list = json::array();
    for (const auto& r : resources) {
        list.push_back({
            {"resource", r.resource},
            {"request_count", r.request_count},
            {"limit", r.limit},
            {"window_ms", r.window_ms},
        });
    }
    return {
        {"total_requests", stats.total_requests},
        {"unique_resources", stats.unique_resources},
        {"rate_limited_resources", stats.rate_limited_resources},
        {"resources", std::move(list)},
    };
}

/**
 * @brief One command against either store flavour
 *
 * The non-adaptive store has no priorities; a priority argument is
 * rejected there rather than silently ignored.
 */
class AdminSession {
public:
    explicit AdminSession(const StoreConfig& config) {
        if (config.adaptive) {
            adaptive_ = create_adaptive_rate_limit_store(config);
        } else {
            plain_ = create_rate_limit_store(config);
        }
    }

    ~AdminSession() {
        if (adaptive_) adaptive_->close();
        if (plain_) plain_->close();
    }

    json run(const std::string& command, const std::vector<std::string>& args) {
        if (command == "status") {
            const auto& resource = arg(args, 0, "resource");
            const auto priority = priority_arg(args, 1);
            const auto status = adaptive_ ? adaptive_->get_status(resource, priority)
                                          : plain_->get_status(resource);
            return status_to_json(resource, status);
        }
        if (command == "wait-time") {
            const auto& resource = arg(args, 0, "resource");
            const auto priority = priority_arg(args, 1);
            const int64_t wait = adaptive_ ? adaptive_->get_wait_time(resource, priority)
                                           : plain_->get_wait_time(resource);
            return {{"resource", resource}, {"wait_time_ms", wait}};
        }
        if (command == "record") {
            const auto& resource = arg(args, 0, "resource");
            const auto priority = priority_arg(args, 1);
            if (adaptive_) adaptive_->record(resource, priority);
            else plain_->record(resource);
            return {{"resource", resource}, {"recorded", true}};
        }
        if (command == "acquire") {
            const auto& resource = arg(args, 0, "resource");
            const auto priority = priority_arg(args, 1);
            const bool acquired = adaptive_ ? adaptive_->acquire(resource, priority)
                                            : plain_->acquire(resource);
            return {{"resource", resource}, {"acquired", acquired}};
        }
        if (command == "reset") {
            const auto& resource = arg(args, 0, "resource");
            if (adaptive_) adaptive_->reset(resource);
            else plain_->reset(resource);
            return {{"resource", resource}, {"reset", true}};
        }
        if (command == "clear") {
            if (adaptive_) adaptive_->clear();
            else plain_->clear();
            return {{"cleared", true}};
        }
        if (command == "cooldown-set") {
            const auto& origin = arg(args, 0, "origin");
            const int64_t until = parse_int(arg(args, 1, "until_ms"), "until_ms");
            if (adaptive_) adaptive_->set_cooldown(origin, until);
            else plain_->set_cooldown(origin, until);
            return {{"origin", origin}, {"cooldown_until_ms", until}};
        }
        if (command == "cooldown-get") {
            const auto& origin = arg(args, 0, "origin");
            const auto until = adaptive_ ? adaptive_->get_cooldown(origin)
                                         : plain_->get_cooldown(origin);
            return {{"origin", origin},
                    {"cooldown_until_ms", until ? json(*until) : json(nullptr)}};
        }
        if (command == "cooldown-clear") {
            const auto& origin = arg(args, 0, "origin");
            if (adaptive_) adaptive_->clear_cooldown(origin);
            else plain_->clear_cooldown(origin);
            return {{"origin", origin}, {"cleared", true}};
        }
        if (command == "stats") {
            if (adaptive_) return stats_to_json(adaptive_->get_stats(), adaptive_->list_resources());
            return stats_to_json(plain_->get_stats(), plain_->list_resources());
        }
        throw UsageError(std::format("Unknown command '{}'", command));
    }

private:
    static const std::string& arg(const std::vector<std::string>& args, size_t index,
                                  const char* name) {
        if (index >= args.size()) {
            throw UsageError(std::format("Missing argument <{}>", name));
        }
        return args[index];
    }

    std::optional<Priority> priority_arg(const std::vector<std::string>& args, size_t index) const {
        if (index >= args.size()) return std::nullopt;
        const auto priority = parse_priority(args[index]);
        if (!priority) {
            throw UsageError(std::format("Unknown priority '{}' (expected user or background)",
                args[index]));
        }
        if (!adaptive_) {
            throw UsageError("Priorities require [store] adaptive = true");
        }
        return priority;
    }

    static int64_t parse_int(const std::string& text, const char* name) {
        try {
            size_t consumed = 0;
            const long long value = std::stoll(text, &consumed);
            if (consumed != text.size()) {
                throw UsageError(std::format("<{}> must be an integer, got '{}'", name, text));
            }
            return value;
        } catch (const std::logic_error&) {
            throw UsageError(std::format("<{}> must be an integer, got '{}'", name, text));
        }
    }

    std::unique_ptr<RateLimitStore> plain_;
    std::unique_ptr<AdaptiveRateLimitStore> adaptive_;
};

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::optional<std::string> config_file;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        const std::string current = argv[i];
        if (current == "--config") {
            if (i + 1 >= argc) {
                print_usage();
                return kExitUsage;
            }
            config_file = argv[++i];
        } else if (current == "-h" || current == "--help") {
            print_usage();
            return kExitOk;
        } else {
            positional.push_back(current);
        }
    }

    if (positional.empty()) {
        print_usage();
        return kExitUsage;
    }

    RatekeeperConfig config;
    if (config_file) {
        auto result = ConfigLoader::load_from_file(*config_file);
        if (!result.success) {
            utils::log::error(result.error_message);
            return kExitUsage;
        }
        config = std::move(result.config);
    } else if (const char* env_path = std::getenv("RATEKEEPER_CONFIG")) {
        auto result = ConfigLoader::load_from_file(env_path);
        if (!result.success) {
            utils::log::error(result.error_message);
            return kExitUsage;
        }
        config = std::move(result.config);
    }
    utils::log::set_level(utils::log::parse_level(config.logging.level));

    const std::string command = positional.front();
    const std::vector<std::string> args(positional.begin() + 1, positional.end());

    try {
        AdminSession session(config.store);
        std::cout << session.run(command, args).dump(2) << '\n';
    } catch (const UsageError& e) {
        utils::log::error(e.what());
        print_usage();
        return kExitUsage;
    } catch (const RateLimitError& e) {
        std::cout << json{{"error", e.what()},
                          {"category", error_category_to_string(e.category())}}.dump(2) << '\n';
        return kExitStore;
    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return kExitStore;
    }

    return kExitOk;
}
