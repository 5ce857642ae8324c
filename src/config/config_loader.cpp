#include "config/config_loader.hpp"
#include "core/error.hpp"
#include "core/resource_key.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace ratekeeper {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Replace every ${VAR_NAME} with the variable's value (empty if unset)
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t pos = 0;
    while (pos < input.size()) {
        if (input.compare(pos, 2, "${") != 0) {
            result += input[pos++];
            continue;
        }
        const size_t close = input.find('}', pos + 2);
        if (close == std::string::npos) {
            throw std::runtime_error(
                std::format("Unclosed env var substitution at position {}", pos));
        }
        const std::string name = input.substr(pos + 2, close - pos - 2);
        if (const char* value = std::getenv(name.c_str())) {
            result += value;
        }
        pos = close + 1;
    }
    return result;
}

void expand_node(toml::node& node);

void expand_table(toml::table& tbl) {
    for (auto&& [key, value] : tbl) {
        expand_node(value);
    }
}

void expand_node(toml::node& node) {
    if (auto* str = node.as_string()) {
        *str = expand_env_vars(str->get());
    } else if (auto* tbl = node.as_table()) {
        expand_table(*tbl);
    } else if (auto* arr = node.as_array()) {
        for (auto& elem : *arr) {
            expand_node(elem);
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_table(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_table(result);
    return result;
}

// Reads a non-negative integer; records an error and returns std::nullopt otherwise
std::optional<int64_t> read_non_negative(const toml::table& tbl, std::string_view key,
                                         const std::string& path,
                                         std::vector<std::string>& errors) {
    const auto node = tbl[key];
    if (!node) return std::nullopt;

    const auto value = node.value<int64_t>();
    if (!value) {
        errors.push_back(std::format("{}.{} must be an integer", path, key));
        return std::nullopt;
    }
    if (*value < 0) {
        errors.push_back(std::format("{}.{} must be non-negative, got {}", path, key, *value));
        return std::nullopt;
    }
    return value;
}

RateLimitConfig extract_rate_limit(const toml::table& tbl, RateLimitConfig base,
                                   const std::string& path,
                                   std::vector<std::string>& errors) {
    if (auto limit = read_non_negative(tbl, "limit", path, errors)) {
        if (*limit > static_cast<int64_t>(UINT32_MAX)) {
            errors.push_back(std::format("{}.limit is too large, got {}", path, *limit));
        } else {
            base.limit = static_cast<uint32_t>(*limit);
        }
    }
    if (auto window = read_non_negative(tbl, "window_ms", path, errors)) {
        base.window_ms = *window;
    }
    return base;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

std::optional<BackendKind> ConfigLoader::parse_backend(const std::string& name) {
    const std::string lower = utils::to_lower(name);
    if (lower == "memory") return BackendKind::MEMORY;
    if (lower == "sqlite") return BackendKind::SQLITE;
    if (lower == "kv" || lower == "dynamodb") return BackendKind::KV;
    return std::nullopt;
}

// ---- Section extractors ----------------------------------------------------

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

StoreConfig ConfigLoader::extract_store(const toml::table& root, std::vector<std::string>& errors) {
    StoreConfig cfg;
    cfg.adaptive_config = extract_adaptive(root);

    const auto* store = root["store"].as_table();
    if (!store) return cfg;
    const auto& s = *store;

    if (const auto name = s["backend"].value<std::string>()) {
        if (const auto kind = parse_backend(*name)) {
            cfg.backend = *kind;
        } else {
            errors.push_back(std::format(
                "store.backend must be one of memory, sqlite, kv; got '{}'", *name));
        }
    }
    cfg.adaptive = s["adaptive"].value_or(false);
    if (auto interval = read_non_negative(s, "cleanup_interval_ms", "store", errors)) {
        cfg.cleanup_interval_ms = *interval;
    }

    if (const auto* def = s["default"].as_table()) {
        cfg.default_config = extract_rate_limit(*def, cfg.default_config, "store.default", errors);
    }

    if (const auto* resources = s["resources"].as_array()) {
        for (size_t i = 0; i < resources->size(); ++i) {
            const auto* r = (*resources)[i].as_table();
            if (!r) continue;

            const std::string path = std::format("store.resources[{}]", i);
            const std::string name = (*r)["resource"].value_or(""s);
            try {
                ResourceKeyCodec::validate_resource(name);
            } catch (const ValidationError& e) {
                errors.push_back(std::format("{}.{}", path, e.what()));
                continue;
            }
            cfg.resource_configs[name] = extract_rate_limit(*r, cfg.default_config, path, errors);
        }
    }

    if (const auto* sqlite = s["sqlite"].as_table()) {
        cfg.sqlite.path = (*sqlite)["path"].value_or(cfg.sqlite.path);
        cfg.sqlite.auto_create_tables = (*sqlite)["auto_create_tables"].value_or(true);
        cfg.sqlite.busy_timeout_ms = (*sqlite)["busy_timeout_ms"].value_or(cfg.sqlite.busy_timeout_ms);
    }

    if (const auto* kv = s["kv"].as_table()) {
        cfg.kv.table = (*kv)["table"].value_or(cfg.kv.table);
        cfg.kv.ensure_table_exists = (*kv)["ensure_table_exists"].value_or(false);
    }

    return cfg;
}

AdaptiveConfig ConfigLoader::extract_adaptive(const toml::table& root) {
    AdaptiveConfig cfg;
    const auto* adaptive = root["adaptive"].as_table();
    if (!adaptive) return cfg;
    const auto& a = *adaptive;

    cfg.monitoring_window_ms = a["monitoring_window_ms"].value_or(cfg.monitoring_window_ms);
    cfg.high_activity_threshold = a["high_activity_threshold"].value_or(cfg.high_activity_threshold);
    cfg.moderate_activity_threshold =
        a["moderate_activity_threshold"].value_or(cfg.moderate_activity_threshold);
    cfg.recalculation_interval_ms =
        a["recalculation_interval_ms"].value_or(cfg.recalculation_interval_ms);
    cfg.sustained_inactivity_threshold_ms =
        a["sustained_inactivity_threshold_ms"].value_or(cfg.sustained_inactivity_threshold_ms);
    cfg.background_pause_on_increasing_trend =
        a["background_pause_on_increasing_trend"].value_or(cfg.background_pause_on_increasing_trend);
    cfg.max_user_scaling = a["max_user_scaling"].value_or(cfg.max_user_scaling);
    cfg.min_user_reserved = a["min_user_reserved"].value_or(cfg.min_user_reserved);
    return cfg;
}

// ---- Shared extraction + validation ----------------------------------------

RatekeeperConfig ConfigLoader::extract_all_sections(const toml::table& root,
                                                    std::vector<std::string>& errors) {
    RatekeeperConfig config;
    config.logging = extract_logging(root);
    config.store = extract_store(root, errors);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(RatekeeperConfig config,
                                                           std::vector<std::string> errors) {
    for (auto& err : validate_config(config)) {
        errors.push_back(std::move(err));
    }
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        std::vector<std::string> errors;
        auto config = extract_all_sections(tbl, errors);
        return validate_and_return(std::move(config), std::move(errors));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        std::vector<std::string> errors;
        auto config = extract_all_sections(tbl, errors);
        return validate_and_return(std::move(config), std::move(errors));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const RatekeeperConfig& config) {
    std::vector<std::string> errors;

    const auto level = utils::to_lower(config.logging.level);
    if (level != "debug" && level != "info" && level != "warn" && level != "warning" &&
        level != "error") {
        errors.push_back(std::format(
            "logging.level must be debug, info, warn or error; got '{}'", config.logging.level));
    }

    const auto& store = config.store;
    if (store.default_config.window_ms < 0) {
        errors.push_back("store.default.window_ms must be non-negative");
    }
    for (const auto& [resource, rc] : store.resource_configs) {
        if (rc.window_ms < 0) {
            errors.push_back(std::format("window_ms for '{}' must be non-negative", resource));
        }
    }

    if (store.backend == BackendKind::SQLITE && store.sqlite.path.empty()) {
        errors.push_back("store.sqlite.path must not be empty");
    }
    if (store.backend == BackendKind::KV && store.kv.table.empty()) {
        errors.push_back("store.kv.table must not be empty");
    }

    const auto& adaptive = store.adaptive_config;
    if (adaptive.max_user_scaling < 1.0) {
        errors.push_back(std::format(
            "adaptive.max_user_scaling must be >= 1.0, got {}", adaptive.max_user_scaling));
    }
    if (adaptive.monitoring_window_ms <= 0) {
        errors.push_back("adaptive.monitoring_window_ms must be > 0");
    }
    if (adaptive.recalculation_interval_ms < 0) {
        errors.push_back("adaptive.recalculation_interval_ms must be non-negative");
    }
    if (adaptive.sustained_inactivity_threshold_ms < 0) {
        errors.push_back("adaptive.sustained_inactivity_threshold_ms must be non-negative");
    }

    return errors;
}

} // namespace ratekeeper
