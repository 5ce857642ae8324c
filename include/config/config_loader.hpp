#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <optional>
#include <string>
#include <vector>

namespace ratekeeper {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        RatekeeperConfig config;

        static LoadResult ok(RatekeeperConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to ratekeeper.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Every problem found, empty when the config is usable
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const RatekeeperConfig& config);

    /**
     * @brief "memory" | "sqlite" | "kv" (case-insensitive)
     */
    [[nodiscard]] static std::optional<BackendKind> parse_backend(const std::string& name);

private:
    static LoggingConfig extract_logging(const toml::table& root);
    static StoreConfig extract_store(const toml::table& root, std::vector<std::string>& errors);
    static AdaptiveConfig extract_adaptive(const toml::table& root);

    static RatekeeperConfig extract_all_sections(const toml::table& root,
                                                 std::vector<std::string>& errors);
    static LoadResult validate_and_return(RatekeeperConfig config,
                                          std::vector<std::string> errors);
};

} // namespace ratekeeper
