#pragma once

#include <compare>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace ratekeeper {

// ============================================================================
// Document model
// ============================================================================

using KvValue = std::variant<std::string, int64_t>;

/**
 * @brief One item: attribute name -> value. Every item has "pk" and "sk".
 */
using KvItem = std::map<std::string, KvValue>;

struct KvKey {
    std::string pk;
    std::string sk;

    auto operator<=>(const KvKey&) const = default;
};

inline constexpr const char* kKvPartitionAttr = "pk";
inline constexpr const char* kKvSortAttr = "sk";
inline constexpr const char* kKvIndexName = "gsi1";
inline constexpr const char* kKvIndexPartitionAttr = "gsi1pk";
inline constexpr const char* kKvIndexSortAttr = "gsi1sk";

// ============================================================================
// Errors
// ============================================================================

enum class KvErrorCode {
    RESOURCE_NOT_FOUND,        // Table (or index) does not exist
    CONDITIONAL_CHECK_FAILED,  // Single-item conditional write rejected
    TRANSACTION_CANCELED,      // Transaction rolled back; see cancellation_reasons()
    THROTTLED,
    OTHER
};

/**
 * @brief Error raised by a key-value client
 *
 * For TRANSACTION_CANCELED, cancellation_reasons() holds one code per
 * transaction item ("None", "ConditionalCheckFailed", ...).
 */
class KvError : public std::runtime_error {
public:
    KvError(KvErrorCode code, const std::string& message,
            std::vector<std::string> cancellation_reasons = {})
        : std::runtime_error(message)
        , code_(code)
        , cancellation_reasons_(std::move(cancellation_reasons)) {}

    [[nodiscard]] KvErrorCode code() const { return code_; }

    [[nodiscard]] const std::vector<std::string>& cancellation_reasons() const {
        return cancellation_reasons_;
    }

private:
    KvErrorCode code_;
    std::vector<std::string> cancellation_reasons_;
};

// ============================================================================
// Requests
// ============================================================================

/**
 * @brief Write condition evaluated against the existing item (if any)
 */
struct KvCondition {
    enum class Kind {
        NONE,
        NOT_EXISTS,              // attribute_not_exists(pk)
        NOT_EXISTS_OR_EXPIRED    // attribute_not_exists(pk) OR attribute <= threshold
    };

    Kind kind = Kind::NONE;
    std::string attribute;
    int64_t threshold = 0;
};

struct KvPut {
    KvItem item;
    KvCondition condition;
};

/**
 * @brief Key-condition query on the table or on the gsi1 index
 *
 * Results are ordered by the sort attribute (sk, or gsi1sk on the index).
 * A page holds at most `limit` items when set; last_evaluated_key is set
 * whenever more matching items may follow.
 */
struct KvQuery {
    bool use_index = false;
    std::string partition_value;
    std::optional<std::string> sort_at_least;   // sort >= value
    bool scan_forward = true;
    std::optional<size_t> limit;
    bool count_only = false;
    std::optional<KvItem> exclusive_start_key;
};

/**
 * @brief Full-table scan filtered to partition keys beginning with any prefix
 */
struct KvScan {
    std::vector<std::string> partition_prefixes;
    std::optional<size_t> limit;
    std::optional<KvItem> exclusive_start_key;
};

struct KvPage {
    std::vector<KvItem> items;
    size_t count = 0;
    std::optional<KvItem> last_evaluated_key;
};

enum class KvTableStatus {
    CREATING,
    ACTIVE
};

// ============================================================================
// Client interface
// ============================================================================

/**
 * @brief Minimal document-store client (pk/sk table with one gsi1 index)
 *
 * All calls throw KvError. A missing table surfaces as RESOURCE_NOT_FOUND.
 */
class IKeyValueClient {
public:
    virtual ~IKeyValueClient() = default;

    /**
     * @throws KvError CONDITIONAL_CHECK_FAILED when the condition is not met
     */
    virtual void put_item(const std::string& table, const KvPut& put) = 0;

    [[nodiscard]] virtual std::optional<KvItem> get_item(
        const std::string& table, const KvKey& key) = 0;

    virtual void delete_item(const std::string& table, const KvKey& key) = 0;

    /**
     * @brief All-or-nothing multi-item put
     * @throws KvError TRANSACTION_CANCELED with one reason per item
     */
    virtual void transact_put(const std::string& table, const std::vector<KvPut>& puts) = 0;

    /**
     * @brief Delete up to 25 keys
     * @return Keys the store did not process; the caller retries them
     */
    [[nodiscard]] virtual std::vector<KvKey> batch_delete(
        const std::string& table, const std::vector<KvKey>& keys) = 0;

    [[nodiscard]] virtual KvPage query(const std::string& table, const KvQuery& query) = 0;

    [[nodiscard]] virtual KvPage scan(const std::string& table, const KvScan& scan) = 0;

    /**
     * @return std::nullopt when the table does not exist
     */
    [[nodiscard]] virtual std::optional<KvTableStatus> describe_table(const std::string& table) = 0;

    /**
     * @brief Create a pk/sk table with the gsi1 (gsi1pk/gsi1sk) index
     */
    virtual void create_table(const std::string& table) = 0;

    /**
     * @brief Whether the store reclaims items by their `ttl` attribute itself
     */
    [[nodiscard]] virtual bool supports_native_ttl() const = 0;
};

// ============================================================================
// Item accessors
// ============================================================================

[[nodiscard]] inline std::optional<std::string> kv_get_string(const KvItem& item,
                                                              const std::string& attr) {
    const auto it = item.find(attr);
    if (it == item.end()) return std::nullopt;
    if (const auto* s = std::get_if<std::string>(&it->second)) return *s;
    return std::nullopt;
}

[[nodiscard]] inline std::optional<int64_t> kv_get_number(const KvItem& item,
                                                          const std::string& attr) {
    const auto it = item.find(attr);
    if (it == item.end()) return std::nullopt;
    if (const auto* n = std::get_if<int64_t>(&it->second)) return *n;
    return std::nullopt;
}

[[nodiscard]] inline std::optional<KvKey> kv_key_of(const KvItem& item) {
    auto pk = kv_get_string(item, kKvPartitionAttr);
    auto sk = kv_get_string(item, kKvSortAttr);
    if (!pk || !sk) return std::nullopt;
    return KvKey{std::move(*pk), std::move(*sk)};
}

} // namespace ratekeeper
