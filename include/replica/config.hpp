#pragma once

/** \file config.hpp
 *  \brief Per-store configuration with environment overrides
 */

#include <cstdint>
#include <expected>
#include <string>

#include "replica/error.hpp"

namespace replica {

/** \brief Store configuration */
struct StoreConfig {
    std::string name{"store"};         /**< Component tag used in log lines */
    bool verbose{false};               /**< Log transfer transitions at debug level */
    bool verify_order{true};           /**< Check comparator consistency after merges */
    std::uint32_t paging_limit{25};    /**< Default page size for collection paging */
};

/** \brief Apply REPLICA_STORE_VERBOSE, REPLICA_VERIFY_ORDER and REPLICA_PAGING_LIMIT.
 *
 * Unset, empty or unparsable variables leave the field untouched.
 */
auto apply_env_overrides(StoreConfig& config) -> void;

/** \brief Defaults with environment overrides applied */
[[nodiscard]] auto config_from_env(std::string name = "store") -> StoreConfig;

/** \brief Reject configurations the stores cannot honor */
[[nodiscard]] auto validate(const StoreConfig& config) -> std::expected<void, core::error>;

} // namespace replica
