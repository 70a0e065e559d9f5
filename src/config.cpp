#include "replica/config.hpp"
#include "replica/core/platform_utils.hpp"

#include <charconv>
#include <limits>
#include <utility>

namespace replica {

namespace {

std::optional<std::uint32_t> parse_u32(const std::string& s) noexcept {
    std::uint64_t x{};
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), x);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    if (x > std::numeric_limits<std::uint32_t>::max()) return std::nullopt;
    return static_cast<std::uint32_t>(x);
}

} // anonymous namespace

auto apply_env_overrides(StoreConfig& config) -> void {
    if (auto v = core::getenv_nonempty("REPLICA_STORE_VERBOSE")) {
        if (auto b = core::parse_bool_ci(*v)) config.verbose = *b;
    }
    if (auto v = core::getenv_nonempty("REPLICA_VERIFY_ORDER")) {
        if (auto b = core::parse_bool_ci(*v)) config.verify_order = *b;
    }
    if (auto v = core::getenv_nonempty("REPLICA_PAGING_LIMIT")) {
        if (auto n = parse_u32(*v)) config.paging_limit = *n;
    }
}

auto config_from_env(std::string name) -> StoreConfig {
    StoreConfig config{};
    config.name = std::move(name);
    apply_env_overrides(config);
    return config;
}

auto validate(const StoreConfig& config) -> std::expected<void, core::error> {
    if (config.paging_limit == 0) {
        return std::unexpected(core::error{
            core::error_code::config_invalid,
            "paging_limit must be positive",
            "config.validate"
        });
    }
    if (config.name.empty()) {
        return std::unexpected(core::error{
            core::error_code::config_invalid,
            "store name must not be empty",
            "config.validate"
        });
    }
    return {};
}

} // namespace replica
