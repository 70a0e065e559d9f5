#pragma once

/** \file collection_state.hpp
 *  \brief Coarse display state of one or more collections
 */

#include <cstdint>
#include <initializer_list>
#include <string_view>

namespace replica {

enum class CollectionState : std::uint8_t { Empty, NotEmpty, Pending };

[[nodiscard]] constexpr auto empty(CollectionState s) noexcept -> bool {
    return s == CollectionState::Empty;
}

/** \brief Nothing to show yet: empty or still loading. */
[[nodiscard]] constexpr auto empty_pending(CollectionState s) noexcept -> bool {
    return s != CollectionState::NotEmpty;
}

[[nodiscard]] constexpr auto not_empty(CollectionState s) noexcept -> bool {
    return s == CollectionState::NotEmpty;
}

[[nodiscard]] constexpr auto not_empty_pending(CollectionState s) noexcept -> bool {
    return s != CollectionState::Empty;
}

[[nodiscard]] constexpr auto pending(CollectionState s) noexcept -> bool {
    return s == CollectionState::Pending;
}

[[nodiscard]] constexpr auto collection_state_of(bool is_pending, bool is_empty) noexcept
    -> CollectionState {
    if (is_pending) return CollectionState::Pending;
    return is_empty ? CollectionState::Empty : CollectionState::NotEmpty;
}

/** \brief Any Pending wins, then any NotEmpty, else Empty. */
[[nodiscard]] constexpr auto combine_collection_states(std::initializer_list<CollectionState> states) noexcept
    -> CollectionState {
    auto combined = CollectionState::Empty;
    for (const auto s : states) {
        if (s == CollectionState::Pending) return CollectionState::Pending;
        if (s == CollectionState::NotEmpty) combined = CollectionState::NotEmpty;
    }
    return combined;
}

template <typename... States>
[[nodiscard]] constexpr auto combine_collection_states(CollectionState first, States... rest) noexcept
    -> CollectionState {
    return combine_collection_states({first, rest...});
}

[[nodiscard]] constexpr auto to_string(CollectionState s) noexcept -> std::string_view {
    switch (s) {
        case CollectionState::Empty: return "empty";
        case CollectionState::NotEmpty: return "not_empty";
        case CollectionState::Pending: return "pending";
    }
    return "unknown";
}

} // namespace replica
