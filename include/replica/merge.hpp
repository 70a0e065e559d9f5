#pragma once

/** \file merge.hpp
 *  \brief Ready-made merge policies for CollectionStore::load_merge
 */

#include <algorithm>
#include <iterator>
#include <utility>
#include <vector>

#include "replica/collection_store.hpp"

namespace replica::merge {

/** \brief The incoming items replace the current ones. */
template <typename E>
[[nodiscard]] auto replace_all() -> MergeFn<E> {
    return [](StatusCode, std::vector<E> incoming, const std::vector<E>&) { return incoming; };
}

/**
 * \brief Incoming items replace the current items they match; local-only items are kept.
 *
 * \param same identity test, e.g. `[](const Task& a, const Task& b) { return a.id == b.id; }`
 */
template <typename E, typename Same>
[[nodiscard]] auto upsert(Same same) -> MergeFn<E> {
    return [same = std::move(same)](StatusCode, std::vector<E> incoming, const std::vector<E>& current) {
        std::vector<E> merged;
        merged.reserve(current.size() + incoming.size());
        for (const auto& local : current) {
            const bool superseded = std::any_of(incoming.begin(), incoming.end(),
                                                [&](const E& remote) { return same(local, remote); });
            if (!superseded) merged.push_back(local);
        }
        merged.insert(merged.end(), std::make_move_iterator(incoming.begin()),
                      std::make_move_iterator(incoming.end()));
        return merged;
    };
}

} // namespace replica::merge
