#pragma once

/** \file collection_store.hpp
 *  \brief Comparator-ordered collection of remotely sourced records
 *
 *  The items are kept sorted by a caller-supplied comparator at all times.
 *  Insertion finds its position by binary search (after any equal items, so
 *  equal items keep encounter order). Loads go through load_merge(), which lets
 *  a caller-supplied policy combine incoming and current items and re-sorts the
 *  result.
 *
 *  Example usage:
 *  ```cpp
 *  CollectionStore<Task> tasks([](const Task& a, const Task& b) { return a.due <=> b.due; });
 *  tasks.start();
 *  auto ok = tasks.load_merge(StatusCode::Ok, std::move(decoded), merge::replace_all<Task>());
 *  ```
 *
 *  Thread-safety: none; a store has a single logical owner.
 */

#include <algorithm>
#include <compare>
#include <cstddef>
#include <expected>
#include <functional>
#include <iterator>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "replica/collection_state.hpp"
#include "replica/config.hpp"
#include "replica/error.hpp"
#include "replica/log.hpp"
#include "replica/messages.hpp"
#include "replica/signal.hpp"
#include "replica/status_code.hpp"
#include "replica/transfer_state.hpp"
#include "replica/transport.hpp"

namespace replica {

template <typename E>
using Comparator = std::function<std::weak_ordering(const E&, const E&)>;

/** \brief Merge policy: (status, incoming, current) -> new items (sorted afterwards by the store). */
template <typename E>
using MergeFn = std::function<std::vector<E>(StatusCode, std::vector<E>, const std::vector<E>&)>;

template <typename E>
class CollectionStore {
public:
    using value_type = E;
    using Operation = TransferState::Operation;
    using ItemsSlot = typename Signal<std::vector<E>>::Slot;

    explicit CollectionStore(Comparator<E> cmp, StoreConfig config = {})
        : config_(std::move(config))
        , cmp_(std::move(cmp))
        , paging_{config_.paging_limit, std::nullopt, std::nullopt} {}

    /** \brief Order by `<=>`. */
    explicit CollectionStore(StoreConfig config = {})
        requires std::three_way_comparable<E, std::weak_ordering>
        : CollectionStore(Comparator<E>([](const E& a, const E& b) -> std::weak_ordering { return a <=> b; }),
                          std::move(config)) {}

    /** \brief Construct after validating `config`. */
    [[nodiscard]] static auto create(Comparator<E> cmp, StoreConfig config)
        -> std::expected<CollectionStore, core::error> {
        if (auto ok = validate(config); !ok) return std::unexpected(ok.error());
        if (!cmp) {
            return std::unexpected(core::error{core::error_code::invalid_argument,
                                               "comparator is empty", "collection.create"});
        }
        return CollectionStore(std::move(cmp), std::move(config));
    }

    CollectionStore(CollectionStore&&) noexcept = default;
    CollectionStore& operator=(CollectionStore&&) = default;
    CollectionStore(const CollectionStore&) = delete;
    CollectionStore& operator=(const CollectionStore&) = delete;

    // ---- ordered edits --------------------------------------------------------

    /** \brief Insert at the comparator position, after equal items; returns the index. */
    auto insert(E item) -> std::size_t {
        const auto index = insert_sorted(std::move(item));
        publish_items();
        return index;
    }

    /** \brief Replace the first comparator-equal item, or insert when there is none. */
    auto set_or_insert(E item) -> std::size_t {
        auto it = std::lower_bound(items_.begin(), items_.end(), item, less());
        std::size_t index = static_cast<std::size_t>(std::distance(items_.begin(), it));
        if (it != items_.end() && std::is_eq(cmp_(*it, item))) {
            *it = std::move(item);
        } else {
            items_.insert(it, std::move(item));
        }
        publish_items();
        return index;
    }

    /** \brief Replace the first item matching `pred` and move it to its new position. */
    template <typename Pred>
    auto set(Pred&& pred, E item) -> bool {
        auto it = std::find_if(items_.begin(), items_.end(), std::forward<Pred>(pred));
        if (it == items_.end()) return false;
        items_.erase(it);
        insert_sorted(std::move(item));
        publish_items();
        return true;
    }

    /** \brief Like set(), inserting when nothing matches; returns the final index. */
    template <typename Pred>
    auto upsert(Pred&& pred, E item) -> std::size_t {
        auto it = std::find_if(items_.begin(), items_.end(), std::forward<Pred>(pred));
        if (it != items_.end()) items_.erase(it);
        const auto index = insert_sorted(std::move(item));
        publish_items();
        return index;
    }

    /** \brief Remove every item matching `pred`; returns how many were removed. */
    template <typename Pred>
    auto remove(Pred&& pred) -> std::size_t {
        const auto removed = std::erase_if(items_, std::forward<Pred>(pred));
        if (removed > 0) publish_items();
        return removed;
    }

    /** \brief Swap in `items` (sorted here) and return the previous items. */
    auto replace(std::vector<E> items) -> std::vector<E> {
        std::stable_sort(items.begin(), items.end(), less());
        auto previous = std::exchange(items_, std::move(items));
        publish_items();
        return previous;
    }

    // ---- transfer lifecycle -------------------------------------------------

    auto start(Operation op = Operation::Load) -> void {
        auto next = transfer_state_.get();
        next.start(op);
        if (config_.verbose) {
            log::line(log::Level::Debug, config_.name, "start ", describe(next));
        }
        apply(next, std::nullopt, false);
    }

    /**
     * \brief Apply the outcome of a load.
     *
     * Items change only when `status` is a success and `payload` is present; then
     * `merge` is called exactly once and its stable-sorted result becomes the
     * items. The transfer state becomes Done(status) and the messages are replaced
     * in every case.
     *
     * \return invalid_argument when a merge is needed but `merge` is empty,
     *         precondition_failed when the comparator does not order the merged
     *         items consistently; the items are left untouched in both cases
     */
    [[nodiscard]] auto load_merge(StatusCode status, std::optional<std::vector<E>> payload,
                                  const MergeFn<E>& merge, Messages messages = {})
        -> std::expected<void, core::error> {
        std::expected<void, core::error> outcome{};
        bool changed = false;
        if (is_success(status) && payload) {
            if (!merge) {
                outcome = std::unexpected(core::error{core::error_code::invalid_argument,
                                                      "merge function is empty", "collection.load_merge"});
            } else {
                auto merged = merge(status, std::move(*payload), items_);
                if (auto sorted = sort_checked(merged); sorted) {
                    items_ = std::move(merged);
                    changed = true;
                } else {
                    outcome = std::unexpected(sorted.error());
                }
            }
            if (!outcome) {
                log::line(log::Level::Warn, config_.name, core::describe(outcome.error()));
            }
        } else if (config_.verbose && is_success(status)) {
            log::line(log::Level::Debug, config_.name, "load without collection, items kept");
        }
        if (is_failure(status) && messages.empty()) {
            messages = TransferFailure(status).effective_messages();
        }
        if (config_.verbose) {
            log::line(log::Level::Debug, config_.name, "load completed: ", to_string(status));
        }
        apply(finished(Operation::Load, status), std::move(messages), changed);
        return outcome;
    }

    /** \brief load_merge() for a full response; paging is taken from successful responses. */
    [[nodiscard]] auto load_response(StatusCode status, CollectionResponse<E> response, const MergeFn<E>& merge)
        -> std::expected<void, core::error> {
        if (is_success(status)) paging_ = std::move(response.paging);
        return load_merge(status, std::move(response.collection), merge, std::move(response.messages));
    }

    auto load_failure(const TransferFailure& failure) -> void {
        fail(Operation::Load, failure);
    }

    /** \brief Outcome of storing the collection; the items are never touched. */
    auto store_result(std::expected<void, TransferFailure> result) -> void {
        if (!result) {
            fail(Operation::Store, result.error());
            return;
        }
        if (config_.verbose) {
            log::line(log::Level::Debug, config_.name, "store completed: ok");
        }
        apply(finished(Operation::Store, StatusCode::Ok), Messages{}, false);
    }

    auto set_transfer_state(std::optional<StatusCode> status) -> void {
        auto next = transfer_state_.get();
        next.set_transfer_state(status);
        apply(next, std::nullopt, false);
    }

    auto reset_transfer_error() -> void {
        auto next = transfer_state_.get();
        next.reset_error();
        apply(next, std::nullopt, false);
    }

    /** \brief Forget the transfer status (forcing the next load) but keep the items. */
    auto invalidate() -> void {
        apply(TransferState{}, std::nullopt, false);
    }

    [[nodiscard]] auto needs_load() const -> bool {
        if (transfer_state_.get().loaded()) {
            if (config_.verbose) {
                log::line(log::Level::Debug, config_.name, "load skipped, using cache");
            }
            return false;
        }
        return true;
    }

    /** \brief Back to the freshly constructed state; the comparator is kept. */
    auto reset() -> void {
        const bool changed = !items_.empty();
        items_.clear();
        paging_ = Paging{config_.paging_limit, std::nullopt, std::nullopt};
        apply(TransferState{}, Messages{}, changed);
    }

    // ---- reads ----------------------------------------------------------------

    [[nodiscard]] auto items() const noexcept -> const std::vector<E>& { return items_; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return items_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return items_.empty(); }
    [[nodiscard]] auto paging() const noexcept -> const Paging& { return paging_; }
    [[nodiscard]] auto transfer_state() const noexcept -> const TransferState& { return transfer_state_.get(); }
    [[nodiscard]] auto messages() const noexcept -> const Messages& { return messages_; }
    [[nodiscard]] auto messages() noexcept -> Messages& { return messages_; }
    [[nodiscard]] auto config() const noexcept -> const StoreConfig& { return config_; }
    [[nodiscard]] auto comparator() const noexcept -> const Comparator<E>& { return cmp_; }
    [[nodiscard]] auto pending() const noexcept -> bool { return transfer_state_.get().is_pending(); }
    [[nodiscard]] auto collection_state() const noexcept -> CollectionState { return state_.get(); }

    template <typename Pred>
    [[nodiscard]] auto find(Pred&& pred) const -> std::optional<E> {
        auto it = std::find_if(items_.begin(), items_.end(), std::forward<Pred>(pred));
        if (it == items_.end()) return std::nullopt;
        return *it;
    }

    /** \brief First engaged result of `f` over the items. */
    template <typename F>
    [[nodiscard]] auto find_map(F&& f) const -> std::invoke_result_t<F, const E&> {
        for (const auto& item : items_) {
            if (auto mapped = std::invoke(f, item)) return mapped;
        }
        return std::nullopt;
    }

    template <typename Pred>
    [[nodiscard]] auto any(Pred&& pred) const -> bool {
        return std::any_of(items_.begin(), items_.end(), std::forward<Pred>(pred));
    }

    template <typename Pred>
    [[nodiscard]] auto all(Pred&& pred) const -> bool {
        return std::all_of(items_.begin(), items_.end(), std::forward<Pred>(pred));
    }

    /** \brief Whether an item comparator-equal to `item` is present. */
    [[nodiscard]] auto contains(const E& item) const -> bool {
        return std::binary_search(items_.begin(), items_.end(), item, less());
    }

    // ---- signals --------------------------------------------------------------

    [[nodiscard]] auto subscribe_items(ItemsSlot slot) const -> Subscription {
        return items_changed_.subscribe(std::move(slot));
    }
    [[nodiscard]] auto transfer_state_signal() const noexcept -> const Observable<TransferState>& {
        return transfer_state_;
    }
    [[nodiscard]] auto pending_signal() const noexcept -> const Observable<bool>& { return pending_; }
    [[nodiscard]] auto empty_signal() const noexcept -> const Observable<bool>& { return empty_; }
    [[nodiscard]] auto collection_state_signal() const noexcept -> const Observable<CollectionState>& {
        return state_;
    }

private:
    auto less() const {
        return [this](const E& a, const E& b) { return std::is_lt(cmp_(a, b)); };
    }

    auto insert_sorted(E item) -> std::size_t {
        auto it = std::upper_bound(items_.begin(), items_.end(), item, less());
        const auto index = static_cast<std::size_t>(std::distance(items_.begin(), it));
        items_.insert(it, std::move(item));
        return index;
    }

    auto sort_checked(std::vector<E>& items) const -> std::expected<void, core::error> {
        std::stable_sort(items.begin(), items.end(), less());
        if (!config_.verify_order) return {};
        for (std::size_t i = 1; i < items.size(); ++i) {
            const auto forward = cmp_(items[i - 1], items[i]);
            const auto backward = cmp_(items[i], items[i - 1]);
            const bool consistent = std::is_lteq(forward) &&
                                    (std::is_eq(forward) == std::is_eq(backward)) &&
                                    (std::is_lt(forward) == std::is_gt(backward));
            if (!consistent) {
                return std::unexpected(core::error{core::error_code::precondition_failed,
                                                   "comparator is inconsistent at index " + std::to_string(i),
                                                   "collection.load_merge"});
            }
        }
        return {};
    }

    auto finished(Operation op, StatusCode code) const -> TransferState {
        auto next = transfer_state_.get();
        next.start(op);
        next.complete(code);
        return next;
    }

    auto fail(Operation op, const TransferFailure& failure) -> void {
        if (config_.verbose) {
            log::line(log::Level::Debug, config_.name, op == Operation::Load ? "load" : "store",
                      " failed: ", to_string(failure.code),
                      failure.hint ? " (" + *failure.hint + ")" : std::string{});
        }
        apply(finished(op, failure.code), failure.effective_messages(), false);
    }

    auto publish_items() -> void {
        apply(transfer_state_.get(), std::nullopt, true);
    }

    auto apply(TransferState next, std::optional<Messages> messages, bool items_changed) -> void {
        const bool state_changed = transfer_state_.set_silent(next);
        const bool pending_changed = pending_.set_silent(next.is_pending());
        const bool empty_changed = empty_.set_silent(items_.empty());
        const bool coarse_changed = state_.set_silent(collection_state_of(next.is_pending(), items_.empty()));
        if (messages) {
            messages_.replace(std::move(*messages));
        }
        if (items_changed) items_changed_.emit(items_);
        if (empty_changed) empty_.notify();
        if (state_changed) transfer_state_.notify();
        if (pending_changed) pending_.notify();
        if (coarse_changed) state_.notify();
    }

    StoreConfig config_;
    Comparator<E> cmp_;
    std::vector<E> items_;
    Paging paging_;
    Observable<TransferState> transfer_state_;
    Observable<bool> pending_{false};
    Observable<bool> empty_{true};
    Observable<CollectionState> state_{CollectionState::Empty};
    Messages messages_;
    Signal<std::vector<E>> items_changed_;
};

/** \brief Build a store directly from available items, stable-sorted by `cmp`. */
template <typename E>
[[nodiscard]] auto collection_state_from_vec(std::vector<E> items, std::type_identity_t<Comparator<E>> cmp,
                                             StoreConfig config = {}) -> CollectionStore<E> {
    CollectionStore<E> store(std::move(cmp), std::move(config));
    store.replace(std::move(items));
    return store;
}

} // namespace replica
