#pragma once

/** \file entity_store.hpp
 *  \brief One remotely sourced record with its transfer state and messages
 *
 *  Failure is data: a failed transfer records its status and messages and leaves
 *  the last known-good record in place. The only path that empties a present
 *  record is a successful delete (or an explicit reset).
 *
 *  Every mutator applies data, transfer state and messages first and notifies
 *  afterwards, so an observer always reads a fully updated store.
 *
 *  Thread-safety: none; a store has a single logical owner.
 */

#include <concepts>
#include <expected>
#include <functional>
#include <optional>
#include <type_traits>
#include <utility>

#include "replica/config.hpp"
#include "replica/error.hpp"
#include "replica/log.hpp"
#include "replica/messages.hpp"
#include "replica/signal.hpp"
#include "replica/status_code.hpp"
#include "replica/transfer_state.hpp"
#include "replica/transport.hpp"

namespace replica {

/** \brief Entity types that track unsaved local edits. */
template <typename E>
concept DirtyTracking = requires(const E& e) {
    { e.is_dirty() } -> std::convertible_to<bool>;
};

template <typename E>
class EntityStore {
public:
    using value_type = E;
    using Operation = TransferState::Operation;
    using DataSlot = typename Signal<std::optional<E>>::Slot;

    explicit EntityStore(StoreConfig config = {})
        : config_(std::move(config)) {}

    explicit EntityStore(E value, StoreConfig config = {})
        : config_(std::move(config))
        , data_(std::move(value))
        , empty_(false) {}

    /** \brief Construct after validating `config`. */
    [[nodiscard]] static auto create(StoreConfig config) -> std::expected<EntityStore, core::error> {
        if (auto ok = validate(config); !ok) return std::unexpected(ok.error());
        return EntityStore(std::move(config));
    }

    [[nodiscard]] static auto with_default(StoreConfig config = {}) -> EntityStore
        requires std::default_initializable<E>
    {
        return EntityStore(E{}, std::move(config));
    }

    EntityStore(EntityStore&&) noexcept = default;
    EntityStore& operator=(EntityStore&&) = default;
    EntityStore(const EntityStore&) = delete;
    EntityStore& operator=(const EntityStore&) = delete;

    // ---- transfer lifecycle -------------------------------------------------

    /** \brief Mark an attempt as in flight; the previous status stays readable. */
    auto start(Operation op = Operation::Load) -> void {
        auto next = transfer_state_.get();
        next.start(op);
        if (config_.verbose) {
            log::line(log::Level::Debug, config_.name, "start ", describe(next));
        }
        apply(next, std::nullopt, false);
    }

    /** \brief Success replaces the record; failure keeps it and records the failure. */
    auto load_result(std::expected<E, TransferFailure> result) -> void {
        if (result) {
            data_ = std::move(*result);
            trace("load", StatusCode::Ok);
            apply(finished(Operation::Load, StatusCode::Ok), Messages{}, true);
        } else {
            fail(Operation::Load, result.error());
        }
    }

    /** \brief Apply a full response; the record changes only for a success carrying an entity. */
    auto load_response(StatusCode status, EntityResponse<E> response) -> void {
        respond(Operation::Load, status, std::move(response));
    }

    /** \brief Success replaces the record when the server echoed one, and keeps it otherwise. */
    auto save_result(std::expected<std::optional<E>, TransferFailure> result) -> void {
        if (result) {
            const bool changed = result->has_value();
            if (changed) data_ = std::move(*result);
            trace("save", StatusCode::Ok);
            apply(finished(Operation::Store, StatusCode::Ok), Messages{}, changed);
        } else {
            fail(Operation::Store, result.error());
        }
    }

    auto save_response(StatusCode status, EntityResponse<E> response) -> void {
        respond(Operation::Store, status, std::move(response));
    }

    /** \brief Success empties the record; failure keeps it. */
    auto delete_result(std::expected<void, TransferFailure> result) -> void {
        if (result) {
            const bool changed = data_.has_value();
            data_.reset();
            trace("delete", StatusCode::Ok);
            apply(finished(Operation::Store, StatusCode::Ok), Messages{}, changed);
        } else {
            fail(Operation::Store, result.error());
        }
    }

    /** \brief Force Done(code) or, for nullopt, Idle without a request cycle. */
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

    /** \brief Forget the transfer status (forcing the next load) but keep the record. */
    auto invalidate() -> void {
        apply(TransferState{}, std::nullopt, false);
    }

    /** \brief False once a load succeeded; callers skip the request and use the cache. */
    [[nodiscard]] auto needs_load() const -> bool {
        if (transfer_state_.get().loaded()) {
            if (config_.verbose) {
                log::line(log::Level::Debug, config_.name, "load skipped, using cache");
            }
            return false;
        }
        return true;
    }

    // ---- reset ----------------------------------------------------------------

    /** \brief Back to the freshly constructed state: no record, Idle, no messages. */
    auto reset() -> void {
        const bool changed = data_.has_value();
        data_.reset();
        apply(TransferState{}, Messages{}, changed);
    }

    auto reset_to_value(E value) -> void {
        data_ = std::move(value);
        apply(TransferState{}, Messages{}, true);
    }

    auto reset_to_default() -> void
        requires std::default_initializable<E>
    {
        reset_to_value(E{});
    }

    // ---- local edits ----------------------------------------------------------

    auto set(std::optional<E> value) -> void {
        data_ = std::move(value);
        apply(transfer_state_.get(), std::nullopt, true);
    }

    auto replace(std::optional<E> value) -> std::optional<E> {
        auto previous = std::exchange(data_, std::move(value));
        apply(transfer_state_.get(), std::nullopt, true);
        return previous;
    }

    /** \brief Install a record obtained outside this store and mark it loaded. */
    auto set_externally_loaded(std::optional<E> value) -> void {
        data_ = std::move(value);
        apply(TransferState::done(StatusCode::Ok, Operation::Load), std::nullopt, true);
    }

    /** \brief Edit the record in place; returns false when there is none. */
    template <typename F>
    auto modify(F&& f) -> bool {
        if (!data_) return false;
        std::invoke(std::forward<F>(f), *data_);
        apply(transfer_state_.get(), std::nullopt, true);
        return true;
    }

    // ---- reads ----------------------------------------------------------------

    [[nodiscard]] auto data() const noexcept -> const std::optional<E>& { return data_; }
    [[nodiscard]] auto transfer_state() const noexcept -> const TransferState& { return transfer_state_.get(); }
    [[nodiscard]] auto messages() const noexcept -> const Messages& { return messages_; }
    /** \brief Mutable access for client-side validation messages. */
    [[nodiscard]] auto messages() noexcept -> Messages& { return messages_; }
    [[nodiscard]] auto config() const noexcept -> const StoreConfig& { return config_; }

    [[nodiscard]] auto empty() const noexcept -> bool { return !data_.has_value(); }
    [[nodiscard]] auto pending() const noexcept -> bool { return transfer_state_.get().is_pending(); }
    [[nodiscard]] auto loaded() const noexcept -> bool { return transfer_state_.get().loaded(); }

    template <typename F>
    [[nodiscard]] auto map(F&& f) const -> std::optional<std::invoke_result_t<F, const E&>> {
        if (!data_) return std::nullopt;
        return std::invoke(std::forward<F>(f), *data_);
    }

    /** \brief The record has unsaved edits and no message blocks committing them. */
    [[nodiscard]] auto can_commit() const -> bool
        requires DirtyTracking<E>
    {
        return data_.has_value() && data_->is_dirty() && !messages_.has_error();
    }

    // ---- signals --------------------------------------------------------------

    [[nodiscard]] auto subscribe_data(DataSlot slot) const -> Subscription {
        return data_changed_.subscribe(std::move(slot));
    }
    [[nodiscard]] auto transfer_state_signal() const noexcept -> const Observable<TransferState>& {
        return transfer_state_;
    }
    [[nodiscard]] auto pending_signal() const noexcept -> const Observable<bool>& { return pending_; }
    [[nodiscard]] auto empty_signal() const noexcept -> const Observable<bool>& { return empty_; }

private:
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

    auto respond(Operation op, StatusCode status, EntityResponse<E> response) -> void {
        bool changed = false;
        if (is_success(status) && response.entity) {
            data_ = std::move(response.entity);
            changed = true;
        }
        Messages messages = std::move(response.messages);
        if (is_failure(status) && messages.empty()) {
            messages = TransferFailure(status).effective_messages();
        }
        trace(op == Operation::Load ? "load" : "store", status);
        apply(finished(op, status), std::move(messages), changed);
    }

    auto trace(const char* what, StatusCode code) const -> void {
        if (config_.verbose) {
            log::line(log::Level::Debug, config_.name, what, " completed: ", to_string(code));
        }
    }

    auto apply(TransferState next, std::optional<Messages> messages, bool data_changed) -> void {
        const bool state_changed = transfer_state_.set_silent(next);
        const bool pending_changed = pending_.set_silent(next.is_pending());
        const bool empty_changed = empty_.set_silent(!data_.has_value());
        if (messages) {
            messages_.replace(std::move(*messages));
        }
        if (data_changed) data_changed_.emit(data_);
        if (empty_changed) empty_.notify();
        if (state_changed) transfer_state_.notify();
        if (pending_changed) pending_.notify();
    }

    StoreConfig config_;
    std::optional<E> data_;
    Observable<TransferState> transfer_state_;
    Observable<bool> pending_{false};
    Observable<bool> empty_{true};
    Messages messages_;
    Signal<std::optional<E>> data_changed_;
};

} // namespace replica
