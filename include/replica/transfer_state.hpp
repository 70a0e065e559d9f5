#pragma once

/** \file transfer_state.hpp
 *  \brief Lifecycle of the load/store attempts made against one entity or collection
 *
 *  Idle --start--> Pending --complete(c)--> Done(c) --start--> Pending ...
 *  reset() returns to Idle from any phase. While Pending, the status of the
 *  previous attempt stays readable through status().
 */

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>

#include "replica/status_code.hpp"

namespace replica {

class TransferState {
public:
    enum class Phase : std::uint8_t { Idle, Pending, Done };
    enum class Operation : std::uint8_t { Load, Store };

    constexpr TransferState() noexcept = default;

    /** \brief A completed state, as produced by set_transfer_state(code). */
    [[nodiscard]] static constexpr auto done(StatusCode code, Operation op = Operation::Load) noexcept
        -> TransferState {
        TransferState s;
        s.phase_ = Phase::Done;
        s.operation_ = op;
        s.status_ = code;
        return s;
    }

    constexpr void start(Operation op = Operation::Load) noexcept {
        phase_ = Phase::Pending;
        operation_ = op;
    }

    /** \brief Record the outcome of the current attempt; the operation kind is kept. */
    constexpr void complete(StatusCode code) noexcept {
        phase_ = Phase::Done;
        status_ = code;
    }

    constexpr void set_transfer_state(std::optional<StatusCode> status) noexcept {
        if (status) {
            complete(*status);
        } else {
            reset();
        }
    }

    constexpr void reset() noexcept {
        phase_ = Phase::Idle;
        operation_ = Operation::Load;
        status_.reset();
    }

    /** \brief Turn a completed failure into a completed success of the same kind. */
    constexpr void reset_error() noexcept {
        if (phase_ == Phase::Done && status_ && is_failure(*status_)) {
            status_ = StatusCode::Ok;
        }
    }

    [[nodiscard]] constexpr auto phase() const noexcept -> Phase { return phase_; }
    [[nodiscard]] constexpr auto operation() const noexcept -> Operation { return operation_; }

    /** \brief Last terminal status; retained underneath while Pending. */
    [[nodiscard]] constexpr auto status() const noexcept -> std::optional<StatusCode> { return status_; }

    [[nodiscard]] constexpr auto is_idle() const noexcept -> bool { return phase_ == Phase::Idle; }
    [[nodiscard]] constexpr auto is_pending() const noexcept -> bool { return phase_ == Phase::Pending; }
    [[nodiscard]] constexpr auto is_done() const noexcept -> bool { return phase_ == Phase::Done; }

    [[nodiscard]] constexpr auto is_ok() const noexcept -> bool {
        return phase_ == Phase::Done && is_success(*status_);
    }

    [[nodiscard]] constexpr auto is_error() const noexcept -> bool {
        return phase_ == Phase::Done && is_failure(*status_);
    }

    [[nodiscard]] constexpr auto loaded() const noexcept -> bool {
        return is_ok() && operation_ == Operation::Load;
    }

    [[nodiscard]] constexpr auto stored() const noexcept -> bool {
        return is_ok() && operation_ == Operation::Store;
    }

    [[nodiscard]] constexpr auto loaded_status() const noexcept -> std::optional<StatusCode> {
        if (phase_ == Phase::Done && operation_ == Operation::Load) return status_;
        return std::nullopt;
    }

    [[nodiscard]] constexpr auto stored_status() const noexcept -> std::optional<StatusCode> {
        if (phase_ == Phase::Done && operation_ == Operation::Store) return status_;
        return std::nullopt;
    }

    [[nodiscard]] constexpr auto not_completed() const noexcept -> bool { return phase_ != Phase::Done; }
    [[nodiscard]] constexpr auto not_error() const noexcept -> bool { return !is_error(); }

    friend constexpr bool operator==(const TransferState&, const TransferState&) noexcept = default;

private:
    Phase phase_{Phase::Idle};
    Operation operation_{Operation::Load};
    std::optional<StatusCode> status_;
};

/** \brief "idle", "pending load (last=ok)", "stored not_found", ... */
[[nodiscard]] auto describe(const TransferState& state) -> std::string;

auto operator<<(std::ostream& os, const TransferState& state) -> std::ostream&;

} // namespace replica
