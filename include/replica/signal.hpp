#pragma once

/** \file signal.hpp
 *  \brief Synchronous publish/subscribe primitives used for change notification
 *
 *  Delivery happens on the caller's thread, inside the mutating call, after the
 *  mutation has been applied. There is no locking: a signal belongs to the single
 *  logical owner of the store that exposes it.
 */

#include <algorithm>
#include <cstdint>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace replica {

/**
 * \brief Connection handle returned by subscribe(); disconnects on destruction.
 *
 * A subscription may outlive its signal, in which case reset() is a no-op.
 */
class Subscription {
public:
    Subscription() noexcept = default;
    explicit Subscription(std::function<void()> disconnect) noexcept
        : disconnect_(std::move(disconnect)) {}

    ~Subscription() { reset(); }

    Subscription(Subscription&& other) noexcept
        : disconnect_(std::exchange(other.disconnect_, nullptr)) {}

    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            reset();
            disconnect_ = std::exchange(other.disconnect_, nullptr);
        }
        return *this;
    }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    void reset() noexcept {
        if (disconnect_) {
            auto disconnect = std::exchange(disconnect_, nullptr);
            disconnect();
        }
    }

    [[nodiscard]] auto active() const noexcept -> bool { return static_cast<bool>(disconnect_); }

private:
    std::function<void()> disconnect_;
};

/**
 * \brief List of slots called in subscription order by emit().
 *
 * Slots may subscribe or disconnect while an emission is running. A slot that is
 * disconnected mid-emission is not called for the rest of that emission; a slot
 * added mid-emission is first called by the next one.
 */
template <typename... Args>
class Signal {
public:
    using Slot = std::function<void(const Args&...)>;

    Signal() = default;
    Signal(Signal&&) noexcept = default;
    Signal& operator=(Signal&&) noexcept = default;
    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;

    [[nodiscard]] auto subscribe(Slot slot) const -> Subscription {
        auto& st = state();
        const auto id = st.next_id++;
        st.slots.push_back(Entry{id, std::make_shared<Slot>(std::move(slot))});
        std::weak_ptr<State> weak = state_;
        return Subscription([weak, id]() noexcept {
            if (auto s = weak.lock()) {
                std::erase_if(s->slots, [id](const Entry& e) { return e.id == id; });
            }
        });
    }

    void emit(const Args&... args) const {
        if (!state_) return;
        // Slots may drop the owner of this signal; keep the state alive until we return.
        auto keep = state_;
        const auto snapshot = keep->slots;
        for (const auto& entry : snapshot) {
            if (!connected(*keep, entry.id)) continue;
            (*entry.slot)(args...);
        }
    }

    [[nodiscard]] auto subscriber_count() const noexcept -> std::size_t {
        return state_ ? state_->slots.size() : 0;
    }

private:
    struct Entry {
        std::uint64_t id;
        std::shared_ptr<Slot> slot;
    };

    struct State {
        std::vector<Entry> slots;
        std::uint64_t next_id{1};
    };

    auto state() const -> State& {
        if (!state_) state_ = std::make_shared<State>();
        return *state_;
    }

    static auto connected(const State& s, std::uint64_t id) noexcept -> bool {
        return std::any_of(s.slots.begin(), s.slots.end(),
                           [id](const Entry& e) { return e.id == id; });
    }

    mutable std::shared_ptr<State> state_;
};

/**
 * \brief A value plus a signal that fires only when the value changes.
 *
 * set_silent() and notify() split the two halves so an owner can apply several
 * fields before any observer runs.
 *
 * notify() emits the current value only when it differs from the last value
 * emitted. When a slot changes the value again from inside an emission, the
 * nested notify() delivers the newer value and the outer one is dropped, so
 * subscribers never see the same value twice in a row.
 */
template <typename T>
class Observable {
public:
    using Slot = typename Signal<T>::Slot;

    Observable() = default;
    explicit Observable(T initial) : value_(initial), delivered_(std::move(initial)) {}

    [[nodiscard]] auto get() const noexcept -> const T& { return value_; }

    /** \brief Store and notify; returns false (and stays silent) when unchanged. */
    auto set(T value) -> bool {
        if (!set_silent(std::move(value))) return false;
        notify();
        return true;
    }

    auto set_silent(T value) -> bool {
        if (value_ == value) return false;
        value_ = std::move(value);
        return true;
    }

    void notify() const {
        if (delivered_ == value_) return;
        delivered_ = value_;
        const T current = value_;
        changed_.emit(current);
    }

    [[nodiscard]] auto subscribe(Slot slot) const -> Subscription {
        return changed_.subscribe(std::move(slot));
    }

    /** \brief Like subscribe(), but also delivers the current value right away. */
    [[nodiscard]] auto watch(Slot slot) const -> Subscription {
        slot(value_);
        return changed_.subscribe(std::move(slot));
    }

private:
    T value_{};
    mutable T delivered_{};
    Signal<T> changed_;
};

} // namespace replica
