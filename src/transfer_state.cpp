#include "replica/transfer_state.hpp"

#include <ostream>

namespace replica {

auto describe(const TransferState& state) -> std::string {
    const bool load = state.operation() == TransferState::Operation::Load;
    switch (state.phase()) {
        case TransferState::Phase::Idle:
            return "idle";
        case TransferState::Phase::Pending: {
            std::string out = load ? "pending load" : "pending store";
            if (auto last = state.status()) {
                out += " (last=";
                out += to_string(*last);
                out += ')';
            }
            return out;
        }
        case TransferState::Phase::Done: {
            std::string out = load ? "loaded " : "stored ";
            out += to_string(*state.status());
            return out;
        }
    }
    return "idle";
}

auto operator<<(std::ostream& os, const TransferState& state) -> std::ostream& {
    return os << describe(state);
}

} // namespace replica
