#pragma once

/** \file transport.hpp
 *  \brief Decoded results handed to the stores by the transport layer
 *
 *  The stores never perform I/O. A transport resolves one attempt into either a
 *  decoded payload or a TransferFailure, and the caller feeds that into the store
 *  that started the attempt. Correlating late results with superseded attempts is
 *  the transport's job; anything handed to a store is applied.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "replica/messages.hpp"
#include "replica/status_code.hpp"

namespace replica {

/** \brief Failure detail of one attempt: the status plus any per-field messages. */
struct TransferFailure {
    StatusCode code{StatusCode::FetchFailed};
    Messages messages;                 /**< server-supplied diagnostics, may be empty */
    std::optional<std::string> hint;   /**< transport diagnostics for logs, never shown */

    TransferFailure() = default;
    explicit TransferFailure(StatusCode c, Messages m = {}, std::optional<std::string> h = std::nullopt)
        : code(c), messages(std::move(m)), hint(std::move(h)) {}

    /** \brief Messages to store: the server's, or a service error named after the status. */
    [[nodiscard]] auto effective_messages() const -> Messages {
        if (!messages.empty()) return messages;
        return Messages::from_service_error(status_template_id(code));
    }

    /** \brief "status.not_found" and friends; the template id used for bare failures. */
    [[nodiscard]] static auto status_template_id(StatusCode c) -> std::string {
        return "status." + std::string(to_string(c));
    }
};

/** \brief Collection paging cursors as returned by the backend. */
struct Paging {
    std::uint32_t limit{25};
    std::optional<std::string> prev;
    std::optional<std::string> next;

    friend bool operator==(const Paging&, const Paging&) = default;
};

template <typename E>
struct EntityResponse {
    Messages messages;
    std::optional<E> entity;   /**< absent when the response does not carry the entity */
};

template <typename E>
struct CollectionResponse {
    Messages messages;
    Paging paging;
    /** Absent means "this response does not speak to the collection", not "empty". */
    std::optional<std::vector<E>> collection;
};

} // namespace replica
