#pragma once

/** \file messages.hpp
 *  \brief Keyed diagnostic messages with aggregate error tracking
 *
 *  Keys are field names, collection names, or one of the prefabricated keys
 *  SERVICE and ENTITY. Each key maps to a non-empty, insertion-ordered list of
 *  messages. has_error() is cached and recomputed after every mutation,
 *  including removals.
 *
 *  Example usage:
 *  ```cpp
 *  Messages messages;
 *  auto token = messages.anything_for_key_signal("email").subscribe(
 *      [](bool any) { show_email_hint(any); });
 *  (void)messages.add("email", Message::error("form.email.invalid", {"a@"}));
 *  messages.clear("email");   // has_error() drops back to false
 *  ```
 */

#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "replica/error.hpp"
#include "replica/signal.hpp"

namespace replica {

enum class Severity : std::uint8_t { Info, Warning, Error };

/** \brief Localization lookup supplied at display time: (template id, parameters) -> text */
using LocalizeFn =
    std::function<std::string(std::string_view template_id, std::span<const std::string> parameters)>;

/** \brief One immutable diagnostic: a template id plus parameters, never final text. */
class Message {
public:
    Message(Severity severity, std::string template_id, std::vector<std::string> parameters = {},
            std::optional<std::string> section = std::nullopt);

    [[nodiscard]] static auto info(std::string template_id, std::vector<std::string> parameters = {})
        -> Message;
    [[nodiscard]] static auto warning(std::string template_id, std::vector<std::string> parameters = {})
        -> Message;
    [[nodiscard]] static auto error(std::string template_id, std::vector<std::string> parameters = {})
        -> Message;

    /** \brief Copy of this message grouped under `section`. */
    [[nodiscard]] auto with_section(std::string section) const -> Message;

    [[nodiscard]] auto severity() const noexcept -> Severity { return severity_; }
    [[nodiscard]] auto is_error() const noexcept -> bool { return severity_ == Severity::Error; }
    [[nodiscard]] auto template_id() const noexcept -> const std::string& { return template_id_; }
    [[nodiscard]] auto parameters() const noexcept -> std::span<const std::string> { return parameters_; }
    [[nodiscard]] auto section() const noexcept -> const std::optional<std::string>& { return section_; }

    [[nodiscard]] auto localize(const LocalizeFn& lookup) const -> std::string;

    friend bool operator==(const Message&, const Message&) = default;

private:
    Severity severity_;
    std::string template_id_;
    std::vector<std::string> parameters_;
    std::optional<std::string> section_;
};

/** \brief Replace `{0}`, `{1}`, ... in `text`; unknown indices are left as written. */
[[nodiscard]] auto expand_parameters(std::string_view text, std::span<const std::string> parameters)
    -> std::string;

class Messages {
public:
    static constexpr std::string_view SERVICE = "service";
    static constexpr std::string_view ENTITY = "entity";

    using Map = std::map<std::string, std::vector<Message>, std::less<>>;
    using KeySlot = std::function<void(const std::string_view&)>;

    Messages();
    ~Messages();

    /** Copies content only; subscribers stay with the source. */
    Messages(const Messages& other);
    /** Moves content and subscribers. */
    Messages(Messages&&) noexcept;

    /**
     * Assignment replaces content only, exactly like replace(): subscribers of
     * the target stay connected, are notified, and key observables handed out
     * by the target stay valid.
     */
    Messages& operator=(const Messages& other);
    Messages& operator=(Messages&& other);

    [[nodiscard]] static auto from_service_error(std::string template_id,
                                                 std::vector<std::string> parameters = {}) -> Messages;
    [[nodiscard]] static auto from_entity_error(std::string template_id,
                                                std::vector<std::string> parameters = {}) -> Messages;

    /** \brief Replace every message of `key`.
     *
     * \return precondition_failed for an empty list, invalid_argument for an empty key
     */
    auto set(std::string key, std::vector<Message> messages) -> std::expected<void, core::error>;

    /** \brief Append one message to `key`.
     *
     * \return invalid_argument for an empty key
     */
    auto add(std::string key, Message message) -> std::expected<void, core::error>;

    auto add_service_error(std::string template_id, std::vector<std::string> parameters = {}) -> void;
    auto add_service_info(std::string template_id, std::vector<std::string> parameters = {}) -> void;
    auto add_entity_error(std::string template_id, std::vector<std::string> parameters = {}) -> void;
    auto add_entity_info(std::string template_id, std::vector<std::string> parameters = {}) -> void;

    /** \brief Remove every message of `key`; returns whether anything was removed. */
    auto clear(std::string_view key) -> bool;
    auto clear_all() -> void;

    /** \brief Merge `other` in, its keys overwriting ours; notifies once per key afterwards. */
    auto extend(const Messages& other) -> void;

    /** \brief Swap in the whole content of `other`. */
    auto replace(Messages other) -> void;

    [[nodiscard]] auto has_error() const noexcept -> bool { return error_.get(); }
    [[nodiscard]] auto has_error_for_key(std::string_view key) const -> bool;
    [[nodiscard]] auto has_anything_for_key(std::string_view key) const -> bool;
    [[nodiscard]] auto get(std::string_view key) const -> std::span<const Message>;
    [[nodiscard]] auto keys() const -> std::vector<std::string>;
    [[nodiscard]] auto entries() const noexcept -> const Map& { return entries_; }
    [[nodiscard]] auto empty() const noexcept -> bool { return entries_.empty(); }
    /** \brief Number of keys. */
    [[nodiscard]] auto size() const noexcept -> std::size_t { return entries_.size(); }
    /** \brief Number of messages across all keys. */
    [[nodiscard]] auto count() const noexcept -> std::size_t;

    [[nodiscard]] auto localize(std::string_view key, const LocalizeFn& lookup) const
        -> std::vector<std::string>;
    [[nodiscard]] auto localize_all(const LocalizeFn& lookup) const
        -> std::map<std::string, std::vector<std::string>, std::less<>>;

    /** \brief Debug rendering: `entity: [E: EE], service: [I: SI]`. */
    [[nodiscard]] auto describe() const -> std::string;

    /** \brief Called with the key after every mutation touching it. */
    [[nodiscard]] auto subscribe(KeySlot slot) const -> Subscription;
    [[nodiscard]] auto error_signal() const noexcept -> const Observable<bool>& { return error_; }
    [[nodiscard]] auto anything_for_key_signal(std::string_view key) const -> const Observable<bool>&;
    [[nodiscard]] auto error_for_key_signal(std::string_view key) const -> const Observable<bool>&;

    friend bool operator==(const Messages& a, const Messages& b) { return a.entries_ == b.entries_; }

private:
    struct KeyWatch {
        Observable<bool> anything;
        Observable<bool> error;
    };

    auto watch_for(std::string_view key) const -> KeyWatch&;
    auto append(std::string key, Message message) -> void;
    auto commit(const std::vector<std::string>& touched) -> void;
    [[nodiscard]] auto compute_error() const -> bool;

    Map entries_;
    Observable<bool> error_{false};
    Signal<std::string_view> changed_;
    // One entry per key ever queried through *_for_key_signal(); keys are field and
    // collection names, so the map is bounded by the form. Entries are never erased,
    // not even by assignment, so references handed out stay valid.
    mutable std::map<std::string, std::unique_ptr<KeyWatch>, std::less<>> watches_;
};

} // namespace replica
