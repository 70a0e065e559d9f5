/** \file messages.cpp
 *  \brief Keyed diagnostic messages and their change notification
 */

#include "replica/messages.hpp"
#include "replica/log.hpp"

#include <algorithm>
#include <charconv>
#include <utility>

namespace replica {

Message::Message(Severity severity, std::string template_id, std::vector<std::string> parameters,
                 std::optional<std::string> section)
    : severity_(severity)
    , template_id_(std::move(template_id))
    , parameters_(std::move(parameters))
    , section_(std::move(section)) {}

auto Message::info(std::string template_id, std::vector<std::string> parameters) -> Message {
    return Message(Severity::Info, std::move(template_id), std::move(parameters));
}

auto Message::warning(std::string template_id, std::vector<std::string> parameters) -> Message {
    return Message(Severity::Warning, std::move(template_id), std::move(parameters));
}

auto Message::error(std::string template_id, std::vector<std::string> parameters) -> Message {
    return Message(Severity::Error, std::move(template_id), std::move(parameters));
}

auto Message::with_section(std::string section) const -> Message {
    return Message(severity_, template_id_, parameters_, std::move(section));
}

auto Message::localize(const LocalizeFn& lookup) const -> std::string {
    return lookup(template_id_, parameters_);
}

auto expand_parameters(std::string_view text, std::span<const std::string> parameters) -> std::string {
    std::string out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '{') {
            const auto close = text.find('}', i + 1);
            if (close != std::string_view::npos && close > i + 1) {
                std::size_t index{};
                const char* first = text.data() + i + 1;
                const char* last = text.data() + close;
                auto [ptr, ec] = std::from_chars(first, last, index);
                if (ec == std::errc{} && ptr == last && index < parameters.size()) {
                    out += parameters[index];
                    i = close + 1;
                    continue;
                }
            }
        }
        out.push_back(text[i]);
        ++i;
    }
    return out;
}

Messages::Messages() = default;
Messages::~Messages() = default;
Messages::Messages(Messages&&) noexcept = default;

Messages::Messages(const Messages& other)
    : entries_(other.entries_)
    , error_(other.has_error()) {}

Messages& Messages::operator=(const Messages& other) {
    if (this != &other) replace(Messages(other));
    return *this;
}

Messages& Messages::operator=(Messages&& other) {
    if (this != &other) replace(std::move(other));
    return *this;
}

auto Messages::from_service_error(std::string template_id, std::vector<std::string> parameters) -> Messages {
    Messages m;
    m.add_service_error(std::move(template_id), std::move(parameters));
    return m;
}

auto Messages::from_entity_error(std::string template_id, std::vector<std::string> parameters) -> Messages {
    Messages m;
    m.add_entity_error(std::move(template_id), std::move(parameters));
    return m;
}

auto Messages::set(std::string key, std::vector<Message> messages) -> std::expected<void, core::error> {
    if (key.empty()) {
        core::error e{core::error_code::invalid_argument, "message key must not be empty", "messages.set"};
        log::write(log::Level::Warn, "messages", core::describe(e));
        return std::unexpected(std::move(e));
    }
    if (messages.empty()) {
        core::error e{core::error_code::precondition_failed,
                      "empty message list for key '" + key + "', use clear() to remove a key",
                      "messages.set"};
        log::write(log::Level::Warn, "messages", core::describe(e));
        return std::unexpected(std::move(e));
    }
    std::vector<std::string> touched{key};
    entries_.insert_or_assign(std::move(key), std::move(messages));
    commit(touched);
    return {};
}

auto Messages::add(std::string key, Message message) -> std::expected<void, core::error> {
    if (key.empty()) {
        core::error e{core::error_code::invalid_argument, "message key must not be empty", "messages.add"};
        log::write(log::Level::Warn, "messages", core::describe(e));
        return std::unexpected(std::move(e));
    }
    append(std::move(key), std::move(message));
    return {};
}

auto Messages::append(std::string key, Message message) -> void {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        it = entries_.emplace(key, std::vector<Message>{}).first;
    }
    it->second.push_back(std::move(message));
    commit({std::move(key)});
}

auto Messages::add_service_error(std::string template_id, std::vector<std::string> parameters) -> void {
    append(std::string(SERVICE), Message::error(std::move(template_id), std::move(parameters)));
}

auto Messages::add_service_info(std::string template_id, std::vector<std::string> parameters) -> void {
    append(std::string(SERVICE), Message::info(std::move(template_id), std::move(parameters)));
}

auto Messages::add_entity_error(std::string template_id, std::vector<std::string> parameters) -> void {
    append(std::string(ENTITY), Message::error(std::move(template_id), std::move(parameters)));
}

auto Messages::add_entity_info(std::string template_id, std::vector<std::string> parameters) -> void {
    append(std::string(ENTITY), Message::info(std::move(template_id), std::move(parameters)));
}

auto Messages::clear(std::string_view key) -> bool {
    auto it = entries_.find(key);
    if (it == entries_.end()) return false;
    std::vector<std::string> touched{it->first};
    entries_.erase(it);
    commit(touched);
    return true;
}

auto Messages::clear_all() -> void {
    if (entries_.empty()) return;
    auto touched = keys();
    entries_.clear();
    commit(touched);
}

auto Messages::extend(const Messages& other) -> void {
    if (&other == this || other.entries_.empty()) return;
    std::vector<std::string> touched;
    touched.reserve(other.entries_.size());
    for (const auto& [key, list] : other.entries_) {
        entries_.insert_or_assign(key, list);
        touched.push_back(key);
    }
    commit(touched);
}

auto Messages::replace(Messages other) -> void {
    auto touched = keys();
    for (const auto& [key, list] : other.entries_) {
        (void)list;
        if (!entries_.contains(key)) touched.push_back(key);
    }
    entries_ = std::move(other.entries_);
    if (touched.empty()) return;
    commit(touched);
}

auto Messages::has_error_for_key(std::string_view key) const -> bool {
    auto it = entries_.find(key);
    if (it == entries_.end()) return false;
    return std::any_of(it->second.begin(), it->second.end(), [](const Message& m) { return m.is_error(); });
}

auto Messages::has_anything_for_key(std::string_view key) const -> bool {
    return entries_.find(key) != entries_.end();
}

auto Messages::get(std::string_view key) const -> std::span<const Message> {
    auto it = entries_.find(key);
    if (it == entries_.end()) return {};
    return it->second;
}

auto Messages::keys() const -> std::vector<std::string> {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& [key, list] : entries_) {
        (void)list;
        out.push_back(key);
    }
    return out;
}

auto Messages::count() const noexcept -> std::size_t {
    std::size_t n = 0;
    for (const auto& [key, list] : entries_) {
        (void)key;
        n += list.size();
    }
    return n;
}

auto Messages::localize(std::string_view key, const LocalizeFn& lookup) const -> std::vector<std::string> {
    std::vector<std::string> out;
    for (const auto& message : get(key)) {
        out.push_back(message.localize(lookup));
    }
    return out;
}

auto Messages::localize_all(const LocalizeFn& lookup) const
    -> std::map<std::string, std::vector<std::string>, std::less<>> {
    std::map<std::string, std::vector<std::string>, std::less<>> out;
    for (const auto& [key, list] : entries_) {
        auto& texts = out[key];
        texts.reserve(list.size());
        for (const auto& message : list) {
            texts.push_back(message.localize(lookup));
        }
    }
    return out;
}

auto Messages::describe() const -> std::string {
    std::string out;
    bool first_key = true;
    for (const auto& [key, list] : entries_) {
        if (!first_key) out += ", ";
        first_key = false;
        out += key;
        out += ": [";
        for (std::size_t i = 0; i < list.size(); ++i) {
            if (i > 0) out += ", ";
            switch (list[i].severity()) {
                case Severity::Error: out += "E: "; break;
                case Severity::Warning: out += "W: "; break;
                case Severity::Info: out += "I: "; break;
            }
            out += list[i].template_id();
        }
        out += ']';
    }
    return out;
}

auto Messages::subscribe(KeySlot slot) const -> Subscription {
    return changed_.subscribe(std::move(slot));
}

auto Messages::anything_for_key_signal(std::string_view key) const -> const Observable<bool>& {
    return watch_for(key).anything;
}

auto Messages::error_for_key_signal(std::string_view key) const -> const Observable<bool>& {
    return watch_for(key).error;
}

auto Messages::watch_for(std::string_view key) const -> KeyWatch& {
    auto it = watches_.find(key);
    if (it == watches_.end()) {
        auto watch = std::make_unique<KeyWatch>(
            KeyWatch{Observable<bool>(has_anything_for_key(key)), Observable<bool>(has_error_for_key(key))});
        it = watches_.emplace(std::string(key), std::move(watch)).first;
    }
    return *it->second;
}

auto Messages::compute_error() const -> bool {
    for (const auto& [key, list] : entries_) {
        (void)key;
        if (std::any_of(list.begin(), list.end(), [](const Message& m) { return m.is_error(); })) {
            return true;
        }
    }
    return false;
}

// Apply every derived flag first, then notify, so no observer sees a half-updated bag.
// Value observers run before key subscribers; a slot that mutates the bag again
// triggers a nested commit whose notifications supersede the pending ones here.
auto Messages::commit(const std::vector<std::string>& touched) -> void {
    const bool error_changed = error_.set_silent(compute_error());

    std::vector<const Observable<bool>*> changed_watches;
    for (const auto& key : touched) {
        auto it = watches_.find(key);
        if (it == watches_.end()) continue;
        if (it->second->anything.set_silent(has_anything_for_key(key))) {
            changed_watches.push_back(&it->second->anything);
        }
        if (it->second->error.set_silent(has_error_for_key(key))) {
            changed_watches.push_back(&it->second->error);
        }
    }

    for (const auto* watch : changed_watches) {
        watch->notify();
    }
    if (error_changed) {
        error_.notify();
    }
    for (const auto& key : touched) {
        changed_.emit(std::string_view{key});
    }
}

} // namespace replica
