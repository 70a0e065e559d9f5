/**
 * Form synchronization example using replica
 *
 * This example demonstrates:
 * - Loading a record into an EntityStore
 * - Reacting to transfer state and message changes
 * - Showing server validation messages next to form fields
 * - Loading a sorted collection with a merge policy
 */

#include <replica.hpp>

#include <iostream>
#include <string>
#include <vector>

namespace {

struct Contact {
    int id{0};
    std::string name;
    std::string email;
    bool dirty{false};

    bool is_dirty() const { return dirty; }
};

// Stand-in for a translation catalog.
std::string lookup(std::string_view id, std::span<const std::string> params) {
    if (id == "form.email.invalid") return replica::expand_parameters("'{0}' is not a valid address", params);
    if (id == "status.server_error") return "The server could not process the request";
    return std::string(id);
}

} // namespace

int main() {
    using namespace replica;

    StoreConfig config = config_from_env("contact");
    if (auto ok = validate(config); !ok) {
        std::cerr << "Invalid configuration: " << core::describe(ok.error()) << "\n";
        return 1;
    }

    EntityStore<Contact> contact(config);

    auto state_sub = contact.transfer_state_signal().subscribe([](const TransferState& s) {
        std::cout << "transfer: " << s << "\n";
    });
    auto email_sub = contact.messages().anything_for_key_signal("email").subscribe([&](const bool& any) {
        if (!any) {
            std::cout << "email: ok\n";
            return;
        }
        for (const auto& text : contact.messages().localize("email", lookup)) {
            std::cout << "email: " << text << "\n";
        }
    });

    // Initial load succeeds.
    contact.start();
    contact.load_result(Contact{1, "Ada", "ada@example.org"});

    // The user edits the email and saves; the server rejects it.
    contact.modify([](Contact& c) {
        c.email = "ada@";
        c.dirty = true;
    });
    std::cout << "can commit: " << std::boolalpha << contact.can_commit() << "\n";

    contact.start(TransferState::Operation::Store);
    Messages rejected;
    if (auto added = rejected.add("email", Message::error("form.email.invalid", {"ada@"})); !added) {
        std::cerr << "message rejected: " << core::describe(added.error()) << "\n";
        return 1;
    }
    contact.save_result(std::unexpected(TransferFailure(StatusCode::ValidationFailed, rejected)));
    std::cout << "record kept: " << contact.data()->name << ", can commit: " << contact.can_commit() << "\n";

    // The corrected save succeeds and clears the messages.
    contact.modify([](Contact& c) { c.email = "ada@example.com"; });
    contact.start(TransferState::Operation::Store);
    contact.save_result(std::optional<Contact>{Contact{1, "Ada", "ada@example.com"}});

    // A contact list ordered by name, refreshed with an upsert merge.
    CollectionStore<Contact> list([](const Contact& a, const Contact& b) { return a.name <=> b.name; },
                                  config_from_env("contacts"));
    auto list_sub = list.collection_state_signal().subscribe([](const CollectionState& s) {
        std::cout << "list: " << to_string(s) << "\n";
    });
    list.insert(Contact{3, "Grace", "grace@example.org"});

    list.start();
    auto merged = list.load_merge(StatusCode::Ok,
                                  std::vector<Contact>{{2, "Barbara", "b@example.org"}, {1, "Ada", "ada@example.com"}},
                                  merge::upsert<Contact>([](const Contact& a, const Contact& b) { return a.id == b.id; }));
    if (!merged) {
        std::cerr << "merge rejected: " << core::describe(merged.error()) << "\n";
        return 1;
    }
    for (const auto& c : list.items()) std::cout << "  " << c.name << " <" << c.email << ">\n";

    // A failed refresh keeps the list and records the failure.
    list.start();
    list.load_failure(TransferFailure(StatusCode::ServerError));
    for (const auto& text : list.messages().localize(Messages::SERVICE, lookup)) {
        std::cout << "service: " << text << "\n";
    }
    std::cout << "still showing " << list.size() << " contacts\n";
    return 0;
}
