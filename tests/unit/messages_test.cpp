/** \file messages_test.cpp
 *  \brief Keyed messages: aggregate error flag, per-key signals and rendering.
 */

#include <catch2/catch.hpp>
#include <replica/messages.hpp>

#include <string>
#include <vector>

using namespace replica;

namespace {

std::string fake_lookup(std::string_view id, std::span<const std::string> params) {
  if (id == "form.email.invalid") return expand_parameters("'{0}' is not an address", params);
  if (id == "form.range") return expand_parameters("between {0} and {1}", params);
  return std::string(id);
}

} // namespace

TEST_CASE("messages track the aggregate error flag", "[messages]") {
  Messages m;
  REQUIRE(m.empty());
  REQUIRE_FALSE(m.has_error());

  REQUIRE(m.add("name", Message::info("form.name.hint")).has_value());
  REQUIRE_FALSE(m.has_error());
  REQUIRE(m.has_anything_for_key("name"));
  REQUIRE_FALSE(m.has_error_for_key("name"));

  REQUIRE(m.add("email", Message::error("form.email.invalid", {"a@"})).has_value());
  REQUIRE(m.has_error());
  REQUIRE(m.has_error_for_key("email"));
  REQUIRE(m.size() == 2);
  REQUIRE(m.count() == 2);

  SECTION("clearing the only error key drops the flag") {
    REQUIRE(m.clear("email"));
    REQUIRE_FALSE(m.has_error());
    REQUIRE(m.has_anything_for_key("name"));
  }

  SECTION("clearing an unrelated key keeps the flag") {
    REQUIRE(m.clear("name"));
    REQUIRE(m.has_error());
  }

  SECTION("clearing a missing key is a no-op") {
    REQUIRE_FALSE(m.clear("nope"));
    REQUIRE(m.size() == 2);
  }

  SECTION("clear_all") {
    m.clear_all();
    REQUIRE(m.empty());
    REQUIRE_FALSE(m.has_error());
  }
}

TEST_CASE("set rejects empty lists and empty keys", "[messages]") {
  Messages m;
  auto r = m.set("email", {});
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == core::error_code::precondition_failed);
  REQUIRE(r.error().component == "messages.set");
  REQUIRE(m.empty());

  auto k = m.set("", {Message::error("x")});
  REQUIRE_FALSE(k.has_value());
  REQUIRE(k.error().code == core::error_code::invalid_argument);

  auto added = m.add("", Message::info("x"));
  REQUIRE_FALSE(added.has_value());
  REQUIRE(added.error().code == core::error_code::invalid_argument);
  REQUIRE(added.error().component == "messages.add");
  REQUIRE(m.empty());

  REQUIRE(m.set("email", {Message::warning("a"), Message::error("b")}).has_value());
  REQUIRE(m.get("email").size() == 2);
  REQUIRE(m.has_error());

  REQUIRE(m.set("email", {Message::warning("a")}).has_value());
  REQUIRE(m.get("email").size() == 1);
  REQUIRE_FALSE(m.has_error());
}

TEST_CASE("messages keep insertion order per key", "[messages]") {
  Messages m;
  REQUIRE(m.add("f", Message::info("one")).has_value());
  REQUIRE(m.add("f", Message::warning("two")).has_value());
  REQUIRE(m.add("f", Message::error("three")).has_value());
  auto list = m.get("f");
  REQUIRE(list.size() == 3);
  REQUIRE(list[0].template_id() == "one");
  REQUIRE(list[1].severity() == Severity::Warning);
  REQUIRE(list[2].is_error());
  REQUIRE(m.get("missing").empty());
}

TEST_CASE("prefabricated keys and describe", "[messages]") {
  auto m = Messages::from_service_error("status.not_found");
  REQUIRE(m.has_error_for_key(Messages::SERVICE));
  m.add_entity_error("EE");
  m.add_service_info("SI");
  REQUIRE(m.describe() == "entity: [E: EE], service: [E: status.not_found, I: SI]");

  auto e = Messages::from_entity_error("locked", {"bob"});
  REQUIRE(e.get(Messages::ENTITY)[0].parameters()[0] == "bob");
}

TEST_CASE("extend and replace", "[messages]") {
  Messages a;
  REQUIRE(a.add("x", Message::info("a.x")).has_value());
  REQUIRE(a.add("y", Message::info("a.y")).has_value());

  Messages b;
  REQUIRE(b.add("y", Message::error("b.y")).has_value());
  REQUIRE(b.add("z", Message::info("b.z")).has_value());

  a.extend(b);
  REQUIRE(a.keys() == std::vector<std::string>{"x", "y", "z"});
  REQUIRE(a.get("y")[0].template_id() == "b.y");
  REQUIRE(a.has_error());

  a.replace(Messages{});
  REQUIRE(a.empty());
  REQUIRE_FALSE(a.has_error());
}

TEST_CASE("copies carry content but not subscribers", "[messages]") {
  Messages m;
  int calls = 0;
  auto sub = m.subscribe([&](const std::string_view&) { ++calls; });
  REQUIRE(m.add("k", Message::error("e")).has_value());
  REQUIRE(calls == 1);

  Messages copy(m);
  REQUIRE(copy == m);
  REQUIRE(copy.has_error());
  REQUIRE(copy.add("k", Message::error("f")).has_value());
  REQUIRE(calls == 1);
  REQUIRE_FALSE(copy == m);
}

TEST_CASE("per-key signals fire after the mutation is applied", "[messages]") {
  Messages m;
  std::vector<bool> anything;
  std::vector<bool> errors;
  std::vector<std::string> touched;

  auto a = m.anything_for_key_signal("email").subscribe([&](const bool& v) { anything.push_back(v); });
  auto e = m.error_signal().subscribe([&](const bool& v) {
    errors.push_back(v);
    REQUIRE(m.has_error() == v);
  });
  auto k = m.subscribe([&](const std::string_view& key) {
    touched.emplace_back(key);
    REQUIRE(m.has_anything_for_key(key) == m.anything_for_key_signal(key).get());
  });

  REQUIRE(m.add("email", Message::error("bad")).has_value());
  REQUIRE(m.add("email", Message::error("worse")).has_value());
  REQUIRE(m.add("name", Message::info("hint")).has_value());
  m.clear("email");

  REQUIRE(anything == std::vector<bool>{true, false});
  REQUIRE(errors == std::vector<bool>{true, false});
  REQUIRE(touched == std::vector<std::string>{"email", "email", "name", "email"});
  REQUIRE_FALSE(m.error_for_key_signal("email").get());
  REQUIRE(m.anything_for_key_signal("name").get());
}

TEST_CASE("localization happens at display time", "[messages]") {
  Messages m;
  REQUIRE(m.add("email", Message::error("form.email.invalid", {"a@"})).has_value());
  REQUIRE(m.add("age", Message::warning("form.range", {"18", "99"}).with_section("profile")).has_value());

  REQUIRE(m.localize("email", fake_lookup) == std::vector<std::string>{"'a@' is not an address"});
  auto all = m.localize_all(fake_lookup);
  REQUIRE(all.at("age") == std::vector<std::string>{"between 18 and 99"});
  REQUIRE(m.get("age")[0].section() == std::optional<std::string>{"profile"});
}

TEST_CASE("expand_parameters leaves unknown placeholders", "[messages]") {
  std::vector<std::string> p{"a", "b"};
  REQUIRE(expand_parameters("{0}-{1}-{2}", p) == "a-b-{2}");
  REQUIRE(expand_parameters("{x} {} {1}", p) == "{x} {} b");
  REQUIRE(expand_parameters("", p).empty());
}

TEST_CASE("extend notifies once with the final state", "[messages]") {
  Messages m;
  REQUIRE(m.add("a", Message::error("a.bad")).has_value());
  REQUIRE(m.add("b", Message::info("b.hint")).has_value());

  bool expect_error = false;
  std::vector<bool> errors;
  std::vector<std::string> touched;
  auto e = m.error_signal().subscribe([&](const bool& v) {
    errors.push_back(v);
    REQUIRE(m.has_error() == v);
    REQUIRE(m.get("a")[0].template_id() == "a.fixed");
    REQUIRE(m.has_anything_for_key("c"));
  });
  auto k = m.subscribe([&](const std::string_view& key) {
    touched.emplace_back(key);
    REQUIRE(m.has_error() == expect_error);
    REQUIRE(m.get("a")[0].template_id() == "a.fixed");
    REQUIRE(m.has_anything_for_key("c"));
  });

  Messages other;
  REQUIRE(other.add("a", Message::info("a.fixed")).has_value());

  SECTION("the error moves to another key") {
    REQUIRE(other.add("c", Message::error("c.bad")).has_value());
    expect_error = true;
    m.extend(other);
    REQUIRE(errors.empty());
    REQUIRE(m.has_error());
  }

  SECTION("the last error is cleared") {
    REQUIRE(other.add("c", Message::warning("c.note")).has_value());
    expect_error = false;
    m.extend(other);
    REQUIRE(errors == std::vector<bool>{false});
    REQUIRE_FALSE(m.has_error());
  }

  REQUIRE(touched == std::vector<std::string>{"a", "c"});
  REQUIRE(m.get("b")[0].template_id() == "b.hint");
}

TEST_CASE("assignment keeps subscribers and handed-out observables", "[messages]") {
  Messages m;
  const auto& name_watch = m.anything_for_key_signal("name");
  std::vector<bool> errors;
  std::vector<bool> names;
  std::vector<std::string> touched;
  auto e = m.error_signal().subscribe([&](const bool& v) { errors.push_back(v); });
  auto n = name_watch.subscribe([&](const bool& v) { names.push_back(v); });
  auto k = m.subscribe([&](const std::string_view& key) { touched.emplace_back(key); });

  m = Messages::from_entity_error("locked");
  REQUIRE(m.has_error());
  REQUIRE(errors == std::vector<bool>{true});
  REQUIRE(touched == std::vector<std::string>{"entity"});

  REQUIRE(m.add("name", Message::error("form.name.empty")).has_value());
  REQUIRE(names == std::vector<bool>{true});
  REQUIRE(name_watch.get());
  REQUIRE(&name_watch == &m.anything_for_key_signal("name"));

  m.clear_all();
  REQUIRE(errors == std::vector<bool>{true, false});
  REQUIRE(names == std::vector<bool>{true, false});
  REQUIRE_FALSE(name_watch.get());

  Messages source;
  REQUIRE(source.add("name", Message::info("form.name.hint")).has_value());
  m = source;
  REQUIRE(m == source);
  REQUIRE(source.has_anything_for_key("name"));
  REQUIRE(names == std::vector<bool>{true, false, true});
  REQUIRE(errors.size() == 2);
}

TEST_CASE("slots may mutate the bag they observe", "[messages]") {
  Messages m;

  SECTION("a key subscriber clears the key it was told about") {
    std::vector<bool> seen;
    auto w = m.anything_for_key_signal("a").subscribe([&](const bool& v) { seen.push_back(v); });
    auto k = m.subscribe([&](const std::string_view& key) {
      if (key == "a" && m.has_anything_for_key("a")) m.clear("a");
    });
    REQUIRE(m.add("a", Message::info("i")).has_value());
    REQUIRE(seen == std::vector<bool>{true, false});
    REQUIRE_FALSE(m.anything_for_key_signal("a").get());
  }

  SECTION("a value observer clears the key") {
    std::vector<bool> anything;
    std::vector<bool> errors;
    std::vector<bool> key_errors;
    auto w = m.anything_for_key_signal("a").subscribe([&](const bool& v) {
      anything.push_back(v);
      if (v) m.clear("a");
    });
    auto e = m.error_signal().subscribe([&](const bool& v) { errors.push_back(v); });
    auto ke = m.error_for_key_signal("a").subscribe([&](const bool& v) { key_errors.push_back(v); });

    REQUIRE(m.add("a", Message::error("e")).has_value());
    REQUIRE(anything == std::vector<bool>{true, false});
    // Net change is none, so neither error observer hears anything.
    REQUIRE(errors.empty());
    REQUIRE(key_errors.empty());
    REQUIRE_FALSE(m.has_error());
  }
}

TEST_CASE("key observables are shared per key and outlive content changes", "[messages]") {
  Messages m;
  const auto& email = m.anything_for_key_signal("email");
  REQUIRE(&email == &m.anything_for_key_signal("email"));
  REQUIRE(&m.error_for_key_signal("email") == &m.error_for_key_signal("email"));

  REQUIRE(m.add("email", Message::error("form.email.invalid")).has_value());
  REQUIRE(email.get());
  m.replace(Messages{});
  m = Messages::from_service_error("status.server_error");
  m.clear_all();

  REQUIRE(&email == &m.anything_for_key_signal("email"));
  REQUIRE_FALSE(email.get());
}
