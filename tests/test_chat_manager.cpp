#include <catch2/catch.hpp>
#include "chat_manager.hpp"
#include "test_support.hpp"

using namespace llmchat;
using llmchat_test::TempDir;

TEST_CASE("Messages land in the current session with timestamps", "[manager]") {
    TempDir dir;
    SessionStore store(dir.file("history.json"));
    store.open();
    ChatSessionManager manager(store, {20, 1000});

    manager.add_message(Role::User, "hello");
    manager.add_message(Role::Assistant, "hi");

    const auto& history = manager.history();
    REQUIRE(history.size() == 2);
    REQUIRE(history[0].content == "hello");
    REQUIRE_FALSE(history[0].timestamp.empty());
    REQUIRE(manager.current_size() == 2);
}

TEST_CASE("Context is bounded by max_context_messages", "[manager]") {
    TempDir dir;
    SessionStore store(dir.file("history.json"));
    store.open();
    ChatSessionManager manager(store, {3, 1000});

    for (int i = 0; i < 7; ++i) {
        manager.add_message(Role::User, "q" + std::to_string(i));
    }

    auto context = manager.get_context();
    REQUIRE(context.size() == 3);
    REQUIRE(context.front().content == "q4");
    REQUIRE(manager.get_messages_for_api().size() == 7);
}

TEST_CASE("Adding past twice the history limit trims the session", "[manager]") {
    TempDir dir;
    SessionStore store(dir.file("history.json"));
    store.open();
    ChatSessionManager manager(store, {20, 3});

    for (int i = 0; i < 6; ++i) {
        manager.add_message(Role::User, std::to_string(i));
    }
    REQUIRE(manager.current_size() == 6);

    manager.add_message(Role::User, "6");
    REQUIRE(manager.current_size() == 3);
    REQUIRE(manager.history().front().content == "4");
}

TEST_CASE("Switching sessions keeps each transcript separate", "[manager]") {
    TempDir dir;
    SessionStore store(dir.file("history.json"));
    store.open();
    ChatSessionManager manager(store, {20, 1000});
    const std::string first = manager.current_session();

    manager.add_message(Role::User, "in first");
    manager.switch_session("other");
    REQUIRE(manager.current_session() == "other");
    REQUIRE(manager.history().empty());

    manager.add_message(Role::User, "in other");
    manager.switch_session(first);
    REQUIRE(manager.history().size() == 1);
    REQUIRE(manager.history()[0].content == "in first");
}

TEST_CASE("New session uses the given or a generated name", "[manager]") {
    TempDir dir;
    SessionStore store(dir.file("history.json"));
    store.open();
    ChatSessionManager manager(store, {20, 1000});

    REQUIRE(manager.new_session(std::string("ideas")) == "ideas");
    REQUIRE(manager.current_session() == "ideas");

    std::string generated = manager.new_session();
    REQUIRE(generated.rfind("session_", 0) == 0);
    REQUIRE(generated.size() == std::string("session_").size() + 8);
    REQUIRE(manager.current_session() == generated);
}

TEST_CASE("Clear empties the current session and persists", "[manager]") {
    TempDir dir;
    SessionStore store(dir.file("history.json"));
    store.open();
    ChatSessionManager manager(store, {20, 1000});
    manager.add_message(Role::User, "x");

    REQUIRE(manager.clear_history().success());
    REQUIRE(manager.history().empty());

    auto persisted = SessionStore(dir.file("history.json")).load().sessions;
    REQUIRE(persisted.at(manager.current_session()).messages.empty());
}

TEST_CASE("Stats count messages by role", "[manager]") {
    TempDir dir;
    SessionStore store(dir.file("history.json"));
    store.open();
    ChatSessionManager manager(store, {20, 1000});
    manager.add_message(Role::User, "a");
    manager.add_message(Role::Assistant, "b");
    manager.add_message(Role::User, "c");
    manager.add_message(Role::System, "d");

    SessionStats stats = manager.stats();
    REQUIRE(stats.name == manager.current_session());
    REQUIRE(stats.total == 4);
    REQUIRE(stats.user == 2);
    REQUIRE(stats.assistant == 1);
    REQUIRE(stats.system == 1);
}

TEST_CASE("Session listing is ordered and marks the active one", "[manager]") {
    TempDir dir;
    SessionStore store(dir.file("history.json"));
    store.open();
    ChatSessionManager manager(store, {20, 1000});
    manager.switch_session("beta");
    manager.add_message(Role::User, "x");
    manager.switch_session("alpha");

    auto rows = manager.list_sessions();
    REQUIRE(rows.size() == 3);
    REQUIRE(rows[0].name == "alpha");
    REQUIRE(rows[0].active);
    REQUIRE(rows[1].name == "beta");
    REQUIRE(rows[1].message_count == 1);
    REQUIRE_FALSE(rows[1].active);
    REQUIRE(rows[2].name.rfind("chat_", 0) == 0);
}

TEST_CASE("Delete and rename go through the store rules", "[manager]") {
    TempDir dir;
    SessionStore store(dir.file("history.json"));
    store.open();
    ChatSessionManager manager(store, {20, 1000});
    const std::string active = manager.current_session();
    manager.switch_session("spare");
    manager.switch_session(active);

    REQUIRE(*manager.delete_session(active).error == ErrorKind::InvalidOperation);
    REQUIRE(manager.rename_session("spare", "kept").success());
    REQUIRE(*manager.rename_session("kept", active).error == ErrorKind::Conflict);
    REQUIRE(manager.delete_session("kept").success());
    REQUIRE(manager.list_sessions().size() == 1);
}

TEST_CASE("Changing limits applies to later context requests", "[manager]") {
    TempDir dir;
    SessionStore store(dir.file("history.json"));
    store.open();
    ChatSessionManager manager(store, {20, 1000});
    for (int i = 0; i < 5; ++i) {
        manager.add_message(Role::User, std::to_string(i));
    }

    manager.set_limits({2, 1000});
    REQUIRE(manager.limits().max_context_messages == 2);
    REQUIRE(manager.get_context().size() == 2);
}
