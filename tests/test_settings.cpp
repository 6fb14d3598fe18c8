#include <catch2/catch.hpp>
#include "settings.hpp"
#include "text_util.hpp"
#include "test_support.hpp"

#include <cstdlib>
#include <fstream>

using namespace llmchat;
using llmchat_test::TempDir;

namespace {

// Sets an environment variable for the lifetime of the guard.
class EnvGuard {
public:
    EnvGuard(const char* name, const char* value) : name_(name) {
        setenv(name, value, 1);
    }
    ~EnvGuard() { unsetenv(name_); }

private:
    const char* name_;
};

} // namespace

TEST_CASE("Defaults match the documented values", "[settings]") {
    Settings s;
    REQUIRE(s.base_url == "https://api.deepseek.com");
    REQUIRE(s.model == "deepseek-chat");
    REQUIRE(s.max_context_messages == 20);
    REQUIRE(s.max_history_messages == 1000);
    REQUIRE(s.streaming_enabled);
    REQUIRE(s.confirm_before_send);
    REQUIRE(s.auto_save_interval == 4);
    REQUIRE(s.history_file == ".chat_history");
}

TEST_CASE("Apply setting parses each kind of value", "[settings]") {
    Settings s;

    REQUIRE(apply_setting(s, "max_history_messages", "50").success());
    REQUIRE(s.max_history_messages == 50);

    REQUIRE(apply_setting(s, "temperature", "1.25").success());
    REQUIRE(s.temperature == Approx(1.25));

    REQUIRE(apply_setting(s, "streaming_enabled", "off").success());
    REQUIRE_FALSE(s.streaming_enabled);
    REQUIRE(apply_setting(s, "Confirm_Before_Send", "YES").success());
    REQUIRE(s.confirm_before_send);

    REQUIRE(apply_setting(s, "auto_save_interval", "0").success());
    REQUIRE(s.auto_save_interval == 0);

    REQUIRE(apply_setting(s, "max_tokens", "2048").success());
    REQUIRE(s.max_tokens == 2048);

    REQUIRE(apply_setting(s, "system_prompt", "Answer in French").success());
    REQUIRE(s.system_prompt == "Answer in French");
}

TEST_CASE("Apply setting rejects bad values without changing them", "[settings]") {
    Settings s;

    REQUIRE(*apply_setting(s, "max_context_messages", "0").error == ErrorKind::InvalidOperation);
    REQUIRE(*apply_setting(s, "max_context_messages", "-3").error == ErrorKind::InvalidOperation);
    REQUIRE(*apply_setting(s, "max_context_messages", "ten").error == ErrorKind::InvalidOperation);
    REQUIRE(s.max_context_messages == DEFAULT_MAX_CONTEXT_MESSAGES);

    REQUIRE_FALSE(apply_setting(s, "temperature", "2.5").success());
    REQUIRE_FALSE(apply_setting(s, "temperature", "0.5x").success());
    REQUIRE_FALSE(apply_setting(s, "streaming_enabled", "maybe").success());
    REQUIRE_FALSE(apply_setting(s, "model", "   ").success());
    REQUIRE(s.model == DEFAULT_MODEL);

    OpResult unknown = apply_setting(s, "colour", "blue");
    REQUIRE(unknown.message == "Unknown option: colour");
}

TEST_CASE("Every listed option is accepted by apply_setting", "[settings]") {
    Settings s;
    for (const auto& name : setting_names()) {
        OpResult result = apply_setting(s, name, "1");
        if (!result.success()) {
            // Only validation failures are allowed, never "unknown".
            REQUIRE(result.message.find("Unknown option") == std::string::npos);
        }
    }
}

TEST_CASE("Describe settings redacts the API key", "[settings]") {
    Settings s;
    s.api_key = "sk-1234567890abcdef";
    auto entries = describe_settings(s);

    REQUIRE(entries[0].first == "api_key");
    REQUIRE(entries[0].second == "sk-12345...");

    s.api_key.clear();
    REQUIRE(describe_settings(s)[0].second == "(not set)");
}

TEST_CASE("Env file exports unset variables only", "[settings][env]") {
    TempDir dir;
    {
        std::ofstream out(dir.file(".env"));
        out << "# comment line\n"
            << "\n"
            << "LLMCHAT_TEST_PLAIN=value one # trailing comment\n"
            << "export LLMCHAT_TEST_EXPORTED=exported\n"
            << "LLMCHAT_TEST_QUOTED=\"has # hash\"\n"
            << "LLMCHAT_TEST_PRESET=from-file\n"
            << "not a pair\n";
    }
    EnvGuard preset("LLMCHAT_TEST_PRESET", "from-env");

    std::size_t exported = load_env_file(dir.file(".env"));

    REQUIRE(exported == 3);
    REQUIRE(std::string(std::getenv("LLMCHAT_TEST_PLAIN")) == "value one");
    REQUIRE(std::string(std::getenv("LLMCHAT_TEST_EXPORTED")) == "exported");
    REQUIRE(std::string(std::getenv("LLMCHAT_TEST_QUOTED")) == "has # hash");
    REQUIRE(std::string(std::getenv("LLMCHAT_TEST_PRESET")) == "from-env");

    unsetenv("LLMCHAT_TEST_PLAIN");
    unsetenv("LLMCHAT_TEST_EXPORTED");
    unsetenv("LLMCHAT_TEST_QUOTED");
}

TEST_CASE("Missing env file exports nothing", "[settings][env]") {
    TempDir dir;
    REQUIRE(load_env_file(dir.file("absent.env")) == 0);
}

TEST_CASE("Environment overrides defaults and warns on bad values", "[settings][env]") {
    EnvGuard key(env::API_KEY, "  sk-from-env  ");
    EnvGuard model(env::MODEL, "gpt-4o-mini");
    EnvGuard context(env::MAX_CONTEXT_MESSAGES, "8");
    EnvGuard temperature(env::TEMPERATURE, "hot");
    EnvGuard streaming(env::STREAMING_MODE, "false");

    SettingsLoad load = load_settings_from_environment();

    REQUIRE(load.settings.api_key == "sk-from-env");
    REQUIRE(load.settings.model == "gpt-4o-mini");
    REQUIRE(load.settings.max_context_messages == 8);
    REQUIRE_FALSE(load.settings.streaming_enabled);
    REQUIRE(load.settings.temperature == Approx(DEFAULT_TEMPERATURE));
    REQUIRE(load.warnings.size() == 1);
    REQUIRE(load.warnings[0].rfind("TEMPERATURE: ", 0) == 0);
}

TEST_CASE("Shared string helpers trim and lowercase", "[settings][text]") {
    REQUIRE(trim("  \t value \r\n") == "value");
    REQUIRE(trim(" \n ").empty());
    REQUIRE(to_lower("ShowTimestamps") == "showtimestamps");
}
