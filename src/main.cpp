#include "chat_app.hpp"
#include "config.hpp"
#include "console.hpp"
#include "input_editor.hpp"
#include "openai_client.hpp"
#include "settings.hpp"
#include "verbose.hpp"

#include <CLI/CLI.hpp>
#include <cstdlib>
#include <iostream>
#include <memory>

using namespace llmchat;

// ========== Connection Check ==========

// Sends one probe request and reports the outcome. Returns the exit code.
static int run_connection_check(OpenAIChatClient& client, Console& console) {
    console.print_header("=== Connection Check ===");
    console.println("Base URL: " + client.base_url());
    console.println("Model:    " + client.model());
    console.println("API Key:  " + redact_secret(client.api_key()));
    console.println();

    if (!client.is_configured()) {
        console.print_error(std::string("✗ ") + env::API_KEY + " is not set");
        return 1;
    }

    console.start_status("Testing connection...");
    bool ok = client.validate_connection();
    console.clear_status();

    if (ok) {
        console.print_success("Connection successful");
        return 0;
    }
    console.print_error("✗ Connection failed (run with -v for details)");
    return 1;
}

// ========== Main Entry Point ==========

int main(int argc, char* argv[]) {
    CLI::App app{"Interactive terminal chat client for OpenAI-compatible chat APIs"};
    app.footer("\nExamples:\n"
               "  llmchat                          Start chatting with settings from .env\n"
               "  llmchat --model deepseek-chat    Override the model\n"
               "  llmchat --check                  Test the API connection and exit\n");

    std::string env_file = ENV_FILE;
    app.add_option("--env-file", env_file, "KEY=VALUE file loaded before reading the environment")
        ->capture_default_str();

    std::string history_file;
    app.add_option("--history-file", history_file, "Session history document (default: .chat_history)");

    std::string model;
    app.add_option("--model", model, "Model name to request");

    std::string base_url;
    app.add_option("--base-url", base_url, "Base URL of the OpenAI-compatible API");

    std::string system_prompt;
    app.add_option("--system", system_prompt, "System prompt sent with every request");

    bool no_stream = false;
    app.add_flag("--no-stream", no_stream, "Wait for complete replies instead of streaming");

    bool no_confirm = false;
    app.add_flag("--no-confirm", no_confirm, "Send @file contents without asking");

    bool check = false;
    app.add_flag("--check", check, "Validate the API connection and exit");

    bool verbose = false;
    app.add_flag("-v,--verbose", verbose, "Log HTTP traffic and internal events to stderr");

    CLI11_PARSE(app, argc, argv);

    try {
        set_verbose(verbose);
        load_env_file(env_file);
        if (const char* v = std::getenv(env::VERBOSE); v && *v && std::string(v) != "0") {
            set_verbose(true);
        }

        SettingsLoad loaded = load_settings_from_environment();
        Settings& settings = loaded.settings;
        if (!history_file.empty()) settings.history_file = history_file;
        if (!model.empty()) settings.model = model;
        if (!base_url.empty()) settings.base_url = base_url;
        if (!system_prompt.empty()) settings.system_prompt = system_prompt;
        if (no_stream) settings.streaming_enabled = false;
        if (no_confirm) settings.confirm_before_send = false;

        Console console;
        for (const auto& warning : loaded.warnings) {
            console.print_warning(warning);
        }

        auto client = std::make_unique<OpenAIChatClient>(
            ClientConfig{settings.api_key, settings.base_url, settings.model});

        if (check) {
            return run_connection_check(*client, console);
        }

        install_interrupt_handler();

        InputEditor editor([&console](const std::string& text) {
            console.print_raw(text);
            console.flush();
        }, console.colors_enabled());

        ChatApp chat(settings, console, editor, client.get());
        return chat.run();
    } catch (const std::exception& e) {
        std::cerr << "fatal: " << e.what() << std::endl;
        return 1;
    }
}
