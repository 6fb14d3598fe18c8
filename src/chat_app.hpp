#pragma once

/**
 * Interactive chat loop.
 *
 * Wires the session store, manager, orchestrator and command layer
 * together, reads lines until /exit or end of input, and saves all
 * sessions before returning.
 */

#include "settings.hpp"

namespace llmchat {

class Console;
class IModelService;
class LineInput;

// ========== Interrupt Handling ==========

// Installs the SIGINT handler. Blocking reads are interrupted rather than
// restarted so Ctrl+C reaches the loop promptly.
void install_interrupt_handler();

// True once SIGINT has arrived since the last clear_interrupt().
bool interrupt_requested();

void clear_interrupt();

// ========== Application ==========

class ChatApp {
public:
    // All collaborators must outlive the app. The service may be null.
    ChatApp(Settings& settings, Console& console, LineInput& input, IModelService* service);

    // Runs until /exit, /quit or end of input. Returns the process exit code.
    int run();

private:
    Settings& settings_;
    Console& console_;
    LineInput& input_;
    IModelService* service_;
};

} // namespace llmchat
