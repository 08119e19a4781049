#pragma once

#include "api/completion_backend.hpp"
#include "chat/frontend.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "session.hpp"
#include "storage/session_store.hpp"

#include <optional>
#include <string>

enum class ChatState { Idle, AwaitingInput, Processing, Terminated };

// Turn-based chat loop over one session. Every mutation is written through
// SessionStore before the in-memory session changes; a failed write ends the
// session.
class ChatOrchestrator {
public:
    ChatOrchestrator(const Config& config, SessionStore& store, CompletionBackend& backend,
                     ChatFrontend& frontend, bool verbose = false);

    ChatOrchestrator(const ChatOrchestrator&) = delete;
    ChatOrchestrator& operator=(const ChatOrchestrator&) = delete;

    // Idle -> AwaitingInput with a session that already holds its seed message.
    bool start(Session session);

    // Reads one input from the frontend and handles it. Returns false once
    // the session has terminated.
    bool step();

    // Loops until Terminated. Returns false if a store write ended the session.
    bool run();

    // nullopt is a cancelled prompt.
    void handle_input(const std::optional<std::string>& input);

    ChatState state() const { return state_; }
    const Session& session() const { return session_; }
    bool store_failed() const { return store_failed_; }

private:
    void handle_exit();
    void handle_history();
    void handle_clear();
    void handle_message(const std::string& text);

    void fail(const StoreError& err);
    void log(const std::string& msg);

    const Config& config_;
    SessionStore& store_;
    CompletionBackend& backend_;
    ChatFrontend& frontend_;
    bool verbose_;

    ChatState state_ = ChatState::Idle;
    Session session_;
    bool store_failed_ = false;
};
