#include "chat/chat_orchestrator.hpp"

#include "chat/message_builder.hpp"
#include "chat/transcript.hpp"

#include <chrono>
#include <format>
#include <print>

ChatOrchestrator::ChatOrchestrator(const Config& config, SessionStore& store,
                                   CompletionBackend& backend, ChatFrontend& frontend,
                                   bool verbose)
    : config_(config), store_(store), backend_(backend), frontend_(frontend),
      verbose_(verbose) {}

bool ChatOrchestrator::start(Session session) {
    if (state_ != ChatState::Idle) {
        std::println(stderr, "chat: cannot start, state is not idle");
        return false;
    }

    session_ = std::move(session);
    state_ = ChatState::AwaitingInput;
    log(std::format("Session {} started with {} message(s)", session_.session_id,
                    session_.messages.size()));
    frontend_.on_transcript_changed(session_);
    return true;
}

bool ChatOrchestrator::step() {
    if (state_ != ChatState::AwaitingInput) return state_ != ChatState::Terminated;

    handle_input(frontend_.read_input());
    return state_ != ChatState::Terminated;
}

bool ChatOrchestrator::run() {
    while (step()) {
    }
    return !store_failed_;
}

void ChatOrchestrator::handle_input(const std::optional<std::string>& input) {
    if (state_ != ChatState::AwaitingInput) return;

    if (!input) {
        log("Prompt cancelled");
        handle_exit();
        return;
    }

    const auto& text = *input;
    if (text == "exit" || text == "quit" || text == "bye") {
        handle_exit();
    } else if (text == "help") {
        frontend_.show_help(transcript::kHelpText);
    } else if (text == "history") {
        handle_history();
    } else if (text == "clear") {
        handle_clear();
    } else if (text.empty()) {
        log("Ignoring empty input");
    } else {
        handle_message(text);
    }
}

void ChatOrchestrator::handle_exit() {
    state_ = ChatState::Terminated;
    frontend_.on_notice("Session ended. History saved to: " + store_.path_for(session_.session_id),
                        Severity::Info);
}

void ChatOrchestrator::handle_history() {
    frontend_.show_history(session_);
}

void ChatOrchestrator::handle_clear() {
    auto res = store_.clear(session_);
    if (!res) {
        fail(res.error());
        return;
    }

    log("Conversation cleared");
    frontend_.on_transcript_changed(session_);
    frontend_.on_notice("Conversation cleared.", Severity::Info);
}

void ChatOrchestrator::handle_message(const std::string& text) {
    state_ = ChatState::Processing;

    auto res = store_.append(session_, Message{
        .role = Role::User,
        .content = text,
        .timestamp = std::chrono::system_clock::now(),
    });
    if (!res) {
        fail(res.error());
        return;
    }
    frontend_.on_transcript_changed(session_);

    auto messages = wire::build_messages(session_);
    frontend_.on_notice("Getting AI response...", Severity::Info);
    log(std::format("Sending {} message(s) to {}", messages.size(), config_.api.model));

    auto start = std::chrono::steady_clock::now();
    auto reply = backend_.complete(config_.api.model, messages);
    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    if (!reply) {
        log(std::format("Completion failed after {:.1f}s: {}", elapsed, describe(reply.error())));
        frontend_.on_notice("Failed to get response from API: " + describe(reply.error()),
                            Severity::Error);
        state_ = ChatState::AwaitingInput;
        return;
    }

    log(std::format("Completion took {:.1f}s, {} chars", elapsed, reply->size()));

    res = store_.append(session_, Message{
        .role = Role::Assistant,
        .content = std::move(*reply),
        .timestamp = std::chrono::system_clock::now(),
    });
    if (!res) {
        fail(res.error());
        return;
    }

    frontend_.on_transcript_changed(session_);
    state_ = ChatState::AwaitingInput;
}

void ChatOrchestrator::fail(const StoreError& err) {
    std::println(stderr, "chat: {}", describe(err));
    store_failed_ = true;
    state_ = ChatState::Terminated;
    frontend_.on_notice("Could not save chat history (" + describe(err) + "). Session ended.",
                        Severity::Error);
}

void ChatOrchestrator::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[copyq-chat] {}", msg);
    }
}
