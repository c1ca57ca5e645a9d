#ifndef SCRIPTOR_TYPES_H
#define SCRIPTOR_TYPES_H

#include <boost/json.hpp>
#include <chrono>
#include <string>
#include <string_view>
#include <optional>
#include <vector>

namespace scriptor {

/**
 * @brief Wire protocol spoken by the AI backend.
 *
 * OpenAI is the multi-turn "chat" shape (role-tagged message list),
 * Gemini is the single-prompt "generate" shape.
 */
enum class BackendKind {
    Auto,
    OpenAI,
    Gemini
};

std::string_view to_string(BackendKind kind);

/**
 * @brief Parses "auto", "openai" or "gemini" (case-insensitive).
 * @return std::nullopt for anything else.
 */
std::optional<BackendKind> parse_backend_kind(std::string_view text);

enum class Role {
    System,
    User,
    Assistant
};

std::string_view to_string(Role role);

struct Message {
    Role role;
    std::string content;

    static Message system(std::string content) { return {Role::System, std::move(content)}; }
    static Message user(std::string content) { return {Role::User, std::move(content)}; }
    static Message assistant(std::string content) { return {Role::Assistant, std::move(content)}; }

    bool operator==(const Message&) const = default;
};

/**
 * @brief What a backend call produced: the text plus whatever usage/finish
 * information the protocol reports.
 */
struct Completion {
    std::string content;
    boost::json::object metadata;
};

/**
 * @brief Result of a successful Session::send.
 */
struct Response {
    std::string content;
    boost::json::object metadata;
    std::string session_id;
    std::chrono::system_clock::time_point timestamp;
    BackendKind backend_kind = BackendKind::Auto;
};

} // namespace scriptor

#endif
