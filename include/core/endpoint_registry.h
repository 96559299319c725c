#pragma once

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace planproxy {

inline constexpr const char* kChatCompletionKey = "chat-completion";
inline constexpr const char* kWorkoutPlanKey = "workout-plan";
inline constexpr const char* kMealPlanKey = "meal-plan";

// Path prefix under which every gateway endpoint is exposed.
inline constexpr const char* kRoutePrefix = "/openai/v1/";

struct EndpointSpec {
    std::string key;
    std::string route;       // logical path below kRoutePrefix, e.g. "workout-plan"
    bool specialized{false};
    std::vector<std::string> required_fields;
    std::vector<std::string> optional_fields;
    std::string collection_field;  // must be a non-empty array; empty for canonical shapes
};

struct TranslationRule {
    std::string system_prompt;
    std::function<std::string(const std::string& prompt)> user_prompt;
    std::string default_prompt{"Create a general plan"};
};

// Read-only lookup tables for endpoint shapes and translation rules.
// Built once at startup and shared by reference; never mutated after construction.
class EndpointRegistry {
public:
    EndpointRegistry() = default;

    // Registry with the chat-completion, workout-plan and meal-plan endpoints.
    static EndpointRegistry builtin();

    // Add a canonical endpoint, or a specialized one when a rule is given.
    // Throws std::invalid_argument on duplicate keys/routes or on a specialized
    // spec without a collection field.
    void add(EndpointSpec spec, std::optional<TranslationRule> rule = std::nullopt);

    const EndpointSpec* find(const std::string& key) const;
    const EndpointSpec* findByRoute(const std::string& route) const;
    const TranslationRule* rule(const std::string& key) const;

    const std::vector<EndpointSpec>& endpoints() const { return specs_; }

private:
    std::vector<EndpointSpec> specs_;
    std::unordered_map<std::string, size_t> by_key_;
    std::unordered_map<std::string, size_t> by_route_;
    std::unordered_map<std::string, TranslationRule> rules_;
};

}  // namespace planproxy
