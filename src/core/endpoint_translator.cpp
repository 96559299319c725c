#include "core/endpoint_translator.h"

#include "core/gateway_error.h"

namespace planproxy {

using json = nlohmann::json;

namespace {

const TranslationRule* ruleFor(const EndpointRegistry& registry, const std::string& logical_path) {
    const EndpointSpec* spec = registry.findByRoute(logical_path);
    if (!spec || !spec->specialized) return nullptr;
    return registry.rule(spec->key);
}

const std::string& chatRoute(const EndpointRegistry& registry) {
    static const std::string kFallback = "chat/completions";
    const EndpointSpec* chat = registry.find(kChatCompletionKey);
    return chat ? chat->route : kFallback;
}

}  // namespace

EndpointTranslator::EndpointTranslator(const EndpointRegistry& registry,
                                       const ResponseSanitizer& sanitizer,
                                       std::string model)
    : registry_(registry), sanitizer_(sanitizer), model_(std::move(model)) {}

CanonicalRequest EndpointTranslator::forward(const std::string& logical_path, const json& body) const {
    const TranslationRule* rule = ruleFor(registry_, logical_path);
    if (!rule) {
        return {logical_path, body};
    }

    std::string prompt = rule->default_prompt;
    if (body.is_object() && body.contains("prompt") && body["prompt"].is_string() &&
        !body["prompt"].get_ref<const std::string&>().empty()) {
        prompt = body["prompt"].get<std::string>();
    }

    long long max_tokens = kDefaultPlanMaxTokens;
    if (body.is_object() && body.contains("max_tokens") && body["max_tokens"].is_number_integer()) {
        const auto requested = body["max_tokens"].get<long long>();
        if (requested > 0) max_tokens = requested;
    }

    json canonical = {
        {"model", model_},
        {"messages", json::array({
            {{"role", "system"}, {"content", rule->system_prompt}},
            {{"role", "user"}, {"content", rule->user_prompt(prompt)}},
        })},
        {"temperature", kPlanTemperature},
        {"max_tokens", max_tokens},
        {"response_format", {{"type", "json_object"}}},
    };
    return {chatRoute(registry_), std::move(canonical)};
}

json EndpointTranslator::backward(const std::string& logical_path, const json& response) const {
    if (!ruleFor(registry_, logical_path)) {
        return response;
    }

    if (!response.is_object() || !response.contains("choices") || !response["choices"].is_array() ||
        response["choices"].empty()) {
        throw GatewayError(ErrorKind::kTranslation,
                           "Failed to parse special endpoint response: no choices returned");
    }
    const json& choice = response["choices"][0];
    if (!choice.is_object() || !choice.contains("message") || !choice["message"].is_object() ||
        !choice["message"].contains("content")) {
        throw GatewayError(ErrorKind::kTranslation,
                           "Failed to parse special endpoint response: first choice has no message content");
    }

    const json& content = choice["message"]["content"];
    json domain = content.is_string()
                      ? sanitizer_.sanitize(content.get<std::string>(), SanitizeMode::kTolerant)
                      : content;
    if (!domain.is_object()) {
        throw GatewayError(ErrorKind::kTranslation,
                           "Failed to parse special endpoint response: content is not a JSON object",
                           std::string("content type: ") + domain.type_name());
    }
    return domain;
}

}  // namespace planproxy
