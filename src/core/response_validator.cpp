#include "core/response_validator.h"

#include "utils/json_utils.h"

namespace planproxy {

using json = nlohmann::json;

namespace {

ValidationResult fail(std::string error) {
    ValidationResult result;
    result.ok = false;
    result.error = std::move(error);
    return result;
}

bool isEmptyValue(const json& v) {
    if (v.is_null()) return true;
    if (v.is_string()) return v.get_ref<const std::string&>().empty();
    return false;
}

}  // namespace

ResponseValidator::ResponseValidator(const EndpointRegistry& registry,
                                     const ResponseSanitizer& sanitizer)
    : registry_(registry), sanitizer_(sanitizer) {}

ValidationResult ResponseValidator::validate(const json& value, const std::string& endpoint_key) const {
    const EndpointSpec* spec = registry_.find(endpoint_key);
    if (!spec) {
        return fail("unknown endpoint '" + endpoint_key + "'");
    }

    auto envelope = validateChatCompletion(value);
    if (!envelope.ok) return envelope;
    if (!spec->specialized) {
        if (const EndpointSpec* chat = registry_.find(kChatCompletionKey)) {
            for (const auto& field : chat->optional_fields) {
                if (!value.contains(field)) envelope.absent_optional.push_back(field);
            }
        }
        return envelope;
    }

    const json& content = value["choices"][0]["message"]["content"];
    json plan = content.is_string()
                    ? sanitizer_.sanitize(content.get<std::string>(), SanitizeMode::kTolerant)
                    : content;
    if (!plan.is_object()) {
        return fail("message content for '" + spec->key + "' must be a JSON object");
    }
    return validateFields(plan, *spec);
}

ValidationResult ResponseValidator::validateChatCompletion(const json& value) const {
    if (!value.is_object()) {
        return fail("response must be a JSON object");
    }
    std::string missing;
    if (!has_required_keys(value, {"id", "choices"}, &missing)) {
        return fail("missing field '" + missing + "'");
    }
    const json& choices = value["choices"];
    if (!choices.is_array()) {
        return fail("collection field 'choices' must be an array");
    }
    if (choices.empty()) {
        return fail("collection field 'choices' must be non-empty");
    }
    for (size_t i = 0; i < choices.size(); ++i) {
        const std::string where = "choices[" + std::to_string(i) + "]";
        const json& choice = choices[i];
        if (!choice.is_object() || !choice.contains("message") || !choice["message"].is_object()) {
            return fail("missing field '" + where + ".message'");
        }
        const json& message = choice["message"];
        if (!message.contains("role") || isEmptyValue(message["role"])) {
            return fail("missing field '" + where + ".message.role'");
        }
        if (!message.contains("content") || isEmptyValue(message["content"])) {
            return fail("missing field '" + where + ".message.content'");
        }
    }
    return {};
}

ValidationResult ResponseValidator::validateFields(const json& value, const EndpointSpec& spec) const {
    std::string missing;
    if (!has_required_keys(value, spec.required_fields, &missing)) {
        return fail("missing field '" + missing + "'");
    }
    if (!spec.collection_field.empty()) {
        if (!value.contains(spec.collection_field)) {
            return fail("missing field '" + spec.collection_field + "'");
        }
        const json& collection = value[spec.collection_field];
        if (!collection.is_array()) {
            return fail("collection field '" + spec.collection_field + "' must be an array");
        }
        if (collection.empty()) {
            return fail("collection field '" + spec.collection_field + "' must be non-empty");
        }
    }

    ValidationResult result;
    for (const auto& field : spec.optional_fields) {
        if (!value.contains(field)) result.absent_optional.push_back(field);
    }
    return result;
}

}  // namespace planproxy
