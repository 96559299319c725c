#include "core/endpoint_registry.h"

#include <stdexcept>

namespace planproxy {

EndpointRegistry EndpointRegistry::builtin() {
    EndpointRegistry registry;

    registry.add(EndpointSpec{kChatCompletionKey,
                              "chat/completions",
                              false,
                              {"id", "choices"},
                              {"object", "created", "model", "usage"},
                              ""});

    TranslationRule workout;
    workout.system_prompt =
        "You are a professional fitness trainer. Create detailed, structured workout plans that "
        "include warmup, exercises, and cooldown. Always return responses in valid JSON format "
        "with name, description, and days fields.";
    workout.user_prompt = [](const std::string& prompt) {
        return "Create a workout plan with the following requirements: " + prompt +
               ". Return the response as a JSON object with fields: name (string), "
               "description (string), and days (array of workout days).";
    };
    registry.add(EndpointSpec{kWorkoutPlanKey,
                              "workout-plan",
                              true,
                              {"name", "description", "days"},
                              {"duration", "difficulty", "equipment"},
                              "days"},
                 std::move(workout));

    TranslationRule meal;
    meal.system_prompt =
        "You are a professional nutritionist. Create detailed, structured meal plans that are "
        "healthy and balanced. Always return responses in valid JSON format with name, "
        "description, and meals fields.";
    meal.user_prompt = [](const std::string& prompt) {
        return "Create a meal plan with the following requirements: " + prompt +
               ". Return the response as a JSON object with fields: name (string), "
               "description (string), and meals (array of meals).";
    };
    registry.add(EndpointSpec{kMealPlanKey,
                              "meal-plan",
                              true,
                              {"name", "description", "meals"},
                              {"calories", "duration", "dietaryRestrictions"},
                              "meals"},
                 std::move(meal));

    return registry;
}

void EndpointRegistry::add(EndpointSpec spec, std::optional<TranslationRule> rule) {
    if (spec.key.empty() || spec.route.empty()) {
        throw std::invalid_argument("endpoint key and route must not be empty");
    }
    if (by_key_.count(spec.key) > 0) {
        throw std::invalid_argument("duplicate endpoint key: " + spec.key);
    }
    if (by_route_.count(spec.route) > 0) {
        throw std::invalid_argument("duplicate endpoint route: " + spec.route);
    }
    spec.specialized = rule.has_value();
    if (spec.specialized) {
        if (spec.collection_field.empty()) {
            throw std::invalid_argument("specialized endpoint needs a collection field: " + spec.key);
        }
        if (!rule->user_prompt) {
            throw std::invalid_argument("specialized endpoint needs a user prompt template: " + spec.key);
        }
        rules_.emplace(spec.key, std::move(*rule));
    }

    const size_t index = specs_.size();
    by_key_.emplace(spec.key, index);
    by_route_.emplace(spec.route, index);
    specs_.push_back(std::move(spec));
}

const EndpointSpec* EndpointRegistry::find(const std::string& key) const {
    auto it = by_key_.find(key);
    return it == by_key_.end() ? nullptr : &specs_[it->second];
}

const EndpointSpec* EndpointRegistry::findByRoute(const std::string& route) const {
    auto it = by_route_.find(route);
    return it == by_route_.end() ? nullptr : &specs_[it->second];
}

const TranslationRule* EndpointRegistry::rule(const std::string& key) const {
    auto it = rules_.find(key);
    return it == rules_.end() ? nullptr : &it->second;
}

}  // namespace planproxy
