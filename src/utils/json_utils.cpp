#include "utils/json_utils.h"

namespace planproxy {

std::optional<nlohmann::json> parse_json(const std::string& body, std::string* error) {
    try {
        auto j = nlohmann::json::parse(body);
        return j;
    } catch (const std::exception& ex) {
        if (error) *error = ex.what();
        return std::nullopt;
    }
}

bool has_required_keys(const nlohmann::json& j,
                       const std::vector<std::string>& keys,
                       std::string* missing_key) {
    for (const auto& k : keys) {
        if (!j.is_object() || !j.contains(k) || j.at(k).is_null()) {
            if (missing_key) *missing_key = k;
            return false;
        }
    }
    return true;
}

std::string excerpt(const std::string& text, size_t limit) {
    if (text.size() <= limit) return text;
    return text.substr(0, limit) + "...";
}

}  // namespace planproxy
