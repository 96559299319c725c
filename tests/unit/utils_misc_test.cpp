#include <gtest/gtest.h>

#include <regex>
#include <set>
#include <thread>
#include <vector>

#include "core/gateway_error.h"
#include "runtime/state.h"
#include "utils/json_utils.h"
#include "utils/request_id.h"

using namespace planproxy;

TEST(JsonUtilsTest, ParseJsonHandlesInvalid) {
    std::string error;
    auto ok = parse_json(R"({"a":1})", &error);
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(ok->at("a").get<int>(), 1);

    auto bad = parse_json("{invalid:json}", &error);
    EXPECT_FALSE(bad.has_value());
    EXPECT_FALSE(error.empty());
}

TEST(JsonUtilsTest, HasRequiredKeysAndFallbacks) {
    nlohmann::json j = {{"name", "plan"}, {"days", 3}, {"notes", nullptr}};
    std::string missing;
    EXPECT_TRUE(has_required_keys(j, {"name", "days"}, &missing));
    EXPECT_TRUE(missing.empty());

    EXPECT_FALSE(has_required_keys(j, {"name", "meals"}, &missing));
    EXPECT_EQ(missing, "meals");

    // null counts as missing
    EXPECT_FALSE(has_required_keys(j, {"notes"}, &missing));
    EXPECT_EQ(missing, "notes");

    EXPECT_EQ(get_or<int>(j, "days", 0), 3);
    EXPECT_EQ(get_or<std::string>(j, "days", "fallback"), "fallback");
    EXPECT_EQ(get_or<std::string>(j, "host", "localhost"), "localhost");
}

TEST(JsonUtilsTest, ExcerptCutsAndMarks) {
    EXPECT_EQ(excerpt("short", 10), "short");
    EXPECT_EQ(excerpt("0123456789abc", 10), "0123456789...");
    EXPECT_EQ(excerpt("", 0), "");
}

TEST(RequestIdTest, GeneratesUuidV4Text) {
    static const std::regex uuid_v4(
        "^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");
    std::set<std::string> seen;
    for (int i = 0; i < 200; ++i) {
        auto id = generate_request_id();
        EXPECT_TRUE(std::regex_match(id, uuid_v4)) << id;
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 200u);
}

TEST(GatewayErrorTest, KindNamesAndDefaultStatuses) {
    EXPECT_STREQ(to_string(ErrorKind::kParse), "parse_error");
    EXPECT_STREQ(to_string(ErrorKind::kTimeout), "timeout_error");
    EXPECT_STREQ(to_string(ErrorKind::kProxy), "proxy_error");
    EXPECT_STREQ(to_string(ErrorKind::kTranslation), "translation_error");
    EXPECT_STREQ(to_string(ErrorKind::kValidation), "validation_error");
    EXPECT_STREQ(to_string(ErrorKind::kInternal), "internal_error");

    EXPECT_EQ(GatewayError(ErrorKind::kParse, "m").status(), 400);
    EXPECT_EQ(GatewayError(ErrorKind::kTimeout, "m").status(), 504);
    EXPECT_EQ(GatewayError(ErrorKind::kValidation, "m").status(), 500);

    GatewayError explicit_status(ErrorKind::kProxy, "m", "d", 429);
    EXPECT_TRUE(explicit_status.hasStatus());
    EXPECT_EQ(explicit_status.status(), 429);
    EXPECT_EQ(explicit_status.details(), "d");
}

TEST(RuntimeStateTest, ActiveRequestGuardCountsRequests) {
    const auto active_before = active_request_count();
    const auto total_before = total_request_count();
    {
        ActiveRequestGuard a;
        ActiveRequestGuard b;
        EXPECT_EQ(active_request_count(), active_before + 2);
    }
    EXPECT_EQ(active_request_count(), active_before);
    EXPECT_EQ(total_request_count(), total_before + 2);
}
