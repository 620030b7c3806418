// =============================================================================
// Unit tests for automation_dispatcher.hpp
// Tests: parameter coercion, every catalog method against a FakeDevice,
//        session-scoped API key, validation-before-device ordering
// =============================================================================
#include <gtest/gtest.h>
#include <fstream>
#include <iterator>

#include <stdlib.h>
#include <unistd.h>

#include "automation_dispatcher.hpp"
#include "phonebridge_log.hpp"
#include "screen_image.hpp"
#include "fake_device.hpp"

using namespace phonebridge;
using phonebridge::testing_support::FakeDevice;
using phonebridge::testing_support::kFakeHierarchyText;

namespace {

AutomationDispatcher::Options fastOptions() {
    AutomationDispatcher::Options o;
    o.focus_settle_ms = 0;
    o.launch_settle_ms = 0;
    return o;
}

class DispatcherTest : public ::testing::Test {
protected:
    FakeDevice device;
    AutomationDispatcher dispatcher{device, fastOptions()};
    Session session;

    Result<DispatchOutcome> call(const std::string& method, const json& params = json::object()) {
        return dispatcher.dispatch(method, params, session);
    }
};

} // namespace

// ---------------------------------------------------------------------------
// rpc_params
// ---------------------------------------------------------------------------
TEST(RpcParamsTest, NumberCoercion) {
    json p = {{"i", 3}, {"f", 2.5}, {"s", " 7.25 "}, {"b", true}, {"bad", "abc"}, {"arr", json::array()}};
    EXPECT_DOUBLE_EQ(rpc_params::number(p, "i").value(), 3.0);
    EXPECT_DOUBLE_EQ(rpc_params::number(p, "f").value(), 2.5);
    EXPECT_DOUBLE_EQ(rpc_params::number(p, "s").value(), 7.25);
    EXPECT_DOUBLE_EQ(rpc_params::number(p, "b").value(), 1.0);

    auto bad = rpc_params::number(p, "bad");
    ASSERT_TRUE(bad.is_err());
    EXPECT_EQ(bad.error().message, "parameter 'bad' must be a number");
    EXPECT_TRUE(rpc_params::number(p, "arr").is_err());

    auto absent = rpc_params::number(p, "zzz");
    ASSERT_TRUE(absent.is_err());
    EXPECT_EQ(absent.error().kind, ErrorKind::Validation);
    EXPECT_EQ(absent.error().message, "missing parameter 'zzz'");
}

TEST(RpcParamsTest, RoundedIntTiesToEven) {
    json p = {{"a", 2.5}, {"b", 3.5}, {"c", -0.4}, {"d", 1e12}};
    EXPECT_EQ(rpc_params::rounded_int(p, "a").value(), 2);
    EXPECT_EQ(rpc_params::rounded_int(p, "b").value(), 4);
    EXPECT_EQ(rpc_params::rounded_int(p, "c").value(), 0);
    EXPECT_TRUE(rpc_params::rounded_int(p, "d").is_err());
}

TEST(RpcParamsTest, TextMustBeString) {
    json p = {{"s", "hi"}, {"n", 5}};
    EXPECT_EQ(rpc_params::text(p, "s").value(), "hi");
    auto bad = rpc_params::text(p, "n");
    ASSERT_TRUE(bad.is_err());
    EXPECT_EQ(bad.error().message, "parameter 'n' must be a string");
}

TEST(RpcParamsTest, IntegerOrDefault) {
    json p = {{"i", 4}, {"s", "12"}, {"f", 2.9}, {"bad", "2x"}};
    EXPECT_EQ(rpc_params::integer_or(p, "missing", 1).value(), 1);
    EXPECT_EQ(rpc_params::integer_or(p, "i", 1).value(), 4);
    EXPECT_EQ(rpc_params::integer_or(p, "s", 1).value(), 12);
    EXPECT_EQ(rpc_params::integer_or(p, "f", 1).value(), 2);
    auto bad = rpc_params::integer_or(p, "bad", 1);
    ASSERT_TRUE(bad.is_err());
    EXPECT_EQ(bad.error().message, "parameter 'bad' must be an integer");
}

TEST(RpcParamsTest, Truthiness) {
    json p = {{"t", true}, {"zero", 0}, {"one", 1}, {"empty", ""}, {"str", "no"}, {"null", nullptr}};
    EXPECT_TRUE(rpc_params::truthy_or(p, "t", false));
    EXPECT_FALSE(rpc_params::truthy_or(p, "zero", true));
    EXPECT_TRUE(rpc_params::truthy_or(p, "one", false));
    EXPECT_FALSE(rpc_params::truthy_or(p, "empty", true));
    EXPECT_TRUE(rpc_params::truthy_or(p, "str", false));
    EXPECT_FALSE(rpc_params::truthy_or(p, "null", true));
    EXPECT_TRUE(rpc_params::truthy_or(p, "absent", true));
}

// ---------------------------------------------------------------------------
// Registry
// ---------------------------------------------------------------------------
TEST_F(DispatcherTest, CatalogIsComplete) {
    const auto& catalog = AutomationDispatcher::method_catalog();
    EXPECT_EQ(catalog.size(), 12u);
    EXPECT_EQ(catalog.front(), "get_tree");
    EXPECT_EQ(catalog.back(), "stop");
}

TEST_F(DispatcherTest, UnknownMethod) {
    auto r = call("reboot");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::Validation);
    EXPECT_EQ(r.error().message, "Unsupported command: reboot");
    EXPECT_TRUE(device.calls().empty());
}

TEST_F(DispatcherTest, NonObjectParamsTreatedAsEmpty) {
    auto r = call("get_tree", json::array({1, 2}));
    ASSERT_TRUE(r.is_ok()) << r.error().message;
    EXPECT_EQ(r.value().result["tree"], kFakeHierarchyText);
}

// ---------------------------------------------------------------------------
// Observation
// ---------------------------------------------------------------------------
TEST_F(DispatcherTest, GetTree) {
    auto r = call("get_tree");
    ASSERT_TRUE(r.is_ok()) << r.error().message;
    EXPECT_EQ(r.value().result, json({{"tree", kFakeHierarchyText}}));
    EXPECT_FALSE(r.value().stop);
}

TEST_F(DispatcherTest, GetTreeSurfacesToolError) {
    device.fail_hierarchy = true;
    auto r = call("get_tree");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::Tool);
    EXPECT_EQ(r.error().message, "uiautomator dump failed: device offline");
}

TEST_F(DispatcherTest, GetScreenImage) {
    auto r = call("get_screen_image");
    ASSERT_TRUE(r.is_ok()) << r.error().message;
    const json& res = r.value().result;
    EXPECT_EQ(res["screenshot_base64"], image::base64_encode(device.screen_png));
    EXPECT_EQ(res["metadata"]["width"], 1080);
    EXPECT_EQ(res["metadata"]["height"], 2400);
    EXPECT_FALSE(res.contains("tree"));
}

TEST_F(DispatcherTest, GetScreenImageRejectsNonPng) {
    device.screen_png = "error: closed";
    auto r = call("get_screen_image");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::Tool);
    EXPECT_EQ(r.error().message, "device screencap did not return PNG bytes");
}

TEST_F(DispatcherTest, GetContextMergesTreeAndImage) {
    auto r = call("get_context");
    ASSERT_TRUE(r.is_ok()) << r.error().message;
    const json& res = r.value().result;
    EXPECT_EQ(res["tree"], kFakeHierarchyText);
    EXPECT_TRUE(res["screenshot_base64"].is_string());
    EXPECT_EQ(res["metadata"]["width"], 1080);
}

// ---------------------------------------------------------------------------
// tap / tap_element
// ---------------------------------------------------------------------------
TEST_F(DispatcherTest, TapRoundsCoordinates) {
    auto r = call("tap", {{"x", 10.5}, {"y", "20.6"}});
    ASSERT_TRUE(r.is_ok()) << r.error().message;
    EXPECT_EQ(device.actions(), std::vector<std::string>({"tap 10 21"}));
    EXPECT_EQ(r.value().result["tree"], kFakeHierarchyText);
}

TEST_F(DispatcherTest, TapMissingParameter) {
    auto r = call("tap", {{"x", 1}});
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().message, "missing parameter 'y'");
    EXPECT_TRUE(device.calls().empty());
}

TEST_F(DispatcherTest, TapElementRepeatsAtCenter) {
    auto r = call("tap_element", {{"coordinate", "{{100, 200}, {200, 60}}"}, {"count", 2}});
    ASSERT_TRUE(r.is_ok()) << r.error().message;
    EXPECT_EQ(device.actions(), std::vector<std::string>({"tap 200 230", "tap 200 230"}));

    const json& res = r.value().result;
    EXPECT_EQ(res["coordinate"], "{{100, 200}, {200, 60}}");
    EXPECT_EQ(res["count"], 2);
    EXPECT_EQ(res["longPress"], false);
    EXPECT_EQ(res["tree"], kFakeHierarchyText);
}

TEST_F(DispatcherTest, TapElementLongPressIsSingleSwipe) {
    auto r = call("tap_element",
                  {{"coordinate", "{{0, 0}, {10, 10}}"}, {"count", 3}, {"longPress", true}});
    ASSERT_TRUE(r.is_ok()) << r.error().message;
    EXPECT_EQ(device.actions(), std::vector<std::string>({"swipe 5 5 5 5 550"}));
    EXPECT_EQ(r.value().result["count"], 1);
    EXPECT_EQ(r.value().result["longPress"], true);
}

TEST_F(DispatcherTest, TapElementRejectsZeroCount) {
    auto r = call("tap_element", {{"coordinate", "{{0, 0}, {10, 10}}"}, {"count", 0}});
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::Validation);
    EXPECT_EQ(r.error().message, "count must be >= 1");
    EXPECT_TRUE(device.calls().empty());
}

TEST_F(DispatcherTest, TapElementRejectsBadCoordinate) {
    auto r = call("tap_element", {{"coordinate", "[0,0][10,10]"}});
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().message, "coordinate must look like {{x, y}, {w, h}}; got '[0,0][10,10]'");
    EXPECT_TRUE(device.calls().empty());
}

// ---------------------------------------------------------------------------
// enter_text
// ---------------------------------------------------------------------------
TEST_F(DispatcherTest, EnterTextFocusesThenTypes) {
    auto r = call("enter_text", {{"coordinate", "{{0, 0}, {100, 40}}"}, {"text", "hello"}});
    ASSERT_TRUE(r.is_ok()) << r.error().message;
    EXPECT_EQ(device.actions(), std::vector<std::string>({"tap 50 20", "text hello", "key 66"}));
    EXPECT_EQ(r.value().result["coordinate"], "{{0, 0}, {100, 40}}");
    EXPECT_EQ(r.value().result["tree"], kFakeHierarchyText);
}

TEST_F(DispatcherTest, EnterTextSplitsLinesAndChunks) {
    std::string longLine(85, 'a');
    auto r = call("enter_text", {{"coordinate", "{{0, 0}, {2, 2}}"}, {"text", longLine + "\nbye"}});
    ASSERT_TRUE(r.is_ok()) << r.error().message;
    EXPECT_EQ(device.actions(), std::vector<std::string>({
        "tap 1 1",
        "text " + std::string(80, 'a'),
        "text aaaaa",
        "key 66",
        "text bye",
        "key 66",
    }));
}

TEST_F(DispatcherTest, EnterEmptyTextStillSubmits) {
    auto r = call("enter_text", {{"coordinate", "{{0, 0}, {2, 2}}"}, {"text", ""}});
    ASSERT_TRUE(r.is_ok()) << r.error().message;
    EXPECT_EQ(device.actions(), std::vector<std::string>({"tap 1 1", "key 66"}));
}

// ---------------------------------------------------------------------------
// scroll / swipe
// ---------------------------------------------------------------------------
TEST_F(DispatcherTest, ScrollAddsDistance) {
    auto r = call("scroll", {{"x", 500}, {"y", 1200}, {"distanceX", 0}, {"distanceY", -400}});
    ASSERT_TRUE(r.is_ok()) << r.error().message;
    EXPECT_EQ(device.actions(), std::vector<std::string>({"size", "swipe 500 1200 500 800 220"}));
}

TEST_F(DispatcherTest, ScrollClampsToScreen) {
    auto r = call("scroll", {{"x", 1000}, {"y", 100}, {"distanceX", 500}, {"distanceY", -500}});
    ASSERT_TRUE(r.is_ok()) << r.error().message;
    EXPECT_EQ(device.actions(), std::vector<std::string>({"size", "swipe 1000 100 1079 0 220"}));
}

TEST_F(DispatcherTest, SwipeUsesHalfShortSide) {
    auto r = call("swipe", {{"x", 540}, {"y", 1600}, {"direction", "Up"}});
    ASSERT_TRUE(r.is_ok()) << r.error().message;
    EXPECT_EQ(device.actions(), std::vector<std::string>({"size", "swipe 540 1600 540 1060 220"}));
}

TEST_F(DispatcherTest, SwipeMinimumSpanAndClamp) {
    device.screen = ScreenSize{200, 300};
    auto r = call("swipe", {{"x", 100}, {"y", 100}, {"direction", "right"}});
    ASSERT_TRUE(r.is_ok()) << r.error().message;
    // span = max(180, 100) = 180; 100 + 180 clamps to 199
    EXPECT_EQ(device.actions(), std::vector<std::string>({"size", "swipe 100 100 199 100 220"}));
}

TEST_F(DispatcherTest, SwipeRejectsUnknownDirection) {
    auto r = call("swipe", {{"x", 1}, {"y", 1}, {"direction", "diagonal"}});
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::Validation);
    EXPECT_EQ(r.error().message, "direction must be one of: up, down, left, right");
    EXPECT_TRUE(device.calls().empty());
}

TEST_F(DispatcherTest, SwipeScreenSizeFailure) {
    device.fail_screen_size = true;
    auto r = call("swipe", {{"x", 1}, {"y", 1}, {"direction", "down"}});
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::Tool);
    EXPECT_EQ(r.error().message, "wm size failed");
}

// ---------------------------------------------------------------------------
// open_app
// ---------------------------------------------------------------------------
TEST_F(DispatcherTest, OpenAppViaResolvedComponent) {
    device.launch_target = "com.android.settings/.Settings";
    auto r = call("open_app", {{"bundle_identifier", "com.android.settings"}});
    ASSERT_TRUE(r.is_ok()) << r.error().message;
    EXPECT_EQ(device.actions(), std::vector<std::string>({
        "resolve com.android.settings",
        "start com.android.settings/.Settings",
        "foreground",
    }));
    EXPECT_EQ(r.value().result["bundle_identifier"], "com.android.settings");
    EXPECT_EQ(r.value().result["package_name"], "com.android.settings");
    EXPECT_EQ(r.value().result["tree"], kFakeHierarchyText);
}

TEST_F(DispatcherTest, OpenAppFallsBackToLauncherIntent) {
    device.launch_target = "com.example/.Main";
    device.fail_component_launch = true;
    auto r = call("open_app", {{"package_name", "com.example"}});
    ASSERT_TRUE(r.is_ok()) << r.error().message;
    EXPECT_EQ(device.actions(), std::vector<std::string>({
        "resolve com.example",
        "start com.example/.Main",
        "monkey com.example",
        "foreground",
    }));
}

TEST_F(DispatcherTest, OpenAppUnresolvedUsesLauncherIntent) {
    auto r = call("open_app", {{"bundle_identifier", "com.example"}});
    ASSERT_TRUE(r.is_ok()) << r.error().message;
    EXPECT_EQ(device.actions(), std::vector<std::string>({
        "resolve com.example", "monkey com.example", "foreground"}));
}

TEST_F(DispatcherTest, OpenAppLaunchFailure) {
    device.fail_package_launch = true;
    auto r = call("open_app", {{"bundle_identifier", "com.example"}});
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::Tool);
    EXPECT_EQ(r.error().message, "failed to open app 'com.example': no activities");
}

TEST_F(DispatcherTest, OpenAppForegroundMismatch) {
    device.launch_sets_foreground = false;
    device.foreground = "com.android.launcher3";
    auto r = call("open_app", {{"bundle_identifier", "com.example"}});
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::Tool);
    EXPECT_EQ(r.error().message,
              "failed to foreground app 'com.example' (current foreground package: 'com.android.launcher3')");
}

TEST_F(DispatcherTest, OpenAppUnknownForegroundAccepted) {
    device.launch_sets_foreground = false;
    device.foreground = "";
    auto r = call("open_app", {{"bundle_identifier", "com.example"}});
    EXPECT_TRUE(r.is_ok());
}

TEST_F(DispatcherTest, OpenAppValidatesBeforeTouchingDevice) {
    auto missing = call("open_app", {{"bundle_identifier", "  "}});
    ASSERT_TRUE(missing.is_err());
    EXPECT_EQ(missing.error().message, "bundle_identifier is required");

    auto injected = call("open_app", {{"bundle_identifier", "com.x; reboot"}});
    ASSERT_TRUE(injected.is_err());
    EXPECT_EQ(injected.error().kind, ErrorKind::Validation);
    EXPECT_EQ(injected.error().message,
              "bundle_identifier 'com.x; reboot' is not a valid Android package name");

    auto numeric = call("open_app", {{"bundle_identifier", 42}});
    ASSERT_TRUE(numeric.is_err());
    EXPECT_EQ(numeric.error().message, "bundle_identifier '42' is not a valid Android package name");

    EXPECT_TRUE(device.calls().empty());
}

// ---------------------------------------------------------------------------
// Session / control
// ---------------------------------------------------------------------------
TEST_F(DispatcherTest, SubmitPromptNeedsKey) {
    auto r = call("submit_prompt", {{"prompt", "open settings"}});
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::Validation);
    EXPECT_EQ(r.error().message, "No API key found");
}

TEST_F(DispatcherTest, ApiKeyIsStoredInSession) {
    auto set = call("set_api_key", {{"api_key", "  sk-test  "}});
    ASSERT_TRUE(set.is_ok()) << set.error().message;
    EXPECT_EQ(set.value().result, json({{"ok", true}}));
    ASSERT_TRUE(session.api_key.has_value());
    EXPECT_EQ(*session.api_key, "sk-test");

    auto r = call("submit_prompt", {{"prompt", "x"}});
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::Tool);

    // A second session does not see the key
    Session other;
    auto r2 = dispatcher.dispatch("submit_prompt", json::object(), other);
    ASSERT_TRUE(r2.is_err());
    EXPECT_EQ(r2.error().message, "No API key found");
}

TEST_F(DispatcherTest, ApiKeyNeverReachesDebugLog) {
    char path[] = "/tmp/phonebridge_dispatch_logXXXXXX";
    int fd = ::mkstemp(path);
    ASSERT_GE(fd, 0);
    ::close(fd);
    ASSERT_TRUE(log::openLogFile(path));
    log::setLogLevel(log::Level::Debug);

    ASSERT_TRUE(call("set_api_key", {{"api_key", "sk-secret-4242"}}).is_ok());

    log::setLogLevel(log::Level::Info);
    log::closeLogFile();
    std::ifstream in(path);
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    ::unlink(path);

    EXPECT_NE(text.find("set_api_key"), std::string::npos);
    EXPECT_EQ(text.find("sk-secret-4242"), std::string::npos);
}

TEST_F(DispatcherTest, EmptyApiKeyRejected) {
    auto r = call("set_api_key", {{"api_key", "   "}});
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().message, "api_key is required");
    EXPECT_FALSE(session.api_key.has_value());
}

TEST_F(DispatcherTest, StopRequestsShutdown) {
    auto r = call("stop");
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(r.value().stop);
    EXPECT_EQ(r.value().result, json::object());
    EXPECT_TRUE(device.calls().empty());
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
