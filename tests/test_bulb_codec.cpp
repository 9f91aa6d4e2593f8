#include "bulbnet/bulb/BulbCommand.hpp"
#include "bulbnet/bulb/BulbConfig.hpp"
#include "bulbnet/bulb/BulbResponse.hpp"
#include "bulbnet/bulb/BulbState.hpp"
#include "bulbnet/bulb/Color.hpp"
#include "bulbnet/core/Error.hpp"
#include "bulbnet/log/Log.hpp"
#include "bulbnet/net/NetConfig.hpp"
#include "bulbnet/net/TimeoutConfig.hpp"

#include <chrono>
#include <string>

using namespace bulbnet;
using nlohmann::json;

static int g_failures = 0;

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { bulbnet::logError("ASSERT TRUE FAILED: ", (msg), \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define ASSERT_EQ(a,b,msg) \
    do { auto _va=(a); auto _vb=(b); if (!((_va)==(_vb))) { bulbnet::logError("ASSERT EQ FAILED: ", (msg), \
        "  (", _va, " != ", _vb, ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

static void testCommandEncoding() {
    auto ping = BulbCommand::ping();
    ping.id = "0a1b2c3d";
    const auto pingJson = json::parse(ping.encode());
    ASSERT_EQ(pingJson.at("command").get<std::string>(), std::string("ping"), "ping name");
    ASSERT_EQ(pingJson.at("id").get<std::string>(), std::string("0a1b2c3d"), "ping id");
    ASSERT_TRUE(!pingJson.contains("params"), "ping omits params");

    auto color = BulbCommand::setColor(RgbColor{255, 0, 127});
    color.id = "deadbeef";
    const auto colorJson = json::parse(color.encode());
    ASSERT_EQ(colorJson.at("command").get<std::string>(), std::string("set_color"), "color name");
    ASSERT_EQ(colorJson["params"]["color"]["r"].get<int>(), 255, "red channel");
    ASSERT_EQ(colorJson["params"]["color"]["g"].get<int>(), 0, "green channel");
    ASSERT_EQ(colorJson["params"]["color"]["b"].get<int>(), 127, "blue channel");

    auto power = BulbCommand::setPower(true);
    ASSERT_EQ(power.name, std::string("set_power"), "power name");
    ASSERT_TRUE(power.params && power.params->at("power").get<bool>(), "power param");

    auto brightness = BulbCommand::setBrightness(42);
    ASSERT_EQ(brightness.params->at("brightness").get<int>(), 42, "brightness param");
}

static void testCommandDecoding() {
    BulbCommand command;
    ASSERT_TRUE(command.decode(R"({"command":"set_brightness","id":"abc","params":{"brightness":7}})"),
                "decode request");
    ASSERT_EQ(command.name, std::string("set_brightness"), "decoded name");
    ASSERT_EQ(command.id, std::string("abc"), "decoded id");
    ASSERT_EQ(command.params->at("brightness").get<int>(), 7, "decoded params");

    BulbCommand untouched;
    untouched.name = "keep";
    ASSERT_TRUE(!untouched.decode(R"({"id":"abc"})"), "missing command rejected");
    ASSERT_TRUE(!untouched.decode(R"({"command":"ping","id":"x","params":[1,2]})"),
                "non-object params rejected");
    ASSERT_TRUE(!untouched.decode("{{{"), "garbage rejected");
    ASSERT_EQ(untouched.name, std::string("keep"), "failed decode leaves command untouched");
}

static void testResponseDecoding() {
    BulbResponse ok;
    ASSERT_TRUE(ok.decode(R"({"success":true,"id":"1234abcd","data":{"power":true}})"),
                "decode success reply");
    ASSERT_TRUE(ok.success, "success flag");
    ASSERT_EQ(ok.id, std::string("1234abcd"), "reply id");
    ASSERT_TRUE(ok.data && ok.data->at("power").get<bool>(), "reply data");
    ASSERT_TRUE(!ok.error, "no error on success");
    ASSERT_TRUE(!ok.code, "no error code on success");

    BulbResponse refused;
    ASSERT_TRUE(refused.decode(R"({"success":false,"id":"x","error":"busy","data":null})"),
                "decode failure reply");
    ASSERT_TRUE(!refused.success, "failure flag");
    ASSERT_EQ(refused.error.value_or(""), std::string("busy"), "failure message");
    ASSERT_TRUE(refused.code == make_error_code(Errc::DeviceError), "device error code");
    ASSERT_TRUE(!refused.data, "null data treated as absent");

    BulbResponse bad;
    ASSERT_TRUE(!bad.decode(R"({"success":true})"), "reply without id rejected");
    ASSERT_TRUE(!bad.decode(R"({"success":"yes","id":"x"})"), "non-bool success rejected");
    ASSERT_TRUE(!bad.decode(R"({"success":true,"id":"x","data":5})"), "non-object data rejected");
    ASSERT_TRUE(!bad.decode(R"([1,2,3])"), "array rejected");
    ASSERT_TRUE(!bad.decode(""), "empty payload rejected");

    const auto reEncoded = json::parse(refused.encode());
    ASSERT_EQ(reEncoded.at("error").get<std::string>(), std::string("busy"), "encode keeps error");
    ASSERT_TRUE(!reEncoded.contains("data"), "encode omits absent data");
}

static void testFailureFactory() {
    auto timeout = BulbResponse::failure("cafe0001", make_error_code(Errc::Timeout), "Command timeout");
    ASSERT_TRUE(!timeout.success, "synthetic failure");
    ASSERT_EQ(timeout.id, std::string("cafe0001"), "synthetic failure keeps id");
    ASSERT_TRUE(timeout.code == make_error_code(Errc::Timeout), "timeout code");

    auto defaulted = BulbResponse::failure("x", make_error_code(Errc::Cancelled));
    ASSERT_EQ(defaulted.error.value_or(""), make_error_code(Errc::Cancelled).message(),
              "message defaults to category text");
}

static void testHexColors() {
    auto red = parseHexColor("#FF0000");
    ASSERT_TRUE(red && *red == (RgbColor{255, 0, 0}), "#FF0000 decodes to red");

    auto spring = parseHexColor("00ff7f");
    ASSERT_TRUE(spring && *spring == (RgbColor{0, 255, 127}), "lowercase without # decodes");

    ASSERT_TRUE(!parseHexColor("#FFF"), "short hex rejected");
    ASSERT_TRUE(!parseHexColor("#1234567"), "long hex rejected");
    ASSERT_TRUE(!parseHexColor("GG0000"), "non-hex digit rejected");
    ASSERT_TRUE(!parseHexColor("##FF000"), "double hash rejected");
    ASSERT_TRUE(!parseHexColor(""), "empty rejected");
    ASSERT_TRUE(parseHexColor("zzzzzz").error() == make_error_code(Errc::CallerError),
                "invalid hex is a caller error");

    ASSERT_EQ(toHex(RgbColor{0, 128, 255}), std::string("#0080FF"), "toHex formatting");

    const RgbColor samples[] = {{0, 0, 0}, {255, 255, 255}, {18, 52, 86}, {171, 205, 239}};
    for (const auto& sample : samples) {
        auto decoded = parseHexColor(toHex(sample));
        ASSERT_TRUE(decoded && *decoded == sample, "hex decode(encode(rgb)) == rgb");
    }

    ASSERT_TRUE(makeRgb(0, 128, 255).has_value(), "in-range channels accepted");
    ASSERT_TRUE(!makeRgb(256, 0, 0), "channel above 255 rejected");
    ASSERT_TRUE(!makeRgb(0, -1, 0), "negative channel rejected");
}

static void testStateMerge() {
    BulbState state;
    ASSERT_TRUE(!state.power && state.brightness == 0 && !state.reachable, "initial snapshot");
    ASSERT_TRUE(state.color == (RgbColor{255, 255, 255}), "initial colour is white");

    state.merge(json{{"power", true}, {"brightness", 80},
                     {"color", {{"r", 1}, {"g", 2}, {"b", 3}}}, {"connected", true}});
    ASSERT_TRUE(state.power, "power merged");
    ASSERT_EQ(state.brightness, 80, "brightness merged");
    ASSERT_TRUE(state.color == (RgbColor{1, 2, 3}), "colour merged");
    ASSERT_TRUE(state.reachable, "connected merged");

    state.merge(json{{"brightness", 101}, {"power", "on"}, {"color", {{"r", 300}, {"g", 0}, {"b", 0}}}});
    ASSERT_EQ(state.brightness, 80, "out-of-range brightness ignored");
    ASSERT_TRUE(state.power, "wrong-typed power ignored");
    ASSERT_TRUE(state.color == (RgbColor{1, 2, 3}), "out-of-range colour ignored");

    state.merge(json{{"brightness", 5}});
    ASSERT_EQ(state.brightness, 5, "partial merge");
    ASSERT_TRUE(state.power && state.reachable, "partial merge leaves other fields");

    const auto out = state.toJson();
    ASSERT_EQ(out.at("brightness").get<int>(), 5, "toJson brightness");
    ASSERT_TRUE(out.at("connected").get<bool>(), "toJson reports reachable as connected");
}

static void testAddresses() {
    auto full = parseAddress("192.168.1.45:4001");
    ASSERT_TRUE(full && full->host == "192.168.1.45" && full->port == 4001, "host:port parsed");

    auto bare = parseAddress("bulb.local");
    ASSERT_TRUE(bare && bare->port == config::BULB_PORT_DEFAULT, "missing port uses default");

    ASSERT_TRUE(!parseAddress("host:"), "empty port rejected");
    ASSERT_TRUE(!parseAddress("host:70000"), "port out of range rejected");
    ASSERT_TRUE(!parseAddress("host:12ab"), "non-numeric port rejected");
    ASSERT_TRUE(!parseAddress(""), "empty address rejected");

    auto fifty = parseInt("50");
    ASSERT_TRUE(fifty && *fifty == 50, "plain integer parsed");
    auto negative = parseInt("-3");
    ASSERT_TRUE(negative && *negative == -3, "negative integer parsed");
    ASSERT_TRUE(!parseInt("4294967346"), "value that would wrap to 50 rejected");
    ASSERT_TRUE(!parseInt("99999999999999999999"), "value beyond long rejected");
    ASSERT_TRUE(!parseInt("12ab"), "trailing text rejected");
    ASSERT_TRUE(!parseInt(" 7"), "leading space rejected");
    ASSERT_TRUE(!parseInt(""), "empty integer rejected");
    ASSERT_TRUE(parseInt("2147483648").error() == make_error_code(Errc::CallerError),
                "int overflow is a caller error");

    const BulbAddress a{"10.0.0.1", 4000};
    const BulbAddress b{"10.0.0.1", 4001};
    ASSERT_TRUE(a < b && !(b < a) && a != b, "address ordering by port");
    ASSERT_EQ(a.toString(), std::string("10.0.0.1:4000"), "address formatting");
}

static void testTimeoutDefaults() {
    ASSERT_TRUE(BulbConfig("h", 1).timeout == net::TimeoutConfig::defaultTimeout(),
                "config takes the process default");
    {
        net::TimeoutConfig::ScopedOverride shorter(std::chrono::milliseconds{250});
        ASSERT_EQ(BulbConfig("h", 1).timeout.count(), 250, "scoped override applies");
    }
    ASSERT_EQ(net::TimeoutConfig::defaultTimeout().count(),
              net::TimeoutConfig::kBuiltinDefault.count(), "override restored");
    ASSERT_EQ(BulbConfig("h", 1, std::chrono::milliseconds{-5}).timeout.count(), 0,
              "negative timeout clamped");
}

static void testErrorsAndLogging() {
    ASSERT_EQ(std::string(bulbnet_category().name()), std::string("bulbnet"), "category name");
    ASSERT_EQ(make_error_code(Errc::Timeout).message(), std::string("command timeout"),
              "timeout message");
    ASSERT_TRUE(classify_transport_error(net::asio::error::timed_out) ==
                make_error_code(Errc::Timeout), "timed_out maps to Timeout");
    ASSERT_TRUE(classify_transport_error(net::asio::error::host_unreachable) ==
                make_error_code(Errc::TransportFailure), "socket errors map to TransportFailure");
    ASSERT_TRUE(!classify_transport_error({}), "no error stays no error");

    std::string captured;
    setInfoLogHandler([&captured](std::string_view message) { captured.append(message); });
    logInfo("[Test] value=", 7, "\n");
    resetLogHandlers();
    ASSERT_EQ(captured, std::string("[Test] value=7\n"), "info handler receives formatted text");
}

int main() {
    testCommandEncoding();
    testCommandDecoding();
    testResponseDecoding();
    testFailureFactory();
    testHexColors();
    testStateMerge();
    testAddresses();
    testTimeoutDefaults();
    testErrorsAndLogging();

    if (g_failures) {
        bulbnet::logError("Tests failed: ", g_failures, " failure(s)\n");
        return 1;
    }
    bulbnet::logInfo("Codec tests passed.\n");
    return 0;
}
