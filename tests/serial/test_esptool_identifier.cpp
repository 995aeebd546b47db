#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "macscout/serial/esptool_identifier.hpp"

using namespace macscout::serial;
using namespace std::chrono_literals;

namespace {

// Runs a shell snippet in place of esptool; $0 is the port.
auto shellTool(const std::string& script) -> EsptoolIdentifier {
    return EsptoolIdentifier(EsptoolConfig{"/bin/sh", {"-c", script, "{port}"}});
}

auto failureOf(const IdentifyResult& result) -> IdentifyFailure {
    EXPECT_TRUE(std::holds_alternative<IdentifyFailure>(result));
    if (const auto* failure = std::get_if<IdentifyFailure>(&result)) {
        return *failure;
    }
    return {};
}

}  // namespace

TEST(EsptoolIdentifierTest, DefaultArguments) {
    EsptoolIdentifier identifier;
    EXPECT_EQ(identifier.config().program, "esptool.py");
    EXPECT_EQ(identifier.buildArguments("/dev/ttyUSB0"),
              (std::vector<std::string>{"--port", "/dev/ttyUSB0", "--baud",
                                        "115200", "read_mac"}));
}

TEST(EsptoolIdentifierTest, ReplacesEveryPlaceholder) {
    EsptoolIdentifier identifier(
        EsptoolConfig{"tool", {"{port}:{port}", "plain"}});
    EXPECT_EQ(identifier.buildArguments("/dev/ttyACM0"),
              (std::vector<std::string>{"/dev/ttyACM0:/dev/ttyACM0", "plain"}));
}

TEST(EsptoolIdentifierTest, ReadsMacFromOutput) {
    auto identifier = shellTool(
        "echo 'Chip is ESP32'; echo 'MAC: 24:0A:C4:00:11:22'; exit 0");
    auto result = identifier.identify("/dev/ttyUSB0", 5s, {});
    ASSERT_TRUE(std::holds_alternative<std::string>(result));
    EXPECT_EQ(std::get<std::string>(result), "24:0a:c4:00:11:22");
}

TEST(EsptoolIdentifierTest, PassesPortToTool) {
    auto identifier = shellTool(
        "if [ \"$0\" = /dev/ttyUSB3 ]; then echo 'MAC: 30:ae:a4:01:02:03'; "
        "else exit 1; fi");
    auto result = identifier.identify("/dev/ttyUSB3", 5s, {});
    ASSERT_TRUE(std::holds_alternative<std::string>(result));
    EXPECT_EQ(std::get<std::string>(result), "30:ae:a4:01:02:03");

    EXPECT_EQ(failureOf(identifier.identify("/dev/ttyUSB4", 5s, {})).code,
              IdentifyError::ProtocolError);
}

TEST(EsptoolIdentifierTest, TimesOut) {
    auto identifier = shellTool("sleep 5");
    auto begin = std::chrono::steady_clock::now();
    auto failure = failureOf(identifier.identify("/dev/ttyUSB0", 200ms, {}));
    auto elapsed = std::chrono::steady_clock::now() - begin;

    EXPECT_EQ(failure.code, IdentifyError::Timeout);
    EXPECT_EQ(failure.message, "no answer within 200 ms");
    EXPECT_LT(elapsed, 3s);
}

TEST(EsptoolIdentifierTest, StopRequestCancels) {
    auto identifier = shellTool("sleep 5");
    std::stop_source stop;
    std::jthread canceller([&stop] {
        std::this_thread::sleep_for(100ms);
        stop.request_stop();
    });

    auto begin = std::chrono::steady_clock::now();
    auto failure =
        failureOf(identifier.identify("/dev/ttyUSB0", 10s, stop.get_token()));
    EXPECT_EQ(failure.code, IdentifyError::Cancelled);
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 3s);
}

TEST(EsptoolIdentifierTest, ClassifiesToolErrors) {
    auto denied = shellTool(
        "echo \"could not open port $0: [Errno 13] Permission denied: "
        "'$0'\"; exit 2");
    auto failure = failureOf(denied.identify("/dev/ttyUSB0", 5s, {}));
    EXPECT_EQ(failure.code, IdentifyError::AccessDenied);
    EXPECT_NE(failure.message.find("Permission denied"), std::string::npos);

    auto vanished = shellTool(
        "echo 'Connecting...'; echo '[Errno 5] Input/output error' >&2; "
        "exit 2");
    EXPECT_EQ(failureOf(vanished.identify("/dev/ttyUSB0", 5s, {})).code,
              IdentifyError::Disconnected);

    auto silent = shellTool("echo 'Chip is ESP32'; exit 0");
    failure = failureOf(silent.identify("/dev/ttyUSB0", 5s, {}));
    EXPECT_EQ(failure.code, IdentifyError::ProtocolError);
    EXPECT_EQ(failure.message, "mac not found");
}

TEST(EsptoolIdentifierTest, MissingProgramFails) {
    EsptoolIdentifier identifier(
        EsptoolConfig{"/nonexistent/esptool.py", {"read_mac"}});
    auto failure = failureOf(identifier.identify("/dev/ttyUSB0", 5s, {}));
    EXPECT_EQ(failure.code, IdentifyError::ProtocolError);
    EXPECT_NE(failure.message.find("cannot execute"), std::string::npos);
}

TEST(EsptoolIdentifierTest, ClassifyFailureUsesLastLine) {
    auto failure = EsptoolIdentifier::classifyFailure(
        2, "Connecting......\nA fatal error occurred: Failed to connect\n\n");
    EXPECT_EQ(failure.code, IdentifyError::ProtocolError);
    EXPECT_EQ(failure.message, "A fatal error occurred: Failed to connect");
    EXPECT_EQ(failure.describe(),
              "protocol error: A fatal error occurred: Failed to connect");

    auto empty = EsptoolIdentifier::classifyFailure(1, "");
    EXPECT_EQ(empty.message, "exit code 1");

    auto busy = EsptoolIdentifier::classifyFailure(
        1, "[Errno 16] Device or resource busy");
    EXPECT_EQ(busy.code, IdentifyError::AccessDenied);
}
