#include <gtest/gtest.h>
#include "subprocess.hpp"

#include <string>

namespace {

ByteSink collect(std::string& out) {
    return [&out](std::string_view chunk) -> std::expected<void, std::string> {
        out.append(chunk);
        return {};
    };
}

} // namespace

TEST(SubprocessTest, StreamsInputThroughChild) {
    std::string payload;
    for (int i = 0; i < 20000; ++i) {
        payload += "INSERT INTO t VALUES (" + std::to_string(i) + ");\n";
    }
    std::string out;
    ProcessOptions options;
    options.input = [&payload](const ByteSink& sink) { return sink(payload); };
    options.output = collect(out);

    auto result = runProcess({"cat"}, options);
    ASSERT_TRUE(result) << result.error();
    EXPECT_EQ(result->exitCode, 0);
    EXPECT_EQ(out, payload);
}

TEST(SubprocessTest, CapturesStderrAndExitCode) {
    auto result = runProcess({"sh", "-c", "echo 'access denied' >&2; exit 3"}, ProcessOptions{});
    ASSERT_TRUE(result) << result.error();
    EXPECT_EQ(result->exitCode, 3);
    EXPECT_EQ(result->errorOutput, "access denied\n");
}

TEST(SubprocessTest, EnvironmentIsPassedToChild) {
    std::string out;
    ProcessOptions options;
    options.output = collect(out);
    options.environment = {{"MYSQL_PWD", "s3cret"}};
    auto result = runProcess({"sh", "-c", "printf %s \"$MYSQL_PWD\""}, options);
    ASSERT_TRUE(result) << result.error();
    EXPECT_EQ(out, "s3cret");
}

TEST(SubprocessTest, StdinIsClosedWithoutProducer) {
    std::string out;
    ProcessOptions options;
    options.output = collect(out);
    auto result = runProcess({"cat"}, options);
    ASSERT_TRUE(result) << result.error();
    EXPECT_EQ(result->exitCode, 0);
    EXPECT_TRUE(out.empty());
}

TEST(SubprocessTest, SinkErrorStopsChild) {
    ProcessOptions options;
    options.output = [](std::string_view) -> std::expected<void, std::string> {
        return std::unexpected("archive write failed");
    };
    auto result = runProcess({"yes"}, options);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), "archive write failed");
}

TEST(SubprocessTest, MissingProgramExitsWith127) {
    auto result = runProcess({"dumpvault-no-such-tool"}, ProcessOptions{});
    ASSERT_TRUE(result) << result.error();
    EXPECT_EQ(result->exitCode, 127);
    EXPECT_NE(result->errorOutput.find("dumpvault-no-such-tool"), std::string::npos);
}
