#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "utils/cli.h"
#include "utils/version.h"

using namespace sagegate;

namespace {
CliResult parse(std::vector<std::string> args) {
    std::vector<char*> argv;
    for (auto& s : args) argv.push_back(s.data());
    argv.push_back(nullptr);
    return parseCliArgs(static_cast<int>(args.size()), argv.data());
}
}  // namespace

TEST(CliTest, HelpFlagShowsHelpMessage) {
    for (const char* flag : {"--help", "-h"}) {
        CliResult result = parse({"sagegate", flag});
        EXPECT_TRUE(result.should_exit);
        EXPECT_EQ(result.exit_code, 0);
        EXPECT_NE(result.output.find("sagegate"), std::string::npos);
        EXPECT_NE(result.output.find("COMMANDS"), std::string::npos);
    }
}

TEST(CliTest, VersionFlagShowsVersion) {
    for (const char* flag : {"--version", "-V"}) {
        CliResult result = parse({"sagegate", flag});
        EXPECT_TRUE(result.should_exit);
        EXPECT_EQ(result.exit_code, 0);
        EXPECT_NE(result.output.find(SAGEGATE_VERSION), std::string::npos);
    }
}

TEST(CliTest, NoArgsContinuesToServerMode) {
    CliResult result = parse({"sagegate"});
    EXPECT_FALSE(result.should_exit);
    EXPECT_EQ(result.subcommand, Subcommand::None);
    EXPECT_EQ(result.serve_options.port, 0);
}

TEST(CliTest, ServeParsesPortAndHost) {
    CliResult result = parse({"sagegate", "serve", "--port", "9090", "--host", "127.0.0.1"});
    EXPECT_FALSE(result.should_exit);
    EXPECT_EQ(result.subcommand, Subcommand::Serve);
    EXPECT_EQ(result.serve_options.port, 9090);
    EXPECT_EQ(result.serve_options.host, "127.0.0.1");
}

TEST(CliTest, LeadingServerOptionsImplyServerMode) {
    CliResult result = parse({"sagegate", "--port", "9191"});
    EXPECT_FALSE(result.should_exit);
    EXPECT_EQ(result.subcommand, Subcommand::None);
    EXPECT_EQ(result.serve_options.port, 9191);
}

TEST(CliTest, ServeHelp) {
    CliResult result = parse({"sagegate", "serve", "--help"});
    EXPECT_TRUE(result.should_exit);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_NE(result.output.find("SAGEMAKER_ENDPOINT_NAME"), std::string::npos);
}

TEST(CliTest, InvalidPortIsRejected) {
    for (const char* port : {"0", "65536", "80x", "abc"}) {
        CliResult result = parse({"sagegate", "serve", "--port", port});
        EXPECT_TRUE(result.should_exit) << port;
        EXPECT_EQ(result.exit_code, 1) << port;
        EXPECT_NE(result.output.find(std::string("Error: invalid port: ") + port), std::string::npos);
    }
}

TEST(CliTest, InvokeReadsEventOption) {
    CliResult result = parse({"sagegate", "invoke", "--event", "event.json"});
    EXPECT_FALSE(result.should_exit);
    EXPECT_EQ(result.subcommand, Subcommand::Invoke);
    EXPECT_EQ(result.invoke_options.event_file, "event.json");

    CliResult stdin_result = parse({"sagegate", "invoke"});
    EXPECT_FALSE(stdin_result.should_exit);
    EXPECT_TRUE(stdin_result.invoke_options.event_file.empty());
}

TEST(CliTest, InvokeHelp) {
    CliResult result = parse({"sagegate", "invoke", "-h"});
    EXPECT_TRUE(result.should_exit);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_NE(result.output.find("--event"), std::string::npos);
}

TEST(CliTest, UnknownCommandFails) {
    CliResult result = parse({"sagegate", "pull"});
    EXPECT_TRUE(result.should_exit);
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_NE(result.output.find("Unknown command: pull"), std::string::npos);
}

TEST(CliTest, UnknownOptionFails) {
    CliResult top = parse({"sagegate", "--verbose"});
    EXPECT_TRUE(top.should_exit);
    EXPECT_EQ(top.exit_code, 1);
    EXPECT_NE(top.output.find("Unknown option: --verbose"), std::string::npos);

    CliResult serve = parse({"sagegate", "serve", "--threads", "4"});
    EXPECT_EQ(serve.exit_code, 1);

    CliResult invoke = parse({"sagegate", "invoke", "--event"});
    EXPECT_EQ(invoke.exit_code, 1);
}

TEST(CliTest, SubcommandNames) {
    EXPECT_EQ(subcommandToString(Subcommand::None), "none");
    EXPECT_EQ(subcommandToString(Subcommand::Serve), "serve");
    EXPECT_EQ(subcommandToString(Subcommand::Invoke), "invoke");
}
