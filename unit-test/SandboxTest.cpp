#include <filesystem>
#include "gtest/gtest.h"
#include "common/io_utils.hpp"
#include "config.hpp"
#include "sandbox.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace codebox;

class SandboxTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        test::setup_test_environment();
    }
};

TEST_F(SandboxTest, DockerCommandTest) {
    docker_sandbox box;
    sandbox_limits limits;
    auto command = box.build("gcc:12.2.0", "/tmp/job-1", {"./main"}, limits, "codebox-job-1");
    vector<string> expected = {
        "docker", "run", "--rm",
        "--name", "codebox-job-1",
        "--network", "none",
        "--cpus", "1.0",
        "--memory", "512m",
        "--pids-limit", "256",
        "-v", "/tmp/job-1:/code:rw",
        "-w", "/code",
        "gcc:12.2.0",
        "./main"};
    EXPECT_EQ(command, expected);
    EXPECT_EQ(box.type(), "docker");
}

TEST_F(SandboxTest, DockerLimitsOverrideTest) {
    docker_sandbox box;
    sandbox_limits limits;
    limits.cpus = "0.5";
    limits.memory = "128m";
    limits.pids_limit = 32;
    auto command = box.build("python:3.11-slim", "/w", {"python", "main.py"}, limits, "n");

    auto value_of = [&](const string &flag) {
        auto it = find(command.begin(), command.end(), flag);
        return it == command.end() || next(it) == command.end() ? string() : *next(it);
    };
    EXPECT_EQ(value_of("--cpus"), "0.5");
    EXPECT_EQ(value_of("--memory"), "128m");
    EXPECT_EQ(value_of("--pids-limit"), "32");
    EXPECT_EQ(value_of("--network"), "none");
    EXPECT_EQ(command[command.size() - 2], "python");
    EXPECT_EQ(command.back(), "main.py");
}

TEST_F(SandboxTest, DirectSandboxRunsInWorkspaceTest) {
    direct_sandbox box;
    posix_process_runner runner;
    auto workspace = make_temp_directory(RUN_DIR, "sandbox-");
    write_file_content(workspace / "hello.txt", "hello from workspace");

    auto result = runner.run(box.build("ignored", workspace, {"cat", "hello.txt"}, sandbox_limits(), "n"), "", chrono::seconds(5));
    EXPECT_EQ(result.exit_code, 0) << result.std_err;
    EXPECT_EQ(result.std_out, "hello from workspace");

    box.reap("n", runner);
    filesystem::remove_all(workspace);
}
