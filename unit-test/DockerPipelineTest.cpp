#include "gtest/gtest.h"
#include "config.hpp"
#include "judge/pipeline.hpp"
#include "judge/warm_pool.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace codebox;

// 需要 docker 以及拉取好的 python、gcc、temurin 镜像
class DockerPipelineTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        test::setup_test_environment();
    }

    void SetUp() override {
        if (!test::docker_available()) GTEST_SKIP() << "docker is not available";
    }

    execution_result execute(const string &language, const string &code, const string &input = "") {
        warm_pool warmer(box, runner, sandbox_limits(), RUN_DIR);
        pipeline p(languages, box, runner, sandbox_limits(), RUN_DIR, &warmer);
        return p.execute({code, language, input, nullopt});
    }

    language_registry languages = language_registry::builtin(server::language_config());
    docker_sandbox box;
    posix_process_runner runner;
};

TEST_F(DockerPipelineTest, PythonTest) {
    auto result = execute("python", "a, b = map(int, input().split())\nprint(a + b)", "1 2\n");
    EXPECT_EQ(result.outcome(), execution_outcome::success) << result.std_err;
    EXPECT_EQ(result.std_out, "3\n");
}

TEST_F(DockerPipelineTest, CppTest) {
    auto result = execute("cpp", R"(#include <iostream>
int main() { long long a, b; std::cin >> a >> b; std::cout << a + b &lt;&lt; std::endl; })", "20 22\n");
    EXPECT_EQ(result.outcome(), execution_outcome::success) << result.std_err;
    EXPECT_EQ(result.std_out, "42\n");
}

TEST_F(DockerPipelineTest, CppCompilationErrorTest) {
    auto result = execute("cpp", "int main() { return }");
    EXPECT_EQ(result.outcome(), execution_outcome::compilation_error);
    EXPECT_FALSE(result.std_err.empty());
}

TEST_F(DockerPipelineTest, JavaTest) {
    auto result = execute("java", R"(public class Solution {
    public static void main(String[] args) {
        System.out.println("hello");
    }
})");
    EXPECT_EQ(result.outcome(), execution_outcome::success) << result.std_err;
    EXPECT_EQ(result.std_out, "hello\n");
}

TEST_F(DockerPipelineTest, NetworkIsDisabledTest) {
    auto result = execute("python", "import socket\nsocket.create_connection(('1.1.1.1', 53), timeout=2)");
    EXPECT_EQ(result.outcome(), execution_outcome::runtime_error);
}
