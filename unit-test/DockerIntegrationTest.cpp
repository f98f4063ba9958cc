#include "common/exceptions.hpp"
#include "config.hpp"
#include "gtest/gtest.h"
#include "judge/test_runner.hpp"
#include "sandbox/docker_api.hpp"
#include "sandbox/docker_cli.hpp"
#include "sandbox/engine.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace codebox;

/**
 * @brief 需要本机有可以访问的 Docker 守护进程，否则跳过
 * 使用的镜像不存在时会先拉取，第一次运行可能较慢
 */
class DockerIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        vector<unique_ptr<engine_backend>> backends;
        backends.push_back(make_unique<docker_api_backend>(DOCKER_ENDPOINT));
        auto cli = make_unique<docker_cli_backend>(DOCKER_EXECUTABLE);
        if (cli->available()) backends.push_back(move(cli));
        selector = make_unique<engine_selector>(move(backends), selector_options::defaults());
        try {
            selector->probe();
        } catch (engine_unavailable &e) {
            GTEST_SKIP() << "No container engine reachable: " << e.what();
        }
        engine = make_unique<execution_engine>(*selector, pool_options{2, chrono::seconds(60), chrono::seconds(30)},
                                               test::make_temp_dir("docker"));
    }

    void TearDown() override {
        if (engine) engine->shutdown();
    }

    execution_result run(language lang, const string &code, const string &input = "",
                         resource_limits limits = resource_limits::from_request(10, 256)) {
        execution_request request{lang, code, input, limits};
        return engine->execute(request);
    }

    unique_ptr<engine_selector> selector;
    unique_ptr<execution_engine> engine;
};

TEST_F(DockerIntegrationTest, PythonEcho) {
    auto result = run(language::PYTHON, "print(int(input()) * 2)", "21\n");
    EXPECT_EQ(result.status, status::SUCCESS) << result.stderr_data << result.internal_message;
    EXPECT_EQ(result.stdout_data, "42\n");
}

TEST_F(DockerIntegrationTest, PythonRuntimeError) {
    auto result = run(language::PYTHON, "1 / 0");
    EXPECT_EQ(result.status, status::RUNTIME_ERROR);
    EXPECT_NE(result.stderr_data.find("ZeroDivisionError"), string::npos);
    EXPECT_EQ(result.exit_code, 1);
}

TEST_F(DockerIntegrationTest, InfiniteLoopTimesOut) {
    auto begin = chrono::steady_clock::now();
    auto result = run(language::PYTHON, "while True: pass", "", resource_limits::from_request(1, 256));
    EXPECT_EQ(result.status, status::TIMEOUT);
    EXPECT_LT(chrono::steady_clock::now() - begin, chrono::seconds(30));

    // 超时之后上下文被清理，可以继续使用
    EXPECT_EQ(run(language::PYTHON, "print('ok')").stdout_data, "ok\n");
}

TEST_F(DockerIntegrationTest, MemoryBomb) {
    auto result = run(language::PYTHON, "x = bytearray(512 * 1024 * 1024)\nprint(len(x))", "", resource_limits::from_request(10, 64));
    EXPECT_EQ(result.status, status::MEMORY_EXCEEDED);
}

TEST_F(DockerIntegrationTest, NetworkIsDisabled) {
    auto result = run(language::PYTHON,
                      "import socket\n"
                      "try:\n"
                      "    socket.create_connection(('1.1.1.1', 53), timeout=2)\n"
                      "    print('connected')\n"
                      "except OSError:\n"
                      "    print('blocked')\n");
    EXPECT_EQ(result.stdout_data, "blocked\n");
}

TEST_F(DockerIntegrationTest, JavaScript) {
    auto result = run(language::JAVASCRIPT, "console.log([1, 2, 3].map(x => x * x).join(' '))");
    EXPECT_EQ(result.status, status::SUCCESS) << result.stderr_data << result.internal_message;
    EXPECT_EQ(result.stdout_data, "1 4 9\n");
}

TEST_F(DockerIntegrationTest, CppCompileAndRun) {
    test_runner runner(*engine);
    run_request request;
    request.lang = language::CPP;
    request.code = "#include <iostream>\nint main() { int a, b; std::cin >> a >> b; std::cout << a + b << std::endl; }";
    request.limits = resource_limits::from_request(10, 256);
    request.visible = {{"1", "1 2", "3"}, {"2", "5 5", "10"}};
    request.hidden = {{"h1", "100 200", "300"}};
    auto report = runner.run(request);
    EXPECT_EQ(report.overall_status, status::SUCCESS) << report.execution.stderr_data;
    EXPECT_EQ(report.visible_passed(), 2u);
    EXPECT_EQ(report.hidden.passed, 1u);
}

TEST_F(DockerIntegrationTest, CppCompileError) {
    auto result = run(language::CPP, "int main() { return 0 }");
    EXPECT_EQ(result.status, status::COMPILE_ERROR);
    EXPECT_NE(result.stderr_data.find("error"), string::npos);
}
