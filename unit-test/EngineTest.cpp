#include <fmt/core.h>
#include <unistd.h>
#include <algorithm>
#include <mutex>
#include <thread>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "gtest/gtest.h"
#include "judge/report.hpp"
#include "judge/test_runner.hpp"
#include "sandbox/engine.hpp"
#include "test/assertions.hpp"
#include "test/environment.hpp"
#include "test/mock_backend.hpp"

using namespace std;
using namespace codebox;
using namespace codebox::test;
namespace fs = std::filesystem;

static bool mentions(const vector<string> &command, const string &word) {
    return find(command.begin(), command.end(), word) != command.end();
}

class EngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        run_dir = make_temp_dir("engine");
        auto p = make_unique<fake_backend>("primary");
        auto f = make_unique<fake_backend>("fallback");
        primary = p.get();
        fallback = f.get();
        vector<unique_ptr<engine_backend>> backends;
        backends.push_back(move(p));
        backends.push_back(move(f));
        selector = make_unique<engine_selector>(move(backends), selector_options{chrono::milliseconds(200), chrono::seconds(60), 3});
    }

    unique_ptr<execution_engine> make_engine(size_t capacity = 4) {
        return make_unique<execution_engine>(*selector, pool_options{capacity, chrono::seconds(300), chrono::seconds(1)}, run_dir);
    }

    execution_result run(execution_engine &engine, language lang, const string &source, const string &input,
                         const cancellation_token *cancel = nullptr) {
        execution_request request{lang, source, input, resource_limits::defaults()};
        return engine.execute(request, cancel);
    }

    size_t remaining_contexts() {
        if (!fs::exists(run_dir / "contexts")) return 0;
        return distance(fs::directory_iterator(run_dir / "contexts"), fs::directory_iterator());
    }

    fs::path run_dir;
    fake_backend *primary, *fallback;
    unique_ptr<engine_selector> selector;
};

TEST_F(EngineTest, RunsInterpretedProgram) {
    auto engine = make_engine();
    auto result = run(*engine, language::PYTHON, "print(input())", "42\n");
    EXPECT_EQ(result.status, status::SUCCESS);
    EXPECT_EQ(result.stdout_data, "42\n");
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(primary->provisioned, 1);
    EXPECT_EQ(primary->execs, 1);
    EXPECT_EQ(primary->last_image, PYTHON_IMAGE);
    ASSERT_EQ(primary->commands.size(), 1u);
    EXPECT_TRUE(mentions(primary->commands[0], "solution.py"));
    EXPECT_EQ(primary->commands[0][1], "/code/.codebox/run.sh");

    // 运行结束后上下文被清理并放回池中
    EXPECT_EQ(primary->resets, 1);
    EXPECT_EQ(engine->get_pool().idle_count(language::PYTHON), 1u);

    engine->shutdown();
    EXPECT_EQ(primary->live_containers(), 0u);
    EXPECT_EQ(remaining_contexts(), 0u);
}

TEST_F(EngineTest, ReusesContextWithCleanWorkspace) {
    auto engine = make_engine();
    primary->on_exec = [](execution_context &ctx, const vector<string> &, const resource_limits &, const cancellation_token *) {
        bool dirty = fs::exists(ctx.scratch_dir / "leftover");
        write_file_content(ctx.scratch_dir / "leftover", "x");
        return make_run(0, dirty ? "dirty" : "clean");
    };
    EXPECT_EQ(run(*engine, language::PYTHON, "pass", "").stdout_data, "clean");
    EXPECT_EQ(run(*engine, language::PYTHON, "pass", "").stdout_data, "clean");
    EXPECT_EQ(primary->provisioned, 1);
    EXPECT_EQ(primary->resets, 2);
}

TEST_F(EngineTest, ReusedContextGetsFreshRunWrapper) {
    auto engine = make_engine();
    int calls = 0;
    primary->on_exec = [&calls](execution_context &ctx, const vector<string> &, const resource_limits &, const cancellation_token *) {
        fs::path private_dir = ctx.scratch_dir / CONTEXT_PRIVATE_DIR;
        if (calls++ == 0) {
            // 容器内的程序和宿主机是同一个用户，可以改写包装脚本
            write_file_content(private_dir / "run.sh", "TAMPERED");
            write_file_content(private_dir / "stolen", "x");
            return make_run(0);
        }
        bool pristine = read_file_content(private_dir / "run.sh") == run_wrapper_script();
        bool stolen = fs::exists(private_dir / "stolen");
        return make_run(0, fmt::format("pristine={} stolen={}", pristine, stolen));
    };
    run(*engine, language::PYTHON, "pass", "");
    EXPECT_EQ(run(*engine, language::PYTHON, "pass", "").stdout_data, "pristine=true stolen=false");
    EXPECT_EQ(primary->provisioned, 1);
}

TEST_F(EngineTest, ResetCommandWipesTemporaryFiles) {
    ASSERT_EQ(RESET_COMMAND.size(), 3u);
    EXPECT_NE(RESET_COMMAND[2].find("kill -9 -1"), string::npos);
    EXPECT_NE(RESET_COMMAND[2].find("rm -rf /tmp/*"), string::npos);
}

TEST_F(EngineTest, StdinDoesNotLeakBetweenRuns) {
    auto engine = make_engine();
    EXPECT_EQ(run(*engine, language::PYTHON, "pass", "secret").stdout_data, "secret");
    EXPECT_EQ(run(*engine, language::PYTHON, "pass", "").stdout_data, "");
}

TEST_F(EngineTest, WithoutPoolEveryRunOwnsItsContext) {
    auto engine = make_engine(0);
    run(*engine, language::PYTHON, "pass", "");
    run(*engine, language::PYTHON, "pass", "");
    EXPECT_EQ(primary->provisioned, 2);
    EXPECT_EQ(primary->destroyed, 2);
    EXPECT_EQ(primary->live_containers(), 0u);
    EXPECT_EQ(remaining_contexts(), 0u);
}

TEST_F(EngineTest, TimeoutKeepsResettableContext) {
    auto engine = make_engine();
    primary->on_exec = [](execution_context &, const vector<string> &, const resource_limits &, const cancellation_token *) {
        auto r = make_run(137, "partial");
        r.time_limit_exceeded = true;
        r.wall_time = 5;
        return r;
    };
    auto result = run(*engine, language::PYTHON, "while True: pass", "");
    EXPECT_EQ(result.status, status::TIMEOUT);
    EXPECT_EQ(result.duration_ms, 5000);
    EXPECT_EQ(primary->resets, 1);
    EXPECT_EQ(engine->get_pool().idle_count(), 1u);
}

TEST_F(EngineTest, TimeoutWithUnkillableContextIsInternalError) {
    auto engine = make_engine();
    primary->fail_reset = true;
    primary->fail_destroy = true;
    primary->on_exec = [](execution_context &, const vector<string> &, const resource_limits &, const cancellation_token *) {
        auto r = make_run(-1);
        r.time_limit_exceeded = true;
        return r;
    };
    auto result = run(*engine, language::PYTHON, "while True: pass", "");
    EXPECT_EQ(result.status, status::INTERNAL_ERROR);
    EXPECT_EQ(result.stderr_data, SERVICE_UNAVAILABLE_MESSAGE);
    EXPECT_EQ(engine->get_pool().idle_count(), 0u);
    EXPECT_EQ(remaining_contexts(), 0u);
}

TEST_F(EngineTest, FailedResetDestroysContext) {
    auto engine = make_engine();
    primary->fail_reset = true;
    auto result = run(*engine, language::PYTHON, "pass", "");
    EXPECT_EQ(result.status, status::SUCCESS);
    EXPECT_EQ(primary->destroyed, 1);
    EXPECT_EQ(engine->get_pool().idle_count(), 0u);
}

TEST_F(EngineTest, CancellationDiscardsContext) {
    auto engine = make_engine();
    primary->on_exec = [](execution_context &, const vector<string> &, const resource_limits &, const cancellation_token *) {
        auto r = make_run(-1);
        r.cancelled = true;
        return r;
    };
    cancellation_token token;
    auto result = run(*engine, language::PYTHON, "pass", "", &token);
    EXPECT_EQ(result.status, status::CANCELLED);
    EXPECT_EQ(primary->destroyed, 1);
    EXPECT_EQ(engine->get_pool().idle_count(), 0u);
}

TEST_F(EngineTest, ContextFaultIsInternalError) {
    auto engine = make_engine();
    primary->on_exec = [](execution_context &ctx, const vector<string> &, const resource_limits &, const cancellation_token *) -> raw_run {
        throw context_fault("container " + ctx.container_id + " disappeared");
    };
    auto result = run(*engine, language::PYTHON, "pass", "");
    EXPECT_EQ(result.status, status::INTERNAL_ERROR);
    EXPECT_EQ(result.stderr_data, SERVICE_UNAVAILABLE_MESSAGE);
    EXPECT_NE(result.internal_message.find("disappeared"), string::npos);
    EXPECT_EQ(primary->destroyed, 1);
    EXPECT_EQ(primary->live_containers(), 0u);
    EXPECT_EQ(selector->consecutive_failures(), 1u);
}

TEST_F(EngineTest, RetriesOnFallbackWhenPrimaryBecomesUnreachable) {
    auto engine = make_engine();
    primary->on_exec = [this](execution_context &, const vector<string> &, const resource_limits &, const cancellation_token *) -> raw_run {
        primary->reachable = false;
        throw engine_unreachable("connection refused");
    };
    auto result = run(*engine, language::PYTHON, "pass", "hello");
    EXPECT_EQ(result.status, status::SUCCESS);
    EXPECT_EQ(result.stdout_data, "hello");
    EXPECT_EQ(primary->execs, 1);
    EXPECT_EQ(fallback->execs, 1);
    EXPECT_EQ(primary->destroyed, 1);
    EXPECT_EQ(selector->current(), fallback);
}

TEST_F(EngineTest, EngineUnavailable) {
    primary->reachable = false;
    fallback->reachable = false;
    auto engine = make_engine();
    auto result = run(*engine, language::PYTHON, "pass", "");
    EXPECT_EQ(result.status, status::ENGINE_UNAVAILABLE);
    EXPECT_EQ(result.stderr_data, SERVICE_UNAVAILABLE_MESSAGE);
    EXPECT_EQ(result.stdout_data, "");
}

TEST_F(EngineTest, ProvisionFailure) {
    auto engine = make_engine();
    primary->fail_provision = true;
    auto result = run(*engine, language::PYTHON, "pass", "");
    EXPECT_EQ(result.status, status::INTERNAL_ERROR);
    EXPECT_EQ(primary->execs, 0);
    EXPECT_EQ(remaining_contexts(), 0u);
    EXPECT_EQ(engine->get_pool().idle_count(), 0u);
}

TEST_F(EngineTest, MemoryExceeded) {
    auto engine = make_engine();
    primary->on_exec = [](execution_context &ctx, const vector<string> &, const resource_limits &, const cancellation_token *) {
        write_meta(ctx, "exitcode: 137\nwall-time-ms: 30\nmemory-bytes: 268435456\nmemory-result: oom\n");
        return make_run(137);
    };
    auto result = run(*engine, language::PYTHON, "x = ' ' * 10**10", "");
    EXPECT_EQ(result.status, status::MEMORY_EXCEEDED);
    EXPECT_EQ(result.duration_ms, 30);
    EXPECT_DOUBLE_EQ(result.memory_used_mb, 256);
}

TEST_F(EngineTest, CompilesOnceAndRunsBinary) {
    auto engine = make_engine();
    primary->on_exec = [](execution_context &ctx, const vector<string> &command, const resource_limits &limits,
                          const cancellation_token *) {
        if (mentions(command, "g++")) {
            EXPECT_EQ(limits.wall_timeout, chrono::milliseconds((int64_t)(COMPILE_TIME_LIMIT * 1000)));
            EXPECT_TRUE(fs::exists(ctx.scratch_dir / "solution.cpp"));
            write_file_content(ctx.scratch_dir / "solution", "binary");
            return make_run(0);
        }
        EXPECT_TRUE(mentions(command, "./solution"));
        EXPECT_EQ(read_file_content(ctx.scratch_dir / "solution"), "binary");
        EXPECT_FALSE(fs::exists(ctx.scratch_dir / "solution.cpp"));
        return make_run(0, read_file_content(ctx.scratch_dir / CONTEXT_PRIVATE_DIR / "stdin"));
    };

    auto limits = resource_limits::defaults();
    auto program = engine->prepare(language::CPP, "int main() {}", limits, nullptr);
    ASSERT_TRUE(program->ok());
    EXPECT_EQ(program->files, vector<string>{"solution"});
    EXPECT_EQ(engine->invoke(*program, "a", limits, nullptr).stdout_data, "a");
    EXPECT_EQ(engine->invoke(*program, "b", limits, nullptr).stdout_data, "b");
    EXPECT_EQ(primary->execs, 3);

    auto artifacts = program->dir;
    program.reset();
    EXPECT_FALSE(fs::exists(artifacts));
}

TEST_F(EngineTest, CompileError) {
    auto engine = make_engine();
    primary->on_exec = [](execution_context &, const vector<string> &, const resource_limits &, const cancellation_token *) {
        return make_run(1, "", "solution.cpp:1:1: error: expected ';'");
    };
    auto limits = resource_limits::defaults();
    auto program = engine->prepare(language::CPP, "int main() {", limits, nullptr);
    EXPECT_FALSE(program->ok());
    EXPECT_EQ(program->compile_result.status, status::COMPILE_ERROR);
    EXPECT_NE(program->compile_result.stderr_data.find("expected ';'"), string::npos);

    // 编译失败的程序不会被运行
    auto result = engine->invoke(*program, "", limits, nullptr);
    EXPECT_EQ(result.status, status::COMPILE_ERROR);
    EXPECT_EQ(primary->execs, 1);
}

TEST_F(EngineTest, CompilationTimeout) {
    auto engine = make_engine();
    primary->on_exec = [](execution_context &, const vector<string> &, const resource_limits &, const cancellation_token *) {
        auto r = make_run(-1);
        r.time_limit_exceeded = true;
        return r;
    };
    auto program = engine->prepare(language::CPP, "#include </dev/random>", resource_limits::defaults(), nullptr);
    EXPECT_EQ(program->compile_result.status, status::COMPILE_ERROR);
    EXPECT_NE(program->compile_result.stderr_data.find("Compilation time limit exceeded"), string::npos);
}

TEST_F(EngineTest, EmptySource) {
    auto engine = make_engine();
    auto python = run(*engine, language::PYTHON, "  \n\t", "");
    EXPECT_EQ(python.status, status::RUNTIME_ERROR);
    auto cpp = run(*engine, language::CPP, "", "");
    EXPECT_EQ(cpp.status, status::COMPILE_ERROR);
    EXPECT_EQ(primary->provisioned, 0);
    EXPECT_EQ(primary->execs, 0);
}

TEST_F(EngineTest, RejectsInvalidLimits) {
    auto engine = make_engine();
    execution_request request{language::PYTHON, "pass", nullopt, resource_limits::from_request(0, 256)};
    EXPECT_THROW(engine->execute(request), invalid_argument);
}

TEST_F(EngineTest, WarmUp) {
    auto engine = make_engine();
    engine->warm_up(language::JAVASCRIPT, resource_limits::defaults(), 2);
    EXPECT_EQ(primary->provisioned, 2);
    EXPECT_EQ(engine->get_pool().idle_count(language::JAVASCRIPT), 2u);

    run(*engine, language::JAVASCRIPT, "console.log(1)", "");
    EXPECT_EQ(primary->provisioned, 2);
}

TEST_F(EngineTest, EvictExpired) {
    auto engine = make_unique<execution_engine>(*selector, pool_options{4, chrono::milliseconds(10), chrono::seconds(1)}, run_dir);
    run(*engine, language::PYTHON, "pass", "");
    usleep(30 * 1000);
    engine->evict_expired();
    EXPECT_EQ(primary->destroyed, 1);
    EXPECT_EQ(remaining_contexts(), 0u);
}

TEST_F(EngineTest, ConcurrentRunsUseDisjointContexts) {
    auto engine = make_engine(4);
    vector<thread> threads;
    vector<execution_result> results(4);
    for (size_t i = 0; i < results.size(); ++i)
        threads.emplace_back([&, i] { results[i] = run(*engine, language::PYTHON, "pass", to_string(i)); });
    for (auto &thd : threads) thd.join();
    for (size_t i = 0; i < results.size(); ++i) {
        EXPECT_EQ(results[i].status, status::SUCCESS);
        EXPECT_EQ(results[i].stdout_data, to_string(i));
    }
    EXPECT_LE(primary->provisioned, 4);
}

TEST_F(EngineTest, ConcurrentLanguagesNeverShareContexts) {
    auto engine = make_engine(4);
    mutex mut;
    vector<string> violations;
    primary->on_exec = [&](execution_context &ctx, const vector<string> &command, const resource_limits &,
                           const cancellation_token *) {
        string source = ctx.lang == language::PYTHON ? "solution.py" : "solution.js";
        string foreign = ctx.lang == language::PYTHON ? "solution.js" : "solution.py";
        if (!mentions(command, source) || mentions(command, foreign) || fs::exists(ctx.scratch_dir / foreign)) {
            scoped_lock guard(mut);
            violations.push_back(ctx.id);
        }
        usleep(2 * 1000);
        return make_run(0, read_file_content(ctx.scratch_dir / CONTEXT_PRIVATE_DIR / "stdin", ""));
    };

    vector<thread> threads;
    vector<vector<execution_result>> results(4);
    for (size_t i = 0; i < results.size(); ++i)
        threads.emplace_back([&, i] {
            language lang = i % 2 == 0 ? language::PYTHON : language::JAVASCRIPT;
            for (int n = 0; n < 5; ++n)
                results[i].push_back(run(*engine, lang, "print(input())", fmt::format("{}-{}", i, n)));
        });
    for (auto &thd : threads) thd.join();

    EXPECT_TRUE(violations.empty());
    for (size_t i = 0; i < results.size(); ++i)
        for (size_t n = 0; n < results[i].size(); ++n) {
            EXPECT_EQ(results[i][n].status, status::SUCCESS);
            EXPECT_EQ(results[i][n].stdout_data, fmt::format("{}-{}", i, n));
        }
}

static nlohmann::json without_timing(const aggregate_report &report) {
    nlohmann::json result = report;
    result["execution"].erase("execution_time_ms");
    result["execution"].erase("memory_usage_mb");
    for (auto kind : {"visible", "hidden"})
        for (auto &entry : result["test_results"][kind])
            entry.erase("execution_time_ms");
    return result;
}

TEST_F(EngineTest, RepeatedRequestGivesSameResults) {
    auto engine = make_engine();
    primary->on_exec = [](execution_context &ctx, const vector<string> &, const resource_limits &, const cancellation_token *) {
        string input = read_file_content(ctx.scratch_dir / CONTEXT_PRIVATE_DIR / "stdin", "");
        if (input == "crash") return make_run(1, "", "Traceback: crash");
        return make_run(0, input + "\n");
    };

    run_request request;
    request.lang = language::PYTHON;
    request.code = "print(input())";
    request.limits = resource_limits::defaults();
    request.visible = {{"1", "a", "a"}, {"2", "b", "c"}, {"3", "crash", ""}};
    request.hidden = {{"h1", "x", "x"}, {"h2", "y", "z"}};

    test_runner runner(*engine, 2);
    auto first = runner.run(request);
    auto second = runner.run(request);
    EXPECT_EQ(first.overall_status, status::RUNTIME_ERROR);
    EXPECT_EQ(first.visible_passed(), 1u);
    EXPECT_EQ(first.hidden.passed, 1u);
    EXPECT_JSON_EQ(without_timing(first), without_timing(second));
}
