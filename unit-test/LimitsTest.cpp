#include <fmt/core.h>
#include <algorithm>
#include <boost/algorithm/string.hpp>
#include "common/io_utils.hpp"
#include "config.hpp"
#include "gtest/gtest.h"
#include "sandbox/limits.hpp"
#include "sandbox/run_meta.hpp"
#include "sandbox/supervisor.hpp"
#include "test/environment.hpp"
#include "test/mock_backend.hpp"

using namespace std;
using namespace codebox;

TEST(LimitsTest, FromRequest) {
    auto limits = resource_limits::from_request(2.5, 128);
    EXPECT_EQ(limits.wall_timeout, chrono::milliseconds(2500));
    EXPECT_EQ(limits.memory_limit, 128ll * 1024 * 1024);
    EXPECT_EQ(limits.cpu_share, CPU_SHARE);
    EXPECT_EQ(limits.stream_size, STREAM_SIZE);
    EXPECT_TRUE(limits.network_disabled);
    EXPECT_NO_THROW(limits.validate());
}

TEST(LimitsTest, RejectsUnboundedLimits) {
    EXPECT_THROW(resource_limits::from_request(0, 128).validate(), invalid_argument);
    EXPECT_THROW(resource_limits::from_request(-1, 128).validate(), invalid_argument);
    EXPECT_THROW(resource_limits::from_request(1, 0).validate(), invalid_argument);

    auto limits = resource_limits::defaults();
    limits.cpu_share = 0;
    EXPECT_THROW(limits.validate(), invalid_argument);

    limits = resource_limits::defaults();
    limits.network_disabled = false;
    EXPECT_THROW(limits.validate(), invalid_argument);
}

TEST(LimitsTest, CompileLimits) {
    auto limits = resource_limits::from_request(1, 64).for_compile();
    EXPECT_EQ(limits.wall_timeout, chrono::milliseconds((int64_t)(COMPILE_TIME_LIMIT * 1000)));
    EXPECT_EQ(limits.memory_limit, 64ll * 1024 * 1024);
    EXPECT_TRUE(limits.same_container_limits(resource_limits::from_request(3, 64)));
    EXPECT_FALSE(limits.same_container_limits(resource_limits::from_request(1, 65)));
}

TEST(LimitsTest, DockerRunFlags) {
    auto limits = resource_limits::from_request(1, 64);
    auto flags = docker_run_flags(limits, "/tmp/scratch");
    auto has = [&flags](const string &key, const string &value) {
        for (size_t i = 0; i + 1 < flags.size(); ++i)
            if (flags[i] == key && flags[i + 1] == value) return true;
        return false;
    };
    EXPECT_TRUE(has("--network", "none"));
    EXPECT_TRUE(has("-m", to_string(64ll * 1024 * 1024)));
    EXPECT_TRUE(has("--memory-swap", to_string(64ll * 1024 * 1024)));
    EXPECT_TRUE(has("-v", "/tmp/scratch:/code:rw"));
    EXPECT_TRUE(has("--pids-limit", to_string(limits.proc_limit)));
    EXPECT_TRUE(has("--cap-drop", "ALL"));
}

TEST(LimitsTest, HostConfig) {
    auto limits = resource_limits::from_request(1, 64);
    auto config = host_config(limits, "/tmp/scratch");
    EXPECT_EQ(config["NetworkMode"], "none");
    EXPECT_EQ(config["Memory"], 64ll * 1024 * 1024);
    EXPECT_EQ(config["MemorySwap"], config["Memory"]);
    ASSERT_TRUE(config["Binds"].is_array());
    EXPECT_EQ(config["Binds"][0], "/tmp/scratch:/code:rw");
    EXPECT_EQ(config["CapDrop"][0], "ALL");
    EXPECT_EQ(config["NanoCpus"], (int64_t)(CPU_SHARE * 1e9));
}

TEST(LimitsTest, WrapCommand) {
    auto wrapped = wrap_command({"python3", "solution.py"});
    ASSERT_EQ(wrapped.size(), 6u);
    EXPECT_EQ(wrapped[0], "/bin/sh");
    EXPECT_EQ(wrapped[1], "/code/.codebox/run.sh");
    EXPECT_EQ(wrapped[4], "python3");
    EXPECT_EQ(wrapped[5], "solution.py");
}

TEST(LimitsTest, ReadRunMetadata) {
    auto dir = test::make_temp_dir("meta");
    write_file_content(dir / "run.meta", "exitcode: 137\nwall-time-ms: 42\nmemory-bytes: 2097152\nmemory-result: oom\n");
    auto meta = read_run_metadata(dir / "run.meta");
    EXPECT_TRUE(meta.present);
    EXPECT_EQ(meta.exitcode, 137);
    EXPECT_EQ(meta.wall_time_ms, 42);
    EXPECT_EQ(meta.memory, 2097152);
    EXPECT_EQ(meta.memory_result, "oom");

    write_file_content(dir / "partial.meta", "wall-time-ms: abc\nmemory-result: \n");
    meta = read_run_metadata(dir / "partial.meta");
    EXPECT_FALSE(meta.present);
    EXPECT_EQ(meta.wall_time_ms, -1);
    EXPECT_EQ(meta.memory_result, "");

    EXPECT_FALSE(read_run_metadata(dir / "missing.meta").present);
}

TEST(LimitsTest, ClassifyRun) {
    run_metadata meta;
    meta.present = true;
    meta.exitcode = 0;
    meta.wall_time_ms = 15;
    meta.memory = 3 * 1024 * 1024;
    auto result = classify_run(test::make_run(0, "ok"), meta);
    EXPECT_EQ(result.status, status::SUCCESS);
    EXPECT_EQ(result.stdout_data, "ok");
    EXPECT_EQ(result.duration_ms, 15);
    EXPECT_DOUBLE_EQ(result.memory_used_mb, 3);

    meta.exitcode = 1;
    result = classify_run(test::make_run(1, "", "Traceback"), meta);
    EXPECT_EQ(result.status, status::RUNTIME_ERROR);
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_EQ(result.stderr_data, "Traceback");

    meta.exitcode = 137;
    meta.memory_result = "oom";
    EXPECT_EQ(classify_run(test::make_run(137), meta).status, status::MEMORY_EXCEEDED);

    // 超时优先于内存超限，取消优先于超时
    auto run = test::make_run(137);
    run.time_limit_exceeded = true;
    run.wall_time = 1.2;
    result = classify_run(run, meta);
    EXPECT_EQ(result.status, status::TIMEOUT);
    EXPECT_EQ(result.duration_ms, 1200);

    run.cancelled = true;
    EXPECT_EQ(classify_run(run, meta).status, status::CANCELLED);

    // 没有运行信息时使用容器引擎报告的退出码
    EXPECT_EQ(classify_run(test::make_run(2), run_metadata()).status, status::RUNTIME_ERROR);
    EXPECT_EQ(classify_run(test::make_run(137), run_metadata()).status, status::MEMORY_EXCEEDED);
}

TEST(LimitsTest, TruncationMarkers) {
    raw_run run;
    run.exitcode = 0;
    string big(100, 'x');
    run.out.append(big.data(), big.size(), 10);
    auto result = classify_run(run, run_metadata());
    EXPECT_EQ(result.stdout_data.size(), 10u);
    EXPECT_TRUE(result.stdout_truncated);
    EXPECT_FALSE(result.stderr_truncated);
}

TEST(LimitsTest, RunWrapperWritesMetadata) {
    // 在宿主机上直接运行包装脚本，路径换成工作目录的实际路径
    auto dir = test::make_temp_dir("wrapper");
    install_run_wrapper(dir);
    auto private_dir = dir / CONTEXT_PRIVATE_DIR;
    write_file_content(private_dir / "stdin", "from stdin\n");

    supervisor_options opt;
    opt.command = {"/bin/sh", (private_dir / "run.sh").string(), (private_dir / "run.meta").string(),
                   (private_dir / "stdin").string(), "/bin/sh", "-c", "cat; exit 4"};
    opt.wall_limit = chrono::seconds(5);
    auto result = supervise(opt);
    EXPECT_EQ(result.exitcode, 4);
    EXPECT_EQ(result.out.data, "from stdin\n");

    auto meta = read_run_metadata(private_dir / "run.meta");
    ASSERT_TRUE(meta.present);
    EXPECT_EQ(meta.exitcode, 4);
    EXPECT_GE(meta.wall_time_ms, 0);
    EXPECT_NE(meta.memory_result, "oom");
    EXPECT_FALSE(filesystem::exists(private_dir / "run.meta.tmp"));
}

TEST(LimitsTest, RunWrapperMeasuresOnlyCurrentRun) {
    // 用普通文件模拟 cgroup：运行开始前已经有 100MB 的用量（比如之前的编译），程序运行时增加到 103MB
    auto dir = test::make_temp_dir("wrapper");
    auto cgroup = test::make_temp_dir("cgroup");
    write_file_content(cgroup / "memory.current", "104857600\n");
    write_file_content(cgroup / "memory.events", "oom 0\noom_kill 0\n");
    install_run_wrapper(dir);
    auto private_dir = dir / CONTEXT_PRIVATE_DIR;

    string program = fmt::format("echo 108003328 > {0}/memory.current; sleep 0.3; echo 104857600 > {0}/memory.current",
                                 cgroup.string());
    supervisor_options opt;
    opt.command = {"env", "CODEBOX_CGROUP_ROOT=" + cgroup.string(), "/bin/sh", (private_dir / "run.sh").string(),
                   (private_dir / "run.meta").string(), (private_dir / "stdin").string(), "/bin/sh", "-c", program};
    opt.wall_limit = chrono::seconds(5);
    auto result = supervise(opt);
    EXPECT_EQ(result.exitcode, 0) << result.err.data;

    auto meta = read_run_metadata(private_dir / "run.meta");
    ASSERT_TRUE(meta.present);
    EXPECT_EQ(meta.memory, 3 * 1024 * 1024);
    EXPECT_EQ(meta.memory_result, "");

    // oom_kill 计数在运行期间增加
    opt.command.back() = fmt::format("printf 'oom 1\\noom_kill 1\\n' > {}/memory.events; exit 137", cgroup.string());
    result = supervise(opt);
    meta = read_run_metadata(private_dir / "run.meta");
    EXPECT_EQ(meta.exitcode, 137);
    EXPECT_EQ(meta.memory_result, "oom");
    EXPECT_EQ(meta.memory, 0);
}

TEST(LimitsTest, RunWrapperScriptIsComplete) {
    const string &script = run_wrapper_script();
    EXPECT_EQ(script.rfind("#!/bin/sh\n", 0), 0u);
    EXPECT_NE(script.find("echo \"wall-time-ms: $(( (end - start) / 1000000 ))\""), string::npos);
    EXPECT_TRUE(boost::ends_with(script, "exit $exitcode\n"));
}
