#include "sandbox/limits.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <unistd.h>
#include <cmath>
#include <stdexcept>
#include "common/io_utils.hpp"
#include "config.hpp"

namespace codebox {
using namespace std;
namespace fs = std::filesystem;

const char *const CONTEXT_WORKDIR = "/code";
const char *const CONTEXT_PRIVATE_DIR = ".codebox";

resource_limits resource_limits::defaults() {
    return from_request(DEFAULT_TIME_LIMIT, DEFAULT_MEMORY_LIMIT);
}

resource_limits resource_limits::from_request(double timeout_seconds, int memory_limit_mb) {
    resource_limits limits;
    limits.wall_timeout = chrono::milliseconds((int64_t)llround(timeout_seconds * 1000));
    limits.memory_limit = (int64_t)memory_limit_mb * 1024 * 1024;
    limits.cpu_share = CPU_SHARE;
    limits.stream_size = STREAM_SIZE;
    limits.proc_limit = PROC_LIMIT;
    return limits;
}

void resource_limits::validate() const {
    if (wall_timeout.count() <= 0)
        throw invalid_argument("wall timeout must be positive");
    if (memory_limit <= 0)
        throw invalid_argument("memory limit must be positive");
    if (!(cpu_share > 0))
        throw invalid_argument("cpu share must be positive");
    if (proc_limit <= 0)
        throw invalid_argument("process limit must be positive");
    if (!network_disabled)
        throw invalid_argument("network access cannot be enabled");
}

resource_limits resource_limits::for_compile() const {
    resource_limits limits = *this;
    limits.wall_timeout = chrono::milliseconds((int64_t)llround(COMPILE_TIME_LIMIT * 1000));
    return limits;
}

bool resource_limits::same_container_limits(const resource_limits &other) const {
    return memory_limit == other.memory_limit &&
           cpu_share == other.cpu_share &&
           proc_limit == other.proc_limit &&
           network_disabled == other.network_disabled &&
           fs_scope == other.fs_scope;
}

static int64_t nano_cpus(const resource_limits &limits) {
    return (int64_t)llround(limits.cpu_share * 1e9);
}

string container_user() {
    // 容器内以宿主机当前用户运行，工作目录里产生的文件宿主机可以直接删除
    return fmt::format("{}:{}", getuid(), getgid());
}

nlohmann::json host_config(const resource_limits &limits, const fs::path &scratch_dir) {
    return {
        {"Binds", nlohmann::json::array({fmt::format("{}:{}:rw", scratch_dir.string(), CONTEXT_WORKDIR)})},
        {"Memory", limits.memory_limit},
        {"MemorySwap", limits.memory_limit},
        {"NanoCpus", nano_cpus(limits)},
        {"PidsLimit", limits.proc_limit},
        {"NetworkMode", "none"},
        {"CapDrop", nlohmann::json::array({"ALL"})},
        {"SecurityOpt", nlohmann::json::array({"no-new-privileges"})},
        {"Tmpfs", {{"/tmp", "rw,nosuid,size=64m"}}},
        {"ReadonlyRootfs", false},
        {"AutoRemove", false}};
}

vector<string> docker_run_flags(const resource_limits &limits, const fs::path &scratch_dir) {
    return {
        "-v", fmt::format("{}:{}:rw", scratch_dir.string(), CONTEXT_WORKDIR),
        "-w", CONTEXT_WORKDIR,
        "-u", container_user(),
        "-m", to_string(limits.memory_limit),
        "--memory-swap", to_string(limits.memory_limit),
        "--cpus", fmt::format("{:.3f}", limits.cpu_share),
        "--pids-limit", to_string(limits.proc_limit),
        "--network", "none",
        "--cap-drop", "ALL",
        "--security-opt", "no-new-privileges",
        "--tmpfs", "/tmp:rw,nosuid,size=64m"};
}

    // memory-bytes 是本次运行期间采样到的 cgroup 内存用量峰值减去运行开始时的用量，不包含之前的运行（比如编译）
    // 内存峰值按运行采样：cgroup 的 memory.peak 覆盖整个容器生命周期，会把之前的运行（比如编译）算进来
    static const string script = R"SH(#!/bin/sh
# run.sh <meta> <stdin> <command...>
meta="$1"
input="$2"
shift 2
cgroup="${CODEBOX_CGROUP_ROOT:-/sys/fs/cgroup}"

oom_kills() {
    for f in "$cgroup/memory.events" "$cgroup/memory/memory.oom_control"; do
        if [ -r "$f" ]; then
            sed -n 's/^oom_kill //p' "$f"
            return
        fi
    done
    echo 0
}

current_memory() {
    for f in "$cgroup/memory.current" "$cgroup/memory/memory.usage_in_bytes"; do
        if [ -r "$f" ]; then
            cat "$f"
            return
        fi
    done
    echo -1
}

running() {
    state=$(sed -n 's/^State:[[:space:]]*\([A-Z]\).*/\1/p' "/proc/$1/status" 2>/dev/null)
    [ -n "$state" ] && [ "$state" != "Z" ]
}

rm -f "$meta"
before=$(oom_kills)
baseline=$(current_memory)
peak=$baseline
start=$(date +%s%N)
"$@" < "$input" &
child=$!
while running "$child"; do
    now=$(current_memory)
    if [ "$now" -gt "$peak" ]; then
        peak=$now
    fi
    sleep 0.01
done
wait "$child"
exitcode=$?
end=$(date +%s%N)
after=$(oom_kills)

if [ "$baseline" -lt 0 ]; then
    memory=-1
else
    memory=$((peak - baseline))
fi

{
    echo "exitcode: $exitcode"
    echo "wall-time-ms: $(( (end - start) / 1000000 ))"
    echo "memory-bytes: $memory"
    if [ "${after:-0}" -gt "${before:-0}" ]; then
        echo "memory-result: oom"
    else
        echo "memory-result: "
    fi
} > "$meta.tmp" && mv "$meta.tmp" "$meta"
exit $exitcode
)SH";
    return script;
}

vector<string> wrap_command(const vector<string> &command) {
    string private_dir = fmt::format("{}/{}", CONTEXT_WORKDIR, CONTEXT_PRIVATE_DIR);
    vector<string> wrapped = {"/bin/sh", private_dir + "/run.sh", private_dir + "/run.meta", private_dir + "/stdin"};
    wrapped.insert(wrapped.end(), command.begin(), command.end());
    return wrapped;
}

void install_run_wrapper(const fs::path &scratch_dir) {
    fs::path private_dir = scratch_dir / CONTEXT_PRIVATE_DIR;
    fs::create_directories(private_dir);
    write_file_content(private_dir / "run.sh", run_wrapper_script());
    fs::permissions(private_dir / "run.sh", fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec | fs::perms::others_read | fs::perms::others_exec);
    if (!fs::exists(private_dir / "stdin"))
        write_file_content(private_dir / "stdin", "");
}

execution_result classify_run(const raw_run &run, const run_metadata &meta) {
    execution_result result;
    result.stdout_data = run.out.data;
    result.stderr_data = run.err.data;
    result.stdout_truncated = run.out.truncated();
    result.stderr_truncated = run.err.truncated();
    result.duration_ms = meta.present && meta.wall_time_ms >= 0 && !run.time_limit_exceeded
                             ? meta.wall_time_ms
                             : (int64_t)llround(run.wall_time * 1000);
    if (meta.memory >= 0)
        result.memory_used_mb = (double)meta.memory / (1024 * 1024);

    int exitcode = meta.present ? meta.exitcode : run.exitcode;

    if (run.cancelled) {
        result.status = status::CANCELLED;
    } else if (run.time_limit_exceeded) {
        LOG(WARNING) << "Timeout after " << result.duration_ms << "ms";
        result.status = status::TIMEOUT;
    } else if (meta.memory_result == "oom" || exitcode == 128 + 9) {
        LOG(WARNING) << "Memory limit exceeded, exitcode " << exitcode;
        result.status = status::MEMORY_EXCEEDED;
        result.exit_code = exitcode;
    } else if (exitcode == 0) {
        result.status = status::SUCCESS;
        result.exit_code = 0;
    } else {
        result.status = status::RUNTIME_ERROR;
        result.exit_code = exitcode;
    }
    return result;
}

}  // namespace codebox
