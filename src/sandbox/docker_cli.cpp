#include "sandbox/docker_cli.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"

namespace codebox {
using namespace std;

const chrono::seconds command_timeout(30);
const chrono::seconds reset_timeout(10);
const size_t control_stream_size = 64 * 1024;

bool is_daemon_unreachable(int exitcode, const string &error_output) {
    return boost::contains(error_output, "Cannot connect to the Docker daemon") ||
           boost::contains(error_output, "Is the docker daemon running") ||
           boost::contains(error_output, "error during connect") ||
           (exitcode == 125 && boost::contains(error_output, "connect:"));
}

docker_cli_backend::docker_cli_backend(const string &executable)
    : executable(find_executable(executable)) {
    if (!this->executable)
        LOG(INFO) << "docker executable " << executable << " is not found, the command line backend is disabled";
}

string docker_cli_backend::name() const {
    return "docker-cli";
}

bool docker_cli_backend::available() const {
    return executable.has_value();
}

supervisor_result docker_cli_backend::docker(const vector<string> &args, chrono::milliseconds limit,
                                             const cancellation_token *cancel, size_t stream_size) {
    if (!executable) throw engine_unreachable("docker command line client is not installed");

    supervisor_options opt;
    opt.command = make_command(*executable, args);
    opt.wall_limit = limit;
    opt.stream_size = stream_size;
    opt.cancel = cancel;

    supervisor_result result;
    try {
        result = supervise(opt);
    } catch (system_error &e) {
        throw internal_error(fmt::format("unable to run docker {}: {}", args.empty() ? "" : args[0], e.what()));
    }

    if (!result.time_limit_exceeded && !result.cancelled && is_daemon_unreachable(result.exitcode, result.err.data))
        throw engine_unreachable(boost::trim_copy(result.err.data));
    return result;
}

void docker_cli_backend::ping(chrono::milliseconds timeout) {
    auto result = docker({"version", "--format", "{{.Server.APIVersion}}"}, timeout, nullptr, control_stream_size);
    if (result.time_limit_exceeded)
        throw engine_unreachable(fmt::format("docker version did not answer within {}ms", timeout.count()));
    if (result.exitcode != 0)
        throw engine_unreachable(fmt::format("docker version exited with {}: {}", result.exitcode, boost::trim_copy(result.err.data)));
}

void docker_cli_backend::provision(execution_context &ctx, const string &image) {
    vector<string> args = make_command("run", "-d", "--name", "codebox-" + ctx.id,
                                       "--label", "codebox.context=" + ctx.id,
                                       docker_run_flags(ctx.limits, ctx.scratch_dir),
                                       image, "sleep", "infinity");
    auto result = docker(args, chrono::seconds(PROVISION_TIME_LIMIT), nullptr, control_stream_size);
    if (result.time_limit_exceeded)
        throw internal_error(fmt::format("docker run {} did not finish within {}s", image, PROVISION_TIME_LIMIT));
    if (result.exitcode != 0)
        throw internal_error(fmt::format("docker run {} exited with {}: {}", image, result.exitcode, boost::trim_copy(result.err.data)));

    // 拉取镜像的进度输出在 stderr，stdout 的最后一行是容器 id
    vector<string> lines;
    string out = boost::trim_copy(result.out.data);
    boost::split(lines, out, boost::is_any_of("\n"));
    ctx.container_id = boost::trim_copy(lines.back());
    if (ctx.container_id.empty())
        throw internal_error("docker run did not report a container id");

    LOG(INFO) << "Provisioned container " << ctx.container_id.substr(0, 12) << " for context " << ctx.id << " from " << image;
}

raw_run docker_cli_backend::exec(execution_context &ctx, const vector<string> &command,
                                 const resource_limits &limits, const cancellation_token *cancel) {
    vector<string> args = make_command("exec", "-w", CONTEXT_WORKDIR, "-u", container_user(), ctx.container_id, command);
    auto result = docker(args, limits.wall_timeout, cancel, limits.stream_size);

    raw_run run;
    run.exitcode = result.exitcode;
    run.wall_time = result.wall_time;
    run.time_limit_exceeded = result.time_limit_exceeded;
    run.cancelled = result.cancelled;
    run.out = move(result.out);
    run.err = move(result.err);

    if (!run.time_limit_exceeded && !run.cancelled && run.exitcode == 125 &&
        boost::contains(run.err.data, "Error response from daemon")) {
        if (boost::contains(run.err.data, "No such container") || boost::contains(run.err.data, "is not running"))
            throw context_fault(fmt::format("container {} is not running", ctx.container_id));
        throw internal_error(boost::trim_copy(run.err.data));
    }
    return run;
}

void docker_cli_backend::reset(execution_context &ctx) {
    supervisor_result result;
    try {
        result = docker(make_command("exec", ctx.container_id, RESET_COMMAND), reset_timeout, nullptr, control_stream_size);
    } catch (sandbox_exception &e) {
        throw context_fault(fmt::format("unable to reset context {}: {}", ctx.id, e.what()));
    }
    if (result.time_limit_exceeded || result.exitcode != 0)
        throw context_fault(fmt::format("unable to reset context {}: exit code {}", ctx.id, result.exitcode));
}

void docker_cli_backend::destroy(execution_context &ctx) {
    if (ctx.container_id.empty()) return;
    auto result = docker({"rm", "-f", "-v", ctx.container_id}, command_timeout, nullptr, control_stream_size);
    if (result.time_limit_exceeded)
        throw internal_error(fmt::format("docker rm {} did not finish within {}s", ctx.container_id, command_timeout.count()));
    if (result.exitcode != 0 && !boost::contains(result.err.data, "No such container"))
        throw internal_error(fmt::format("docker rm {} exited with {}: {}", ctx.container_id, result.exitcode, boost::trim_copy(result.err.data)));
    LOG(INFO) << "Removed container " << ctx.container_id.substr(0, 12) << " of context " << ctx.id;
}

}  // namespace codebox
