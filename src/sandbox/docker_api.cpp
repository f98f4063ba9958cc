#include "sandbox/docker_api.hpp"
#include <curl/curl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <cstring>
#include <mutex>
#include <sstream>
#include <thread>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"

namespace codebox {
using namespace std;

static const char *const API_PREFIX = "/v1.41";
static const int MIN_API_MAJOR = 1;
static const int MIN_API_MINOR = 41;
static const char *const DEFAULT_SOCKET = "/var/run/docker.sock";
const chrono::milliseconds request_timeout(30000);
const chrono::milliseconds connect_timeout(2000);
const chrono::seconds reset_timeout(10);

static void init_curl() {
    static once_flag flag;
    call_once(flag, [] { curl_global_init(CURL_GLOBAL_ALL); });
}

string normalize_docker_endpoint(const string &endpoint) {
    if (boost::starts_with(endpoint, "unix://")) {
        string path = endpoint.substr(strlen("unix://"));
        if (path.empty()) return DEFAULT_SOCKET;
        return path[0] == '/' ? path : "/" + path;
    }
    if (!endpoint.empty() && endpoint[0] == '/')
        return endpoint;
    if (!endpoint.empty())
        LOG(WARNING) << "Docker endpoint " << endpoint << " is not a unix socket, using unix://" << DEFAULT_SOCKET;
    return DEFAULT_SOCKET;
}

stream_demuxer::stream_demuxer(captured_stream &out, captured_stream &err, size_t limit)
    : out(out), err(err), limit(limit) {}

void stream_demuxer::feed(const char *data, size_t n) {
    while (n > 0) {
        if (header_read < sizeof(header)) {
            size_t take = min(n, sizeof(header) - header_read);
            memcpy(header + header_read, data, take);
            header_read += take;
            data += take;
            n -= take;
            if (header_read == sizeof(header)) {
                stream_type = header[0];
                remaining = ((size_t)header[4] << 24) | ((size_t)header[5] << 16) |
                            ((size_t)header[6] << 8) | (size_t)header[7];
                if (remaining == 0) header_read = 0;
            }
            continue;
        }

        size_t take = min(n, remaining);
        (stream_type == 2 ? err : out).append(data, take, limit);
        data += take;
        n -= take;
        remaining -= take;
        if (remaining == 0) header_read = 0;
    }
}

bool stream_demuxer::at_frame_boundary() const {
    return header_read == 0;
}

static size_t write_string(char *ptr, size_t size, size_t nmemb, void *userdata) {
    static_cast<string *>(userdata)->append(ptr, size * nmemb);
    return size * nmemb;
}

static size_t write_demuxer(char *ptr, size_t size, size_t nmemb, void *userdata) {
    static_cast<stream_demuxer *>(userdata)->feed(ptr, size * nmemb);
    return size * nmemb;
}

struct transfer_state {
    const cancellation_token *cancel;
    chrono::steady_clock::time_point deadline;
    bool expired = false;
    bool cancelled = false;
};

static int transfer_progress(void *clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto *state = static_cast<transfer_state *>(clientp);
    if (chrono::steady_clock::now() >= state->deadline) {
        state->expired = true;
        return 1;
    }
    if (is_cancelled(state->cancel)) {
        state->cancelled = true;
        return 1;
    }
    return 0;
}

static bool is_connection_error(CURLcode res) {
    return res == CURLE_COULDNT_CONNECT || res == CURLE_COULDNT_RESOLVE_HOST ||
           res == CURLE_SEND_ERROR || res == CURLE_RECV_ERROR ||
           res == CURLE_GOT_NOTHING || res == CURLE_OPERATION_TIMEDOUT;
}

static string daemon_message(const string &body) {
    try {
        auto j = nlohmann::json::parse(body);
        if (j.is_object() && j.count("message") && j["message"].is_string())
            return j["message"].get<string>();
    } catch (nlohmann::json::exception &) {
        // 不是 JSON 的响应原样返回
    }
    return boost::trim_copy(body);
}

static nlohmann::json parse_body(const string &body, const string &what) {
    try {
        return nlohmann::json::parse(body);
    } catch (nlohmann::json::exception &e) {
        throw internal_error(fmt::format("malformed response of {}: {}", what, e.what()));
    }
}

static bool api_version_supported(const string &version) {
    vector<string> parts;
    boost::split(parts, version, boost::is_any_of("."));
    if (parts.size() < 2) return false;
    try {
        int major = boost::lexical_cast<int>(parts[0]);
        int minor = boost::lexical_cast<int>(parts[1]);
        return major > MIN_API_MAJOR || (major == MIN_API_MAJOR && minor >= MIN_API_MINOR);
    } catch (boost::bad_lexical_cast &) {
        return false;
    }
}

static pair<string, string> split_image(const string &image) {
    size_t slash = image.find_last_of('/');
    size_t colon = image.find_last_of(':');
    if (colon != string::npos && (slash == string::npos || colon > slash))
        return {image.substr(0, colon), image.substr(colon + 1)};
    return {image, "latest"};
}

docker_api_backend::docker_api_backend(const string &endpoint)
    : socket_path(normalize_docker_endpoint(endpoint)) {
    init_curl();
}

string docker_api_backend::name() const {
    return "docker-api";
}

const string &docker_api_backend::socket() const {
    return socket_path;
}

docker_api_backend::http_response docker_api_backend::request(const string &method, const string &path,
                                                              const nlohmann::json *body, chrono::milliseconds timeout) {
    http_response response;
    string payload = body ? body->dump() : "";
    string url = "http://localhost" + path;

    CURL *curl = curl_easy_init();
    if (!curl) throw internal_error("unable to initialize curl");
    curl_slist *headers = curl_slist_append(nullptr, "Content-Type: application/json");
    defer {
        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);
    };

    curl_easy_setopt(curl, CURLOPT_UNIX_SOCKET_PATH, socket_path.c_str());
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, (long)timeout.count());
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, (long)min(timeout, connect_timeout).count());
    if (method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, (long)payload.size());
    }
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_string);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        string message = fmt::format("{} {} on {}: {}", method, path, socket_path, curl_easy_strerror(res));
        if (is_connection_error(res)) throw engine_unreachable(message);
        throw internal_error(message);
    }
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.code);
    return response;
}

void docker_api_backend::ping(chrono::milliseconds timeout) {
    elapsed_time timer;
    auto pong = request("GET", "/_ping", nullptr, timeout);
    if (pong.code != 200)
        throw engine_unreachable(fmt::format("docker daemon at {} answered ping with HTTP {}", socket_path, pong.code));

    auto remaining = max(timeout - timer.duration<chrono::milliseconds>(), chrono::milliseconds(1));
    auto version = request("GET", "/version", nullptr, remaining);
    if (version.code != 200)
        throw engine_unreachable(fmt::format("docker daemon at {} answered version with HTTP {}", socket_path, version.code));

    string api_version;
    try {
        api_version = nlohmann::json::parse(version.body).at("ApiVersion").get<string>();
    } catch (nlohmann::json::exception &e) {
        throw engine_unreachable(fmt::format("malformed version response from {}: {}", socket_path, e.what()));
    }
    if (!api_version_supported(api_version))
        throw engine_unreachable(fmt::format("docker API version {} is older than {}.{}", api_version, MIN_API_MAJOR, MIN_API_MINOR));
}

void docker_api_backend::pull_image(const string &image) {
    auto [repo, tag] = split_image(image);
    auto response = request("POST", fmt::format("{}/images/create?fromImage={}&tag={}", API_PREFIX, repo, tag),
                            nullptr, chrono::seconds(PROVISION_TIME_LIMIT));
    if (response.code != 200)
        throw internal_error(fmt::format("unable to pull {}: HTTP {} {}", image, response.code, daemon_message(response.body)));

    // 拉取进度以 JSON 行的形式返回，失败信息也在其中
    istringstream lines(response.body);
    string line;
    while (getline(lines, line)) {
        if (boost::trim_copy(line).empty()) continue;
        nlohmann::json progress = nlohmann::json::parse(line, nullptr, false);
        if (progress.is_object() && progress.count("error"))
            throw internal_error(fmt::format("unable to pull {}: {}", image, progress["error"].dump()));
    }
    LOG(INFO) << "Pulled image " << image;
}

void docker_api_backend::provision(execution_context &ctx, const string &image) {
    nlohmann::json body = {
        {"Image", image},
        {"Cmd", nlohmann::json::array({"sleep", "infinity"})},
        {"WorkingDir", CONTEXT_WORKDIR},
        {"User", container_user()},
        {"NetworkDisabled", ctx.limits.network_disabled},
        {"Labels", {{"codebox.context", ctx.id}}},
        {"HostConfig", host_config(ctx.limits, ctx.scratch_dir)}};
    string path = fmt::format("{}/containers/create?name=codebox-{}", API_PREFIX, ctx.id);
    chrono::seconds timeout(PROVISION_TIME_LIMIT);

    auto response = request("POST", path, &body, timeout);
    if (response.code == 404) {
        LOG(INFO) << "Image " << image << " does not exist locally, pulling";
        pull_image(image);
        response = request("POST", path, &body, timeout);
    }
    if (response.code != 201)
        throw internal_error(fmt::format("unable to create container from {}: HTTP {} {}", image, response.code, daemon_message(response.body)));
    ctx.container_id = parse_body(response.body, "container create").at("Id").get<string>();

    auto started = request("POST", fmt::format("{}/containers/{}/start", API_PREFIX, ctx.container_id), nullptr, timeout);
    if (started.code != 204 && started.code != 304)
        throw internal_error(fmt::format("unable to start container {}: HTTP {} {}", ctx.container_id, started.code, daemon_message(started.body)));

    LOG(INFO) << "Provisioned container " << ctx.container_id.substr(0, 12) << " for context " << ctx.id << " from " << image;
}

string docker_api_backend::create_exec(execution_context &ctx, const vector<string> &command) {
    nlohmann::json body = {
        {"AttachStdin", false},
        {"AttachStdout", true},
        {"AttachStderr", true},
        {"Tty", false},
        {"Cmd", command},
        {"WorkingDir", CONTEXT_WORKDIR},
        {"User", container_user()}};
    auto response = request("POST", fmt::format("{}/containers/{}/exec", API_PREFIX, ctx.container_id), &body, request_timeout);
    if (response.code == 404 || response.code == 409)
        throw context_fault(fmt::format("container {} is not running: {}", ctx.container_id, daemon_message(response.body)));
    if (response.code != 201)
        throw internal_error(fmt::format("unable to create exec in {}: HTTP {} {}", ctx.container_id, response.code, daemon_message(response.body)));
    return parse_body(response.body, "exec create").at("Id").get<string>();
}

int docker_api_backend::inspect_exit_code(const string &exec_id) {
    // 输出流关闭后，守护进程可能还没有更新 exec 的状态
    for (int attempt = 0; attempt < 20; ++attempt) {
        auto response = request("GET", fmt::format("{}/exec/{}/json", API_PREFIX, exec_id), nullptr, request_timeout);
        if (response.code != 200)
            throw internal_error(fmt::format("unable to inspect exec {}: HTTP {}", exec_id, response.code));
        auto j = parse_body(response.body, "exec inspect");
        if (!j.value("Running", false)) {
            if (!j.count("ExitCode") || !j["ExitCode"].is_number_integer()) return -1;
            return j["ExitCode"].get<int>();
        }
        this_thread::sleep_for(chrono::milliseconds(50));
    }
    throw internal_error("exec " + exec_id + " is still running after its output stream closed");
}

raw_run docker_api_backend::exec(execution_context &ctx, const vector<string> &command,
                                 const resource_limits &limits, const cancellation_token *cancel) {
    string exec_id = create_exec(ctx, command);

    raw_run run;
    stream_demuxer demuxer(run.out, run.err, limits.stream_size);
    transfer_state state{cancel, chrono::steady_clock::now() + limits.wall_timeout};
    string payload = nlohmann::json({{"Detach", false}, {"Tty", false}}).dump();
    string url = fmt::format("http://localhost{}/exec/{}/start", API_PREFIX, exec_id);

    CURL *curl = curl_easy_init();
    if (!curl) throw internal_error("unable to initialize curl");
    curl_slist *headers = curl_slist_append(nullptr, "Content-Type: application/json");
    defer {
        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);
    };

    curl_easy_setopt(curl, CURLOPT_UNIX_SOCKET_PATH, socket_path.c_str());
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, (long)payload.size());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, (long)connect_timeout.count());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, (long)limits.wall_timeout.count());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_demuxer);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &demuxer);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, transfer_progress);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &state);

    elapsed_time timer;
    CURLcode res = curl_easy_perform(curl);
    run.wall_time = timer.duration<chrono::microseconds>().count() / 1e6;

    if (res == CURLE_OPERATION_TIMEDOUT || (res == CURLE_ABORTED_BY_CALLBACK && state.expired)) {
        run.time_limit_exceeded = true;
    } else if (res == CURLE_ABORTED_BY_CALLBACK) {
        run.cancelled = true;
    } else if (res != CURLE_OK) {
        string message = fmt::format("exec {} on {}: {}", exec_id, socket_path, curl_easy_strerror(res));
        if (is_connection_error(res)) throw engine_unreachable(message);
        throw internal_error(message);
    } else {
        long code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
        if (code == 404 || code == 409)
            throw context_fault(fmt::format("container {} is not running", ctx.container_id));
        if (code != 200)
            throw internal_error(fmt::format("unable to start exec {}: HTTP {}", exec_id, code));
        run.exitcode = inspect_exit_code(exec_id);
    }
    return run;
}

void docker_api_backend::reset(execution_context &ctx) {
    resource_limits limits = ctx.limits;
    limits.wall_timeout = reset_timeout;
    limits.stream_size = 4096;

    raw_run run;
    try {
        run = exec(ctx, RESET_COMMAND, limits, nullptr);
    } catch (sandbox_exception &e) {
        throw context_fault(fmt::format("unable to reset context {}: {}", ctx.id, e.what()));
    }
    if (run.time_limit_exceeded || run.exitcode != 0)
        throw context_fault(fmt::format("unable to reset context {}: exit code {}", ctx.id, run.exitcode));
}

void docker_api_backend::destroy(execution_context &ctx) {
    if (ctx.container_id.empty()) return;
    auto response = request("DELETE", fmt::format("{}/containers/{}?force=true&v=true", API_PREFIX, ctx.container_id),
                            nullptr, request_timeout);
    if (response.code != 204 && response.code != 404)
        throw internal_error(fmt::format("unable to remove container {}: HTTP {} {}", ctx.container_id, response.code, daemon_message(response.body)));
    LOG(INFO) << "Removed container " << ctx.container_id.substr(0, 12) << " of context " << ctx.id;
}

}  // namespace codebox
