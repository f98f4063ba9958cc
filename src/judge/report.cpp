#include "judge/report.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"
#include "config.hpp"

namespace codebox {
using namespace std;
using namespace nlohmann;

/**
 * @brief 写入文本字段，不是合法 UTF-8 的内容使用 base64 编码，并加上 <key>_encoding 字段
 */
static void put_text(json &j, const string &key, const string &value) {
    if (utf8_check_is_valid(value)) {
        j[key] = value;
    } else {
        j[key] = base64_encode(value);
        j[key + "_encoding"] = "base64";
    }
}

static string get_id(const json &j) {
    const json &id = access(j, "id");
    if (id.is_string()) return id.get<string>();
    if (id.is_number_integer()) return to_string(id.get<int64_t>());
    if (id.is_number()) return id.dump();
    throw build_invalid_argument(j, "id");
}

void from_json(const json &j, test_case &value) {
    value.id = get_id(j);
    value.input = get_value_def<string>(j, "", "input");
    value.expected_output = get_value_def<string>(j, "", "expected_output");
}

run_request parse_run_request(const json &j) {
    if (!j.is_object()) throw invalid_argument("run request must be a json object");

    run_request request;
    request.lang = parse_language(get_value<string>(j, "language"));
    request.code = get_value<string>(j, "code");

    try {
        if (exists(j, "tests", "visible")) j.at("tests").at("visible").get_to(request.visible);
        if (exists(j, "tests", "hidden")) j.at("tests").at("hidden").get_to(request.hidden);
    } catch (json::exception &e) {
        throw invalid_argument(string("malformed test cases: ") + e.what());
    }

    double timeout = get_value_def<double>(j, DEFAULT_TIME_LIMIT, "timeout_seconds");
    int memory = get_value_def<int>(j, DEFAULT_MEMORY_LIMIT, "memory_limit_mb");
    request.limits = resource_limits::from_request(timeout, memory);
    request.limits.validate();

    if (exists(j, "stdin")) request.input = get_value<string>(j, "stdin");
    return request;
}

void to_json(json &j, const execution_result &result) {
    j = json::object();
    j["status"] = get_status_name(result.status);
    put_text(j, "stdout", result.stdout_data);
    put_text(j, "stderr", result.stderr_data);
    j["stdout_truncated"] = result.stdout_truncated;
    j["stderr_truncated"] = result.stderr_truncated;
    j["exit_code"] = result.exit_code;
    j["execution_time_ms"] = result.duration_ms;
    j["memory_usage_mb"] = result.memory_used_mb;
}

void to_json(json &j, const test_case_result &result) {
    j = {{"id", result.test_id},
         {"status", result.passed ? "passed" : "failed"},
         {"execution_time_ms", result.duration_ms}};
    put_text(j, "input", result.input);
    put_text(j, "expected_output", result.expected_output);
    put_text(j, "actual_output", result.actual_output);
    j["actual_output_truncated"] = result.execution.stdout_truncated;
    if (result.error)
        put_text(j, "error", *result.error);
    else
        j["error"] = nullptr;
}

void to_json(json &j, const hidden_test_view &view) {
    j = {{"id", view.test_id},
         {"status", view.passed ? "passed" : "failed"},
         {"execution_time_ms", view.duration_ms}};
}

void to_json(json &j, const aggregate_report &report) {
    j = {{"execution", report.execution},
         {"test_results", {{"visible", report.visible_results}, {"hidden", report.hidden_results}}},
         {"summary", {{"visible_passed", report.visible_passed()},
                      {"visible_failed", report.visible_failed()},
                      {"hidden_passed", report.hidden.passed},
                      {"hidden_failed", report.hidden.failed}}},
         {"overall_status", get_status_name(report.overall_status)}};
}

}  // namespace codebox
