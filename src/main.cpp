#include <glog/logging.h>
#include <signal.h>
#include <boost/algorithm/string.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <cmath>
#include <fstream>
#include <iostream>
#include <iterator>
#include "common/cancellation.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "judge/report.hpp"
#include "judge/test_runner.hpp"
#include "monitor/log_monitor.hpp"
#include "sandbox/docker_api.hpp"
#include "sandbox/docker_cli.hpp"
#include "sandbox/engine.hpp"
using namespace std;
namespace po = boost::program_options;

codebox::cancellation_token interrupted;

void sigintHandler(int /* signum */) {
    interrupted.cancel();
}

/**
 * @brief 按照命令行参数、环境变量、默认值的顺序读取配置
 */
template <typename T>
static void assign_option(const po::variables_map &vm, const char *option, const char *env, T &target) {
    if (vm.count(option))
        target = vm.at(option).as<T>();
    else if (getenv(env))
        target = boost::lexical_cast<T>(getenv(env));
}

static string read_request(const string &source) {
    if (source == "-")
        return string(istreambuf_iterator<char>(cin), istreambuf_iterator<char>());
    ifstream fin(source, ios::binary);
    if (!fin) throw invalid_argument("Unable to open request file " + source);
    return string(istreambuf_iterator<char>(fin), istreambuf_iterator<char>());
}

static vector<unique_ptr<codebox::engine_backend>> make_backends() {
    vector<unique_ptr<codebox::engine_backend>> backends;
    auto api = make_unique<codebox::docker_api_backend>(codebox::DOCKER_ENDPOINT);
    auto cli = make_unique<codebox::docker_cli_backend>(codebox::DOCKER_EXECUTABLE);

    if (codebox::PRIMARY_BACKEND == "cli") {
        if (cli->available()) backends.push_back(move(cli));
        backends.push_back(move(api));
    } else {
        backends.push_back(move(api));
        if (cli->available()) backends.push_back(move(cli));
    }
    return backends;
}

/**
 * @brief 解析 --warm-up 参数，格式为 language[:count]
 */
static void warm_up(codebox::execution_engine &engine, const vector<string> &entries) {
    for (auto &entry : entries) {
        vector<string> parts;
        boost::split(parts, entry, boost::is_any_of(":"));
        codebox::language lang = codebox::parse_language(parts[0]);
        size_t count = parts.size() > 1 ? boost::lexical_cast<size_t>(parts[1]) : 1;
        engine.warm_up(lang, codebox::resource_limits::defaults(), count);
    }
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    po::options_description desc("codebox options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("request", po::value<string>(), "run the request in given json file, or read it from stdin if \"-\" is given")
        ("probe", "probe the container engines and print the selected backend")
        ("warm-up", po::value<vector<string>>(), "pre-provision execution contexts, in format language[:count]")
        ("timeout", po::value<double>(), "default wall time limit in seconds, default to 5. You can either pass it from environ CODEBOX_TIMEOUT")
        ("memory-limit", po::value<int>(), "default memory limit in MB, default to 256. You can either pass it from environ CODEBOX_MEMORY_LIMIT")
        ("cpu-share", po::value<double>(), "cpu share of each execution, default to 1.0. You can either pass it from environ CODEBOX_CPU_SHARE")
        ("compile-time-limit", po::value<double>(), "time limit in seconds for compilation, default to 10. You can either pass it from environ CODEBOX_COMPILE_TIME_LIMIT")
        ("output-limit", po::value<size_t>(), "maximum bytes kept of stdout and stderr, default to 1048576. You can either pass it from environ CODEBOX_OUTPUT_LIMIT")
        ("proc-limit", po::value<int>(), "maximum number of processes in a context, default to 64. You can either pass it from environ CODEBOX_PROC_LIMIT")
        ("backend", po::value<string>(), "primary container engine backend, api or cli, default to api. You can either pass it from environ CODEBOX_BACKEND")
        ("docker-host", po::value<string>(), "docker daemon endpoint, default to unix:///var/run/docker.sock. You can either pass it from environ DOCKER_HOST")
        ("docker-executable", po::value<string>(), "docker command line client, default to docker. You can either pass it from environ CODEBOX_DOCKER")
        ("python-image", po::value<string>(), "image for python programs. You can either pass it from environ CODEBOX_PYTHON_IMAGE")
        ("javascript-image", po::value<string>(), "image for javascript programs. You can either pass it from environ CODEBOX_JAVASCRIPT_IMAGE")
        ("cpp-image", po::value<string>(), "image for c++ programs. You can either pass it from environ CODEBOX_CPP_IMAGE")
        ("cpp-flags", po::value<string>(), "compile flags for c++ programs. You can either pass it from environ CODEBOX_CPP_FLAGS")
        ("pool-capacity", po::value<size_t>(), "maximum number of pooled execution contexts, 0 to disable pooling, default to 8. You can either pass it from environ CODEBOX_POOL_CAPACITY")
        ("pool-idle-ttl", po::value<int>(), "seconds an idle context is kept, default to 300. You can either pass it from environ CODEBOX_POOL_IDLE_TTL")
        ("pool-acquire-timeout", po::value<int>(), "seconds to wait for a free context, default to 30. You can either pass it from environ CODEBOX_POOL_ACQUIRE_TIMEOUT")
        ("probe-timeout", po::value<int>(), "milliseconds allowed for probing engines, default to 2000. You can either pass it from environ CODEBOX_PROBE_TIMEOUT")
        ("probe-ttl", po::value<int>(), "seconds a probed backend is trusted, default to 60. You can either pass it from environ CODEBOX_PROBE_TTL")
        ("failure-threshold", po::value<size_t>(), "consecutive internal errors before re-probing, default to 3. You can either pass it from environ CODEBOX_FAILURE_THRESHOLD")
        ("fan-out", po::value<size_t>(), "number of test cases run concurrently, default to 1. You can either pass it from environ CODEBOX_FAN_OUT")
        ("submission-margin", po::value<double>(), "seconds added to the submission time budget, default to 5. You can either pass it from environ CODEBOX_SUBMISSION_MARGIN")
        ("run-dir", po::value<string>(), "set the directory to store execution contexts and artifacts. You can either pass it from environ CODEBOX_RUN_DIR")
        ("debug", "turn on the debug mode, not to delete scratch directories of execution contexts.")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);

        assign_option(vm, "timeout", "CODEBOX_TIMEOUT", codebox::DEFAULT_TIME_LIMIT);
        assign_option(vm, "memory-limit", "CODEBOX_MEMORY_LIMIT", codebox::DEFAULT_MEMORY_LIMIT);
        assign_option(vm, "cpu-share", "CODEBOX_CPU_SHARE", codebox::CPU_SHARE);
        assign_option(vm, "compile-time-limit", "CODEBOX_COMPILE_TIME_LIMIT", codebox::COMPILE_TIME_LIMIT);
        assign_option(vm, "output-limit", "CODEBOX_OUTPUT_LIMIT", codebox::STREAM_SIZE);
        assign_option(vm, "proc-limit", "CODEBOX_PROC_LIMIT", codebox::PROC_LIMIT);
        assign_option(vm, "backend", "CODEBOX_BACKEND", codebox::PRIMARY_BACKEND);
        assign_option(vm, "docker-host", "DOCKER_HOST", codebox::DOCKER_ENDPOINT);
        assign_option(vm, "docker-executable", "CODEBOX_DOCKER", codebox::DOCKER_EXECUTABLE);
        assign_option(vm, "python-image", "CODEBOX_PYTHON_IMAGE", codebox::PYTHON_IMAGE);
        assign_option(vm, "javascript-image", "CODEBOX_JAVASCRIPT_IMAGE", codebox::JAVASCRIPT_IMAGE);
        assign_option(vm, "cpp-image", "CODEBOX_CPP_IMAGE", codebox::CPP_IMAGE);
        assign_option(vm, "cpp-flags", "CODEBOX_CPP_FLAGS", codebox::CPP_COMPILE_FLAGS);
        assign_option(vm, "pool-capacity", "CODEBOX_POOL_CAPACITY", codebox::POOL_CAPACITY);
        assign_option(vm, "pool-idle-ttl", "CODEBOX_POOL_IDLE_TTL", codebox::POOL_IDLE_TTL);
        assign_option(vm, "pool-acquire-timeout", "CODEBOX_POOL_ACQUIRE_TIMEOUT", codebox::POOL_ACQUIRE_TIMEOUT);
        assign_option(vm, "probe-timeout", "CODEBOX_PROBE_TIMEOUT", codebox::PROBE_TIMEOUT);
        assign_option(vm, "probe-ttl", "CODEBOX_PROBE_TTL", codebox::PROBE_TTL);
        assign_option(vm, "failure-threshold", "CODEBOX_FAILURE_THRESHOLD", codebox::FAILURE_THRESHOLD);
        assign_option(vm, "fan-out", "CODEBOX_FAN_OUT", codebox::FAN_OUT);
        assign_option(vm, "submission-margin", "CODEBOX_SUBMISSION_MARGIN", codebox::SUBMISSION_MARGIN);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    } catch (boost::bad_lexical_cast &e) {
        cerr << "Malformed environment variable: " << e.what() << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "codebox: run untrusted programs against test cases in isolated containers" << endl
             << "Reads a run request in json, prints the report in json" << endl
             << "Usage: " << argv[0] << " --request <file|-> [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "codebox 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("debug") || getenv("CODEBOX_DEBUG")) {
        codebox::DEBUG = true;
    }

    if (vm.count("run-dir")) {
        codebox::RUN_DIR = filesystem::path(vm.at("run-dir").as<string>());
    } else if (getenv("CODEBOX_RUN_DIR")) {
        codebox::RUN_DIR = filesystem::path(getenv("CODEBOX_RUN_DIR"));
    }
    error_code ec;
    filesystem::create_directories(codebox::RUN_DIR, ec);
    CHECK(filesystem::is_directory(codebox::RUN_DIR))
        << "Run directory " << codebox::RUN_DIR << " does not exist";

    if (!vm.count("request") && !vm.count("probe") && !vm.count("warm-up")) {
        cerr << "Nothing to do, pass --request or --probe" << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    signal(SIGINT, sigintHandler);
    signal(SIGTERM, sigintHandler);

    codebox::register_monitor(make_unique<codebox::log_monitor>());

    codebox::engine_selector selector(make_backends(), codebox::selector_options::defaults());

    if (vm.count("probe")) {
        try {
            cout << selector.probe().name() << endl;
        } catch (codebox::engine_unavailable &e) {
            cerr << e.what() << endl;
            return EXIT_FAILURE;
        }
        if (!vm.count("request") && !vm.count("warm-up")) return EXIT_SUCCESS;
    }

    codebox::execution_engine engine(selector, codebox::pool_options::defaults(), codebox::RUN_DIR);

    if (vm.count("warm-up")) {
        try {
            warm_up(engine, vm.at("warm-up").as<vector<string>>());
        } catch (std::exception &e) {
            LOG(ERROR) << "Unable to warm up execution contexts: " << boost::diagnostic_information(e);
            return EXIT_FAILURE;
        }
    }

    if (!vm.count("request")) return EXIT_SUCCESS;

    codebox::run_request request;
    try {
        auto body = nlohmann::json::parse(read_request(vm.at("request").as<string>()));
        request = codebox::parse_run_request(body);
    } catch (nlohmann::json::exception &e) {
        cerr << "Malformed run request: " << e.what() << endl;
        return EXIT_FAILURE;
    } catch (invalid_argument &e) {
        cerr << "Invalid run request: " << e.what() << endl;
        return EXIT_FAILURE;
    }

    auto margin = chrono::milliseconds((int64_t)llround(codebox::SUBMISSION_MARGIN * 1000));
    codebox::test_runner runner(engine, codebox::FAN_OUT, margin);
    codebox::aggregate_report report = runner.run(request, &interrupted);

    nlohmann::json response = report;
    cout << response.dump(2) << endl;
    return EXIT_SUCCESS;
}
