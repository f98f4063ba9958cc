#include "sandbox/engine.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "monitor/monitor.hpp"
#include "sandbox/run_meta.hpp"

namespace codebox {
using namespace std;
namespace fs = std::filesystem;

const chrono::seconds drain_timeout(30);

prepared_program::prepared_program(language lang, fs::path dir)
    : lang(lang), dir(move(dir)) {}

prepared_program::~prepared_program() {
    if (dir.empty() || DEBUG) return;
    error_code ec;
    fs::remove_all(dir, ec);
    if (ec) LOG(ERROR) << "Unable to remove artifact directory " << dir << ": " << ec.message();
}

bool prepared_program::ok() const {
    return compile_result.status == status::SUCCESS;
}

execution_service::~execution_service() {}

execution_result execution_service::execute(const execution_request &request, const cancellation_token *cancel) {
    auto program = prepare(request.lang, request.source_code, request.limits, cancel);
    if (!program->ok()) return program->compile_result;
    return invoke(*program, request.input.value_or(""), request.limits, cancel);
}

/**
 * @brief 借出的执行上下文
 * 如果持有者没有调用 release（比如抛出了异常），析构时销毁上下文
 */
struct execution_engine::lease {
    explicit lease(execution_engine &engine) : engine(engine) {}

    ~lease() {
        if (!done) engine.release(*this, false);
    }

    execution_engine &engine;
    optional<size_t> slot;
    unique_ptr<execution_context> owned;
    execution_context *ctx = nullptr;
    bool done = false;
};

execution_engine::execution_engine(engine_selector &selector, pool_options pool_opts, fs::path run_dir)
    : selector(selector), pool(pool_opts), run_dir(move(run_dir)) {}

execution_engine::~execution_engine() {
    shutdown();
}

context_pool &execution_engine::get_pool() {
    return pool;
}

template <typename Fn>
execution_result execution_engine::with_backend(const char *operation, Fn &&fn) {
    // 后端无法连接时重新探测并重试一次，选手代码本身的失败不会重试
    for (int attempt = 0; attempt < 2; ++attempt) {
        engine_backend *backend;
        try {
            backend = &selector.probe();
        } catch (engine_unavailable &e) {
            LOG(ERROR) << operation << " failed: " << e.what();
            return infrastructure_failure(status::ENGINE_UNAVAILABLE, e.what());
        }

        try {
            execution_result result = fn(*backend);
            if (result.status == status::INTERNAL_ERROR) {
                report_error(fmt::format("{} on {}: {}", operation, backend->name(), result.internal_message));
                selector.report_failure(*backend);
            } else {
                selector.report_success(*backend);
            }
            return result;
        } catch (engine_unreachable &e) {
            LOG(WARNING) << operation << " on " << backend->name() << " failed, engine is unreachable: " << e.what();
            selector.report_unreachable(*backend);
            if (attempt > 0) {
                report_error(e.what());
                return infrastructure_failure(status::ENGINE_UNAVAILABLE, e.what());
            }
        } catch (sandbox_exception &e) {
            LOG(ERROR) << operation << " on " << backend->name() << " failed: " << e;
            report_error(e.what());
            selector.report_failure(*backend);
            return infrastructure_failure(status::INTERNAL_ERROR, e.what());
        } catch (std::exception &e) {
            LOG(ERROR) << operation << " on " << backend->name() << " failed: " << boost::diagnostic_information(e);
            report_error(e.what());
            selector.report_failure(*backend);
            return infrastructure_failure(status::INTERNAL_ERROR, e.what());
        }
    }
    return infrastructure_failure(status::ENGINE_UNAVAILABLE, "container engine is unreachable");
}

unique_ptr<execution_context> execution_engine::provision(engine_backend &backend, language lang, const resource_limits &limits) {
    string id = generate_uuid();
    auto ctx = make_unique<execution_context>(id, lang, limits, run_dir / "contexts" / id);
    ctx->backend = &backend;
    try {
        fs::create_directories(ctx->scratch_dir);
        install_run_wrapper(ctx->scratch_dir);
        backend.provision(*ctx, make_runner(lang).image());
        ctx->transition(context_state::READY);
        return ctx;
    } catch (std::exception &e) {
        LOG(WARNING) << "Unable to provision " << get_language_name(lang) << " context on " << backend.name() << ": " << e.what();
        ctx->transition(context_state::FAULTED);
        teardown(move(ctx));
        throw;
    }
}

void execution_engine::borrow(lease &l, engine_backend &backend, language lang, const resource_limits &limits) {
    if (!pool.enabled()) {
        l.owned = provision(backend, lang, limits);
        l.ctx = l.owned.get();
    } else {
        vector<unique_ptr<execution_context>> evicted;
        defer {
            for (auto &ctx : evicted) teardown(move(ctx));
        };

        l.slot = pool.acquire(lang, backend, limits, evicted);
        if (!pool.get(*l.slot))
            pool.install(*l.slot, provision(backend, lang, limits));
        l.ctx = pool.get(*l.slot);
    }
    l.ctx->transition(context_state::RUNNING);
    l.ctx->touch();
}

bool execution_engine::release(lease &l, bool keep) {
    l.done = true;
    execution_context *ctx = l.ctx;
    if (!ctx) {
        if (l.slot) pool.release(*l.slot);
        return true;
    }

    // 不使用池时，容器用完即销毁，删除容器同时会杀死其中所有进程
    if (!l.slot) keep = false;

    bool terminated = false;
    if (keep) {
        try {
            ctx->backend->reset(*ctx);
            terminated = true;
            // 容器内的程序可以改写 .codebox 中的包装脚本，整个工作目录连同它一起重建
            clear_directory(ctx->scratch_dir);
            install_run_wrapper(ctx->scratch_dir);
            ctx->transition(context_state::READY);
            ctx->touch();
        } catch (std::exception &e) {
            LOG(ERROR) << "Unable to clean context " << ctx->id << ", destroying it: " << e.what();
            keep = false;
        }
    }

    if (!keep) {
        unique_ptr<execution_context> victim = l.slot ? pool.take(*l.slot) : move(l.owned);
        if (teardown(move(victim))) terminated = true;
    }

    if (l.slot) pool.release(*l.slot);
    l.ctx = nullptr;
    return terminated;
}

bool execution_engine::teardown(unique_ptr<execution_context> ctx) {
    if (!ctx) return true;
    bool ok = true;
    try {
        if (ctx->state() == context_state::RUNNING || ctx->state() == context_state::PROVISIONING)
            ctx->transition(context_state::FAULTED);
        if (ctx->backend) ctx->backend->destroy(*ctx);
    } catch (std::exception &e) {
        LOG(ERROR) << "Unable to destroy context " << ctx->id << ": " << e.what();
        report_error(fmt::format("unable to destroy context {}: {}", ctx->id, e.what()));
        ok = false;
    }

    if (!DEBUG) {
        error_code ec;
        fs::remove_all(ctx->scratch_dir, ec);
        if (ec) LOG(ERROR) << "Unable to remove scratch directory " << ctx->scratch_dir << ": " << ec.message();
    }

    if (ctx->can_transition(context_state::TERMINATED))
        ctx->transition(context_state::TERMINATED);
    return ok;
}

static void stage_files(const fs::path &from, const vector<string> &files, const fs::path &to) {
    for (auto &file : files)
        fs::copy_file(from / assert_safe_path(file), to / file, fs::copy_options::overwrite_existing);
}

execution_result execution_engine::compile_on(engine_backend &backend, prepared_program &program, const string &source,
                                              const resource_limits &limits, const cancellation_token *cancel) {
    auto runner = make_runner(program.lang);
    lease l(*this);
    borrow(l, backend, program.lang, limits);
    execution_context &ctx = *l.ctx;

    execution_result result;
    bool keep = true, killed = false;
    try {
        write_file_content(ctx.scratch_dir / runner.source_name(), source);
        resource_limits compile_limits = limits.for_compile();
        LOG(INFO) << "Compiling " << get_language_name(program.lang) << " program in context " << ctx.id;
        raw_run run = backend.exec(ctx, wrap_command(runner.prepare_command()), compile_limits, cancel);
        killed = run.time_limit_exceeded || run.cancelled;
        result = classify_run(run, read_run_metadata(ctx.scratch_dir / CONTEXT_PRIVATE_DIR / "run.meta"));

        switch (result.status) {
            case status::SUCCESS:
                stage_files(ctx.scratch_dir, runner.artifact_files(), program.dir);
                program.files = runner.artifact_files();
                break;
            case status::CANCELLED:
                keep = false;
                break;
            case status::TIMEOUT:
                LOG(WARNING) << "Compilation time limit exceeded";
                result.status = status::COMPILE_ERROR;
                result.stderr_data = fmt::format("Compilation time limit exceeded ({}ms)\n", compile_limits.wall_timeout.count()) + result.stderr_data;
                break;
            default:
                // 编译器的 stdout 也是诊断信息的一部分
                result.status = status::COMPILE_ERROR;
                result.stderr_data += result.stdout_data;
                result.stdout_data.clear();
                break;
        }
    } catch (engine_unreachable &) {
        release(l, false);
        throw;
    } catch (context_fault &e) {
        LOG(ERROR) << "Context " << ctx.id << " faulted while compiling: " << e;
        result = infrastructure_failure(status::INTERNAL_ERROR, e.what());
        keep = false;
    } catch (std::exception &e) {
        LOG(ERROR) << "Compilation in context " << ctx.id << " failed: " << boost::diagnostic_information(e);
        result = infrastructure_failure(status::INTERNAL_ERROR, e.what());
        keep = false;
    }

    if (!release(l, keep) && killed)
        return infrastructure_failure(status::INTERNAL_ERROR, "unable to terminate compiler");
    return result;
}

prepared_ptr execution_engine::prepare(language lang, const string &source, const resource_limits &limits,
                                       const cancellation_token *cancel) {
    limits.validate();
    auto runner = make_runner(lang);

    if (boost::trim_copy(source).empty()) {
        auto program = make_shared<prepared_program>(lang, fs::path());
        program->compile_result.status = runner.empty_source_status();
        program->compile_result.stderr_data = "empty source code";
        return program;
    }

    auto program = make_shared<prepared_program>(lang, run_dir / "artifacts" / generate_uuid());
    try {
        fs::create_directories(program->dir);
    } catch (fs::filesystem_error &e) {
        LOG(ERROR) << "Unable to create artifact directory: " << e.what();
        program->compile_result = infrastructure_failure(status::INTERNAL_ERROR, e.what());
        return program;
    }

    if (runner.prepare_command().empty()) {
        try {
            write_file_content(program->dir / runner.source_name(), source);
        } catch (std::system_error &e) {
            LOG(ERROR) << "Unable to save source code: " << e.what();
            program->compile_result = infrastructure_failure(status::INTERNAL_ERROR, e.what());
            return program;
        }
        program->files = runner.artifact_files();
        program->compile_result.status = status::SUCCESS;
        return program;
    }

    program->compile_result = with_backend("compile", [&](engine_backend &backend) {
        return compile_on(backend, *program, source, limits, cancel);
    });
    report_execution(lang, program->compile_result);
    return program;
}

execution_result execution_engine::invoke_on(engine_backend &backend, const prepared_program &program, const string &input,
                                             const resource_limits &limits, const cancellation_token *cancel) {
    auto runner = make_runner(program.lang);
    lease l(*this);
    borrow(l, backend, program.lang, limits);
    execution_context &ctx = *l.ctx;
    string context_id = ctx.id;
    fs::path private_dir = ctx.scratch_dir / CONTEXT_PRIVATE_DIR;

    execution_result result;
    bool keep = true;
    try {
        stage_files(program.dir, program.files, ctx.scratch_dir);
        write_file_content(private_dir / "stdin", input);
        fs::remove(private_dir / "run.meta");

        raw_run run = backend.exec(ctx, wrap_command(runner.run_command()), limits, cancel);
        result = classify_run(run, read_run_metadata(private_dir / "run.meta"));
        if (result.status == status::CANCELLED) keep = false;
    } catch (engine_unreachable &) {
        release(l, false);
        throw;
    } catch (context_fault &e) {
        LOG(ERROR) << "Context " << ctx.id << " faulted: " << e;
        result = infrastructure_failure(status::INTERNAL_ERROR, e.what());
        keep = false;
    } catch (std::exception &e) {
        LOG(ERROR) << "Run in context " << ctx.id << " failed: " << boost::diagnostic_information(e);
        result = infrastructure_failure(status::INTERNAL_ERROR, e.what());
        keep = false;
    }

    bool terminated = release(l, keep);
    if (!terminated && (result.status == status::TIMEOUT || result.status == status::CANCELLED)) {
        LOG(ERROR) << "Unable to terminate the program in context " << context_id;
        return infrastructure_failure(status::INTERNAL_ERROR, "unable to terminate program after " + string(get_display_message(result.status)));
    }
    return result;
}

execution_result execution_engine::invoke(const prepared_program &program, const string &input,
                                          const resource_limits &limits, const cancellation_token *cancel) {
    limits.validate();
    if (!program.ok()) return program.compile_result;

    auto result = with_backend("run", [&](engine_backend &backend) {
        return invoke_on(backend, program, input, limits, cancel);
    });
    report_execution(program.lang, result);
    return result;
}

void execution_engine::warm_up(language lang, const resource_limits &limits, size_t count) {
    if (!pool.enabled()) return;
    limits.validate();
    engine_backend &backend = selector.probe();

    vector<size_t> held;
    defer {
        for (size_t index : held) pool.release(index);
    };
    for (size_t n = 0; n < count && n < pool.capacity(); ++n) {
        vector<unique_ptr<execution_context>> evicted;
        defer {
            for (auto &ctx : evicted) teardown(move(ctx));
        };
        size_t index = pool.acquire(lang, backend, limits, evicted);
        held.push_back(index);
        if (!pool.get(index))
            pool.install(index, provision(backend, lang, limits));
    }
    LOG(INFO) << "Warmed up " << held.size() << " " << get_language_name(lang) << " contexts";
}

void execution_engine::evict_expired() {
    for (auto &ctx : pool.collect_expired()) {
        LOG(INFO) << "Evicting idle context " << ctx->id;
        teardown(move(ctx));
    }
}

void execution_engine::shutdown() {
    for (auto &ctx : pool.drain(drain_timeout))
        teardown(move(ctx));
}

}  // namespace codebox
