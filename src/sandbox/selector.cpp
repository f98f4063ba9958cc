#include "sandbox/selector.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "config.hpp"
#include "monitor/monitor.hpp"

namespace codebox {
using namespace std;

selector_options selector_options::defaults() {
    return {chrono::milliseconds(PROBE_TIMEOUT), chrono::seconds(PROBE_TTL), FAILURE_THRESHOLD};
}

engine_selector::engine_selector(vector<unique_ptr<engine_backend>> backends, selector_options opts)
    : backends(move(backends)), opts(opts) {}

shared_ptr<const engine_selector::selection> engine_selector::load() const {
    return atomic_load(&state);
}

bool engine_selector::fresh(const selection &sel, chrono::steady_clock::time_point now) const {
    // 失败的探测结果只缓存 probe_timeout，一批同时到来的请求不会重复探测
    auto ttl = sel.backend ? opts.probe_ttl : opts.probe_timeout;
    return now - sel.probed_at < ttl;
}

engine_backend &engine_selector::probe() {
    if (auto sel = load(); sel && fresh(*sel, chrono::steady_clock::now())) {
        if (!sel->backend) throw engine_unavailable(sel->error);
        return *sel->backend;
    }

    scoped_lock guard(probe_mutex);

    // 等待锁期间其他线程可能已经完成了探测
    auto now = chrono::steady_clock::now();
    if (auto sel = load(); sel && fresh(*sel, now)) {
        if (!sel->backend) throw engine_unavailable(sel->error);
        return *sel->backend;
    }

    auto deadline = now + opts.probe_timeout;
    string errors;
    engine_backend *chosen = nullptr;
    for (auto &backend : backends) {
        auto remaining = chrono::duration_cast<chrono::milliseconds>(deadline - chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            errors += fmt::format("{}: probe timeout exhausted; ", backend->name());
            continue;
        }
        try {
            backend->ping(remaining);
            chosen = backend.get();
            break;
        } catch (sandbox_exception &e) {
            LOG(WARNING) << "Engine backend " << backend->name() << " is unreachable: " << e.what();
            errors += fmt::format("{}: {}; ", backend->name(), e.what());
        }
    }

    auto sel = make_shared<selection>();
    sel->backend = chosen;
    sel->probed_at = chrono::steady_clock::now();
    sel->error = chosen ? "" : "no container engine is reachable: " + errors;
    atomic_store(&state, shared_ptr<const selection>(sel));
    failures = 0;

    if (chosen != last_selected) {
        string from = last_selected ? last_selected->name() : "none";
        string to = chosen ? chosen->name() : "none";
        LOG(INFO) << "Engine backend changed from " << from << " to " << to;
        report_backend_changed(from, to);
        last_selected = chosen;
    }

    if (!chosen) {
        report_error(sel->error);
        throw engine_unavailable(sel->error);
    }
    return *chosen;
}

void engine_selector::report_success(const engine_backend &) {
    failures = 0;
}

void engine_selector::report_failure(const engine_backend &backend) {
    size_t count = ++failures;
    if (count >= opts.failure_threshold) {
        auto sel = load();
        if (sel && sel->backend == &backend) {
            LOG(WARNING) << "Engine backend " << backend.name() << " failed " << count << " times in a row, probing again";
            invalidate();
        }
    }
}

void engine_selector::report_unreachable(const engine_backend &backend) {
    auto sel = load();
    if (sel && sel->backend == &backend) {
        LOG(WARNING) << "Engine backend " << backend.name() << " became unreachable, probing again";
        invalidate();
    }
}

void engine_selector::invalidate() {
    atomic_store(&state, shared_ptr<const selection>());
    failures = 0;
}

engine_backend *engine_selector::current() const {
    auto sel = load();
    return sel ? sel->backend : nullptr;
}

size_t engine_selector::consecutive_failures() const {
    return failures;
}

const vector<unique_ptr<engine_backend>> &engine_selector::get_backends() const {
    return backends;
}

}  // namespace codebox
