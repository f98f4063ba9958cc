#include "monitor/monitor.hpp"
#include <glog/logging.h>
#include <functional>
#include <vector>

namespace codebox {
using namespace std;

monitor::~monitor() {}

void monitor::report_error(const string &) {}

void monitor::backend_changed(const string &, const string &) {}

void monitor::execution_finished(language, const execution_result &) {}

static vector<unique_ptr<monitor>> monitors;

void register_monitor(unique_ptr<monitor> &&monitor) {
    monitors.push_back(move(monitor));
}

void clear_monitors() {
    monitors.clear();
}

static void call_monitor(function<void(monitor &)> callback) {
    try {
        for (auto &monitor : monitors) callback(*monitor);
    } catch (std::exception &ex) {
        LOG(ERROR) << "Monitor has crashed when reporting monitoring information, " << ex.what();
    }
}

void report_error(const string &message) {
    call_monitor([&](monitor &m) { m.report_error(message); });
}

void report_backend_changed(const string &from, const string &to) {
    call_monitor([&](monitor &m) { m.backend_changed(from, to); });
}

void report_execution(language lang, const execution_result &result) {
    call_monitor([&](monitor &m) { m.execution_finished(lang, result); });
}

}  // namespace codebox
