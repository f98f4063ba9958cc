#include "monitor/log_monitor.hpp"
#include <glog/logging.h>

namespace codebox {
using namespace std;

void log_monitor::report_error(const string &message) {
    LOG(ERROR) << "[monitor] " << message;
}

void log_monitor::backend_changed(const string &from, const string &to) {
    if (to == "none")
        LOG(ERROR) << "[monitor] no container engine is available, last backend was " << from;
    else
        LOG(INFO) << "[monitor] container engine backend switched from " << from << " to " << to;
}

void log_monitor::execution_finished(language lang, const execution_result &result) {
    DLOG(INFO) << "[monitor] " << get_language_name(lang) << " run finished: " << get_display_message(result.status)
               << ", " << result.duration_ms << "ms, " << result.memory_used_mb << "MB";
    if (result.status == status::INTERNAL_ERROR)
        LOG(ERROR) << "[monitor] internal error: " << result.internal_message;
}

}  // namespace codebox
