#pragma once

#include "monitor/monitor.hpp"

namespace codebox {

/**
 * @brief 把监控信息写进 glog 日志的监控器
 */
struct log_monitor : public monitor {
    void report_error(const std::string &message) override;

    void backend_changed(const std::string &from, const std::string &to) override;

    void execution_finished(language lang, const execution_result &result) override;
};

}  // namespace codebox
