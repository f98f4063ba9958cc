#include "common/status.hpp"
#include <boost/assign.hpp>
#include <stdexcept>
#include <unordered_map>

namespace codebox {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_string = boost::assign::map_list_of
    (status::SUCCESS, "Success")
    (status::RUNTIME_ERROR, "Runtime Error")
    (status::TIMEOUT, "Timeout")
    (status::MEMORY_EXCEEDED, "Memory Exceeded")
    (status::COMPILE_ERROR, "Compile Error")
    (status::INTERNAL_ERROR, "Internal Error")
    (status::ENGINE_UNAVAILABLE, "Engine Unavailable")
    (status::CANCELLED, "Cancelled")
    (status::TESTS_FAILED, "Tests Failed");

static const unordered_map<status, const char *> status_name = boost::assign::map_list_of
    (status::SUCCESS, "success")
    (status::RUNTIME_ERROR, "runtime_error")
    (status::TIMEOUT, "timeout")
    (status::MEMORY_EXCEEDED, "memory_exceeded")
    (status::COMPILE_ERROR, "compile_error")
    (status::INTERNAL_ERROR, "internal_error")
    (status::ENGINE_UNAVAILABLE, "engine_unavailable")
    (status::CANCELLED, "cancelled")
    (status::TESTS_FAILED, "tests_failed");
// clang-format on

const char *get_display_message(status stat) {
    return status_string.at(stat);
}

const char *get_status_name(status stat) {
    return status_name.at(stat);
}

status parse_status(const string &name) {
    for (auto &[stat, text] : status_name)
        if (name == text) return stat;
    throw invalid_argument("Unrecognized status " + name);
}

bool is_infrastructure_failure(status stat) {
    return stat == status::INTERNAL_ERROR || stat == status::ENGINE_UNAVAILABLE;
}

}  // namespace codebox
