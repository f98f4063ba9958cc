#include "sandbox/execution.hpp"

namespace codebox {
using namespace std;

const char *const SERVICE_UNAVAILABLE_MESSAGE = "Execution service unavailable";

execution_result infrastructure_failure(codebox::status stat, const string &detail) {
    execution_result result;
    result.status = stat;
    result.stderr_data = SERVICE_UNAVAILABLE_MESSAGE;
    result.internal_message = detail;
    return result;
}

}  // namespace codebox
