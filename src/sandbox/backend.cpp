#include "sandbox/backend.hpp"

namespace codebox {
using namespace std;

const vector<string> RESET_COMMAND = {"/bin/sh", "-c", "kill -9 -1 2>/dev/null; rm -rf /tmp/* /tmp/.[!.]* /tmp/..?* 2>/dev/null; exit 0"};

engine_backend::~engine_backend() {}

}  // namespace codebox
