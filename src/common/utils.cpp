#include "common/utils.hpp"
#include <unistd.h>
#include <boost/algorithm/string.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <mutex>

namespace codebox {
using namespace std;
namespace fs = std::filesystem;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

optional<fs::path> find_executable(const string &name) {
    if (name.empty()) return {};
    if (name.find('/') != string::npos) {
        if (access(name.c_str(), X_OK) == 0) return fs::path(name);
        return {};
    }

    vector<string> dirs;
    string path = get_env("PATH", "/usr/local/bin:/usr/bin:/bin");
    boost::split(dirs, path, boost::is_any_of(":"));
    for (auto &dir : dirs) {
        if (dir.empty()) continue;
        fs::path candidate = fs::path(dir) / name;
        error_code ec;
        if (fs::is_regular_file(candidate, ec) && access(candidate.c_str(), X_OK) == 0)
            return candidate;
    }
    return {};
}

string generate_uuid() {
    static mutex uuid_mutex;
    static boost::uuids::random_generator generator;
    scoped_lock guard(uuid_mutex);
    return boost::uuids::to_string(generator());
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

}  // namespace codebox
