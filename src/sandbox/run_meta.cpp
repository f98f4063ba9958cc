#include "sandbox/run_meta.hpp"
#include <boost/lexical_cast.hpp>
#include <fstream>
#include <map>

namespace codebox {
using namespace std;

static map<string, string> read_metadata(ifstream &fin) {
    map<string, string> mp;
    string line;
    while (getline(fin, line)) {
        size_t sep = line.find(':');
        if (sep == string::npos) continue;
        string key = line.substr(0, sep);
        size_t begin = line.find_first_not_of(' ', sep + 1);
        mp[key] = begin == string::npos ? "" : line.substr(begin);
    }
    return mp;
}

template <typename T>
void try_to_parse(const map<string, string> &metadata, const char *key, T &value) {
    auto it = metadata.find(key);
    if (it == metadata.end()) return;
    try {
        value = boost::lexical_cast<T>(it->second);
    } catch (boost::bad_lexical_cast &) {
        // 包装脚本在 cgroup 文件不可读时可能写出空值，保留默认值
    }
}

run_metadata read_run_metadata(const filesystem::path &metafile) {
    run_metadata result;
    ifstream fin(metafile);
    if (!fin) return result;

    auto metadata = read_metadata(fin);
    result.present = metadata.count("exitcode") > 0;
    try_to_parse(metadata, "exitcode", result.exitcode);
    try_to_parse(metadata, "wall-time-ms", result.wall_time_ms);
    try_to_parse(metadata, "memory-bytes", result.memory);
    if (metadata.count("memory-result")) result.memory_result = metadata.at("memory-result");
    return result;
}

}  // namespace codebox
