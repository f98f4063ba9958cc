#include "common/io_utils.hpp"
#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <fstream>
#include <system_error>

namespace codebox {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(filesystem::path const &path) {
    ifstream fin(path, ios::binary);
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(filesystem::path const &path, const string &def) {
    if (!filesystem::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path, ios::binary | ios::trunc);
    if (!fout) throw system_error(errno, generic_category(), "unable to open " + path.string());
    fout.write(content.data(), content.size());
    if (!fout) throw system_error(errno, generic_category(), "unable to write " + path.string());
}

bool utf8_check_is_valid(const string &string) {
    int c, i, ix, n, j;
    for (i = 0, ix = string.length(); i < ix; i++) {
        c = (unsigned char)string[i];
        if (0x00 <= c && c <= 0x7f)
            n = 0;  // 0bbbbbbb
        else if ((c & 0xE0) == 0xC0)
            n = 1;  // 110bbbbb
        else if (c == 0xed && i < (ix - 1) && ((unsigned char)string[i + 1] & 0xa0) == 0xa0)
            return false;  // U+d800 to U+dfff
        else if ((c & 0xF0) == 0xE0)
            n = 2;  // 1110bbbb
        else if ((c & 0xF8) == 0xF0)
            n = 3;  // 11110bbb
        else
            return false;
        for (j = 0; j < n && i < ix; j++) {  // n bytes matching 10bbbbbb follow ?
            if ((++i == ix) || (((unsigned char)string[i] & 0xC0) != 0x80))
                return false;
        }
    }
    return true;
}

string base64_encode(const string &bytes) {
    using namespace boost::archive::iterators;
    using base64_iterator = base64_from_binary<transform_width<string::const_iterator, 6, 8>>;
    string encoded(base64_iterator(bytes.begin()), base64_iterator(bytes.end()));
    encoded.append((3 - bytes.size() % 3) % 3, '=');
    return encoded;
}

string assert_safe_path(const string &subpath) {
    if (subpath.find("../") != string::npos || subpath == ".." || (!subpath.empty() && subpath[0] == '/'))
        throw runtime_error("subpath is not safe " + subpath);
    return subpath;
}

void clear_directory(const fs::path &dir) {
    for (auto &entry : fs::directory_iterator(dir))
        fs::remove_all(entry.path());
}

}  // namespace codebox
