#include "common/io_utils.hpp"
#include <fstream>
#include "common/exceptions.hpp"

namespace codify {
using namespace std;

string read_file_content(const filesystem::path &path) {
    ifstream fin(path, ios::binary);
    if (!fin) throw internal_error("Unable to open file " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

void write_file_content(const filesystem::path &path, const string &content) {
    ofstream fout(path, ios::binary | ios::trunc);
    if (!fout) throw internal_error("Unable to create file " + path.string());
    fout << content;
    fout.close();
    if (!fout) throw internal_error("Unable to write file " + path.string());
}

string assert_safe_path(const string &subpath) {
    if (subpath.empty() || subpath.find("..") != string::npos || subpath.find('/') != string::npos)
        throw internal_error("subpath is not safe " + subpath);
    return subpath;
}

}  // namespace codify
