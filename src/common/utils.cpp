#include "common/utils.hpp"
#include <unistd.h>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <cstdlib>
#include <filesystem>

namespace codify {
using namespace std;
namespace fs = std::filesystem;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

bool find_in_path(const string &program) {
    if (program.empty()) return false;
    if (program.find('/') != string::npos)
        return access(program.c_str(), X_OK) == 0;

    vector<string> dirs;
    boost::split(dirs, get_env("PATH", "/usr/local/bin:/usr/bin:/bin"), boost::is_any_of(":"));
    for (auto &dir : dirs) {
        if (dir.empty()) continue;
        fs::path candidate = fs::path(dir) / program;
        error_code ec;
        if (fs::is_regular_file(candidate, ec) && access(candidate.c_str(), X_OK) == 0)
            return true;
    }
    return false;
}

time_t current_time() {
    return chrono::system_clock::to_time_t(chrono::system_clock::now());
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

}  // namespace codify
