#include "judge/toolchain.hpp"
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <regex>
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace codify {
using namespace std;

bool toolchain::has_compile_step() const {
    return !compile_command.empty();
}

vector<string> toolchain::required_programs() const {
    vector<string> programs;
    if (has_compile_step()) programs.push_back(compile_command.front());
    // 编译型语言运行的是生成的可执行文件，不需要检查
    if (!run_command.empty() && run_command.front().find('{') == string::npos)
        programs.push_back(run_command.front());
    return programs;
}

toolchain_registry::toolchain_registry() {
    register_toolchain({"python", "Python", ".py", {}, {"python3", "{source}"}}, {"py"});
    register_toolchain({"javascript", "JavaScript", ".js", {}, {"node", "{source}"}}, {"js", "node"});
    register_toolchain({"java", "Java", ".java",
                        {"javac", "{source}"},
                        {"java", "-cp", "{workdir}", "{entry}"},
                        entry_point_strategy::EXTRACTED_FROM_SOURCE});
    register_toolchain({"cpp", "C++", ".cpp", {"g++", "{source}", "-o", "{executable}"}, {"{executable}"}}, {"c++"});
    register_toolchain({"c", "C", ".c", {"gcc", "{source}", "-o", "{executable}"}, {"{executable}"}});
    register_toolchain({"go", "Go", ".go", {}, {"go", "run", "{source}"}});
    register_toolchain({"ruby", "Ruby", ".rb", {}, {"ruby", "{source}"}}, {"rb"});
    register_toolchain({"php", "PHP", ".php", {}, {"php", "{source}"}});
}

void toolchain_registry::register_toolchain(const toolchain &tc, const vector<string> &names) {
    string id = boost::to_lower_copy(tc.language);
    toolchain copy = tc;
    copy.language = id;
    toolchains[id] = copy;
    for (auto &alias : names)
        aliases[boost::to_lower_copy(alias)] = id;
}

string toolchain_registry::normalize(const string &language) const {
    string id = boost::to_lower_copy(boost::trim_copy(language));
    auto it = aliases.find(id);
    return it == aliases.end() ? id : it->second;
}

const toolchain *toolchain_registry::find(const string &language) const {
    auto it = toolchains.find(normalize(language));
    return it == toolchains.end() ? nullptr : &it->second;
}

const toolchain &toolchain_registry::resolve(const string &language) const {
    const toolchain *tc = find(language);
    if (!tc)
        throw validation_error(validation_error::reason::UNSUPPORTED_LANGUAGE, "Unsupported language: " + language);
    return *tc;
}

bool toolchain_registry::supports(const string &language) const {
    return find(language) != nullptr;
}

vector<string> toolchain_registry::languages() const {
    vector<string> result;
    for (auto &[id, tc] : toolchains) result.push_back(id);
    return result;
}

vector<string> toolchain_registry::aliases_of(const string &language) const {
    vector<string> result;
    for (auto &[alias, id] : aliases)
        if (id == language) result.push_back(alias);
    return result;
}

map<string, string> toolchain_registry::probe() const {
    map<string, string> missing;
    for (auto &[id, tc] : toolchains)
        for (auto &program : tc.required_programs())
            if (!find_in_path(program)) {
                missing[id] = program;
                break;
            }
    return missing;
}

static string strip_comments(const string &source) {
    static const regex block_comment(R"(/\*[\s\S]*?\*/)");
    static const regex line_comment(R"(//[^\n]*)");
    return regex_replace(regex_replace(source, block_comment, ""), line_comment, "");
}

optional<string> derive_entry_point(const string &source) {
    static const regex public_class(R"(public\s+class\s+(\w+))");
    static const regex any_class(R"((?:^|\s)class\s+(\w+))");

    string code = strip_comments(source);
    smatch match;
    if (regex_search(code, match, public_class) || regex_search(code, match, any_class))
        return match[1].str();
    return nullopt;
}

string synthesize_entry_point(const string &source) {
    return "public class Main {\n"
           "    public static void main(String[] args) {\n" +
           source +
           "\n    }\n"
           "}\n";
}

}  // namespace codify
