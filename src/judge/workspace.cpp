#include "judge/workspace.hpp"
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace codify {
using namespace std;
namespace fs = std::filesystem;

fs::path workspace::working_directory() const {
    return is_directory ? root_path : root_path.parent_path();
}

workspace_manager::workspace_manager(const fs::path &temp_root)
    : root(temp_root) {}

const fs::path &workspace_manager::temp_root() const {
    return root;
}

workspace workspace_manager::create(const toolchain &tc, const string &code) const {
    error_code ec;
    fs::create_directories(root, ec);
    if (ec) throw internal_error("Unable to create temp directory " + root.string() + ": " + ec.message());

    workspace ws;
    ws.id = boost::lexical_cast<string>(boost::uuids::random_generator()());
    ws.language = tc.language;
    string content = code;

    if (tc.entry_point == entry_point_strategy::EXTRACTED_FROM_SOURCE) {
        auto entry = derive_entry_point(code);
        if (!entry) {
            entry = "Main";
            content = synthesize_entry_point(code);
        }
        ws.entry_point = assert_safe_path(*entry);
        ws.is_directory = true;
        ws.root_path = root / ws.id;
        ws.source_path = ws.root_path / (ws.entry_point + tc.source_extension);
        fs::create_directories(ws.root_path, ec);
        if (ec) throw internal_error("Unable to create workspace " + ws.root_path.string() + ": " + ec.message());
    } else {
        ws.root_path = root / ws.id;
        ws.source_path = root / (ws.id + tc.source_extension);
        if (tc.has_compile_step())
            ws.executable_path = ws.root_path;
    }

    try {
        write_file_content(ws.source_path, content);
    } catch (internal_error &) {
        destroy(ws);
        throw;
    }
    return ws;
}

static void remove_quietly(const fs::path &path, bool recursive) {
    error_code ec;
    if (recursive)
        fs::remove_all(path, ec);
    else
        fs::remove(path, ec);
    if (ec) LOG(ERROR) << "Unable to delete " << path << ": " << ec.message();
}

void workspace_manager::destroy(workspace &ws) const noexcept {
    if (ws.destroyed) return;
    ws.destroyed = true;

    if (ws.is_directory) {
        remove_quietly(ws.root_path, true);
        return;
    }

    remove_quietly(ws.source_path, false);
    if (ws.executable_path) {
        remove_quietly(*ws.executable_path, false);
        // 交叉编译或 Windows 工具链可能生成 .exe 后缀
        remove_quietly(ws.executable_path->string() + ".exe", false);
    }
}

}  // namespace codify
