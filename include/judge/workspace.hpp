#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include "judge/toolchain.hpp"

namespace codify {

/**
 * @brief 一次编译运行所使用的独立工作区
 * 每次评测或在线运行都会创建新的工作区，互不共享文件
 */
struct workspace {
    /**
     * @brief 工作区 id，随机生成的 uuid
     */
    std::string id;

    /**
     * @brief 工作区根路径
     * Java 程序为 TEMP_DIR/<id> 文件夹，其他语言为 TEMP_DIR/<id>（不含扩展名）
     */
    std::filesystem::path root_path;

    std::filesystem::path source_path;

    /**
     * @brief 编译型语言的可执行文件路径
     */
    std::optional<std::filesystem::path> executable_path;

    /**
     * @brief 程序入口名，目前只有 Java 使用
     */
    std::string entry_point;

    std::string language;

    /**
     * @brief 工作区是否是一个单独的文件夹
     */
    bool is_directory = false;

    bool destroyed = false;

    /**
     * @brief 子进程的工作目录
     */
    std::filesystem::path working_directory() const;
};

/**
 * @brief 管理工作区的创建和删除
 */
struct workspace_manager {
    explicit workspace_manager(const std::filesystem::path &temp_root);

    /**
     * @brief 创建工作区并写入源代码
     * 对于入口由代码决定的语言，会先从代码中找出入口类名，
     * 找不到时使用 Main 类包装代码
     * @throw internal_error 无法创建文件
     */
    workspace create(const toolchain &tc, const std::string &code) const;

    /**
     * @brief 删除工作区内的所有文件
     * 可以重复调用，删除失败时只记录日志，不会抛出异常
     */
    void destroy(workspace &ws) const noexcept;

    const std::filesystem::path &temp_root() const;

private:
    std::filesystem::path root;
};

}  // namespace codify
