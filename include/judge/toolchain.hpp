#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace codify {

/**
 * @brief 程序入口的确定方式
 */
enum class entry_point_strategy {
    /**
     * @brief 入口固定，源文件名和可执行文件名都由工作区决定
     */
    FIXED,

    /**
     * @brief 入口由代码决定，比如 Java 的 public class 类名
     * 源文件名必须和类名一致，因此需要单独的工作区文件夹
     */
    EXTRACTED_FROM_SOURCE
};

/**
 * @brief 一种编程语言的编译和运行方式
 *
 * 命令模板中可以使用以下占位符，在运行时由工作区替换：
 *   {source}     源文件的绝对路径
 *   {executable} 编译生成的可执行文件路径
 *   {entry}      程序入口名（Java 类名）
 *   {workdir}    子进程的工作目录
 */
struct toolchain {
    /**
     * @brief 语言标识，如 python, cpp, java
     */
    std::string language;

    /**
     * @brief 展示给用户的名称，如 "C++"
     */
    std::string display_name;

    /**
     * @brief 源文件扩展名，包含 '.'
     */
    std::string source_extension;

    /**
     * @brief 编译命令模板，解释型语言为空
     */
    std::vector<std::string> compile_command;

    /**
     * @brief 运行命令模板
     */
    std::vector<std::string> run_command;

    entry_point_strategy entry_point = entry_point_strategy::FIXED;

    bool has_compile_step() const;

    /**
     * @brief 编译和运行需要用到的外部程序（命令模板的第一个参数）
     */
    std::vector<std::string> required_programs() const;
};

/**
 * @brief 语言注册表
 * 保存所有支持的语言以及别名（如 py -> python），
 * 启动后只读，可以被多个 worker 并发访问
 */
struct toolchain_registry {
    /**
     * @brief 注册内置的 8 种语言
     */
    toolchain_registry();

    /**
     * @brief 注册或替换一种语言
     */
    void register_toolchain(const toolchain &tc, const std::vector<std::string> &aliases = {});

    /**
     * @brief 将语言名转换为小写并解析别名
     */
    std::string normalize(const std::string &language) const;

    /**
     * @brief 查找语言，不支持时返回 nullptr
     */
    const toolchain *find(const std::string &language) const;

    /**
     * @brief 查找语言
     * @throw validation_error 不支持该语言
     */
    const toolchain &resolve(const std::string &language) const;

    bool supports(const std::string &language) const;

    std::vector<std::string> languages() const;

    std::vector<std::string> aliases_of(const std::string &language) const;

    /**
     * @brief 检查所有语言需要的外部程序是否在 PATH 中
     * @return 缺少外部程序的语言，以及缺少的程序名
     */
    std::map<std::string, std::string> probe() const;

private:
    std::map<std::string, toolchain> toolchains;
    std::map<std::string, std::string> aliases;
};

/**
 * @brief 从 Java 代码中找出入口类名
 * 去掉注释后，优先匹配 public class，否则匹配第一个 class
 * @return 找不到类声明时返回 std::nullopt
 */
std::optional<std::string> derive_entry_point(const std::string &source);

/**
 * @brief 将没有类声明的 Java 代码片段包装进 Main 类的 main 方法
 */
std::string synthesize_entry_point(const std::string &source);

}  // namespace codify
