#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>

namespace codify {

/**
 * @brief 评测系统所有异常的基类
 * 构造时会记录调用栈，打印异常时可以一并输出，便于定位出错的位置
 */
struct judge_exception : std::exception {
    judge_exception();
    explicit judge_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const judge_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测系统的内部错误
 * 评测流程中出现的意料之外的错误，比如临时文件无法写入
 */
struct internal_error : public judge_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示评测环境的配置错误
 * 比如宿主机上没有安装某种语言的编译器或解释器，
 * 这种错误和选手代码无关，需要和编译错误、运行错误区分开
 */
struct configuration_error : public judge_exception {
    configuration_error();
    explicit configuration_error(const std::string &message);
};

/**
 * @brief 表示请求参数不合法
 */
struct validation_error : public judge_exception {
    enum class reason {
        MISSING_FIELDS,        // 缺少必填字段
        UNSUPPORTED_LANGUAGE,  // 不支持的编程语言
        CODE_TOO_LONG,         // 代码长度超出限制
        NOT_REGISTERED,        // 选手没有报名比赛
        CONTEST_NOT_ACTIVE,    // 比赛不在进行中
        LANGUAGE_NOT_ALLOWED,  // 比赛不允许使用该语言
        NO_TEST_CASES          // 题目没有测试数据
    };

    const reason why;

    validation_error(reason why, const std::string &message);
};

/**
 * @brief 表示请求的用户、题目、比赛或提交不存在
 */
struct not_found_error : public judge_exception {
    explicit not_found_error(const std::string &message);
};

}  // namespace codify
