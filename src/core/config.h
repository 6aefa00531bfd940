#pragma once
#include <string>
#include <cstddef>
#include "log/logger.h"

namespace hron::core {

class Config {
public:
    // 单例接口
    static Config& instance();

    // 加载 JSON 配置文件
    bool load(const std::string& path);

    // 从 JSON 文本加载（load 的实际实现，也便于测试）
    bool load_from_string(const std::string& text, const std::string& origin = "<string>");

    // 从环境变量覆盖配置
    void load_from_env();

    // 恢复默认值
    void reset();

    // 配置访问接口
    LogLevel log_level() const { return m_log_level; }
    bool log_console() const { return m_log_console; }
    std::string log_path() const { return m_log_path; }
    std::size_t log_tail() const { return m_log_tail; }

private:
    Config();                           // 私有构造
    Config(const Config&) = delete;     // 禁止拷贝
    Config& operator=(const Config&) = delete;

private:
    LogLevel m_log_level = LogLevel::Info;
    bool m_log_console = true;
    std::string m_log_path;             // 为空表示不写文件
    std::size_t m_log_tail = 500;
};

} // namespace hron::core
