#include "config.h"
#include <cstdlib>          // getenv
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include "utils.h"

namespace hron::core {

Config& Config::instance() {
    static Config instance;
    return instance;
}

Config::Config() {
    reset();
}

void Config::reset() {
    m_log_level = LogLevel::Info;
    m_log_console = true;
    m_log_path.clear();
    m_log_tail = 500;
}

bool Config::load(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        Logger::warn("Config file not found: " + path + ", using defaults", "config");
        return false;
    }
    std::stringstream buf;
    buf << ifs.rdbuf();
    return load_from_string(buf.str(), path);
}

bool Config::load_from_string(const std::string& text, const std::string& origin) {
    try {
        nlohmann::json j = nlohmann::json::parse(text);

        // log 部分
        if (j.contains("log") && j["log"].is_object()) {
            const auto& l = j["log"];
            if (l.contains("level") && l["level"].is_string()) {
                m_log_level = parseLogLevel(l["level"].get<std::string>(), m_log_level);
            }
            if (l.contains("console") && l["console"].is_boolean()) {
                m_log_console = l["console"].get<bool>();
            }
            if (l.contains("path") && l["path"].is_string()) {
                m_log_path = l["path"].get<std::string>();
            }
            if (l.contains("tail") && l["tail"].is_number_integer()) {
                const int tail = l["tail"].get<int>();
                if (tail >= 0) m_log_tail = static_cast<std::size_t>(tail);
            }
        }
        Logger::info("Config loaded from: " + origin, "config");
        return true;
    }
    catch (const nlohmann::json::exception& ex) {
        Logger::error(std::string("Failed to parse config: ") + origin +
                      ", error: " + ex.what(), "config");
        return false;
    }
}

// 从环境变量覆盖
void Config::load_from_env() {
    if (const char* p = std::getenv("HRON_LOG_LEVEL")) {
        m_log_level = parseLogLevel(p, m_log_level);
    }
    if (const char* p = std::getenv("HRON_LOG_PATH")) {
        m_log_path = p;
    }
    if (const char* p = std::getenv("HRON_LOG_CONSOLE")) {
        const std::string v = utils::to_lower(p);
        if (v == "1" || v == "true") m_log_console = true;
        else if (v == "0" || v == "false") m_log_console = false;
    }
}

} // namespace hron::core
