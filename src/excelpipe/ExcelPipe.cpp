#include "excelpipe/ExcelPipe.hpp"
#include "excelpipe/utils/ModuleLoggers.hpp"

#include <iostream>

namespace excelpipe {

bool initialize(const std::string& log_file_path, utils::Logger::Level level, bool enable_console) {
    try {
        utils::Logger::getInstance().initialize(log_file_path, level, enable_console);
        EXCELPIPE_LOG_INFO("ExcelPipe initialized, version {}", getVersion());
        return true;
    } catch (const std::exception& e) {
        // 日志系统本身不可用，只能输出到标准错误
        std::cerr << "Failed to initialize ExcelPipe: " << e.what() << std::endl;
        return false;
    }
}

void cleanup() {
    EXCELPIPE_LOG_INFO("ExcelPipe cleanup completed");
    utils::Logger::getInstance().shutdown();
}

} // namespace excelpipe
