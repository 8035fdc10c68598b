#include "excelpager/ExcelPager.hpp"
#include "excelpager/utils/Logger.hpp"
#include <iostream>

namespace excelpager {

bool initialize(const core::ServiceConfig& config) {
    try {
        Logger::getInstance().initialize(config.logFile(), config.logLevel(), config.logConsole());
        EXCELPAGER_LOG_INFO("ExcelPager {} initialized", version());
        EXCELPAGER_LOG_INFO("Data directory: {}, page size: {}, sheet selection: {}, row count: {}",
                            config.dataDir().string(), config.perPage(),
                            core::toString(config.sheetSelection()), core::toString(config.rowCountMode()));
        return true;
    } catch (const std::exception& e) {
        // 日志系统不可用时输出到标准错误
        std::cerr << "Failed to initialize ExcelPager logging: " << e.what() << std::endl;
        return false;
    }
}

void cleanup() {
    EXCELPAGER_LOG_INFO("ExcelPager shutting down");
    Logger::getInstance().flush();
    Logger::getInstance().shutdown();
}

} // namespace excelpager
