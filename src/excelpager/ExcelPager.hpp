#pragma once

// ExcelPager - xlsx 工作表分页读取服务

#include <string>

#include "excelpager/core/CancellationToken.hpp"
#include "excelpager/core/CellValue.hpp"
#include "excelpager/core/Config.hpp"
#include "excelpager/core/Expected.hpp"
#include "excelpager/locator/SheetLocator.hpp"
#include "excelpager/paging/RowPaginator.hpp"

// 版本信息
#define EXCELPAGER_VERSION_MAJOR 1
#define EXCELPAGER_VERSION_MINOR 0
#define EXCELPAGER_VERSION_PATCH 0
#define EXCELPAGER_VERSION_STRING "1.0.0"

namespace excelpager {

inline const char* version() {
    return EXCELPAGER_VERSION_STRING;
}

/**
 * @brief 按配置初始化日志系统
 * @return 初始化是否成功
 */
bool initialize(const core::ServiceConfig& config);

/**
 * @brief 刷新并关闭日志
 */
void cleanup();

} // namespace excelpager
