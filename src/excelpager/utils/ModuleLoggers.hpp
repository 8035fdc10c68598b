#pragma once
#include "Logger.hpp"

/**
 * @file ModuleLoggers.hpp
 * @brief 模块化日志宏定义
 *
 * 每个模块都有自己的日志宏，格式: [等级][模块] 消息
 */

// 核心模块 (core)
#define CORE_DEBUG(...)    EXCELPAGER_LOG_DEBUG("[DBG][core] " __VA_ARGS__)
#define CORE_INFO(...)     EXCELPAGER_LOG_INFO("[INF][core] " __VA_ARGS__)
#define CORE_WARN(...)     EXCELPAGER_LOG_WARN("[WRN][core] " __VA_ARGS__)
#define CORE_ERROR(...)    EXCELPAGER_LOG_ERROR("[ERR][core] " __VA_ARGS__)

// 读取模块 (reader)
#define READER_TRACE(...)  EXCELPAGER_LOG_TRACE("[TRC][read] " __VA_ARGS__)
#define READER_DEBUG(...)  EXCELPAGER_LOG_DEBUG("[DBG][read] " __VA_ARGS__)
#define READER_INFO(...)   EXCELPAGER_LOG_INFO("[INF][read] " __VA_ARGS__)
#define READER_WARN(...)   EXCELPAGER_LOG_WARN("[WRN][read] " __VA_ARGS__)
#define READER_ERROR(...)  EXCELPAGER_LOG_ERROR("[ERR][read] " __VA_ARGS__)

// XML模块 (xml)
#define XML_DEBUG(...)     EXCELPAGER_LOG_DEBUG("[DBG][xml ] " __VA_ARGS__)
#define XML_WARN(...)      EXCELPAGER_LOG_WARN("[WRN][xml ] " __VA_ARGS__)
#define XML_ERROR(...)     EXCELPAGER_LOG_ERROR("[ERR][xml ] " __VA_ARGS__)

// 归档模块 (archive)
#define ARCHIVE_DEBUG(...) EXCELPAGER_LOG_DEBUG("[DBG][arch] " __VA_ARGS__)
#define ARCHIVE_WARN(...)  EXCELPAGER_LOG_WARN("[WRN][arch] " __VA_ARGS__)
#define ARCHIVE_ERROR(...) EXCELPAGER_LOG_ERROR("[ERR][arch] " __VA_ARGS__)

// 定位模块 (locator)
#define LOCATOR_DEBUG(...) EXCELPAGER_LOG_DEBUG("[DBG][locr] " __VA_ARGS__)
#define LOCATOR_INFO(...)  EXCELPAGER_LOG_INFO("[INF][locr] " __VA_ARGS__)
#define LOCATOR_WARN(...)  EXCELPAGER_LOG_WARN("[WRN][locr] " __VA_ARGS__)
#define LOCATOR_ERROR(...) EXCELPAGER_LOG_ERROR("[ERR][locr] " __VA_ARGS__)

// 分页模块 (paging)
#define PAGER_DEBUG(...)   EXCELPAGER_LOG_DEBUG("[DBG][page] " __VA_ARGS__)
#define PAGER_INFO(...)    EXCELPAGER_LOG_INFO("[INF][page] " __VA_ARGS__)
#define PAGER_WARN(...)    EXCELPAGER_LOG_WARN("[WRN][page] " __VA_ARGS__)
#define PAGER_ERROR(...)   EXCELPAGER_LOG_ERROR("[ERR][page] " __VA_ARGS__)

// 服务模块 (server)
#define SERVER_DEBUG(...)  EXCELPAGER_LOG_DEBUG("[DBG][srv ] " __VA_ARGS__)
#define SERVER_INFO(...)   EXCELPAGER_LOG_INFO("[INF][srv ] " __VA_ARGS__)
#define SERVER_WARN(...)   EXCELPAGER_LOG_WARN("[WRN][srv ] " __VA_ARGS__)
#define SERVER_ERROR(...)  EXCELPAGER_LOG_ERROR("[ERR][srv ] " __VA_ARGS__)
#define SERVER_CRITICAL(...) EXCELPAGER_LOG_CRITICAL("[CRT][srv ] " __VA_ARGS__)

// 工具模块 (utils)
#define UTILS_DEBUG(...)   EXCELPAGER_LOG_DEBUG("[DBG][util] " __VA_ARGS__)
#define UTILS_WARN(...)    EXCELPAGER_LOG_WARN("[WRN][util] " __VA_ARGS__)
