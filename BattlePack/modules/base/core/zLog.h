/*
 * [BPK_FLOW_NOTE] 文件级流程注释
 * - 日志宏与接口声明。
 * - 工具链位置：全局基础设施。
 * - 输入：模块日志请求。
 * - 输出：统一日志格式（INFO 以下走 stdout，WARN/ERROR 走 stderr）。
 */
#ifndef BPK_BASE_LOG_H
#define BPK_BASE_LOG_H

#include <cstdarg>  // `va_list` / 可变参数接口需要。

// 日志总开关：1 = 启用日志宏；0 = 关闭日志宏。
#ifndef ZLOG_ENABLE_LOGGING
#define ZLOG_ENABLE_LOGGING 1
#endif

// 日志级别定义（数值越大表示等级越高、越重要）。
#define LOG_LEVEL_VERBOSE 2
#define LOG_LEVEL_DEBUG   3
#define LOG_LEVEL_INFO    4
#define LOG_LEVEL_WARN    5
#define LOG_LEVEL_ERROR   6

// 当前日志级别阈值：`level < CURRENT_LOG_LEVEL` 的日志会被丢弃。
// 允许通过编译参数覆盖（例如测试构建压低到 WARN）。
#ifndef CURRENT_LOG_LEVEL
#define CURRENT_LOG_LEVEL LOG_LEVEL_INFO
#endif

// 默认日志标签（跨模块可通过重新定义 `LOG_TAG` 覆盖）。
#ifndef LOG_TAG
#define LOG_TAG "BattlePack"
#endif

// 兼容没有 __FILE_NAME__ 的编译环境。
#ifndef __FILE_NAME__
#define __FILE_NAME__ __FILE__
#endif

#if ZLOG_ENABLE_LOGGING
    #define LOGV(...) zLogPrint(LOG_LEVEL_VERBOSE, LOG_TAG, __FILE_NAME__, __FUNCTION__, __LINE__, ##__VA_ARGS__)
    #define LOGD(...) zLogPrint(LOG_LEVEL_DEBUG, LOG_TAG, __FILE_NAME__, __FUNCTION__, __LINE__, ##__VA_ARGS__)
    #define LOGI(...) zLogPrint(LOG_LEVEL_INFO, LOG_TAG, __FILE_NAME__, __FUNCTION__, __LINE__, ##__VA_ARGS__)
    #define LOGW(...) zLogPrint(LOG_LEVEL_WARN, LOG_TAG, __FILE_NAME__, __FUNCTION__, __LINE__, ##__VA_ARGS__)
    #define LOGE(...) zLogPrint(LOG_LEVEL_ERROR, LOG_TAG, __FILE_NAME__, __FUNCTION__, __LINE__, ##__VA_ARGS__)
#else
    // 关闭日志时宏直接清空，不产生运行时代码。
    #define LOGV(...)
    #define LOGD(...)
    #define LOGI(...)
    #define LOGW(...)
    #define LOGE(...)
#endif

// 统一日志输出函数。
// `tag`/`fileName`/`functionName`/`lineNum` 仅在 DEBUG 及以下级别输出，
// 保持常规进度日志简洁。
void zLogPrint(int level, const char* tag, const char* fileName, const char* functionName, int lineNum, const char* format, ...)
#if defined(__GNUC__) || defined(__clang__)
    __attribute__((format(printf, 6, 7)))
#endif
    ;

#endif // BPK_BASE_LOG_H
