/*
 * [BPK_FLOW_NOTE] 文件级流程注释
 * - 控制台日志实现，统一进度/错误输出。
 * - 输入：日志级别与格式化参数。
 * - 输出：控制台可读日志。
 */
#include "zLog.h"

#include <cstdarg>  // va_list / va_start / va_end。
#include <cstdio>   // fprintf / vsnprintf。

// 单次格式化缓冲长度上限（含结尾 '\0'）。
#define MAX_LOG_BUF_LEN 3000

void zLogPrint(int level, const char* tag, const char* fileName, const char* functionName, int lineNum, const char* format, ...) {
    // 小于阈值的日志直接忽略。
    if (level < CURRENT_LOG_LEVEL) return;

    va_list args;
    va_start(args, format);
    // 先格式化到固定缓冲区，超长内容自动截断。
    char buffer[MAX_LOG_BUF_LEN];
    vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);

    const char* levelStr = "INFO";
    if (level == LOG_LEVEL_ERROR) levelStr = "ERROR";
    else if (level == LOG_LEVEL_WARN) levelStr = "WARN";
    else if (level == LOG_LEVEL_DEBUG) levelStr = "DEBUG";
    else if (level == LOG_LEVEL_VERBOSE) levelStr = "VERBOSE";

    // 告警与错误写 stderr，方便外层脚本区分进度输出和失败原因。
    if (level >= LOG_LEVEL_WARN) {
        std::fprintf(stderr, "[%s][%s] %s\n", levelStr, tag, buffer);
        return;
    }
    // 调试级别附带位置信息。
    if (level <= LOG_LEVEL_DEBUG) {
        std::printf("[%s][%s:%d %s] %s\n", levelStr, fileName, lineNum, functionName, buffer);
        return;
    }
    // INFO 只输出消息正文，保持回归日志简洁。
    std::printf("%s\n", buffer);
}
