#pragma once
#include "Logger.hpp"

/**
 * @file ModuleLoggers.hpp
 * @brief 模块化日志宏定义
 *
 * 每个模块都有自己的日志宏，格式: [等级][模块] 消息
 */

// 核心模块 (core)
#define CORE_DEBUG(...)    TAB2FIG_LOG_DEBUG("[DBG][core] " __VA_ARGS__)
#define CORE_INFO(...)     TAB2FIG_LOG_INFO("[INF][core] " __VA_ARGS__)
#define CORE_WARN(...)     TAB2FIG_LOG_WARN("[WRN][core] " __VA_ARGS__)
#define CORE_ERROR(...)    TAB2FIG_LOG_ERROR("[ERR][core] " __VA_ARGS__)

// 主题模块 (theme)
#define THEME_DEBUG(...)   TAB2FIG_LOG_DEBUG("[DBG][thm ] " __VA_ARGS__)
#define THEME_INFO(...)    TAB2FIG_LOG_INFO("[INF][thm ] " __VA_ARGS__)
#define THEME_WARN(...)    TAB2FIG_LOG_WARN("[WRN][thm ] " __VA_ARGS__)

// LaTeX 生成模块 (latex)
#define LATEX_DEBUG(...)   TAB2FIG_LOG_DEBUG("[DBG][tex ] " __VA_ARGS__)
#define LATEX_INFO(...)    TAB2FIG_LOG_INFO("[INF][tex ] " __VA_ARGS__)
#define LATEX_WARN(...)    TAB2FIG_LOG_WARN("[WRN][tex ] " __VA_ARGS__)
#define LATEX_ERROR(...)   TAB2FIG_LOG_ERROR("[ERR][tex ] " __VA_ARGS__)

// 外部进程模块 (process)
#define PROC_DEBUG(...)    TAB2FIG_LOG_DEBUG("[DBG][proc] " __VA_ARGS__)
#define PROC_INFO(...)     TAB2FIG_LOG_INFO("[INF][proc] " __VA_ARGS__)
#define PROC_WARN(...)     TAB2FIG_LOG_WARN("[WRN][proc] " __VA_ARGS__)
#define PROC_ERROR(...)    TAB2FIG_LOG_ERROR("[ERR][proc] " __VA_ARGS__)

// 适配器模块 (adapters)
#define ADAPT_DEBUG(...)   TAB2FIG_LOG_DEBUG("[DBG][adpt] " __VA_ARGS__)
#define ADAPT_WARN(...)    TAB2FIG_LOG_WARN("[WRN][adpt] " __VA_ARGS__)

// 进度消息：verbose 时提升到 INFO，否则只在 DEBUG 可见
#define TAB2FIG_PROGRESS(verbose, ...)                                   \
    do {                                                                 \
        if (verbose) { CORE_INFO(__VA_ARGS__); }                         \
        else { CORE_DEBUG(__VA_ARGS__); }                                \
    } while (0)
