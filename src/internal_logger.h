/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#ifndef LMSHAO_LMMETA_INTERNAL_LOGGER_H
#define LMSHAO_LMMETA_INTERNAL_LOGGER_H

#include <mutex>

#include "lmmeta/lmmeta_logger.h"

namespace lmshao::lmmeta {

// Applies the default settings on first use unless InitLmmetaLogger was called.
inline lmshao::lmcore::Logger &GetLmmetaLoggerWithAutoInit()
{
    static std::once_flag initFlag;
    std::call_once(initFlag, []() {
        if (!LmmetaLoggerInitialized().load()) {
            InitLmmetaLogger();
        }
    });
    return lmshao::lmcore::LoggerRegistry::GetLogger<LmmetaModuleTag>();
}

#define LMMETA_LOG_AT(level, fmt, ...)                                                                                 \
    do {                                                                                                               \
        auto &logger = lmshao::lmmeta::GetLmmetaLoggerWithAutoInit();                                                  \
        if (logger.ShouldLog(level)) {                                                                                 \
            logger.LogWithModuleTag<lmshao::lmmeta::LmmetaModuleTag>(level, __FILE__, __LINE__, __FUNCTION__, fmt,     \
                                                                     ##__VA_ARGS__);                                   \
        }                                                                                                              \
    } while (0)

#define LMMETA_LOGD(fmt, ...) LMMETA_LOG_AT(lmshao::lmcore::LogLevel::kDebug, fmt, ##__VA_ARGS__)
#define LMMETA_LOGI(fmt, ...) LMMETA_LOG_AT(lmshao::lmcore::LogLevel::kInfo, fmt, ##__VA_ARGS__)
#define LMMETA_LOGW(fmt, ...) LMMETA_LOG_AT(lmshao::lmcore::LogLevel::kWarn, fmt, ##__VA_ARGS__)
#define LMMETA_LOGE(fmt, ...) LMMETA_LOG_AT(lmshao::lmcore::LogLevel::kError, fmt, ##__VA_ARGS__)

} // namespace lmshao::lmmeta

#endif // LMSHAO_LMMETA_INTERNAL_LOGGER_H
