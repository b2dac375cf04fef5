/**
 * @author SHAO Liming <lmshao@163.com>
 * @copyright Copyright (c) 2025 SHAO Liming
 * @license MIT
 *
 * SPDX-License-Identifier: MIT
 */

#ifndef LMSHAO_LMMETA_LMMETA_LOGGER_H
#define LMSHAO_LMMETA_LMMETA_LOGGER_H

#include <lmcore/logger.h>

#include <atomic>
#include <string>

namespace lmshao::lmmeta {

// Module tag for Lmmeta
struct LmmetaModuleTag {};

// Set once InitLmmetaLogger has run, so the library keeps the caller's settings
inline std::atomic<bool> &LmmetaLoggerInitialized()
{
    static std::atomic<bool> initialized{false};
    return initialized;
}

/**
 * @brief Initialize Lmmeta logger with specified settings
 *
 * Optional: the library initializes itself with the defaults on first log.
 */
inline void InitLmmetaLogger(lmcore::LogLevel level =
#if defined(_DEBUG) || defined(DEBUG) || !defined(NDEBUG)
                                 lmcore::LogLevel::kDebug,
#else
                                 lmcore::LogLevel::kWarn,
#endif
                             lmcore::LogOutput output = lmcore::LogOutput::CONSOLE, const std::string &filename = "")
{
    lmcore::LoggerRegistry::RegisterModule<LmmetaModuleTag>("LMMETA");
    lmcore::LoggerRegistry::InitLogger<LmmetaModuleTag>(level, output, filename);
    LmmetaLoggerInitialized().store(true);
}

} // namespace lmshao::lmmeta

#endif // LMSHAO_LMMETA_LMMETA_LOGGER_H
