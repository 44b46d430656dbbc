/**
 * @file Platform.hpp
 * @brief Branch-prediction hints for the contract macros.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef DZ_CORE_PLATFORM_HPP
    #define DZ_CORE_PLATFORM_HPP

    #if defined(__GNUC__) || defined(__clang__)
        #define DZ_UNLIKELY(x) __builtin_expect(!!(x), 0)
    #else
        #define DZ_UNLIKELY(x) (x)
    #endif

#endif // DZ_CORE_PLATFORM_HPP
