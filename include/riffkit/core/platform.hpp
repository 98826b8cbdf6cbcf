/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#pragma once

// Both macros below are always defined, as 0 or 1.

#if defined(__APPLE__)
    #include <TargetConditionals.h>
    #if TARGET_OS_OSX
        #define RIFF_MACOS 1
    #endif
#endif
#ifndef RIFF_MACOS
    #define RIFF_MACOS 0
#endif

#if defined(_WIN32)
    #define RIFF_WINDOWS 1
#else
    #define RIFF_WINDOWS 0
#endif

#if defined(_MSC_VER)
    #define RIFF_FUNCTION __FUNCSIG__
#elif defined(__GNUC__)
    #define RIFF_FUNCTION __PRETTY_FUNCTION__
#else
    #define RIFF_FUNCTION __func__
#endif
