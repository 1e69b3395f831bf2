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

// Note: these constants are treated as tri-state variables, so they can be 0, 1, or undefined.

// Windows
#if defined(WIN32) || defined(_WIN32) || defined(__WIN32__) || defined(__NT__)
    #define NSD_WINDOWS 1
#else
    #define NSD_WINDOWS 0
#endif

// Apple
#if defined(__APPLE__)
    #define NSD_APPLE 1
    #define NSD_POSIX 1  // POSIX-certified.
    #include <TargetConditionals.h>
    #if TARGET_OS_IPHONE  // iOS, tvOS, or watchOS device
        #define NSD_IPHONE 1
        #define NSD_MACOS 0
    #elif TARGET_OS_MAC  // Apple desktop OS
        #define NSD_IPHONE 0
        #define NSD_MACOS 1
    #else
        #error "Unknown Apple platform"
    #endif
#else
    #define NSD_APPLE 0
    #define NSD_IPHONE 0
    #define NSD_MACOS 0
#endif

// Android
#if defined(__ANDROID__)
    #define NSD_ANDROID 1
    #define NSD_POSIX 1  // Mostly POSIX compliant.
#else
    #define NSD_ANDROID 0
#endif

// Linux
#if defined(__linux__)
    #define NSD_LINUX 1
    #define NSD_POSIX 1  // Most distributions are mostly POSIX compliant.
#else
    #define NSD_LINUX 0
#endif

// BSD
#if defined(__FreeBSD__) || defined(__OpenBSD__)
    #define NSD_BSD 1
    #define NSD_POSIX 1  // Mostly POSIX compliant.
#else
    #define NSD_BSD 0
#endif

// Posix
#ifndef NSD_POSIX
    #if defined(_POSIX_VERSION)
        #define NSD_POSIX 1
    #else
        #define NSD_POSIX 0
    #endif
#endif

// Name of the enclosing function, used for exceptions.
#if defined(_MSC_VER)
    #define NSD_FUNCTION __FUNCSIG__
#elif defined(__GNUC__) || defined(__clang__)
    #define NSD_FUNCTION __PRETTY_FUNCTION__
#else
    #define NSD_FUNCTION __func__
#endif

#if NSD_WINDOWS
    #ifndef NOMINMAX
        #error "Please define NOMINMAX as compile constant in your build system."
    #endif
#endif
