#pragma once

#if defined(__x86_64__) || defined(_M_X64) || defined(__i386) || defined(_M_IX86)
#include <immintrin.h>
#define CASK_CPU_RELAX() _mm_pause()
#elif defined(__aarch64__) || defined(__arm__)
#define CASK_CPU_RELAX() asm volatile("yield")
#else
#define CASK_CPU_RELAX() asm volatile("")
#endif

#ifndef CASK_BASE_API
#if defined(_WIN32) || defined(__CYGWIN__)
#if defined(CASK_BASE_SHARED_BUILD)
#define CASK_BASE_API __declspec(dllexport)
#elif defined(CASK_BASE_SHARED)
#define CASK_BASE_API __declspec(dllimport)
#else
#define CASK_BASE_API
#endif
#else
#if defined(CASK_BASE_SHARED_BUILD) || defined(CASK_BASE_SHARED)
#define CASK_BASE_API __attribute__((visibility("default")))
#else
#define CASK_BASE_API
#endif
#endif
#endif
