/**
 * @file compiler.hh
 * @brief Compiler detection and feature macros
 */
#pragma once

#if !defined(__EMSCRIPTEN__)
#if defined(__clang__)
#define RINGPLAY_COMPILER_CLANG
#elif defined(__GNUC__) || defined(__GNUG__)
#define RINGPLAY_COMPILER_GCC
#elif defined(_MSC_VER)
#define RINGPLAY_COMPILER_MSVC
#endif
#else
#define RINGPLAY_COMPILER_WASM
#endif
