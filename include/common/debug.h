#pragma once

#include <stdio.h>
#include <string.h>
#include <errno.h>
#include <iostream>
#include <string>

#include <source_location>

#ifndef SESSION_DEBUG
#define SESSION_DEBUG 0
#endif

#if SESSION_DEBUG==1
    #define DEBUG_PRINT(fmt, ...) \
        printf("[DEBUG] file: %s, function: %s, line: %d | " fmt "\n", \
               __FILE__, __func__, __LINE__  __VA_OPT__(, __VA_ARGS__))
#else
    #define DEBUG_PRINT(fmt, ...)
#endif

#define RUNTIME_ERROR(fmt, ...) \
    fprintf(stderr, "[ERROR] file: %s, function: %s, line: %d | " fmt "\n", \
            __FILE__, __func__, __LINE__ __VA_OPT__(, __VA_ARGS__))

// Debug trace, compiled out unless SESSION_DEBUG=1.
inline void log_cpp20(const std::string& message,
               const std::source_location& location = std::source_location::current()) {
#if SESSION_DEBUG==1
    std::cout << "[" << location.file_name()
              << ":" << location.line() << "] "
              << location.function_name() << "() - "
              << message << std::endl;
#else
    (void)message;
    (void)location;
#endif
}

// Errors are always reported.
inline void error_cpp20(const std::string& message,
               const std::source_location& location = std::source_location::current()) {
    std::cerr << "[" << location.file_name()
              << ":" << location.line() << "] "
              << location.function_name() << "(ERROR) - "
              << message << std::endl;
}
