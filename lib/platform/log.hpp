#pragma once

#include <cstdio>

#define LOG_TAG "PRECISION"

#define logInfo(fmt, ...) printf(fmt "\n", ##__VA_ARGS__)
#define logError(fmt, ...) fprintf(stderr, "ERROR: " fmt "\n", ##__VA_ARGS__)
#define logWarn(fmt, ...) printf("WARN: " fmt "\n", ##__VA_ARGS__)

#ifdef PRECISION_DEBUG_LOG
    #define logDebug(fmt, ...) printf("DEBUG [" LOG_TAG "]: " fmt "\n", ##__VA_ARGS__)
#else
    #define logDebug(fmt, ...) do {} while (0)
#endif
