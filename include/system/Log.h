#pragma once

// Tagged serial logging. On the bridge every line goes to Serial as
// "[TAG] message". Host builds stay silent unless QCARDIO_HOST_LOGGING is set.

#ifdef ARDUINO
#include <Arduino.h>

#define QC_LOG(tag, fmt, ...) Serial.printf("[" tag "] " fmt "\n", ##__VA_ARGS__)
#define QC_WARN(tag, fmt, ...) Serial.printf("[" tag "] WARN " fmt "\n", ##__VA_ARGS__)

#elif defined(QCARDIO_HOST_LOGGING)
#include <cstdio>

#define QC_LOG(tag, fmt, ...) std::fprintf(stderr, "[" tag "] " fmt "\n", ##__VA_ARGS__)
#define QC_WARN(tag, fmt, ...) std::fprintf(stderr, "[" tag "] WARN " fmt "\n", ##__VA_ARGS__)

#else

#define QC_LOG(tag, fmt, ...) \
    do {                      \
    } while (0)
#define QC_WARN(tag, fmt, ...) \
    do {                       \
    } while (0)

#endif
