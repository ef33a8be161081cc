#pragma once

// Fixed 6-digit pairing passkey for the bridge service
#define BLE_FIXED_PASSKEY 246810

#define BRIDGE_DEVICE_NAME "qcardio-bridge"
#define BRIDGE_FIRMWARE_VERSION "0.3.0"

// Default device type when nothing is stored in NVS
#define DEFAULT_DEVICE_TYPE "arm"

// Scan budget for locating the health device before connecting
#define DEFAULT_SCAN_TIMEOUT_MS 5000
// Scan and connect block inside NimBLE without feeding the watchdog
#define MAX_SCAN_TIMEOUT_MS 30000

// A measurement with no notification on either channel for this long is aborted
#define DEFAULT_MEASURE_TIMEOUT_MS 60000

// Keep-alive read interval; 0 disables keep-alive
#define DEFAULT_POLL_INTERVAL_MS 60000

// Connect retry policy is opt-in
#define DEFAULT_CONNECT_RETRIES 0
#define DEFAULT_RETRY_BACKOFF_MS 1000
#define MAX_RETRY_BACKOFF_MS 10000

// Per-subscription notification queue depth before Overrun is reported
#ifndef DISPATCH_QUEUE_DEPTH
#define DISPATCH_QUEUE_DEPTH 16
#endif

// Foreground loop granularity while waiting on the device
#define ENGINE_SERVICE_INTERVAL_MS 5

#define STATUS_INTERVAL_MS 10000
#define WDT_FEED_INTERVAL_MS 5000
// Must cover one scan plus one connect at MAX_SCAN_TIMEOUT_MS each
#define WDT_TIMEOUT_S 90

// Wall-clock readings before 2020-01-01 mean the RTC was never set
#define MIN_VALID_EPOCH_S 1577836800LL

// Bridge service exposed to the client (phone or desktop CLI)
#define BRIDGE_SERVICE_UUID "51636172-6469-6f00-b5a3-000000000000"
#define BRIDGE_CHAR_COMMAND_UUID "51636172-6469-6f00-b5a3-000000000001"
#define BRIDGE_CHAR_EVENT_UUID "51636172-6469-6f00-b5a3-000000000002"
#define BRIDGE_CHAR_INFO_UUID "51636172-6469-6f00-b5a3-000000000003"

#define BRIDGE_MTU 247
