#pragma once

// Compile-time defaults for the GridLink host tools.
//
// These are *not* protocol constants (they do not change what devices
// publish). They control local timing and naming defaults; every value can
// be overridden at runtime through BrokerConfig, SessionConfig or the
// command line.

// --- Messaging namespace ---
// First topic segment used by the grid monitor firmware.
#ifndef GRIDLINK_DEFAULT_NAMESPACE
#define GRIDLINK_DEFAULT_NAMESPACE "open_grid_monitor"
#endif

// --- Broker defaults ---
#ifndef GRIDLINK_DEFAULT_BROKER_HOST
#define GRIDLINK_DEFAULT_BROKER_HOST "localhost"
#endif

#ifndef GRIDLINK_DEFAULT_BROKER_PORT
#define GRIDLINK_DEFAULT_BROKER_PORT 1883
#endif

#ifndef GRIDLINK_DEFAULT_KEEPALIVE_S
#define GRIDLINK_DEFAULT_KEEPALIVE_S 60
#endif

// How long connect() waits for the broker CONNACK.
#ifndef GRIDLINK_CONNECT_TIMEOUT_MS
#define GRIDLINK_CONNECT_TIMEOUT_MS 10000UL
#endif

// --- Session timing ---
#ifndef GRIDLINK_COREDUMP_TIMEOUT_MS
#define GRIDLINK_COREDUMP_TIMEOUT_MS 120000UL
#endif

#ifndef GRIDLINK_CAPTURE_TIMEOUT_MS
#define GRIDLINK_CAPTURE_TIMEOUT_MS 60000UL
#endif

#ifndef GRIDLINK_OTA_TIMEOUT_MS
#define GRIDLINK_OTA_TIMEOUT_MS 300000UL
#endif

// Deadline watchdog poll interval. Absence of messages is itself a
// failure signal, so this is capped at one second.
#ifndef GRIDLINK_DEADLINE_POLL_MS
#define GRIDLINK_DEADLINE_POLL_MS 250UL
#endif

#ifndef GRIDLINK_MAX_DEADLINE_POLL_MS
#define GRIDLINK_MAX_DEADLINE_POLL_MS 1000UL
#endif

// --- Chunked transfer ---
// Upper bound on a declared total_chunks. The firmware sends 1 KB chunks,
// so this admits dumps up to 64 MB.
#ifndef GRIDLINK_MAX_CHUNKS
#define GRIDLINK_MAX_CHUNKS 65536UL
#endif

// --- Device discovery ---
#ifndef GRIDLINK_DISCOVERY_WINDOW_MS
#define GRIDLINK_DISCOVERY_WINDOW_MS 3000UL
#endif

#ifndef GRIDLINK_DISCOVERY_POLL_MS
#define GRIDLINK_DISCOVERY_POLL_MS 100UL
#endif

// --- Firmware HTTP server ---
#ifndef GRIDLINK_DEFAULT_HTTP_PORT
#define GRIDLINK_DEFAULT_HTTP_PORT 8000
#endif

#ifndef GRIDLINK_HTTP_MAX_REQUEST_BYTES
#define GRIDLINK_HTTP_MAX_REQUEST_BYTES 8192U
#endif

#ifndef GRIDLINK_HTTP_IO_CHUNK_BYTES
#define GRIDLINK_HTTP_IO_CHUNK_BYTES 16384U
#endif

// --- Restart command ---
// Grace period after publishing `restart` before the tool disconnects.
#ifndef GRIDLINK_RESTART_LINGER_MS
#define GRIDLINK_RESTART_LINGER_MS 2000UL
#endif
