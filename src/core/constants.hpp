#pragma once

#include <cstddef>
#include <cstdint>

// ── Lock file ───────────────────────────────────────────────
constexpr const char* DEFAULT_LOCK_FILENAME = ".lock";
constexpr int LOCK_REOPEN_MAX_ATTEMPTS      = 16;    // lock file replaced under us

// ── State record layout ─────────────────────────────────────
constexpr std::size_t STATE_PID_OFFSET  = 0;
constexpr std::size_t STATE_PORT_OFFSET = 4;
constexpr std::size_t STATE_RECORD_SIZE = 8;

// ── Wire protocol ───────────────────────────────────────────
constexpr std::size_t FRAME_HEADER_SIZE     = 4;     // nameLen:u16 | dataLen:u16
constexpr std::size_t MAX_FRAME_FIELD_BYTES = 65535;

// ── Networking ──────────────────────────────────────────────
constexpr const char* LOOPBACK_HOST   = "127.0.0.1";
constexpr int DEFAULT_LISTEN_BACKLOG  = 16;
constexpr int DEFAULT_READ_BUF_SIZE   = 4096;

// ── Config files ────────────────────────────────────────────
constexpr const char* PROJECT_CONFIG_FILENAME = "solo.yaml";
constexpr const char* GLOBAL_CONFIG_DIRNAME   = ".solo";
constexpr const char* GLOBAL_CONFIG_FILENAME  = "config.yaml";
constexpr const char* DEFAULT_LOG_FILENAME    = "solo_debug.log";
