#ifndef FLOTILLA_SRC_COMMON_CONFIG_H_
#define FLOTILLA_SRC_COMMON_CONFIG_H_

#include <cstddef>
#include <cstdint>

/// Launcher defaults
/// The port the first-tier broker binds (or clients attach to)
const uint16_t kDefaultBrokerPort = 1337;
/// The port of the centralized (second-tier) broker
const uint16_t kDefaultCentralizedBrokerPort = 1338;
/// The delay between two client launches, multiplied by the stagger index
const uint64_t kDefaultLaunchDelayMs = 10;
/// Pause after forking the centralized broker so it can bind before clients attach
const int64_t kCentralizedBrokerBindPauseMs = 10;

/// Centralized broker loop
/// A client silent for this long is treated as disconnected
const int64_t kCentralizedClientTimeoutMs = 30000;
/// Poll interval of the centralized broker loop
const int64_t kCentralizedPollIntervalMs = 5;
/// Exit code of the centralized broker once its last client left
const int kShuttingDownExitCode = 0;

/// Transport
/// The interval between two client heartbeats
const int64_t kHeartbeatPeriodMs = 1000;
/// First-tier broker: a client silent for this long is treated as disconnected
const int64_t kBrokerClientTimeoutMs = 60000;
/// How long a client keeps retrying to attach before giving up
const int64_t kAttachTimeoutMs = 30000;
/// Number of relayed events the broker keeps for polling clients
const size_t kBrokerEventLogCapacity = 4096;

/// Shared memory
/// Size of a per-core state slot
const size_t kDefaultStateSlotSize = 1UL << 20;

#endif  // FLOTILLA_SRC_COMMON_CONFIG_H_
