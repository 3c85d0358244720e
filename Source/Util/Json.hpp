/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <json11.hpp>

using RJson = json11::Json;

// Json consts
#define rJC static constexpr char const*

// snapshot input
rJC JSON_KEY_ROUTERS = "routers";
rJC JSON_KEY_TIMESTAMP = "timestamp";
rJC JSON_KEY_MAC = "mac_address";
rJC JSON_KEY_HOSTNAME = "hostname";
rJC JSON_KEY_IP = "ip_address";
rJC JSON_KEY_SIGNAL = "signal_strength";
rJC JSON_KEY_CONNECTION_TYPE = "connection_type";

// report output
rJC JSON_KEY_ROUTER = "router";
rJC JSON_KEY_FROM_ROUTER = "from_router";
rJC JSON_KEY_TO_ROUTER = "to_router";
rJC JSON_KEY_EVENT_TYPE = "event_type";
rJC JSON_KEY_SIGNAL_BEFORE = "signal_before";
rJC JSON_KEY_SIGNAL_AFTER = "signal_after";
rJC JSON_KEY_SESSION_DURATION = "session_duration";
rJC JSON_KEY_TRIGGER_REASON = "trigger_reason";
rJC JSON_KEY_START_TIME = "start_time";
rJC JSON_KEY_END_TIME = "end_time";
rJC JSON_KEY_DURATION = "duration";
rJC JSON_KEY_AVERAGE_SIGNAL = "average_signal";
rJC JSON_KEY_SIGNAL_TREND = "signal_trend";
rJC JSON_KEY_SAMPLE_COUNT = "sample_count";
rJC JSON_KEY_DEVICE_TYPE = "device_type";
rJC JSON_KEY_ROUTERS_SEEN = "routers_seen";
rJC JSON_KEY_ROAMING_FREQUENCY = "roaming_frequency";
rJC JSON_KEY_AVG_SESSION_DURATION = "avg_session_duration";
rJC JSON_KEY_FIRST_SEEN = "first_seen";
rJC JSON_KEY_LAST_SEEN = "last_seen";
rJC JSON_KEY_LAST_ROUTER = "last_router";
rJC JSON_KEY_TOTAL_ROAMS = "total_roams";
rJC JSON_KEY_TOTAL_SESSIONS = "total_sessions";
rJC JSON_KEY_TOTAL_DEVICES = "total_devices";
rJC JSON_KEY_ACTIVE_DEVICES = "active_devices";
rJC JSON_KEY_ROAMING_DEVICES = "roaming_devices";
rJC JSON_KEY_TOTAL_EVENTS = "total_events";
rJC JSON_KEY_LAST_UPDATE = "last_update";
rJC JSON_KEY_TOTAL_CONNECTIONS = "total_connections";
rJC JSON_KEY_ACTIVE_CONNECTIONS = "active_connections";
rJC JSON_KEY_ROAMS_IN = "roams_in";
rJC JSON_KEY_ROAMS_OUT = "roams_out";
rJC JSON_KEY_DISCONNECTS = "disconnects";
rJC JSON_KEY_GENERATED_AT = "generated_at";
rJC JSON_KEY_STATISTICS = "statistics";
rJC JSON_KEY_DEVICE_PROFILES = "device_profiles";
rJC JSON_KEY_ACTIVE_SESSIONS = "active_sessions";
rJC JSON_KEY_ROUTER_STATISTICS = "router_statistics";
rJC JSON_KEY_RECENT_EVENTS = "recent_events";
rJC JSON_KEY_MOBILITY_PATTERNS = "mobility_patterns";
