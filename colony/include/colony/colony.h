/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <colony/error_codes.h>
#include <colony/logging.h>
#include <colony/actions.h>
#include <colony/colony_state.h>
#include <colony/bounded_queue.h>
#include <colony/correlation_table.h>
#include <colony/command_channel.h>
#include <colony/event_channel.h>
#include <colony/client.h>
#include <colony/session_worker.h>
