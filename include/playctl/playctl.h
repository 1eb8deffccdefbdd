/**
 * @file playctl.h
 * @brief Client for the host audio daemon.
 *
 * Sources are started with AudioBuilder, which appends a command to the daemon's command
 * file and waits until the daemon lists the new source in its status file. The returned
 * Audio handle reads and updates that source by its daemon-assigned ID.
 */

#pragma once

#include "playctl/core/config_loader.h"
#include "playctl/core/error_codes.h"
#include "playctl/playback/audio.h"
#include "playctl/playback/audio_builder.h"
#include "playctl/playback/command_codec.h"
#include "playctl/playback/source_descriptor.h"
#include "playctl/playback/status_resolver.h"
#include "playctl/playback/timestamp.h"
