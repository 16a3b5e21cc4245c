/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#ifndef MESHCALL_EVENTS_H
#define MESHCALL_EVENTS_H

#include "common.hpp"
#include "error.hpp"
#include "participant.hpp"
#include "recorder.hpp"
#include "stats.hpp"

namespace meshcall {

struct StreamAddedEvent {
	shared_ptr<MediaStream> stream;
	MediaType type;
	bool local;
	optional<string> participantId; // unset for local streams
};

struct StreamRemovedEvent {
	string streamId;
	optional<string> participantId;
};

struct PeerConnectedEvent {
	Participant participant;
};

struct PeerDisconnectedEvent {
	Participant participant;
};

struct ConnectionStateEvent {
	string participantId;
	ConnectionState state;
};

struct TrackToggledEvent {
	MediaKind kind;
	bool enabled;
	optional<string> participantId; // unset for local tracks
};

// A local offer is being generated for the participant
struct NegotiationEvent {
	string participantId;
};

struct ScreenShareStartedEvent {
	optional<string> participantId; // unset when sharing locally
	shared_ptr<MediaStream> stream;  // local screen stream, null for remote participants
};

struct ScreenShareEndedEvent {
	optional<string> participantId;
};

struct RecordingStartedEvent {
	string mimeType;
};

struct RecordingPausedEvent {};

struct RecordingResumedEvent {};

struct RecordingStoppedEvent {
	binary blob;
	string mimeType;
};

struct StatsEvent {
	string participantId;
	CallStats stats;
	NetworkQuality quality;
};

struct ErrorEvent {
	ErrorCode code;
	string message;
	optional<string> participantId;
};

using Event = variant<StreamAddedEvent, StreamRemovedEvent, PeerConnectedEvent,
                      PeerDisconnectedEvent, ConnectionStateEvent, TrackToggledEvent,
                      NegotiationEvent, ScreenShareStartedEvent, ScreenShareEndedEvent,
                      RecordingStartedEvent, RecordingPausedEvent, RecordingResumedEvent,
                      RecordingStoppedEvent, StatsEvent, ErrorEvent>;

MESHCALL_CPP_EXPORT string eventName(const Event &event);

} // namespace meshcall

#endif
