/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "events.hpp"

namespace meshcall {

string eventName(const Event &event) {
	return std::visit(
	    overloaded{
	        [](const StreamAddedEvent &) { return "stream-added"; },
	        [](const StreamRemovedEvent &) { return "stream-removed"; },
	        [](const PeerConnectedEvent &) { return "peer-connected"; },
	        [](const PeerDisconnectedEvent &) { return "peer-disconnected"; },
	        [](const ConnectionStateEvent &) { return "connection-state-changed"; },
	        [](const TrackToggledEvent &) { return "track-toggled"; },
	        [](const NegotiationEvent &) { return "negotiation"; },
	        [](const ScreenShareStartedEvent &) { return "screen-share-started"; },
	        [](const ScreenShareEndedEvent &) { return "screen-share-ended"; },
	        [](const RecordingStartedEvent &) { return "recording-started"; },
	        [](const RecordingPausedEvent &) { return "recording-paused"; },
	        [](const RecordingResumedEvent &) { return "recording-resumed"; },
	        [](const RecordingStoppedEvent &) { return "recording-stopped"; },
	        [](const StatsEvent &) { return "stats"; },
	        [](const ErrorEvent &) { return "error"; },
	    },
	    event);
}

} // namespace meshcall
