/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#ifndef MESHCALL_SESSION_H
#define MESHCALL_SESSION_H

#include "common.hpp"
#include "configuration.hpp"
#include "events.hpp"
#include "mediadevices.hpp"
#include "participant.hpp"
#include "peertransport.hpp"
#include "recorder.hpp"
#include "signaling.hpp"

namespace meshcall {

namespace impl {
class Session;
}

struct SessionDependencies {
	shared_ptr<SignalingChannel> signaling;
	shared_ptr<PeerTransportFactory> transports;
	shared_ptr<MediaDevices> devices;
	shared_ptr<MediaEncoderFactory> encoders; // defaults to ElementaryStreamEncoderFactory
};

class MESHCALL_CPP_EXPORT Session final : CheshireCat<impl::Session> {
public:
	Session(CallConfig config, SessionDependencies dependencies);
	~Session();

	// Acquires local media if requested, joins the room and announces presence.
	// Throws CallError.
	void initialize();

	// Single teardown path, idempotent
	void cleanup();

	const CallConfig &config() const;

	// Toggle if unset, returns the new state (false without local tracks)
	bool toggleAudio(optional<bool> enabled = nullopt);
	bool toggleVideo(optional<bool> enabled = nullopt);

	void startScreenShare(ScreenShareOptions options = {});
	void stopScreenShare();
	bool isScreenSharing() const;

	// Switches the local capture device of one kind without renegotiation
	void switchDevice(MediaKind kind, const string &deviceId);

	void startRecording(RecordingOptions options = {});
	void pauseRecording();
	void resumeRecording();
	void stopRecording();
	RecordingState recordingState() const;

	shared_ptr<MediaStream> localStream() const;
	shared_ptr<MediaStream> screenStream() const;

	// Snapshots, safe to keep
	std::vector<Participant> getParticipants() const;
	optional<Participant> getParticipant(const string &participantId) const;

	// Events are delivered in order from the session's processing thread
	void onEvent(std::function<void(const Event &event)> callback);
};

} // namespace meshcall

#endif
