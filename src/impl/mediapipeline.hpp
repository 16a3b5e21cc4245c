/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#ifndef MESHCALL_IMPL_MEDIA_PIPELINE_H
#define MESHCALL_IMPL_MEDIA_PIPELINE_H

#include "common.hpp"
#include "configuration.hpp"
#include "events.hpp"
#include "mediadevices.hpp"
#include "mediastream.hpp"
#include "peermanager.hpp"
#include "signaling.hpp"

#include <mutex>

namespace meshcall::impl {

// Owns the local camera/microphone stream and the screen stream, and keeps the
// outgoing tracks of every connection in sync with them
class MediaPipeline final : public std::enable_shared_from_this<MediaPipeline> {
public:
	struct Hooks {
		std::function<void(const string &event, const json &payload)> broadcast;
		std::function<void(Event event)> emit;
		std::function<void(std::function<void()> task)> post;
	};

	MediaPipeline(string localUserId, shared_ptr<MediaDevices> devices,
	              shared_ptr<PeerManager> peers, Hooks hooks);
	~MediaPipeline();

	shared_ptr<MediaStream> acquireLocalStream(const MediaConstraints &constraints);

	bool toggleAudio(optional<bool> enabled);
	bool toggleVideo(optional<bool> enabled);

	shared_ptr<MediaStream> startScreenShare(const ScreenShareOptions &options);
	void stopScreenShare();
	bool isScreenSharing() const;

	void switchDevice(MediaKind kind, const string &deviceId);

	// Stops every local track, nothing is broadcast
	void releaseAll();

	shared_ptr<MediaStream> localStream() const;
	shared_ptr<MediaStream> screenStream() const;

private:
	bool toggle(MediaKind kind, optional<bool> enabled);
	shared_ptr<MediaTrack> localTrack(MediaKind kind) const;
	void broadcast(const string &event, const json &payload);

	// Rethrows device failures as CallError
	template <typename F> static auto capture(F &&f) -> decltype(f());

	const string mLocalUserId;
	const shared_ptr<MediaDevices> mDevices;
	const shared_ptr<PeerManager> mPeers;
	const Hooks mHooks;

	shared_ptr<MediaStream> mLocalStream;
	shared_ptr<MediaStream> mScreenStream;
	mutable std::recursive_mutex mMutex;
};

} // namespace meshcall::impl

#endif
