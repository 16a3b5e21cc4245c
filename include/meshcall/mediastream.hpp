/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#ifndef MESHCALL_MEDIA_STREAM_H
#define MESHCALL_MEDIA_STREAM_H

#include "common.hpp"

#include <iostream>

namespace meshcall {

enum class MediaKind { Audio, Video };

// A single audio or video source. Video frames are H.264 access units in Annex-B
// format, audio frames are Opus packets.
class MESHCALL_CPP_EXPORT MediaTrack final : public std::enable_shared_from_this<MediaTrack> {
public:
	enum class ReadyState { Live, Ended };

	using FrameCallback = std::function<void(const binary &frame, std::chrono::microseconds timestamp)>;
	using SinkId = uint64_t;

	MediaTrack(string id, MediaKind kind, string label, string deviceId = "");
	~MediaTrack();

	MediaTrack(const MediaTrack &) = delete;
	MediaTrack &operator=(const MediaTrack &) = delete;

	const string &id() const { return mId; }
	MediaKind kind() const { return mKind; }
	const string &label() const { return mLabel; }
	const string &deviceId() const { return mDeviceId; }

	bool enabled() const;
	void setEnabled(bool enabled);
	ReadyState readyState() const;
	bool isLive() const { return readyState() == ReadyState::Live; }

	// Stops the track locally, the ended callback is not called
	void stop();

	// Called by the source when it terminates by itself, calls the ended callback
	void end();

	void onEnded(std::function<void()> callback);

	SinkId addSink(FrameCallback callback);
	void removeSink(SinkId id);

	// Called by the source; frames are dropped while disabled or ended
	void deliver(const binary &frame, std::chrono::microseconds timestamp);

private:
	const string mId;
	const MediaKind mKind;
	const string mLabel;
	const string mDeviceId;

	bool mEnabled = true;
	ReadyState mReadyState = ReadyState::Live;
	SinkId mNextSinkId = 1;
	std::map<SinkId, FrameCallback> mSinks;
	synchronized_callback<> mEndedCallback;

	mutable std::mutex mMutex;
};

class MESHCALL_CPP_EXPORT MediaStream final {
public:
	explicit MediaStream(string id);

	const string &id() const { return mId; }

	std::vector<shared_ptr<MediaTrack>> tracks() const;
	std::vector<shared_ptr<MediaTrack>> audioTracks() const;
	std::vector<shared_ptr<MediaTrack>> videoTracks() const;
	shared_ptr<MediaTrack> track(const string &trackId) const;

	void addTrack(shared_ptr<MediaTrack> track);
	bool removeTrack(const string &trackId);
	bool empty() const;

	// Stops every track in the stream
	void stop();

private:
	const string mId;
	std::vector<shared_ptr<MediaTrack>> mTracks;

	mutable std::mutex mMutex;
};

} // namespace meshcall

MESHCALL_CPP_EXPORT std::ostream &operator<<(std::ostream &out, meshcall::MediaKind kind);

#endif
