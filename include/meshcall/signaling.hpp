/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#ifndef MESHCALL_SIGNALING_H
#define MESHCALL_SIGNALING_H

#include "common.hpp"
#include "peertransport.hpp"

#include <nlohmann/json.hpp>

namespace meshcall {

using json = nlohmann::json;

namespace signaling {

// Event names on the room channel
inline const string Offer = "webrtc:offer";
inline const string Answer = "webrtc:answer";
inline const string IceCandidate = "webrtc:ice-candidate";
inline const string CallStart = "webrtc:call-start";
inline const string CallEnd = "webrtc:call-end";
inline const string ScreenShareStart = "webrtc:screen-share-start";
inline const string ScreenShareEnd = "webrtc:screen-share-end";
inline const string TrackEnabled = "webrtc:media-track-enabled";
inline const string TrackDisabled = "webrtc:media-track-disabled";

} // namespace signaling

struct MESHCALL_CPP_EXPORT SignalingMessage {
	enum class Type { Offer, Answer, IceCandidate };

	Type type;
	string from;
	string to;
	string roomId;
	variant<SessionDescription, meshcall::IceCandidate> data;
	bool polite = false; // role of the sender, offers only

	// Event name the envelope travels under
	string event() const;

	json toJson() const;

	// Throws CallError with SignalingError on malformed envelopes
	static SignalingMessage FromJson(const json &j);

	static string typeToString(Type type);
};

// Publish/subscribe channel scoped to one room. Every subscriber but the sender
// receives every broadcast: recipients filter on their own.
class MESHCALL_CPP_EXPORT SignalingChannel {
public:
	using MessageHandler = std::function<void(string event, json payload)>;

	virtual ~SignalingChannel() = default;

	// Blocks until subscribed, throws CallError with SignalingError on failure
	virtual void connect(const string &roomId) = 0;
	virtual void send(const string &event, const json &payload) = 0;
	virtual void disconnect() = 0;
	virtual bool isConnected() const = 0;

	void onMessage(MessageHandler handler);

protected:
	void triggerMessage(string event, json payload);

private:
	synchronized_callback<string, json> mMessageCallback;
};

} // namespace meshcall

#endif
