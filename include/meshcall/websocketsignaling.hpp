/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#ifndef MESHCALL_WEBSOCKET_SIGNALING_H
#define MESHCALL_WEBSOCKET_SIGNALING_H

#include "common.hpp"
#include "signaling.hpp"

#include <atomic>
#include <future>

namespace rtc {
class WebSocket;
}

namespace meshcall {

// Signaling over a WebSocket pub/sub relay. Frames are JSON objects:
//   client -> relay {"action":"subscribe","topic":T}
//   relay -> client {"action":"subscribed","topic":T} or {"action":"error","reason":R}
//   both ways       {"action":"broadcast","topic":T,"event":E,"payload":P}
//   client -> relay {"action":"unsubscribe","topic":T}
class MESHCALL_CPP_EXPORT WebSocketSignaling final
    : public SignalingChannel,
      public std::enable_shared_from_this<WebSocketSignaling> {
public:
	WebSocketSignaling(string url, std::chrono::milliseconds timeout = std::chrono::seconds(10));
	~WebSocketSignaling();

	void connect(const string &roomId) override;
	void send(const string &event, const json &payload) override;
	void disconnect() override;
	bool isConnected() const override;

	static string TopicForRoom(const string &roomId);

private:
	void handleFrame(const json &frame);

	const string mUrl;
	const std::chrono::milliseconds mTimeout;
	shared_ptr<rtc::WebSocket> mWebSocket;
	string mTopic;
	std::atomic<bool> mSubscribed = false;
	optional<std::promise<void>> mSubscribePromise;
	mutable std::mutex mMutex;
};

} // namespace meshcall

#endif
