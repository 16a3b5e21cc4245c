/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "websocketsignaling.hpp"
#include "error.hpp"

#include "impl/internals.hpp"

#include <rtc/websocket.hpp>

namespace meshcall {

WebSocketSignaling::WebSocketSignaling(string url, std::chrono::milliseconds timeout)
    : mUrl(std::move(url)), mTimeout(timeout) {}

WebSocketSignaling::~WebSocketSignaling() {
	try {
		disconnect();
	} catch (const std::exception &e) {
		PLOG_ERROR << e.what();
	}
}

string WebSocketSignaling::TopicForRoom(const string &roomId) { return "webrtc:" + roomId; }

void WebSocketSignaling::connect(const string &roomId) {
	if (weak_from_this().expired())
		throw std::logic_error("WebSocketSignaling must be owned by a shared_ptr");

	std::future<void> subscribed;
	shared_ptr<rtc::WebSocket> ws;
	{
		std::lock_guard lock(mMutex);
		if (mWebSocket)
			throw CallError(ErrorCode::SignalingError, "Signaling channel is already connected");

		mTopic = TopicForRoom(roomId);
		mSubscribePromise.emplace();
		subscribed = mSubscribePromise->get_future();
		ws = mWebSocket = std::make_shared<rtc::WebSocket>();
	}

	auto settle = [weak_this = weak_from_this()](std::exception_ptr error) {
		auto self = weak_this.lock();
		if (!self)
			return;

		std::lock_guard lock(self->mMutex);
		if (!self->mSubscribePromise)
			return;

		if (error) {
			self->mSubscribePromise->set_exception(error);
		} else {
			self->mSubscribed = true;
			self->mSubscribePromise->set_value();
		}
		self->mSubscribePromise.reset();
	};

	ws->onOpen([weak_this = weak_from_this(), weak_ws = std::weak_ptr(ws)]() {
		auto self = weak_this.lock();
		auto ws = weak_ws.lock();
		if (!self || !ws)
			return;

		PLOG_DEBUG << "Signaling WebSocket open, subscribing to " << self->mTopic;
		json frame = {{"action", "subscribe"}, {"topic", self->mTopic}};
		ws->send(frame.dump());
	});

	ws->onError([settle](string error) {
		PLOG_WARNING << "Signaling WebSocket error: " << error;
		settle(std::make_exception_ptr(
		    CallError(ErrorCode::SignalingError, "Signaling channel error: " + error)));
	});

	ws->onClosed([weak_this = weak_from_this(), settle]() {
		PLOG_INFO << "Signaling WebSocket closed";
		if (auto self = weak_this.lock())
			self->mSubscribed = false;

		settle(std::make_exception_ptr(
		    CallError(ErrorCode::SignalingError, "Signaling channel closed")));
	});

	ws->onMessage([weak_this = weak_from_this(), settle](auto data) {
		// data holds either std::string or rtc::binary
		if (!std::holds_alternative<std::string>(data))
			return;

		auto self = weak_this.lock();
		if (!self)
			return;

		try {
			json frame = json::parse(std::get<std::string>(data));
			string action = frame.value("action", "");
			if (action == "subscribed") {
				settle(nullptr);
			} else if (action == "error") {
				string reason = frame.value("reason", "unknown reason");
				PLOG_WARNING << "Signaling relay error: " << reason;
				settle(std::make_exception_ptr(
				    CallError(ErrorCode::SignalingError, "Subscription failed: " + reason)));
			} else {
				self->handleFrame(frame);
			}
		} catch (const json::exception &e) {
			PLOG_WARNING << "Invalid signaling frame: " << e.what();
		}
	});

	PLOG_INFO << "Connecting signaling to " << mUrl;
	try {
		ws->open(mUrl);
	} catch (const std::exception &e) {
		disconnect();
		throw CallError(ErrorCode::SignalingError,
		                string("Unable to open signaling channel: ") + e.what());
	}

	if (subscribed.wait_for(mTimeout) != std::future_status::ready) {
		disconnect();
		throw CallError(ErrorCode::Timeout, "Timed out subscribing to room " + roomId);
	}

	try {
		subscribed.get();
	} catch (const CallError &) {
		disconnect();
		throw;
	}

	PLOG_INFO << "Subscribed to " << TopicForRoom(roomId);
}

void WebSocketSignaling::handleFrame(const json &frame) {
	if (frame.value("action", "") != "broadcast")
		return;

	if (frame.value("topic", "") != mTopic)
		return;

	auto event = frame.find("event");
	if (event == frame.end() || !event->is_string()) {
		PLOG_WARNING << "Broadcast frame without event name";
		return;
	}

	json payload = frame.contains("payload") ? frame["payload"] : json::object();
	triggerMessage(event->get<string>(), std::move(payload));
}

void WebSocketSignaling::send(const string &event, const json &payload) {
	shared_ptr<rtc::WebSocket> ws;
	string topic;
	{
		std::lock_guard lock(mMutex);
		ws = mWebSocket;
		topic = mTopic;
	}

	if (!ws || !mSubscribed || !ws->isOpen())
		throw CallError(ErrorCode::SignalingError, "Signaling channel is not connected");

	json frame = {{"action", "broadcast"}, {"topic", topic}, {"event", event}, {"payload", payload}};
	ws->send(frame.dump());
}

void WebSocketSignaling::disconnect() {
	shared_ptr<rtc::WebSocket> ws;
	{
		std::lock_guard lock(mMutex);
		ws = std::exchange(mWebSocket, nullptr);
		if (mSubscribePromise) {
			mSubscribePromise->set_exception(std::make_exception_ptr(
			    CallError(ErrorCode::SignalingError, "Signaling channel disconnected")));
			mSubscribePromise.reset();
		}
	}

	mSubscribed = false;
	if (!ws)
		return;

	PLOG_DEBUG << "Disconnecting signaling from " << mTopic;
	if (ws->isOpen()) {
		json frame = {{"action", "unsubscribe"}, {"topic", mTopic}};
		ws->send(frame.dump());
	}

	ws->close();
}

bool WebSocketSignaling::isConnected() const { return mSubscribed; }

} // namespace meshcall
