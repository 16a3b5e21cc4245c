/**
 * meshcall signaling relay example
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

// Topic-based pub/sub relay for WebSocketSignaling. A broadcast frame is forwarded
// to every other subscriber of its topic.

#include <rtc/rtc.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

using nlohmann::json;
using std::shared_ptr;
using std::weak_ptr;

template <class T> weak_ptr<T> make_weak_ptr(shared_ptr<T> ptr) { return ptr; }

class Relay {
public:
	void accept(shared_ptr<rtc::WebSocket> ws);

private:
	void handle(const shared_ptr<rtc::WebSocket> &ws, const std::string &message);
	void subscribe(const shared_ptr<rtc::WebSocket> &ws, const std::string &topic);
	void unsubscribe(const shared_ptr<rtc::WebSocket> &ws, const std::string &topic);
	void broadcast(const shared_ptr<rtc::WebSocket> &ws, const std::string &topic,
	               const std::string &message);
	void remove(const rtc::WebSocket *ws);

	static void sendError(const shared_ptr<rtc::WebSocket> &ws, const std::string &reason);

	std::map<std::string, std::map<const rtc::WebSocket *, weak_ptr<rtc::WebSocket>>> mTopics;
	std::set<shared_ptr<rtc::WebSocket>> mClients;
	std::mutex mMutex;
};

void Relay::accept(shared_ptr<rtc::WebSocket> ws) {
	{
		std::lock_guard lock(mMutex);
		mClients.insert(ws);
	}

	ws->onOpen([wws = make_weak_ptr(ws)]() {
		if (auto ws = wws.lock())
			std::cout << "Client connected from " << ws->remoteAddress().value_or("unknown")
			          << std::endl;
	});

	ws->onMessage([this, wws = make_weak_ptr(ws)](auto data) {
		// data holds either std::string or rtc::binary
		if (!std::holds_alternative<std::string>(data))
			return;

		if (auto ws = wws.lock())
			handle(ws, std::get<std::string>(data));
	});

	ws->onError([](std::string error) { std::cerr << "WebSocket error: " << error << std::endl; });

	const rtc::WebSocket *key = ws.get();
	ws->onClosed([this, key]() {
		std::cout << "Client disconnected" << std::endl;
		remove(key);
	});
}

void Relay::handle(const shared_ptr<rtc::WebSocket> &ws, const std::string &message) {
	json frame;
	try {
		frame = json::parse(message);
	} catch (const json::parse_error &e) {
		sendError(ws, std::string("Invalid frame: ") + e.what());
		return;
	}

	std::string action = frame.value("action", "");
	std::string topic = frame.value("topic", "");
	if (topic.empty()) {
		sendError(ws, "Missing topic");
		return;
	}

	if (action == "subscribe")
		subscribe(ws, topic);
	else if (action == "unsubscribe")
		unsubscribe(ws, topic);
	else if (action == "broadcast")
		broadcast(ws, topic, message);
	else
		sendError(ws, "Unknown action \"" + action + "\"");
}

void Relay::subscribe(const shared_ptr<rtc::WebSocket> &ws, const std::string &topic) {
	{
		std::lock_guard lock(mMutex);
		mTopics[topic].emplace(ws.get(), ws);
	}

	std::cout << "Subscribed to " << topic << std::endl;
	json reply = {{"action", "subscribed"}, {"topic", topic}};
	ws->send(reply.dump());
}

void Relay::unsubscribe(const shared_ptr<rtc::WebSocket> &ws, const std::string &topic) {
	std::lock_guard lock(mMutex);
	if (auto it = mTopics.find(topic); it != mTopics.end()) {
		it->second.erase(ws.get());
		if (it->second.empty())
			mTopics.erase(it);
	}
}

void Relay::broadcast(const shared_ptr<rtc::WebSocket> &ws, const std::string &topic,
                      const std::string &message) {
	std::vector<shared_ptr<rtc::WebSocket>> targets;
	bool subscribed = false;
	{
		std::lock_guard lock(mMutex);
		if (auto it = mTopics.find(topic); it != mTopics.end() && it->second.count(ws.get())) {
			subscribed = true;
			for (const auto &[key, weak] : it->second)
				if (key != ws.get())
					if (auto target = weak.lock())
						targets.push_back(std::move(target));
		}
	}

	if (!subscribed) {
		sendError(ws, "Not subscribed to " + topic);
		return;
	}

	for (const auto &target : targets)
		if (target->isOpen())
			target->send(message);
}

void Relay::remove(const rtc::WebSocket *ws) {
	std::lock_guard lock(mMutex);
	for (auto it = mTopics.begin(); it != mTopics.end();) {
		it->second.erase(ws);
		if (it->second.empty())
			it = mTopics.erase(it);
		else
			++it;
	}

	for (auto it = mClients.begin(); it != mClients.end(); ++it) {
		if (it->get() == ws) {
			mClients.erase(it);
			break;
		}
	}
}

void Relay::sendError(const shared_ptr<rtc::WebSocket> &ws, const std::string &reason) {
	std::cerr << "Rejecting frame: " << reason << std::endl;
	json reply = {{"action", "error"}, {"reason", reason}};
	if (ws->isOpen())
		ws->send(reply.dump());
}

int main(int argc, char **argv) try {
	rtc::WebSocketServer::Configuration config;
	config.port = 8000;

	for (int i = 1; i < argc; ++i) {
		if (std::strcmp(argv[i], "--help") == 0) {
			std::cerr << "Usage: " << argv[0]
			          << " [-p <port>] [--enable-tls] [--certificatePemFile <file>]"
			             " [--keyPemFile <file>]"
			          << std::endl;
			return EXIT_FAILURE;
		}
		if (std::strcmp(argv[i], "-p") == 0 && i + 1 < argc) {
			config.port = static_cast<uint16_t>(std::atoi(argv[++i]));
			continue;
		}
		if (std::strcmp(argv[i], "--enable-tls") == 0) {
			config.enableTls = true;
			continue;
		}
		if (std::strcmp(argv[i], "--certificatePemFile") == 0 && i + 1 < argc) {
			config.certificatePemFile = argv[++i];
			continue;
		}
		if (std::strcmp(argv[i], "--keyPemFile") == 0 && i + 1 < argc) {
			config.keyPemFile = argv[++i];
			continue;
		}
	}

	rtc::InitLogger(rtc::LogLevel::Info);

	Relay relay;
	rtc::WebSocketServer server(config);
	server.onClient([&relay](shared_ptr<rtc::WebSocket> ws) { relay.accept(std::move(ws)); });

	std::cout << "Signaling relay listening on " << (config.enableTls ? "wss" : "ws")
	          << "://0.0.0.0:" << server.port() << std::endl;
	std::cout << "Press enter to exit..." << std::endl;
	std::cin.get();

	server.stop();
	return EXIT_SUCCESS;

} catch (const std::exception &e) {
	std::cerr << "Error: " << e.what() << std::endl;
	return EXIT_FAILURE;
}
