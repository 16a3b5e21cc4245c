/**
 * meshcall client example
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "meshcall/meshcall.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <future>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <utility>

using namespace std::chrono_literals;
using std::shared_ptr;

std::string randomId(size_t length);
void printUsage(const char *name);
void printEvent(const meshcall::Event &event);

int main(int argc, char **argv) try {
	std::string url = "ws://127.0.0.1:8000";
	std::string roomId = "default";
	std::string userId = randomId(4);
	std::string name;
	std::string videoDir;
	std::string audioDir;
	std::string recordFile;
	unsigned int fps = 30;
	bool verbose = false;

	for (int i = 1; i < argc; ++i) {
		const char *arg = argv[i];
		bool hasValue = i + 1 < argc;
		if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
			printUsage(argv[0]);
			return EXIT_SUCCESS;
		} else if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--verbose") == 0) {
			verbose = true;
		} else if ((std::strcmp(arg, "-s") == 0 || std::strcmp(arg, "--signaling") == 0) && hasValue) {
			url = argv[++i];
		} else if ((std::strcmp(arg, "-r") == 0 || std::strcmp(arg, "--room") == 0) && hasValue) {
			roomId = argv[++i];
		} else if ((std::strcmp(arg, "-u") == 0 || std::strcmp(arg, "--user") == 0) && hasValue) {
			userId = argv[++i];
		} else if ((std::strcmp(arg, "-n") == 0 || std::strcmp(arg, "--name") == 0) && hasValue) {
			name = argv[++i];
		} else if (std::strcmp(arg, "--video") == 0 && hasValue) {
			videoDir = argv[++i];
		} else if (std::strcmp(arg, "--audio") == 0 && hasValue) {
			audioDir = argv[++i];
		} else if (std::strcmp(arg, "--fps") == 0 && hasValue) {
			fps = static_cast<unsigned int>(std::atoi(argv[++i]));
		} else if (std::strcmp(arg, "--record") == 0 && hasValue) {
			recordFile = argv[++i];
		} else {
			std::cerr << "Unrecognized option " << arg << std::endl;
			printUsage(argv[0]);
			return EXIT_FAILURE;
		}
	}

	meshcall::InitLogger(verbose ? meshcall::LogLevel::Debug : meshcall::LogLevel::Info);

	meshcall::FileCaptureDevices::Configuration captureConfig;
	if (!videoDir.empty())
		captureConfig.camera = meshcall::FileCaptureDevices::Source{videoDir, fps > 0 ? fps : 30};
	if (!audioDir.empty())
		captureConfig.microphone = meshcall::FileCaptureDevices::Source{audioDir, 50}; // 20ms frames

	auto devices = std::make_shared<meshcall::FileCaptureDevices>(captureConfig);

	meshcall::CallConfig config;
	config.roomId = roomId;
	config.userId = userId;
	config.displayName = name.empty() ? userId : name;
	config.video = !videoDir.empty();
	config.audio = !audioDir.empty();

	meshcall::SessionDependencies deps;
	deps.signaling = std::make_shared<meshcall::WebSocketSignaling>(url);
	deps.devices = devices;

	std::cout << "Joining room " << roomId << " as " << userId << std::endl;
	meshcall::Session session(config, deps);

	std::promise<meshcall::RecordingStoppedEvent> recorded;
	bool recordPending = true;
	session.onEvent([&recorded, &recordPending](const meshcall::Event &event) {
		printEvent(event);
		auto stopped = std::get_if<meshcall::RecordingStoppedEvent>(&event);
		if (stopped && std::exchange(recordPending, false))
			recorded.set_value(*stopped);
	});

	session.initialize();

	if (!recordFile.empty())
		session.startRecording();

	std::cout << "Commands: a (toggle audio), v (toggle video), p (participants), q (quit)"
	          << std::endl;

	std::string command;
	while (std::getline(std::cin, command)) {
		if (command == "q")
			break;

		if (command == "a") {
			bool enabled = session.toggleAudio();
			std::cout << "Audio " << (enabled ? "enabled" : "disabled") << std::endl;
		} else if (command == "v") {
			bool enabled = session.toggleVideo();
			std::cout << "Video " << (enabled ? "enabled" : "disabled") << std::endl;
		} else if (command == "p") {
			for (const auto &participant : session.getParticipants())
				std::cout << participant.id << " (" << participant.name
				          << "): " << participant.connectionState << ", "
				          << participant.networkQuality << std::endl;
		}
	}

	if (!recordFile.empty() && session.recordingState() != meshcall::RecordingState::Inactive) {
		auto future = recorded.get_future();
		session.stopRecording();
		if (future.wait_for(5s) == std::future_status::ready) {
			auto result = future.get();
			std::ofstream file(recordFile, std::ios::binary);
			file.write(reinterpret_cast<const char *>(result.blob.data()), result.blob.size());
			std::cout << "Recording saved to " << recordFile << " (" << result.mimeType << ", "
			          << result.blob.size() << " bytes)" << std::endl;
		}
	}

	std::cout << "Cleaning up..." << std::endl;
	session.cleanup();
	devices->stopAll();
	return EXIT_SUCCESS;

} catch (const meshcall::CallError &e) {
	std::cerr << "Call error (" << e.code() << "): " << e.what() << std::endl;
	return EXIT_FAILURE;

} catch (const std::exception &e) {
	std::cerr << "Error: " << e.what() << std::endl;
	return EXIT_FAILURE;
}

void printUsage(const char *name) {
	std::cerr << "Usage: " << name
	          << " [-s <signaling-url>] [-r <room>] [-u <user-id>] [-n <name>]"
	             " [--video <dir>] [--audio <dir>] [--fps <fps>] [--record <file>] [-v]"
	          << std::endl
	          << "Example:" << std::endl
	          << "    " << name << " -s ws://127.0.0.1:8000 -r room-42 --video h264 --audio opus"
	          << std::endl;
}

void printEvent(const meshcall::Event &event) {
	using namespace meshcall;
	std::visit(overloaded{[](const StreamAddedEvent &e) {
		                      std::cout << "Stream " << e.stream->id() << " added ("
		                                << e.type << ") from "
		                                << e.participantId.value_or("local") << std::endl;
	                      },
	                      [](const PeerConnectedEvent &e) {
		                      std::cout << e.participant.name << " joined" << std::endl;
	                      },
	                      [](const PeerDisconnectedEvent &e) {
		                      std::cout << e.participant.name << " left" << std::endl;
	                      },
	                      [](const ConnectionStateEvent &e) {
		                      std::cout << "Connection to " << e.participantId << ": " << e.state
		                                << std::endl;
	                      },
	                      [](const TrackToggledEvent &e) {
		                      std::cout << e.participantId.value_or("local") << " " << e.kind
		                                << (e.enabled ? " on" : " off") << std::endl;
	                      },
	                      [](const ErrorEvent &e) {
		                      std::cout << "Error (" << e.code << "): " << e.message << std::endl;
	                      },
	                      [&event](const auto &) {
		                      std::cout << "Event: " << eventName(event) << std::endl;
	                      }},
	           event);
}

// Helper function to generate a random ID
std::string randomId(size_t length) {
	using std::chrono::high_resolution_clock;
	static thread_local std::mt19937 rng(
	    static_cast<unsigned int>(high_resolution_clock::now().time_since_epoch().count()));
	static const std::string characters(
	    "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz");
	std::string id(length, '0');
	std::uniform_int_distribution<int> uniform(0, int(characters.size() - 1));
	std::generate(id.begin(), id.end(), [&]() { return characters.at(uniform(rng)); });
	return id;
}
