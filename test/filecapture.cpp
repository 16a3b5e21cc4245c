/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "fakes.hpp"
#include "impl/filecapture.hpp"
#include "meshcall/filecapture.hpp"
#include "test.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>

using namespace meshcall;
using namespace fakes;
using std::chrono::milliseconds;

namespace fs = std::filesystem;

namespace {

// One length-prefixed NAL unit
void writeSample(const fs::path &path, uint8_t nalType) {
	const char sample[] = {0, 0, 0, 3, char(nalType), 0x42, 0x43};
	std::ofstream file(path, std::ios_base::binary);
	file.write(sample, sizeof(sample));
}

fs::path makeSamples(const string &name, int count) {
	auto directory = fs::temp_directory_path() / ("meshcall-test-" + name);
	fs::remove_all(directory);
	fs::create_directories(directory);
	for (int i = 0; i < count; ++i)
		writeSample(directory / ("sample-" + std::to_string(i) + ".h264"), uint8_t(0x65));
	return directory;
}

} // namespace

TestResult test_file_capture() {
	const binary prefixed = {byte{0}, byte{0}, byte{0}, byte{2}, byte{0x67}, byte{1},
	                         byte{0}, byte{0}, byte{0}, byte{1}, byte{0x68}};
	const binary annexB = {byte{0}, byte{0}, byte{0}, byte{1}, byte{0x67}, byte{1},
	                       byte{0}, byte{0}, byte{0}, byte{1}, byte{0x68}};
	if (impl::FileCapture::LengthPrefixedToAnnexB(prefixed) != annexB)
		return TestResult(false, "Length-prefixed sample was not converted to Annex-B");

	auto cameraDir = makeSamples("camera", 3);
	auto screenDir = makeSamples("screen", 3);

	FileCaptureDevices::Configuration config;
	config.camera = FileCaptureDevices::Source{cameraDir.string(), 50, true};
	config.screen = FileCaptureDevices::Source{screenDir.string(), 100, false};
	FileCaptureDevices devices(config);

	if (devices.enumerateDevices().size() != 2)
		return TestResult(false, "Wrong device list");

	auto stream = devices.getUserMedia(DefaultMediaConstraints(true, false));
	auto tracks = stream->videoTracks();
	if (tracks.size() != 1 || !stream->audioTracks().empty())
		return TestResult(false, "Wrong tracks in the camera stream");

	std::atomic<int> frames = 0;
	std::atomic<bool> wellFormed = true;
	tracks.front()->addSink([&](const binary &frame, std::chrono::microseconds) {
		if (frame.size() != 7 || frame[3] != byte{1} || frame[4] != byte{0x65})
			wellFormed = false;
		++frames;
	});

	// Looping past the last sample
	if (!waitUntil([&]() { return frames >= 5; }))
		return TestResult(false, "Camera frames were not delivered");

	if (!wellFormed)
		return TestResult(false, "Camera frames are malformed");

	std::atomic<bool> ended = false;
	auto screen = devices.getDisplayMedia(ScreenShareOptions{});
	auto screenTrack = screen->videoTracks().front();
	screenTrack->onEnded([&ended]() { ended = true; });
	if (!waitUntil([&]() { return ended.load(); }))
		return TestResult(false, "Non-looping screen capture did not end");

	if (screenTrack->isLive())
		return TestResult(false, "Screen track is still live");

	try {
		devices.openDevice(MediaKind::Audio, "file-microphone");
		return TestResult(false, "Opened a microphone that is not configured");
	} catch (const CallError &e) {
		if (e.code() != ErrorCode::DeviceNotFound)
			return TestResult(false, "Wrong error for a missing device");
	}

	FileCaptureDevices::Configuration missing;
	missing.camera = FileCaptureDevices::Source{(cameraDir / "nowhere").string(), 30, true};
	try {
		FileCaptureDevices(missing).getUserMedia(DefaultMediaConstraints(true, false));
		return TestResult(false, "Captured from a missing directory");
	} catch (const CallError &e) {
		if (e.code() != ErrorCode::DeviceNotFound)
			return TestResult(false, "Wrong error for a missing directory");
	}

	stream->stop();
	devices.stopAll();
	if (tracks.front()->isLive())
		return TestResult(false, "Camera track is still live after stop");

	fs::remove_all(cameraDir);
	fs::remove_all(screenDir);
	return TestResult(true);
}
