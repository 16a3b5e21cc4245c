/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "filecapture.hpp"
#include "error.hpp"

#include "impl/filecapture.hpp"
#include "impl/internals.hpp"

#include <algorithm>
#include <atomic>
#include <filesystem>

namespace meshcall {

namespace {

const string CameraDeviceId = "file-camera";
const string MicrophoneDeviceId = "file-microphone";
const string ScreenDeviceId = "file-screen";

string nextId(const string &prefix) {
	static std::atomic<unsigned int> counter = 0;
	return prefix + "-" + std::to_string(++counter);
}

void checkDirectory(const string &directory) {
	namespace fs = std::filesystem;
	std::error_code ec;
	auto status = fs::status(directory, ec);
	if (ec == std::errc::permission_denied)
		throw CallError(ErrorCode::PermissionDenied, "Access to " + directory + " was denied");

	if (!fs::exists(status) || !fs::is_directory(status))
		throw CallError(ErrorCode::DeviceNotFound, "No capture directory at " + directory);

	fs::directory_iterator it(directory, ec);
	if (ec == std::errc::permission_denied)
		throw CallError(ErrorCode::PermissionDenied, "Access to " + directory + " was denied");
	if (ec)
		throw CallError(ErrorCode::MediaError, "Unable to read " + directory + ": " + ec.message());
}

} // namespace

FileCaptureDevices::FileCaptureDevices(Configuration config) : mConfig(std::move(config)) {}

FileCaptureDevices::~FileCaptureDevices() { stopAll(); }

std::vector<DeviceInfo> FileCaptureDevices::enumerateDevices() {
	std::vector<DeviceInfo> devices;
	if (mConfig.camera)
		devices.push_back({CameraDeviceId, DeviceInfo::Kind::VideoInput,
		                   "File camera (" + mConfig.camera->directory + ")"});
	if (mConfig.microphone)
		devices.push_back({MicrophoneDeviceId, DeviceInfo::Kind::AudioInput,
		                   "File microphone (" + mConfig.microphone->directory + ")"});
	if (mConfig.screen)
		devices.push_back({ScreenDeviceId, DeviceInfo::Kind::ScreenInput,
		                   "File screen (" + mConfig.screen->directory + ")"});
	return devices;
}

shared_ptr<MediaStream> FileCaptureDevices::getUserMedia(const MediaConstraints &constraints) {
	if (!constraints.video && !constraints.audio)
		throw CallError(ErrorCode::MediaError, "At least one of audio and video must be requested");

	auto stream = std::make_shared<MediaStream>(nextId("stream"));
	try {
		if (constraints.video) {
			const auto &deviceId = constraints.video->deviceId;
			if (!mConfig.camera || (deviceId && *deviceId != CameraDeviceId))
				throw CallError(ErrorCode::DeviceNotFound, "No matching camera");

			stream->addTrack(startCapture(*mConfig.camera, MediaKind::Video, "File camera",
			                              CameraDeviceId));
		}
		if (constraints.audio) {
			const auto &deviceId = constraints.audio->deviceId;
			if (!mConfig.microphone || (deviceId && *deviceId != MicrophoneDeviceId))
				throw CallError(ErrorCode::DeviceNotFound, "No matching microphone");

			stream->addTrack(startCapture(*mConfig.microphone, MediaKind::Audio,
			                              "File microphone", MicrophoneDeviceId));
		}
	} catch (const CallError &) {
		stream->stop();
		throw;
	}
	return stream;
}

shared_ptr<MediaStream> FileCaptureDevices::getDisplayMedia(const ScreenShareOptions &options) {
	if (!mConfig.screen)
		throw CallError(ErrorCode::DeviceNotFound, "No screen capture source");

	if (options.audio)
		PLOG_DEBUG << "Screen capture audio is not available from files";

	auto stream = std::make_shared<MediaStream>(nextId("screen"));
	stream->addTrack(startCapture(*mConfig.screen, MediaKind::Video, "File screen", ScreenDeviceId));
	return stream;
}

shared_ptr<MediaTrack> FileCaptureDevices::openDevice(MediaKind kind, const string &deviceId) {
	if (kind == MediaKind::Video) {
		if (deviceId == CameraDeviceId && mConfig.camera)
			return startCapture(*mConfig.camera, kind, "File camera", deviceId);
		if (deviceId == ScreenDeviceId && mConfig.screen)
			return startCapture(*mConfig.screen, kind, "File screen", deviceId);
	} else if (deviceId == MicrophoneDeviceId && mConfig.microphone) {
		return startCapture(*mConfig.microphone, kind, "File microphone", deviceId);
	}

	throw CallError(ErrorCode::DeviceNotFound, "No " +
	                                               string(kind == MediaKind::Video ? "video" : "audio") +
	                                               " device with id \"" + deviceId + "\"");
}

void FileCaptureDevices::stopAll() {
	std::vector<shared_ptr<impl::FileCapture>> captures;
	{
		std::lock_guard lock(mMutex);
		captures = std::exchange(mCaptures, {});
	}

	for (const auto &capture : captures) {
		capture->stop();
		capture->track()->stop();
	}
}

shared_ptr<MediaTrack> FileCaptureDevices::startCapture(const Source &source, MediaKind kind,
                                                        const string &label,
                                                        const string &deviceId) {
	checkDirectory(source.directory);

	auto track = std::make_shared<MediaTrack>(nextId(kind == MediaKind::Video ? "video" : "audio"),
	                                          kind, label, deviceId);
	auto capture = std::make_shared<impl::FileCapture>(source, track);
	{
		std::lock_guard lock(mMutex);
		// Forget finished captures
		mCaptures.erase(std::remove_if(mCaptures.begin(), mCaptures.end(),
		                               [](const auto &c) { return !c->isRunning(); }),
		                mCaptures.end());
		mCaptures.push_back(capture);
	}

	capture->start();
	return track;
}

} // namespace meshcall
