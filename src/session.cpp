/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "session.hpp"

#include "impl/internals.hpp"
#include "impl/session.hpp"

namespace meshcall {

Session::Session(CallConfig config, SessionDependencies dependencies)
    : CheshireCat<impl::Session>(std::move(config), std::move(dependencies)) {
	impl()->init();
}

Session::~Session() {
	try {
		impl()->cleanup();
	} catch (const std::exception &e) {
		PLOG_ERROR << e.what();
	}
}

void Session::initialize() { impl()->initialize(); }

void Session::cleanup() { impl()->cleanup(); }

const CallConfig &Session::config() const { return impl()->config(); }

bool Session::toggleAudio(optional<bool> enabled) { return impl()->toggleAudio(enabled); }

bool Session::toggleVideo(optional<bool> enabled) { return impl()->toggleVideo(enabled); }

void Session::startScreenShare(ScreenShareOptions options) { impl()->startScreenShare(options); }

void Session::stopScreenShare() { impl()->stopScreenShare(); }

bool Session::isScreenSharing() const { return impl()->isScreenSharing(); }

void Session::switchDevice(MediaKind kind, const string &deviceId) {
	impl()->switchDevice(kind, deviceId);
}

void Session::startRecording(RecordingOptions options) { impl()->startRecording(options); }

void Session::pauseRecording() { impl()->pauseRecording(); }

void Session::resumeRecording() { impl()->resumeRecording(); }

void Session::stopRecording() { impl()->stopRecording(); }

RecordingState Session::recordingState() const { return impl()->recordingState(); }

shared_ptr<MediaStream> Session::localStream() const { return impl()->localStream(); }

shared_ptr<MediaStream> Session::screenStream() const { return impl()->screenStream(); }

std::vector<Participant> Session::getParticipants() const { return impl()->getParticipants(); }

optional<Participant> Session::getParticipant(const string &participantId) const {
	return impl()->getParticipant(participantId);
}

void Session::onEvent(std::function<void(const Event &event)> callback) {
	impl()->onEvent(std::move(callback));
}

} // namespace meshcall
