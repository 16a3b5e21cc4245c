/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "peermanager.hpp"
#include "internals.hpp"

#include "error.hpp"

#include <algorithm>
#include <utility>

namespace meshcall::impl {

namespace {

optional<string> stringField(const json &j, const char *key) {
	if (!j.is_object())
		return nullopt;

	auto it = j.find(key);
	if (it == j.end() || !it->is_string())
		return nullopt;

	return it->get<string>();
}

optional<bool> boolField(const json &j, const char *key) {
	auto it = j.find(key);
	if (it == j.end() || !it->is_boolean())
		return nullopt;

	return it->get<bool>();
}

MediaType streamType(const string &streamId) {
	return streamId.find("screen") != string::npos ? MediaType::Screen : MediaType::Camera;
}

} // namespace

PeerManager::PeerManager(Settings settings, shared_ptr<PeerTransportFactory> factory, Hooks hooks)
    : mSettings(std::move(settings)), mFactory(std::move(factory)), mHooks(std::move(hooks)) {}

PeerManager::~PeerManager() {
	try {
		closeAll();
	} catch (const std::exception &e) {
		PLOG_ERROR << e.what();
	}
}

void PeerManager::handleSignal(const string &event, const json &payload) {
	if (event != signaling::Offer && event != signaling::Answer &&
	    event != signaling::IceCandidate) {
		handlePresence(event, payload);
		return;
	}

	// Every subscriber receives every envelope
	auto to = stringField(payload, "to");
	if (!to || *to != mSettings.localUserId) {
		PLOG_VERBOSE << "Ignoring " << event << " not addressed to us";
		return;
	}

	SignalingMessage message;
	try {
		message = SignalingMessage::FromJson(payload);
	} catch (const CallError &e) {
		PLOG_WARNING << "Invalid signaling message: " << e.what();
		emit(ErrorEvent{e.code(), e.what(), stringField(payload, "from")});
		return;
	}

	if (message.from == mSettings.localUserId)
		return;

	if (message.roomId != mSettings.roomId) {
		PLOG_DEBUG << "Ignoring message for room \"" << message.roomId << "\"";
		return;
	}

	switch (message.type) {
	case SignalingMessage::Type::Offer:
		handleOffer(message);
		break;
	case SignalingMessage::Type::Answer:
		handleAnswer(message);
		break;
	case SignalingMessage::Type::IceCandidate:
		handleIceCandidate(message);
		break;
	}
}

void PeerManager::handlePresence(const string &event, const json &payload) {
	if (event == signaling::CallStart) {
		auto it = payload.is_object() ? payload.find("participant") : payload.end();
		if (it == payload.end() || !it->is_object()) {
			PLOG_WARNING << "Call start without participant";
			return;
		}

		const json &announced = *it;
		auto id = stringField(announced, "id");
		if (!id || *id == mSettings.localUserId)
			return;

		std::lock_guard lock(mMutex);
		if (findRecord(*id)) {
			PLOG_INFO << "Participant " << *id << " announced again, reconnecting";
			removeConnection(*id);
		}

		try {
			// The announcing side initiates nothing, the receiver is polite
			if (!createConnection(*id, true))
				return;

		} catch (const std::exception &e) {
			PLOG_ERROR << "Unable to create connection to " << *id << ": " << e.what();
			emit(ErrorEvent{ErrorCode::PeerConnectionFailed, e.what(), *id});
			return;
		}

		updateParticipant(*id, [&announced](Participant &p) {
			if (auto userId = stringField(announced, "userId"))
				p.userId = *userId;
			if (auto name = stringField(announced, "name"))
				p.name = *name;
			if (auto audio = boolField(announced, "audioEnabled"))
				p.audioEnabled = *audio;
			if (auto video = boolField(announced, "videoEnabled"))
				p.videoEnabled = *video;
			if (auto screen = boolField(announced, "screenSharing"))
				p.screenSharing = *screen;
		});
		return;
	}

	auto participantId = stringField(payload, "participantId");
	if (!participantId || *participantId == mSettings.localUserId)
		return;

	if (event == signaling::CallEnd) {
		PLOG_INFO << "Participant " << *participantId << " left";
		removeConnection(*participantId);

	} else if (event == signaling::ScreenShareStart || event == signaling::ScreenShareEnd) {
		const bool sharing = event == signaling::ScreenShareStart;
		updateParticipant(*participantId, [sharing](Participant &p) { p.screenSharing = sharing; });
		if (sharing)
			emit(ScreenShareStartedEvent{*participantId, nullptr});
		else
			emit(ScreenShareEndedEvent{*participantId});

	} else if (event == signaling::TrackEnabled || event == signaling::TrackDisabled) {
		const bool enabled = event == signaling::TrackEnabled;
		auto type = stringField(payload, "type");
		if (!type || (*type != "audio" && *type != "video")) {
			PLOG_WARNING << "Track toggle without a valid type";
			return;
		}

		const MediaKind kind = *type == "audio" ? MediaKind::Audio : MediaKind::Video;
		updateParticipant(*participantId, [kind, enabled](Participant &p) {
			if (kind == MediaKind::Audio)
				p.audioEnabled = enabled;
			else
				p.videoEnabled = enabled;
		});
		emit(TrackToggledEvent{kind, enabled, *participantId});

	} else {
		PLOG_VERBOSE << "Ignoring room event " << event;
	}
}

optional<Participant> PeerManager::createConnection(const string &participantId, bool polite) {
	std::lock_guard lock(mMutex);
	if (auto record = findRecord(participantId))
		return record->participant;

	if (mSettings.maxParticipants > 0 && mRecords.size() + 1 >= mSettings.maxParticipants) {
		PLOG_WARNING << "Room is full, not connecting to " << participantId;
		return nullopt;
	}

	PLOG_INFO << "Creating " << (polite ? "polite" : "impolite") << " connection to "
	          << participantId;

	auto transport = mFactory->create(mSettings.iceServers);

	PeerConnectionRecord record{transport, Participant{}, polite};
	record.participant.id = participantId;
	record.participant.userId = participantId;
	mRecords.emplace(participantId, std::move(record));

	auto weak_this = weak_from_this();
	std::weak_ptr<PeerTransport> weak_transport = transport;
	auto dispatch = [weak_this, weak_transport,
	                 participantId](std::function<void(PeerManager &)> func) {
		auto self = weak_this.lock();
		if (!self)
			return;

		self->post([weak_this, weak_transport, participantId, func = std::move(func)]() {
			auto self = weak_this.lock();
			auto transport = weak_transport.lock();
			if (!self || !transport)
				return;

			std::lock_guard lock(self->mMutex);
			auto record = self->findRecord(participantId);
			if (!record || record->transport != transport)
				return; // stale callback from a replaced connection

			func(*self);
		});
	};

	transport->onNegotiationNeeded([dispatch, participantId]() {
		dispatch([participantId](PeerManager &m) { m.negotiate(participantId); });
	});

	transport->onLocalCandidate([dispatch, participantId](IceCandidate candidate) {
		dispatch([participantId, candidate = std::move(candidate)](PeerManager &m) {
			m.handleLocalCandidate(participantId, candidate);
		});
	});

	transport->onStateChange([dispatch, participantId](ConnectionState state) {
		dispatch([participantId, state](PeerManager &m) { m.handleStateChange(participantId, state); });
	});

	transport->onIceStateChange([dispatch, participantId](IceState state) {
		dispatch(
		    [participantId, state](PeerManager &m) { m.handleIceStateChange(participantId, state); });
	});

	transport->onTrack([dispatch, participantId](shared_ptr<MediaTrack> track, string streamId) {
		auto trackId = track->id();
		track->onEnded([dispatch, participantId, streamId, trackId]() {
			dispatch([participantId, streamId, trackId](PeerManager &m) {
				m.handleTrackEnded(participantId, streamId, trackId);
			});
		});
		dispatch([participantId, track = std::move(track), streamId](PeerManager &m) {
			m.handleTrack(participantId, track, streamId);
		});
	});

	for (const auto &local : mLocalTracks) {
		if (!local.track || !local.track->isLive())
			continue;

		try {
			transport->addTrack(local.track, local.streamId);
		} catch (const std::exception &e) {
			PLOG_WARNING << "Unable to attach " << local.kind << " track to " << participantId
			             << ": " << e.what();
		}
	}

	if (polite)
		post([weak_this, participantId]() {
			if (auto self = weak_this.lock())
				self->negotiate(participantId);
		});

	return findRecord(participantId)->participant;
}

void PeerManager::negotiate(const string &participantId) {
	std::lock_guard lock(mMutex);
	auto record = findRecord(participantId);
	if (!record)
		return;

	auto step = Negotiate(record->negotiation, NegotiationInput::NegotiationNeeded, record->polite);
	switch (step.action) {
	case NegotiationAction::Defer:
		PLOG_DEBUG << "Negotiation with " << participantId << " is busy ("
		           << record->negotiation << "), deferring";
		record->renegotiate = true;
		return;

	case NegotiationAction::CreateOffer:
		break;

	default:
		return;
	}

	if (!record->transport->negotiationNeeded()) {
		PLOG_VERBOSE << "No negotiation needed with " << participantId;
		return;
	}

	record->negotiation = step.next;
	record->renegotiate = false;
	emit(NegotiationEvent{participantId});

	try {
		PLOG_DEBUG << "Creating offer for " << participantId;
		auto offer = record->transport->setLocalDescription(SessionDescription::Type::Offer);

		SignalingMessage message;
		message.type = SignalingMessage::Type::Offer;
		message.to = participantId;
		message.data = std::move(offer);
		message.polite = record->polite;
		sendMessage(std::move(message));

	} catch (const std::exception &e) {
		fail(*record, e);
	}
}

void PeerManager::handleOffer(const SignalingMessage &message) {
	std::lock_guard lock(mMutex);
	auto record = findRecord(message.from);
	if (!record) {
		try {
			// Unsolicited offer, we announced ourselves to this peer
			if (!createConnection(message.from, false))
				return;

		} catch (const std::exception &e) {
			PLOG_ERROR << "Unable to create connection to " << message.from << ": " << e.what();
			emit(ErrorEvent{ErrorCode::PeerConnectionFailed, e.what(), message.from});
			return;
		}
		record = findRecord(message.from);
	}

	const bool colliding = record->negotiation == NegotiationState::Offering ||
	                       record->negotiation == NegotiationState::Ignoring;
	if (colliding && record->polite && message.polite &&
	    !KeepsPoliteRole(mSettings.localUserId, message.from)) {
		PLOG_INFO << "Both sides of " << message.from << " are polite, turning impolite";
		record->polite = false;
	}

	auto step = Negotiate(record->negotiation, NegotiationInput::RemoteOffer, record->polite);
	PLOG_DEBUG << "Offer from " << message.from << " in state " << record->negotiation << ": "
	           << step.action;
	record->negotiation = step.next;

	const auto &offer = std::get<SessionDescription>(message.data);
	try {
		switch (step.action) {
		case NegotiationAction::IgnoreOffer:
			return;

		case NegotiationAction::RollbackAndAcceptOffer:
			record->transport->rollback();
			record->renegotiate = true; // our offer is lost, replay it
			acceptOffer(*record, offer);
			break;

		case NegotiationAction::AcceptOffer:
			acceptOffer(*record, offer);
			break;

		default:
			break;
		}
	} catch (const std::exception &e) {
		fail(*record, e);
		return;
	}

	settle(*record);
}

void PeerManager::acceptOffer(PeerConnectionRecord &record, const SessionDescription &offer) {
	record.transport->setRemoteDescription(offer);
	auto answer = record.transport->setLocalDescription(SessionDescription::Type::Answer);

	SignalingMessage message;
	message.type = SignalingMessage::Type::Answer;
	message.to = record.participant.id;
	message.data = std::move(answer);
	sendMessage(std::move(message));
}

void PeerManager::handleAnswer(const SignalingMessage &message) {
	std::lock_guard lock(mMutex);
	auto record = findRecord(message.from);
	if (!record) {
		PLOG_DEBUG << "Dropping answer from unknown participant " << message.from;
		return;
	}

	auto step = Negotiate(record->negotiation, NegotiationInput::RemoteAnswer, record->polite);
	if (step.action != NegotiationAction::ApplyAnswer) {
		PLOG_WARNING << "Unexpected answer from " << message.from << " in state "
		             << record->negotiation;
		return;
	}

	record->negotiation = step.next;
	try {
		record->transport->setRemoteDescription(std::get<SessionDescription>(message.data));
	} catch (const std::exception &e) {
		fail(*record, e);
		return;
	}

	record->negotiation =
	    Negotiate(record->negotiation, NegotiationInput::AnswerApplied, record->polite).next;
	settle(*record);
}

void PeerManager::handleIceCandidate(const SignalingMessage &message) {
	std::lock_guard lock(mMutex);
	auto record = findRecord(message.from);
	if (!record) {
		PLOG_DEBUG << "Dropping candidate from unknown participant " << message.from;
		return;
	}

	auto step = Negotiate(record->negotiation, NegotiationInput::RemoteCandidate, record->polite);
	if (step.action == NegotiationAction::DropCandidate) {
		PLOG_DEBUG << "Dropping candidate from " << message.from << " while ignoring its offer";
		return;
	}

	try {
		record->transport->addIceCandidate(std::get<IceCandidate>(message.data));
	} catch (const std::exception &e) {
		PLOG_WARNING << "Failed to add candidate from " << message.from << ": " << e.what();
		emit(ErrorEvent{ErrorCode::PeerConnectionFailed,
		                string("Failed to add ICE candidate: ") + e.what(), message.from});
	}
}

void PeerManager::settle(PeerConnectionRecord &record) {
	if (record.negotiation != NegotiationState::Idle || !record.renegotiate)
		return;

	record.renegotiate = false;
	if (!record.transport->negotiationNeeded())
		return;

	PLOG_DEBUG << "Replaying deferred negotiation with " << record.participant.id;
	post([weak_this = weak_from_this(), participantId = record.participant.id]() {
		if (auto self = weak_this.lock())
			self->negotiate(participantId);
	});
}

void PeerManager::fail(PeerConnectionRecord &record, const std::exception &e) {
	PLOG_WARNING << "Negotiation with " << record.participant.id << " failed: " << e.what();
	record.negotiation =
	    Negotiate(record.negotiation, NegotiationInput::Failure, record.polite).next;

	try {
		if (record.transport->signalingState() == SignalingState::HaveLocalOffer)
			record.transport->rollback();
	} catch (const std::exception &re) {
		PLOG_WARNING << "Rollback failed: " << re.what();
	}

	emit(ErrorEvent{ErrorCode::SignalingError, e.what(), record.participant.id});
}

void PeerManager::sendMessage(SignalingMessage message) {
	message.from = mSettings.localUserId;
	message.roomId = mSettings.roomId;
	mHooks.send(message.event(), message.toJson());
}

void PeerManager::handleLocalCandidate(const string &participantId, IceCandidate candidate) {
	SignalingMessage message;
	message.type = SignalingMessage::Type::IceCandidate;
	message.to = participantId;
	message.data = std::move(candidate);
	try {
		sendMessage(std::move(message));
	} catch (const std::exception &e) {
		PLOG_WARNING << "Unable to send candidate to " << participantId << ": " << e.what();
	}
}

void PeerManager::handleStateChange(const string &participantId, ConnectionState state) {
	std::lock_guard lock(mMutex);
	auto record = findRecord(participantId);
	if (!record)
		return;

	PLOG_INFO << "Connection to " << participantId << " is " << state;
	record->participant.connectionState = state;
	emit(ConnectionStateEvent{participantId, state});

	switch (state) {
	case ConnectionState::Connected:
		if (!std::exchange(record->connectedOnce, true))
			emit(PeerConnectedEvent{record->participant});
		break;

	case ConnectionState::Failed:
		emit(ErrorEvent{ErrorCode::PeerConnectionFailed, "Connection to " + participantId + " failed",
		                participantId});
		removeConnection(participantId);
		break;

	case ConnectionState::Closed:
		removeConnection(participantId);
		break;

	default:
		break;
	}
}

void PeerManager::handleIceStateChange(const string &participantId, IceState state) {
	if (state != IceState::Failed)
		return;

	std::lock_guard lock(mMutex);
	auto record = findRecord(participantId);
	if (!record)
		return;

	PLOG_WARNING << "ICE failed with " << participantId << ", restarting";
	try {
		record->transport->restartIce();
	} catch (const std::exception &e) {
		PLOG_WARNING << "ICE restart failed: " << e.what();
	}
}

void PeerManager::handleTrack(const string &participantId, shared_ptr<MediaTrack> track,
                              string streamId) {
	std::lock_guard lock(mMutex);
	auto record = findRecord(participantId);
	if (!record)
		return;

	auto &streams = record->participant.streams;
	auto it = streams.find(streamId);
	if (it != streams.end()) {
		it->second->addTrack(std::move(track));
		return;
	}

	auto stream = std::make_shared<MediaStream>(streamId);
	stream->addTrack(std::move(track));
	streams.emplace(streamId, stream);

	PLOG_DEBUG << "Remote stream " << streamId << " from " << participantId;
	emit(StreamAddedEvent{stream, streamType(streamId), false, participantId});
}

void PeerManager::handleTrackEnded(const string &participantId, const string &streamId,
                                   const string &trackId) {
	std::lock_guard lock(mMutex);
	auto record = findRecord(participantId);
	if (!record)
		return;

	auto &streams = record->participant.streams;
	auto it = streams.find(streamId);
	if (it == streams.end())
		return;

	it->second->removeTrack(trackId);
	if (!it->second->empty())
		return;

	streams.erase(it);
	emit(StreamRemovedEvent{streamId, participantId});
}

bool PeerManager::removeConnection(const string &participantId) {
	std::lock_guard lock(mMutex);
	auto it = mRecords.find(participantId);
	if (it == mRecords.end())
		return false;

	PeerConnectionRecord record = std::move(it->second);
	mRecords.erase(it);

	PLOG_INFO << "Removing connection to " << participantId;
	record.transport->resetCallbacks();
	try {
		record.transport->close();
	} catch (const std::exception &e) {
		PLOG_WARNING << "Closing connection to " << participantId << " failed: " << e.what();
	}

	for (auto &[id, stream] : record.participant.streams)
		stream->stop();

	record.participant.connectionState = ConnectionState::Closed;
	emit(PeerDisconnectedEvent{std::move(record.participant)});
	return true;
}

void PeerManager::closeAll() {
	std::lock_guard lock(mMutex);
	std::vector<string> ids;
	ids.reserve(mRecords.size());
	for (const auto &[id, record] : mRecords)
		ids.push_back(id);

	for (const auto &id : ids)
		removeConnection(id);
}

std::vector<Participant> PeerManager::getParticipants() const {
	std::lock_guard lock(mMutex);
	std::vector<Participant> result;
	result.reserve(mRecords.size());
	for (const auto &[id, record] : mRecords)
		result.push_back(record.participant);

	return result;
}

optional<Participant> PeerManager::getParticipant(const string &participantId) const {
	std::lock_guard lock(mMutex);
	auto it = mRecords.find(participantId);
	if (it == mRecords.end())
		return nullopt;

	return it->second.participant;
}

bool PeerManager::updateParticipant(const string &participantId,
                                    std::function<void(Participant &)> update) {
	std::lock_guard lock(mMutex);
	auto record = findRecord(participantId);
	if (!record)
		return false;

	update(record->participant);
	return true;
}

optional<bool> PeerManager::isPolite(const string &participantId) const {
	std::lock_guard lock(mMutex);
	auto it = mRecords.find(participantId);
	if (it == mRecords.end())
		return nullopt;

	return it->second.polite;
}

optional<NegotiationState> PeerManager::negotiationState(const string &participantId) const {
	std::lock_guard lock(mMutex);
	auto it = mRecords.find(participantId);
	if (it == mRecords.end())
		return nullopt;

	return it->second.negotiation;
}

size_t PeerManager::count() const {
	std::lock_guard lock(mMutex);
	return mRecords.size();
}

void PeerManager::attachTrack(shared_ptr<MediaTrack> track, const string &streamId) {
	std::lock_guard lock(mMutex);
	mLocalTracks.push_back({track->kind(), track, streamId});
	for (auto &[id, record] : mRecords) {
		try {
			record.transport->addTrack(track, streamId);
		} catch (const std::exception &e) {
			PLOG_WARNING << "Unable to attach " << track->kind() << " track to " << id << ": "
			             << e.what();
		}
	}
}

bool PeerManager::hasLocalTrack(MediaKind kind) const {
	std::lock_guard lock(mMutex);
	return std::any_of(mLocalTracks.begin(), mLocalTracks.end(),
	                   [kind](const LocalTrack &local) { return local.kind == kind; });
}

size_t PeerManager::replaceTrack(MediaKind kind, shared_ptr<MediaTrack> track) {
	std::lock_guard lock(mMutex);
	for (auto &local : mLocalTracks)
		if (local.kind == kind)
			local.track = track;

	size_t count = 0;
	for (auto &[id, record] : mRecords) {
		for (const auto &sender : record.transport->senders()) {
			if (sender->kind() != kind)
				continue;

			sender->replaceTrack(track);
			++count;
		}
	}

	PLOG_DEBUG << "Replaced outgoing " << kind << " track on " << count << " senders";
	return count;
}

std::vector<ConnectionReport> PeerManager::collectStats() {
	std::lock_guard lock(mMutex);
	std::vector<ConnectionReport> reports;
	reports.reserve(mRecords.size());
	for (auto &[id, record] : mRecords) {
		try {
			auto &transport = record.transport;
			reports.push_back({id, transport->state(), transport->iceState(),
			                   transport->signalingState(), transport->stats()});
		} catch (const std::exception &e) {
			PLOG_WARNING << "Unable to get stats for " << id << ": " << e.what();
		}
	}
	return reports;
}

void PeerManager::setNetworkQuality(const string &participantId, NetworkQuality quality) {
	updateParticipant(participantId, [quality](Participant &p) { p.networkQuality = quality; });
}

PeerConnectionRecord *PeerManager::findRecord(const string &participantId) {
	auto it = mRecords.find(participantId);
	return it != mRecords.end() ? &it->second : nullptr;
}

void PeerManager::emit(Event event) {
	if (mHooks.emit)
		mHooks.emit(std::move(event));
}

void PeerManager::post(std::function<void()> task) {
	if (mHooks.post)
		mHooks.post(std::move(task));
}

} // namespace meshcall::impl
