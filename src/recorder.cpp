/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "recorder.hpp"

#include "impl/internals.hpp"

namespace meshcall {

namespace {

// Concatenates the access units of a single video track
class ElementaryStreamEncoder final : public MediaEncoder {
public:
	string mimeType() const override { return ElementaryStreamEncoderFactory::MimeType; }

	void encode(MediaKind kind, const string &trackId, const binary &frame,
	            std::chrono::microseconds timestamp) override {
		if (kind != MediaKind::Video || frame.empty())
			return;

		if (!mTrackId) {
			PLOG_DEBUG << "Recording video track \"" << trackId << "\"";
			mTrackId = trackId;
		} else if (*mTrackId != trackId) {
			return; // an elementary stream holds one track
		}

		if (mLastTimestamp && timestamp < *mLastTimestamp)
			PLOG_VERBOSE << "Out of order frame in recording of track \"" << trackId << "\"";

		mLastTimestamp = timestamp;
		mBuffer.insert(mBuffer.end(), frame.begin(), frame.end());
	}

	binary flush() override { return std::exchange(mBuffer, binary{}); }

private:
	optional<string> mTrackId;
	optional<std::chrono::microseconds> mLastTimestamp;
	binary mBuffer;
};

} // namespace

bool ElementaryStreamEncoderFactory::isTypeSupported(const string &mimeType) const {
	return mimeType == MimeType;
}

unique_ptr<MediaEncoder> ElementaryStreamEncoderFactory::create(const string &mimeType,
                                                                const RecordingOptions &options) {
	if (!isTypeSupported(mimeType))
		throw std::invalid_argument("Unsupported recording type: " + mimeType);

	if (options.videoBitsPerSecond)
		PLOG_DEBUG << "Elementary stream recording keeps the source bitrate";

	return std::make_unique<ElementaryStreamEncoder>();
}

const std::vector<string> &PreferredMimeTypes() {
	static const std::vector<string> types = {
	    "video/webm;codecs=vp9,opus",
	    "video/webm;codecs=vp8,opus",
	    "video/webm",
	    "video/mp4",
	    "video/h264",
	};
	return types;
}

optional<string> ChooseMimeType(const MediaEncoderFactory &factory,
                                const optional<string> &requested) {
	if (requested) {
		if (factory.isTypeSupported(*requested))
			return requested;

		PLOG_WARNING << "Recording type \"" << *requested << "\" is not supported, falling back";
	}

	for (const auto &type : PreferredMimeTypes())
		if (factory.isTypeSupported(type))
			return type;

	return nullopt;
}

} // namespace meshcall

std::ostream &operator<<(std::ostream &out, meshcall::RecordingState state) {
	using State = meshcall::RecordingState;
	const char *str;
	switch (state) {
	case State::Inactive:
		str = "inactive";
		break;
	case State::Recording:
		str = "recording";
		break;
	case State::Paused:
		str = "paused";
		break;
	default:
		str = "unknown";
		break;
	}
	return out << str;
}
