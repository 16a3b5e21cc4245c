/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#ifndef MESHCALL_RECORDER_H
#define MESHCALL_RECORDER_H

#include "common.hpp"
#include "configuration.hpp"
#include "mediastream.hpp"

#include <iostream>

namespace meshcall {

enum class RecordingState { Inactive, Recording, Paused };

// Encodes the tracks of one composite stream. Calls are serialized by the caller.
class MESHCALL_CPP_EXPORT MediaEncoder {
public:
	virtual ~MediaEncoder() = default;

	virtual string mimeType() const = 0;
	virtual void encode(MediaKind kind, const string &trackId, const binary &frame,
	                    std::chrono::microseconds timestamp) = 0;

	// Returns the data encoded since the previous call, possibly empty
	virtual binary flush() = 0;
};

class MESHCALL_CPP_EXPORT MediaEncoderFactory {
public:
	virtual ~MediaEncoderFactory() = default;

	virtual bool isTypeSupported(const string &mimeType) const = 0;
	virtual unique_ptr<MediaEncoder> create(const string &mimeType,
	                                        const RecordingOptions &options) = 0;
};

// Writes the video of the recording as an H.264 Annex-B elementary stream
// ("video/h264"). Audio frames are not recorded.
class MESHCALL_CPP_EXPORT ElementaryStreamEncoderFactory final : public MediaEncoderFactory {
public:
	inline static const string MimeType = "video/h264";

	bool isTypeSupported(const string &mimeType) const override;
	unique_ptr<MediaEncoder> create(const string &mimeType,
	                                const RecordingOptions &options) override;
};

// Candidates in descending priority
MESHCALL_CPP_EXPORT const std::vector<string> &PreferredMimeTypes();

// The requested type if supported, else the first supported candidate
MESHCALL_CPP_EXPORT optional<string> ChooseMimeType(const MediaEncoderFactory &factory,
                                                    const optional<string> &requested);

} // namespace meshcall

MESHCALL_CPP_EXPORT std::ostream &operator<<(std::ostream &out, meshcall::RecordingState state);

#endif
