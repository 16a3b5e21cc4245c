/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#ifndef MESHCALL_DATACHANNEL_TRANSPORT_H
#define MESHCALL_DATACHANNEL_TRANSPORT_H

#include "common.hpp"
#include "peertransport.hpp"

namespace meshcall {

// Peer transports backed by libdatachannel. Video is sent as H.264, audio as Opus.
class MESHCALL_CPP_EXPORT DataChannelTransportFactory final : public PeerTransportFactory {
public:
	struct Options {
		uint16_t portRangeBegin = 1024;
		uint16_t portRangeEnd = 65535;
		optional<string> bindAddress;
		bool forceRelay = false;
		int videoPayloadType = 96;
		int audioPayloadType = 111;
		int videoBitrate = 3000; // kbps
	};

	DataChannelTransportFactory();
	DataChannelTransportFactory(Options options);

	shared_ptr<PeerTransport> create(const std::vector<IceServer> &iceServers) override;

private:
	const Options mOptions;
};

} // namespace meshcall

#endif
