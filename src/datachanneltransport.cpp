/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "datachanneltransport.hpp"

#include "impl/datachanneltransport.hpp"
#include "impl/internals.hpp"

namespace meshcall {

namespace {

rtc::IceServer toRtcIceServer(const IceServer &server) {
	if (server.type == IceServer::Type::Stun)
		return rtc::IceServer(server.hostname, server.port);

	rtc::IceServer::RelayType relayType;
	switch (server.relayType) {
	case IceServer::RelayType::TurnTcp:
		relayType = rtc::IceServer::RelayType::TurnTcp;
		break;
	case IceServer::RelayType::TurnTls:
		relayType = rtc::IceServer::RelayType::TurnTls;
		break;
	default:
		relayType = rtc::IceServer::RelayType::TurnUdp;
		break;
	}
	return rtc::IceServer(server.hostname, server.port, server.username, server.password,
	                      relayType);
}

} // namespace

DataChannelTransportFactory::DataChannelTransportFactory() : DataChannelTransportFactory(Options{}) {}

DataChannelTransportFactory::DataChannelTransportFactory(Options options)
    : mOptions(std::move(options)) {}

shared_ptr<PeerTransport> DataChannelTransportFactory::create(const std::vector<IceServer> &iceServers) {
	rtc::Configuration config;
	for (const auto &server : iceServers)
		config.iceServers.push_back(toRtcIceServer(server));

	config.portRangeBegin = mOptions.portRangeBegin;
	config.portRangeEnd = mOptions.portRangeEnd;
	config.bindAddress = mOptions.bindAddress;
	if (mOptions.forceRelay)
		config.iceTransportPolicy = rtc::TransportPolicy::Relay;

	// Offers are driven by the peer connection manager
	config.disableAutoNegotiation = true;
	config.forceMediaTransport = true;

	PLOG_VERBOSE << "Creating peer transport with " << config.iceServers.size() << " ICE servers";
	auto transport = std::make_shared<impl::DataChannelTransport>(std::move(config), mOptions);
	transport->init();
	return transport;
}

} // namespace meshcall
