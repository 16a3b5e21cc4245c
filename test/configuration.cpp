/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "meshcall/configuration.hpp"
#include "test.hpp"

#include <stdexcept>

using namespace meshcall;

TestResult test_ice_servers() {
	IceServer stun("stun:stun.l.google.com:19302");
	if (stun.type != IceServer::Type::Stun || stun.hostname != "stun.l.google.com" ||
	    stun.port != 19302)
		return TestResult(false, "STUN URL parsed incorrectly");

	IceServer turn("turn:alice:secret@turn.example.com?transport=tcp");
	if (turn.type != IceServer::Type::Turn || turn.relayType != IceServer::RelayType::TurnTcp ||
	    turn.username != "alice" || turn.password != "secret" || turn.port != 3478)
		return TestResult(false, "TURN URL parsed incorrectly");

	IceServer turns("turns:turn.example.com");
	if (turns.relayType != IceServer::RelayType::TurnTls || turns.port != 5349)
		return TestResult(false, "TURNS default port is wrong");

	if (IceServer("stun:[::1]:3478").hostname != "::1")
		return TestResult(false, "IPv6 hostname was not unbracketed");

	for (const char *url : {"http://example.com", "stun:", "stun:host:port"}) {
		try {
			IceServer invalid(url);
			return TestResult(false, string("Accepted invalid URL ") + url);
		} catch (const std::invalid_argument &) {
			// expected
		}
	}

	auto servers = DefaultIceServers();
	if (servers.size() < 5 || servers.front().url() != "stun:stun.l.google.com:19302")
		return TestResult(false, "Default ICE servers are wrong");

	auto constraints = DefaultMediaConstraints(true, false);
	if (!constraints.video || constraints.audio || constraints.video->width.ideal != 1280 ||
	    constraints.video->frameRate.max != 30)
		return TestResult(false, "Default media constraints are wrong");

	return TestResult(true);
}
