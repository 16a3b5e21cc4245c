/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include "configuration.hpp"

#include "impl/internals.hpp"

#include <algorithm>
#include <cstdlib>
#include <regex>

namespace meshcall {

namespace {

optional<string> getEnv(const char *name) {
	const char *value = std::getenv(name);
	if (value && *value)
		return string(value);
	return nullopt;
}

} // namespace

IceServer::IceServer(const string &url) {
	// Modified regex from RFC 3986, see https://tools.ietf.org/html/rfc3986#appendix-B
	static const char *rs =
	    R"(^(([^:.@/?#]+):)?(/{0,2}((([^:@]*)(:([^@]*))?)@)?(([^:/?#]*)(:([^/?#]*))?))?([^?#]*)(\?([^#]*))?(#(.*))?)";
	static const std::regex r(rs, std::regex::extended);

	std::smatch m;
	if (!std::regex_match(url, m, r) || m[10].length() == 0)
		throw std::invalid_argument("Invalid ICE server URL: " + url);

	std::vector<optional<string>> opt(m.size());
	std::transform(m.begin(), m.end(), opt.begin(), [](const auto &sm) {
		return sm.length() > 0 ? std::make_optional(string(sm)) : nullopt;
	});

	string scheme = opt[2].value_or("stun");
	relayType = RelayType::TurnUdp;
	if (scheme == "stun" || scheme == "STUN")
		type = Type::Stun;
	else if (scheme == "turn" || scheme == "TURN")
		type = Type::Turn;
	else if (scheme == "turns" || scheme == "TURNS") {
		type = Type::Turn;
		relayType = RelayType::TurnTls;
	} else
		throw std::invalid_argument("Unknown ICE server protocol: " + scheme);

	if (auto &query = opt[15]) {
		if (query->find("transport=udp") != string::npos)
			relayType = RelayType::TurnUdp;
		if (query->find("transport=tcp") != string::npos)
			relayType = RelayType::TurnTcp;
	}

	username = opt[6].value_or("");
	password = opt[8].value_or("");

	hostname = opt[10].value();
	while (!hostname.empty() && hostname.front() == '[')
		hostname.erase(hostname.begin());
	while (!hostname.empty() && hostname.back() == ']')
		hostname.pop_back();

	string service = opt[12].value_or(relayType == RelayType::TurnTls ? "5349" : "3478");
	try {
		port = uint16_t(std::stoul(service));
	} catch (const std::logic_error &) {
		throw std::invalid_argument("Invalid ICE server port in URL: " + service);
	}
}

IceServer::IceServer(string hostname_, uint16_t port_)
    : hostname(std::move(hostname_)), port(port_), type(Type::Stun),
      relayType(RelayType::TurnUdp) {}

IceServer::IceServer(string hostname_, uint16_t port_, string username_, string password_,
                     RelayType relayType_)
    : hostname(std::move(hostname_)), port(port_), type(Type::Turn), username(std::move(username_)),
      password(std::move(password_)), relayType(relayType_) {}

string IceServer::url() const {
	string scheme;
	if (type == Type::Stun)
		scheme = "stun";
	else
		scheme = relayType == RelayType::TurnTls ? "turns" : "turn";

	string host = hostname.find(':') != string::npos ? "[" + hostname + "]" : hostname;
	string result = scheme + ":" + host + ":" + std::to_string(port);
	if (type == Type::Turn && relayType == RelayType::TurnTcp)
		result += "?transport=tcp";

	return result;
}

std::vector<IceServer> DefaultIceServers() {
	std::vector<IceServer> servers;
	servers.emplace_back("stun:stun.l.google.com:19302");
	for (int i = 1; i <= 4; ++i)
		servers.emplace_back("stun:stun" + std::to_string(i) + ".l.google.com:19302");

	if (auto turnUrl = getEnv("MESHCALL_TURN_URL")) {
		try {
			IceServer turn(*turnUrl);
			if (auto username = getEnv("MESHCALL_TURN_USERNAME"))
				turn.username = *username;
			if (auto credential = getEnv("MESHCALL_TURN_CREDENTIAL"))
				turn.password = *credential;

			servers.push_back(std::move(turn));
		} catch (const std::invalid_argument &e) {
			PLOG_WARNING << "Ignoring TURN server from environment: " << e.what();
		}
	}

	return servers;
}

MediaConstraints DefaultMediaConstraints(bool video, bool audio) {
	MediaConstraints constraints;
	if (video) {
		VideoConstraints v;
		v.width = {640, 1280, 1920};
		v.height = {480, 720, 1080};
		v.frameRate = {nullopt, 30, 30};
		v.facingMode = "user";
		constraints.video = std::move(v);
	}
	if (audio) {
		AudioConstraints a;
		a.echoCancellation = true;
		a.noiseSuppression = true;
		a.autoGainControl = true;
		constraints.audio = std::move(a);
	}
	return constraints;
}

} // namespace meshcall
