/**
 * Copyright (c) 2026 The meshcall authors
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 */

#include <chrono>
#include <future>
#include <iostream>

#include "meshcall/meshcall.hpp"
#include "test.hpp"

using namespace std;
using namespace chrono_literals;

using chrono::duration_cast;
using chrono::milliseconds;
using chrono::seconds;
using chrono::steady_clock;

TestResult test_negotiation_table();
TestResult test_ice_servers();
TestResult test_signaling_codec();
TestResult test_quality_grading();
TestResult test_stats_monitor();
TestResult test_glare();
TestResult test_polite_tiebreak();
TestResult test_recipient_filtering();
TestResult test_connection_failure();
TestResult test_file_capture();
TestResult test_mime_type_choice();
TestResult test_room_scenario();
TestResult test_screen_share();
TestResult test_recording();
TestResult test_media_errors();
TestResult test_session_cleanup();

TestResult test_cleanup() {
	try {
		// Every session must have been destroyed, otherwise the wait will block
		if (meshcall::Cleanup().wait_for(10s) == future_status::timeout)
			return TestResult(false, "timeout");
		return TestResult(true);
	} catch (const exception &e) {
		return TestResult(false, e.what());
	}
}

static const vector<Test> tests = {
    Test("Negotiation table", test_negotiation_table),
    Test("ICE servers", test_ice_servers),
    Test("Signaling codec", test_signaling_codec),
    Test("Quality grading", test_quality_grading),
    Test("Stats monitor", test_stats_monitor),
    Test("Offer collision", test_glare),
    Test("Polite tie-break", test_polite_tiebreak),
    Test("Recipient filtering", test_recipient_filtering),
    Test("Connection failure", test_connection_failure),
    Test("File capture", test_file_capture),
    Test("Recording type choice", test_mime_type_choice),
    Test("Room scenario", test_room_scenario),
    Test("Screen share", test_screen_share),
    Test("Recording", test_recording),
    Test("Media errors", test_media_errors),
    Test("Session cleanup", test_session_cleanup),
    Test("Cleanup", test_cleanup),
};

int main(int argc, char **argv) {
	meshcall::InitLogger(meshcall::LogLevel::Debug);

	int success_tests = 0;
	int failed_tests = 0;
	steady_clock::time_point startTime, endTime;

	startTime = steady_clock::now();

	for (auto test : tests) {
		auto res = test.run();
		if (res.success) {
			success_tests++;
		} else {
			failed_tests++;
		}
	}

	endTime = steady_clock::now();

	auto durationMs = duration_cast<milliseconds>(endTime - startTime);
	auto durationS = duration_cast<seconds>(endTime - startTime);
	cout << "Finished " << success_tests + failed_tests << " tests in " << durationS.count()
	     << "s (" << durationMs.count() << " ms). Succeeded: " << success_tests
	     << ". Failed: " << failed_tests << "." << endl;

	return failed_tests == 0 ? 0 : 1;
}
