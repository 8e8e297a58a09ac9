#include <catch2/catch.hpp>

#include <libforgelink/CameraProbe.hpp>

#include "FakeTransport.hpp"

using namespace ForgeLink;
using namespace ForgeLink::Test;

namespace {
const PrinterDescriptor printer_at_50 = PrinterDescriptor::from_address("192.168.1.50");
}

TEST_CASE("Camera URLs", "[CameraProbe]") {
    CameraProbe probe(std::make_shared<FakeTransport>());
    REQUIRE(probe.stream_url("192.168.1.50") == "http://192.168.1.50:8080/?action=stream");
    REQUIRE(probe.snapshot_url("192.168.1.50") == "http://192.168.1.50:8080/?action=snapshot");
}

TEST_CASE("Camera backoff", "[CameraProbe]") {
    REQUIRE(CameraProbe::backoff_delay(Milliseconds(500), 0) == Milliseconds(500));
    REQUIRE(CameraProbe::backoff_delay(Milliseconds(500), 1) == Milliseconds(1000));
    REQUIRE(CameraProbe::backoff_delay(Milliseconds(500), 3) == Milliseconds(4000));
}

SCENARIO("Probing the camera stream", "[CameraProbe]") {
    auto transport = std::make_shared<FakeTransport>();

    GIVEN("A streamer which answers at once") {
        transport->camera_answers = { CameraAnswer::Ok };
        CameraProbeResult result = CameraProbe(transport).probe(printer_at_50);
        THEN("it is available after one attempt") {
            REQUIRE(result.available);
            REQUIRE(result.attempts == 1);
            REQUIRE(result.last_latency_ms);
            REQUIRE(result.error.empty());
            REQUIRE(result.stream_url == "http://192.168.1.50:8080/?action=stream");
        }
    }
    GIVEN("A cold streamer answering the third request") {
        transport->camera_answers = { CameraAnswer::Timeout, CameraAnswer::Refuse, CameraAnswer::Ok };
        const Clock::time_point started = Clock::now();
        CameraProbeResult result = CameraProbe(transport).probe(printer_at_50, 4, Milliseconds(500));
        const auto elapsed = std::chrono::duration_cast<Milliseconds>(Clock::now() - started);
        THEN("it is available after backing off 500 and 1000 ms") {
            REQUIRE(result.available);
            REQUIRE(result.attempts == 3);
            REQUIRE(elapsed >= Milliseconds(1500));
            // The fake answers at once, so nothing but the two waits adds up.
            REQUIRE(elapsed < Milliseconds(1500 + 1000));
        }
    }
    GIVEN("A streamer which never answers") {
        transport->camera_answers = { CameraAnswer::Timeout };
        CameraProbeParams params;
        params.max_attempts = 4;
        params.base_delay   = Milliseconds(5);
        CameraProbeResult result = CameraProbe(transport, params).probe(printer_at_50);
        THEN("every attempt is used and the camera is reported unavailable") {
            REQUIRE_FALSE(result.available);
            REQUIRE(result.attempts == 4);
            REQUIRE(transport->camera_connects == 4);
            REQUIRE_FALSE(result.last_latency_ms);
            REQUIRE_FALSE(result.error.empty());
        }
    }
    GIVEN("A small wait budget") {
        transport->camera_answers = { CameraAnswer::Refuse };
        CameraProbeParams params;
        params.max_attempts   = 10;
        params.base_delay     = Milliseconds(20);
        params.max_total_wait = Milliseconds(30);
        const Clock::time_point started = Clock::now();
        CameraProbeResult result = CameraProbe(transport, params).probe(printer_at_50);
        const auto elapsed = std::chrono::duration_cast<Milliseconds>(Clock::now() - started);
        THEN("the camera check gives up once the budget is spent") {
            // Waits of 20 and 10 ms, then nothing is left.
            REQUIRE_FALSE(result.available);
            REQUIRE(result.attempts == 3);
            REQUIRE(elapsed >= params.max_total_wait);
            REQUIRE(elapsed < params.max_total_wait + Milliseconds(500));
        }
    }
    GIVEN("A streamer answering with an error status") {
        transport->camera_answers = { CameraAnswer::ServiceUnavailable, CameraAnswer::Ok };
        CameraProbeResult result = CameraProbe(transport).probe(printer_at_50);
        THEN("it is unavailable without retrying") {
            REQUIRE_FALSE(result.available);
            REQUIRE(result.attempts == 1);
            REQUIRE(transport->camera_connects == 1);
            REQUIRE_THAT(result.error, Catch::Contains("503"));
        }
    }
    GIVEN("Zero attempts requested") {
        transport->camera_answers = { CameraAnswer::Ok };
        THEN("one attempt is still made") {
            REQUIRE(CameraProbe(transport).probe(printer_at_50, 0, Milliseconds(1)).attempts == 1);
        }
    }
}
