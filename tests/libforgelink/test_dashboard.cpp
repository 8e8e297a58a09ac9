#include <catch2/catch.hpp>

#include <libforgelink/Dashboard.hpp>
#include <libforgelink/Exception.hpp>

#include "FakeTransport.hpp"

using namespace ForgeLink;
using namespace ForgeLink::Test;

namespace {

std::shared_ptr<FakeTransport> idle_printer()
{
    auto transport = std::make_shared<FakeTransport>();
    transport->printer->replies["M119"] = state_reply("READY");
    transport->printer->replies["M105"] = reply_frame("M105", "T0:25.0/0.0 B:24.0/0.0\r\n");
    return transport;
}

Dashboard make_dashboard(std::shared_ptr<FakeTransport> transport)
{
    CameraProbeParams camera;
    camera.base_delay = Milliseconds(1);
    DashboardParams params;
    params.discovery_timeout = Milliseconds(10);
    return Dashboard(transport, DiscoveryParams(), SessionParams(), camera, params);
}

}

SCENARIO("Watching a printer", "[Dashboard]") {
    auto transport = idle_printer();

    GIVEN("One printer on the network with a broken camera") {
        transport->discovery_replies.push_back(discovery_reply("192.168.1.50", "Adventurer5M", "SNMOMC9900728"));
        transport->camera_answers = { CameraAnswer::Refuse };
        DashboardView view = make_dashboard(transport).watch();

        THEN("the status is still reported") {
            REQUIRE(view.status);
            REQUIRE(view.status->state == DeviceState::Idle);
            REQUIRE(view.status_error.empty());
        }
        THEN("the camera failure is recorded") {
            REQUIRE_FALSE(view.camera.available);
            REQUIRE(view.camera.attempts == 4);
            REQUIRE_FALSE(view.camera.error.empty());
        }
        THEN("the descriptor is completed by the identification") {
            REQUIRE(view.info);
            REQUIRE(view.descriptor.ip_address == "192.168.1.50");
            REQUIRE(view.descriptor.model == "Flashforge Adventurer 5M Pro");
        }
        THEN("the control session was released") {
            REQUIRE(transport->printer->received("M602"));
        }
    }
    GIVEN("No printer on the network") {
        THEN("watching fails") {
            REQUIRE_THROWS_AS(make_dashboard(transport).watch(), NoDeviceFoundError);
        }
    }
    GIVEN("Two printers on the network") {
        transport->discovery_replies.push_back(discovery_reply("192.168.1.50", "Adventurer5M", "SN1"));
        transport->discovery_replies.push_back(discovery_reply("192.168.1.60", "Garage", "SN2"));
        THEN("watching fails listing both") {
            REQUIRE_THROWS_AS(make_dashboard(transport).watch(), AmbiguousDeviceError);
            REQUIRE_THROWS_WITH(make_dashboard(transport).watch(), Catch::Contains("192.168.1.50") && Catch::Contains("192.168.1.60"));
        }
        THEN("a given printer is watched without discovery") {
            transport->camera_answers = { CameraAnswer::Ok };
            DashboardView view = make_dashboard(transport).watch(PrinterDescriptor::from_address("192.168.1.60"));
            REQUIRE(view.status);
            REQUIRE(view.camera.available);
        }
    }
    GIVEN("A printer refusing the control connection") {
        transport->printer->refuse_connect = true;
        transport->camera_answers = { CameraAnswer::Ok };
        DashboardView view = make_dashboard(transport).watch(PrinterDescriptor::from_address("192.168.1.50"));
        THEN("only the status branch failed") {
            REQUIRE_FALSE(view.status);
            REQUIRE_FALSE(view.status_error.empty());
            REQUIRE_FALSE(view.info);
            REQUIRE(view.camera.available);
        }
    }
    GIVEN("A printer with an incomplete identification") {
        transport->printer->replies["M115"] = reply_frame("M115", "Machine Type: Adventurer 5M\r\n");
        transport->camera_answers = { CameraAnswer::Ok };
        DashboardView view = make_dashboard(transport).watch(PrinterDescriptor::from_address("192.168.1.50"));
        THEN("the status is reported nevertheless") {
            REQUIRE_FALSE(view.info);
            REQUIRE_FALSE(view.info_error.empty());
            REQUIRE(view.status);
            REQUIRE(view.status_error.empty());
        }
    }
}
