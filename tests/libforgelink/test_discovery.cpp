#include <catch2/catch.hpp>

#include <algorithm>

#include <libforgelink/Discovery.hpp>
#include <libforgelink/Exception.hpp>

#include "FakeTransport.hpp"

using namespace ForgeLink;
using namespace ForgeLink::Test;

TEST_CASE("Discovery reply records", "[Discovery]") {
    SECTION("Name and serial are NUL padded fields") {
        auto printer = PrinterDiscovery::parse_reply(discovery_reply("192.168.1.50", "Adventurer5M", "SNMOMC9900728"));
        REQUIRE(printer);
        REQUIRE(printer->name == "Adventurer5M");
        REQUIRE(printer->serial_number == "SNMOMC9900728");
        REQUIRE(printer->ip_address == "192.168.1.50");
        REQUIRE(printer->control_port == CONTROL_PORT);
        REQUIRE(printer->discovered_at > 0);
    }
    SECTION("Unnamed printer") {
        auto printer = PrinterDiscovery::parse_reply(discovery_reply("192.168.1.51", "", "SN2"));
        REQUIRE(printer);
        REQUIRE(printer->name == "FlashForge@192.168.1.51");
    }
    SECTION("Short record") {
        REQUIRE_FALSE(PrinterDiscovery::parse_reply(discovery_reply("192.168.1.52", "Short", "SN3", 0xC3)));
    }
    SECTION("Record without serial") {
        REQUIRE_FALSE(PrinterDiscovery::parse_reply(discovery_reply("192.168.1.53", "NoSerial", "")));
    }
}

SCENARIO("Discovering printers", "[Discovery]") {
    auto transport = std::make_shared<FakeTransport>();

    GIVEN("No printer on the network") {
        PrinterDiscovery discovery(transport);
        THEN("the result is empty") {
            REQUIRE(discovery.discover(Milliseconds(50)).empty());
        }
        THEN("a 16 byte probe went to the multicast group and the broadcast address") {
            discovery.discover(Milliseconds(50));
            REQUIRE(transport->probes_sent == std::vector<std::string>{ "225.0.0.9:19000/16", "255.255.255.255:48899/16" });
        }
    }
    GIVEN("Two printers, one answering twice with a new name") {
        transport->discovery_replies.push_back(discovery_reply("192.168.1.50", "Old name", "SN1"));
        transport->discovery_replies.push_back(discovery_reply("192.168.1.60", "Garage", "SN2"));
        transport->discovery_replies.push_back(discovery_reply("192.168.1.70", "Broken", "SN9", 100));
        transport->discovery_replies.push_back(discovery_reply("192.168.1.55", "New name", "SN1"));
        std::vector<PrinterDescriptor> printers = PrinterDiscovery(transport).discover(Milliseconds(50));

        THEN("there is one entry per serial") {
            REQUIRE(printers.size() == 2);
        }
        THEN("the latest reply wins") {
            auto it = std::find_if(printers.begin(), printers.end(), [](const PrinterDescriptor &p) { return p.serial_number == "SN1"; });
            REQUIRE(it != printers.end());
            REQUIRE(it->name == "New name");
            REQUIRE(it->ip_address == "192.168.1.55");
        }
    }
    GIVEN("Repeated probes") {
        DiscoveryParams params;
        params.targets     = { { "225.0.0.9", 19000 } };
        params.probe_count = 7;
        PrinterDiscovery(transport, params).discover(Milliseconds(10));
        THEN("at most three are sent") {
            REQUIRE(transport->probes_sent.size() == 3);
        }
    }
    GIVEN("An unreachable broadcast address") {
        transport->failing_targets.insert("255.255.255.255");
        transport->discovery_replies.push_back(discovery_reply("192.168.1.50", "Adventurer5M", "SN1"));
        THEN("the multicast probe still finds the printer") {
            REQUIRE(PrinterDiscovery(transport).discover(Milliseconds(10)).size() == 1);
        }
        WHEN("no probe can be sent at all") {
            transport->failing_targets.insert("225.0.0.9");
            THEN("discovery fails") {
                REQUIRE_THROWS_AS(PrinterDiscovery(transport).discover(Milliseconds(10)), ConnectionError);
            }
        }
    }
}

TEST_CASE("Discovery with identification", "[Discovery]") {
    auto transport = std::make_shared<FakeTransport>();
    transport->discovery_replies.push_back(discovery_reply("192.168.1.50", "Adventurer5M", "SNMOMC9900728"));
    transport->discovery_replies.push_back(discovery_reply("192.168.1.60", "Offline", "SN2"));
    transport->unreachable_hosts.insert("192.168.1.60");

    std::vector<PrinterDescriptor> printers = PrinterDiscovery(transport).discover_with_info(Milliseconds(10));
    REQUIRE(printers.size() == 2);
    for (const PrinterDescriptor &printer : printers) {
        if (printer.ip_address == "192.168.1.50") {
            REQUIRE(printer.model == "Flashforge Adventurer 5M Pro");
            REQUIRE(printer.firmware_version == "v2.7.5");
            REQUIRE(printer.name == "Workshop 5M");
        } else {
            // Not reachable over TCP, the discovery record is kept as is.
            REQUIRE(printer.model.empty());
            REQUIRE(printer.name == "Offline");
        }
    }
}
