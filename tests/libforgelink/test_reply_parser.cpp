#include <catch2/catch.hpp>

#include <libforgelink/Exception.hpp>
#include <libforgelink/ReplyParser.hpp>

#include "FakeTransport.hpp"

using namespace ForgeLink;
using namespace ForgeLink::ReplyParser;
using ForgeLink::Test::reply_frame;

TEST_CASE("Command framing", "[ReplyParser]") {
    REQUIRE(format_command("M119") == "~M119\r\n");
    REQUIRE(format_command("  M601 S1 ") == "~M601 S1\r\n");
    REQUIRE(command_code("M28 1024 0:/user/a.gx") == "M28");
    REQUIRE(command_code("~M601 S1") == "M601");
    REQUIRE(command_code("M27") == "M27");
}

TEST_CASE("Reply frame scanning", "[ReplyParser]") {
    SECTION("Frame without terminator is incomplete") {
        REQUIRE(scan_reply_frame("").end == FrameEnd::Incomplete);
        REQUIRE(scan_reply_frame("CMD M119 Received.\r\nMachineStatus: READY\r\n").end == FrameEnd::Incomplete);
        // The terminating line is not complete yet.
        REQUIRE(scan_reply_frame("CMD M119 Received.\r\nok").end == FrameEnd::Incomplete);
    }
    SECTION("ok line ends the frame") {
        const std::string frame = reply_frame("M105", "T0:210.0/210.0 B:60/60\r\n");
        FrameScan scan = scan_reply_frame(frame);
        REQUIRE(scan.end == FrameEnd::Ok);
        REQUIRE(scan.length == frame.size());
    }
    SECTION("ok is matched case insensitive and trimmed") {
        REQUIRE(scan_reply_frame("CMD M27 Received.\n  OK \n").end == FrameEnd::Ok);
    }
    SECTION("Lines merely containing ok do not end the frame") {
        REQUIRE(scan_reply_frame("CMD M23 Received.\r\nokay\r\nTool: ok\r\n").end == FrameEnd::Incomplete);
    }
    SECTION("Bytes after the frame are not part of it") {
        const std::string frame = reply_frame("M105", "T0:210.0/210.0 B:60/60\r\n");
        FrameScan scan = scan_reply_frame(frame + "CMD M119 Rec");
        REQUIRE(scan.end == FrameEnd::Ok);
        REQUIRE(scan.length == frame.size());
    }
    SECTION("error line ends the frame") {
        FrameScan scan = scan_reply_frame("CMD M28 Received.\r\nerror: file exists\r\n");
        REQUIRE(scan.end == FrameEnd::Error);
    }
    SECTION("Refused handshake ends the frame") {
        REQUIRE(scan_reply_frame("CMD M601 Received.\r\nControl failed.\r\n").end == FrameEnd::Error);
    }
}

TEST_CASE("Reply echo", "[ReplyParser]") {
    REQUIRE_NOTHROW(verify_reply_echo("M119", reply_frame("M119")));
    REQUIRE_NOTHROW(verify_reply_echo("M28 10 0:/user/a.gx", reply_frame("M28")));
    REQUIRE_NOTHROW(verify_reply_echo("M119", "ok\r\n"));
    REQUIRE_THROWS_AS(verify_reply_echo("M119", reply_frame("M105")), ProtocolError);
}

TEST_CASE("Bare terminators", "[ReplyParser]") {
    REQUIRE(is_bare_terminator("ok\r\n"));
    REQUIRE(is_bare_terminator("OK\n"));
    REQUIRE_FALSE(is_bare_terminator(reply_frame("M119", "MachineStatus: READY\r\n")));
    REQUIRE_FALSE(is_bare_terminator("error\r\n"));
}

TEST_CASE("Failure notices", "[ReplyParser]") {
    REQUIRE(reply_reports_failure("CMD M601 Received.\r\nControl failed.\r\nok\r\n"));
    REQUIRE(reply_reports_failure("CMD M23 Received.\r\nopen failed, File: 0:/user/x.gx\r\nok\r\n"));
    REQUIRE_FALSE(reply_reports_failure(reply_frame("M601", "Control Success.\r\n")));
}

TEST_CASE("Machine state tokens", "[ReplyParser]") {
    REQUIRE(device_state_from_token("BUILDING_FROM_SD") == DeviceState::Printing);
    REQUIRE(device_state_from_token("building") == DeviceState::Printing);
    REQUIRE(device_state_from_token("PRINTING") == DeviceState::Printing);
    REQUIRE(device_state_from_token("PAUSED") == DeviceState::Paused);
    REQUIRE(device_state_from_token("READY") == DeviceState::Idle);
    REQUIRE(device_state_from_token(" IDLE ") == DeviceState::Idle);
    REQUIRE(device_state_from_token("ERROR") == DeviceState::Error);
    REQUIRE(device_state_from_token("CALIBRATING") == DeviceState::Unknown);
}

SCENARIO("M119 state replies", "[ReplyParser]") {
    GIVEN("A printer building from SD") {
        StateReport report = parse_state_reply(Test::state_reply("BUILDING_FROM_SD", "benchy.gx"));
        THEN("the state is Printing") {
            REQUIRE(report.state == DeviceState::Printing);
            REQUIRE(report.raw_state == "BUILDING_FROM_SD");
        }
        THEN("the current file is reported") {
            REQUIRE(report.current_file);
            REQUIRE(*report.current_file == "benchy.gx");
        }
        THEN("the head is not moving") {
            REQUIRE_FALSE(report.moving);
        }
    }
    GIVEN("An idle printer without a file") {
        StateReport report = parse_state_reply(Test::state_reply("READY"));
        THEN("no current file is reported") {
            REQUIRE(report.state == DeviceState::Idle);
            REQUIRE_FALSE(report.current_file);
        }
    }
    GIVEN("A state token the firmware introduced later") {
        StateReport report = parse_state_reply(Test::state_reply("HEATING"));
        THEN("the state is Unknown and the token is kept") {
            REQUIRE(report.state == DeviceState::Unknown);
            REQUIRE(report.raw_state == "HEATING");
        }
    }
    GIVEN("A moving head and extra whitespace") {
        StateReport report = parse_state_reply("CMD M119 Received.\r\n  MachineStatus:   PAUSED  \r\nMoveMode: MOVING\r\nok\r\n");
        THEN("both are parsed") {
            REQUIRE(report.state == DeviceState::Paused);
            REQUIRE(report.moving);
        }
    }
    GIVEN("A reply without MachineStatus") {
        THEN("parsing fails") {
            REQUIRE_THROWS_AS(parse_state_reply(reply_frame("M119", "MoveMode: READY\r\n")), ProtocolError);
            REQUIRE_THROWS_AS(parse_state_reply(reply_frame("M119", "MachineStatus:\r\n")), ProtocolError);
        }
    }
}

TEST_CASE("M105 temperature replies", "[ReplyParser]") {
    SECTION("Current and target of nozzle and bed") {
        TemperatureReport t = parse_temperature_reply(reply_frame("M105", "T0:210.0/210.0 B:60/60\r\n"));
        REQUIRE(t.nozzle_current == Approx(210.));
        REQUIRE(t.nozzle_target == Approx(210.));
        REQUIRE(t.bed_current == Approx(60.));
        REQUIRE(t.bed_target == Approx(60.));
    }
    SECTION("Space before the slash") {
        TemperatureReport t = parse_temperature_reply(reply_frame("M105", "T0:25.3 /0.0 B:24.9 /0.0\r\n"));
        REQUIRE(t.nozzle_current == Approx(25.3));
        REQUIRE(t.nozzle_target == Approx(0.));
        REQUIRE(t.bed_current == Approx(24.9));
        REQUIRE(t.bed_target == Approx(0.));
    }
    SECTION("Single extruder firmware reports T") {
        TemperatureReport t = parse_temperature_reply(reply_frame("M105", "T:199.5/200 B:55.0/55\r\n"));
        REQUIRE(t.nozzle_current == Approx(199.5));
        REQUIRE(t.bed_target == Approx(55.));
    }
    SECTION("Missing bed temperature") {
        REQUIRE_THROWS_AS(parse_temperature_reply(reply_frame("M105", "T0:210.0/210.0\r\n")), ProtocolError);
    }
    SECTION("Missing nozzle temperature") {
        REQUIRE_THROWS_AS(parse_temperature_reply(reply_frame("M105", "B:60/60\r\n")), ProtocolError);
    }
}

TEST_CASE("M27 progress replies", "[ReplyParser]") {
    SECTION("Bytes and layers") {
        ProgressReport p = parse_progress_reply(reply_frame("M27", "SD printing byte 52/100\r\nLayer: 147/550\r\n"));
        REQUIRE(p.bytes_printed == 52);
        REQUIRE(p.bytes_total == 100);
        REQUIRE(p.current_layer == 147);
        REQUIRE(p.total_layers == 550);
    }
    SECTION("Layer line is optional") {
        ProgressReport p = parse_progress_reply(reply_frame("M27", "SD printing byte 10/2000\r\n"));
        REQUIRE(p.bytes_printed == 10);
        REQUIRE(p.current_layer == 0);
        REQUIRE(p.total_layers == 0);
    }
    SECTION("Current layer beyond the total") {
        REQUIRE_THROWS_AS(parse_progress_reply(reply_frame("M27", "SD printing byte 10/20\r\nLayer: 12/11\r\n")), ProtocolError);
    }
    SECTION("Missing byte counters") {
        REQUIRE_THROWS_AS(parse_progress_reply(reply_frame("M27", "Layer: 1/2\r\n")), ProtocolError);
    }
}

TEST_CASE("M115 info replies", "[ReplyParser]") {
    SECTION("Complete identification") {
        PrinterInfo info = parse_info_reply(Test::info_reply());
        REQUIRE(info.model == "Flashforge Adventurer 5M Pro");
        REQUIRE(info.name == "Workshop 5M");
        REQUIRE(info.firmware_version == "v2.7.5");
        REQUIRE(info.serial_number == "SNMOMC9900728");
        REQUIRE(info.mac_address == "88:A9:A7:93:0B:2C");
        REQUIRE(info.tool_count == 1);
        REQUIRE(info.build_x == Approx(220.));
        REQUIRE(info.build_y == Approx(220.));
        REQUIRE(info.build_z == Approx(220.));
    }
    SECTION("Serial number is mandatory") {
        REQUIRE_THROWS_AS(parse_info_reply(reply_frame("M115", "Machine Type: Adventurer 5M\r\nFirmware: v2.7.5\r\n")), ProtocolError);
    }
    SECTION("Machine type is mandatory") {
        REQUIRE_THROWS_AS(parse_info_reply(reply_frame("M115", "Firmware: v2.7.5\r\nSN: 123\r\n")), ProtocolError);
    }
}

TEST_CASE("Status assembly", "[ReplyParser]") {
    TemperatureReport temperatures;
    temperatures.nozzle_current = 210.;
    ProgressReport progress;
    progress.bytes_printed = 52;
    progress.bytes_total   = 100;
    progress.current_layer = 147;
    progress.total_layers  = 550;

    SECTION("Printing takes the progress") {
        StateReport state;
        state.state = DeviceState::Printing;
        MachineStatus status = assemble_status(state, temperatures, progress);
        REQUIRE(status.progress_percent == Approx(52.));
        REQUIRE(status.current_layer == 147);
        REQUIRE(status.total_layers == 550);
        REQUIRE(status.nozzle_temp_current == Approx(210.));
    }
    SECTION("Progress is clamped") {
        StateReport state;
        state.state = DeviceState::Printing;
        progress.bytes_printed = 120;
        REQUIRE(assemble_status(state, temperatures, progress).progress_percent == Approx(100.));
    }
    SECTION("Paused printer reports no progress") {
        StateReport state;
        state.state = DeviceState::Paused;
        MachineStatus status = assemble_status(state, temperatures, progress);
        REQUIRE(status.progress_percent == 0.);
        REQUIRE(status.current_layer == 0);
        REQUIRE(status.total_layers == 0);
        REQUIRE(status.bytes_printed == 0);
    }
    SECTION("Printing without progress") {
        StateReport state;
        state.state = DeviceState::Printing;
        REQUIRE_THROWS_AS(assemble_status(state, temperatures, std::nullopt), ProtocolError);
    }
}
