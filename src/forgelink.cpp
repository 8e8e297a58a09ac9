#include "libforgelink/libforgelink.h"
#include "libforgelink/AppConfig.hpp"
#include "libforgelink/AsioTransport.hpp"
#include "libforgelink/CameraProbe.hpp"
#include "libforgelink/ControlSession.hpp"
#include "libforgelink/Dashboard.hpp"
#include "libforgelink/Discovery.hpp"
#include "libforgelink/Exception.hpp"
#include "libforgelink/JobUploader.hpp"
#include "libforgelink/Time.hpp"
#include "libforgelink/Utils.hpp"

#include <iostream>
#include <string>

#include <boost/format.hpp>
#include <boost/log/trivial.hpp>
#include <boost/nowide/args.hpp>
#include <boost/nowide/cstdlib.hpp>
#include <boost/program_options.hpp>

using namespace ForgeLink;
namespace po = boost::program_options;

enum ExitCode {
    EXIT_OK             = 0,
    EXIT_USAGE          = 1,
    EXIT_NO_DEVICE      = 2,
    EXIT_CONNECTION     = 3,
    EXIT_PROTOCOL       = 4,
    EXIT_UPLOAD         = 5,
};

static const char *USAGE =
    "forgelink <command> [argument] [options]\n"
    "Commands:\n"
    "  list              discover printers on the local network\n"
    "  info              print the identification of a printer\n"
    "  status            print the machine state, temperatures and progress\n"
    "  send <file>       upload a .gcode / .gx file, --print starts it\n"
    "  start <name>      print a file already stored on the printer\n"
    "  camera            check the camera stream\n"
    "  watch             status and camera check at once\n";

static void print_descriptor(const PrinterDescriptor &printer)
{
    std::cout << printer;
    if (! printer.firmware_version.empty())
        std::cout << ", firmware " << printer.firmware_version;
    if (printer.discovered_at > 0)
        std::cout << ", seen " << Utils::iso_utc_timestamp(printer.discovered_at);
    std::cout << std::endl;
}

static void print_info(const PrinterInfo &info)
{
    std::cout << "Machine:    " << info.model << std::endl;
    if (! info.name.empty())
        std::cout << "Name:       " << info.name << std::endl;
    std::cout << "Firmware:   " << info.firmware_version << std::endl;
    std::cout << "Serial:     " << info.serial_number << std::endl;
    if (! info.mac_address.empty())
        std::cout << "MAC:        " << info.mac_address << std::endl;
    if (info.tool_count > 0)
        std::cout << "Tools:      " << info.tool_count << std::endl;
    if (info.build_x > 0.)
        std::cout << boost::format("Volume:     %1% x %2% x %3% mm") % info.build_x % info.build_y % info.build_z << std::endl;
}

static void print_status(const MachineStatus &status)
{
    std::cout << "State:      " << to_string(status.state);
    if (status.state == DeviceState::Unknown && ! status.raw_state.empty())
        std::cout << " (" << status.raw_state << ")";
    std::cout << std::endl;
    std::cout << boost::format("Nozzle:     %.1f / %.1f C") % status.nozzle_temp_current % status.nozzle_temp_target << std::endl;
    std::cout << boost::format("Bed:        %.1f / %.1f C") % status.bed_temp_current % status.bed_temp_target << std::endl;
    if (status.active_file_name)
        std::cout << "File:       " << *status.active_file_name << std::endl;
    if (status.is_printing()) {
        std::cout << boost::format("Progress:   %1$.0f%% (%2% / %3%)") % status.progress_percent
            % format_memsize(size_t(status.bytes_printed)) % format_memsize(size_t(status.bytes_total)) << std::endl;
        if (status.total_layers > 0)
            std::cout << "Layer:      " << status.current_layer << " / " << status.total_layers << std::endl;
    }
}

static void print_camera(const CameraProbeResult &camera)
{
    std::cout << "Camera:     " << (camera.available ? "available" : "unavailable");
    if (camera.last_latency_ms)
        std::cout << ", " << *camera.last_latency_ms << " ms";
    std::cout << " after " << camera.attempts << " attempt(s)" << std::endl;
    std::cout << "Stream:     " << camera.stream_url << std::endl;
    std::cout << "Snapshot:   " << camera.snapshot_url << std::endl;
    if (! camera.available && ! camera.error.empty())
        std::cout << "Reason:     " << camera.error << std::endl;
}

static PrinterDescriptor resolve_printer(const AppConfig &config, std::shared_ptr<Transport> transport)
{
    const std::string ip = config.printer_ip();
    if (! ip.empty())
        return PrinterDescriptor::from_address(ip, config.control_port());
    Dashboard dashboard(transport, config.discovery_params(), config.session_params(), config.camera_params(), config.dashboard_params());
    return dashboard.select_printer();
}

static int run_command(const std::string &command, const std::string &argument, bool start_after_upload, const AppConfig &config)
{
    auto transport = std::make_shared<AsioTransport>();

    if (command == "list") {
        PrinterDiscovery discovery(transport, config.discovery_params());
        const std::vector<PrinterDescriptor> printers = discovery.discover_with_info(config.discovery_timeout(), config.session_params());
        if (printers.empty())
            std::cout << "No printers found." << std::endl;
        for (const PrinterDescriptor &printer : printers)
            print_descriptor(printer);
        return EXIT_OK;
    }

    if (command == "watch") {
        std::optional<PrinterDescriptor> printer;
        if (! config.printer_ip().empty())
            printer = PrinterDescriptor::from_address(config.printer_ip(), config.control_port());
        Dashboard dashboard(transport, config.discovery_params(), config.session_params(), config.camera_params(), config.dashboard_params());
        const DashboardView view = dashboard.watch(printer);
        std::cout << "Printer:    " << view.descriptor << std::endl;
        std::cout << "Checked:    " << Utils::time2str(Utils::TimeZone::local, Utils::TimeFormat::display) << std::endl;
        if (view.info)
            print_info(*view.info);
        else if (! view.info_error.empty())
            std::cout << "Info:       " << view.info_error << std::endl;
        if (view.status)
            print_status(*view.status);
        else
            std::cout << "Status:     " << view.status_error << std::endl;
        print_camera(view.camera);
        return view.status ? EXIT_OK : EXIT_CONNECTION;
    }

    const PrinterDescriptor printer = resolve_printer(config, transport);

    if (command == "camera") {
        const CameraProbeResult camera = CameraProbe(transport, config.camera_params()).probe(printer);
        print_camera(camera);
        return camera.available ? EXIT_OK : EXIT_CONNECTION;
    }

    if (command == "send") {
        if (argument.empty())
            throw LogicError("send expects the file to upload");
        UploadJob job = UploadJob::from_file(argument, start_after_upload);
        std::unique_ptr<ControlSession> session = ControlSession::connect(transport, printer, config.session_params());
        UploadTransfer transfer = JobUploader().upload(*session, std::move(job));
        int last_percent = -10;
        const UploadJob &done = transfer.run([&last_percent](const UploadProgress &progress) {
            int percent = int(progress.percent());
            if (percent / 10 != last_percent / 10) {
                std::cout << boost::format("Uploading... %1%%% (%2% / %3%)") % percent % format_memsize(progress.bytes_sent) % format_memsize(progress.bytes_total) << std::endl;
                last_percent = percent;
            }
        });
        std::cout << "Upload of " << done.remote_file_name << " " << to_string(done.state) << "." << std::endl;
        session->close();
        return EXIT_OK;
    }

    std::unique_ptr<ControlSession> session = ControlSession::connect(transport, printer, config.session_params());
    if (command == "info") {
        print_info(session->info());
    } else if (command == "status") {
        print_status(session->status());
    } else if (command == "start") {
        if (argument.empty())
            throw LogicError("start expects the name of a file stored on the printer");
        session->start_print(argument);
        std::cout << "Started " << argument << "." << std::endl;
    } else {
        throw LogicError("Unknown command: " + command);
    }
    session->close();
    return EXIT_OK;
}

int main(int argc, char *argv[])
{
    boost::nowide::args nowide_args(argc, argv);

    po::options_description desc(std::string(FORGELINK_APP_NAME " " FORGELINK_VERSION "\nUsage: ") + USAGE + "Options");
    // clang-format off
    desc.add_options()("help,h", "help")
    ("ip,i", po::value<std::string>(), "Printer address. Optional, the printer is discovered if not specified")
    ("port,p", po::value<int>(), "Control port. Optional, default is 8899")
    ("timeout,t", po::value<int>(), "Discovery timeout in milliseconds")
    ("print", po::bool_switch()->default_value(false), "Start printing once the upload completes")
    ("config,c", po::value<std::string>(), "INI file with [network], [camera], [discovery] and [log] settings")
    ("log_file", po::value<std::string>(), "Also write the log to this file, in the data directory")
    ("datadir", po::value<std::string>()->default_value("."), "Data directory holding the log folder")
    ("log_level,l", po::value<std::string>(), "Log level, 0..5 or fatal, error, warning, info, debug, trace. Optional, default is 2 (warning).");
    po::options_description hidden;
    hidden.add_options()
    ("command", po::value<std::string>(), "command")
    ("argument", po::value<std::string>()->default_value(""), "argument");
    // clang-format on
    po::options_description all;
    all.add(desc).add(hidden);
    po::positional_options_description positional;
    positional.add("command", 1).add("argument", 1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), vm);

        if (vm.count("help") || ! vm.count("command")) {
            std::cout << desc << "\n";
            return EXIT_USAGE;
        }

        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << desc << "\n";
        return EXIT_USAGE;
    }

    AppConfig config;
    try {
        if (vm.count("config")) {
            const std::string error = config.load(vm["config"].as<std::string>());
            if (! error.empty()) {
                std::cerr << "Error: " << error << "\n";
                return EXIT_USAGE;
            }
        }
        config.load_environment();
        if (vm.count("ip"))
            config.set("network", "printer_ip", vm["ip"].as<std::string>());
        if (vm.count("port"))
            config.set("network", "control_port", std::to_string(vm["port"].as<int>()));
        if (vm.count("timeout")) {
            config.set("discovery", "discovery_timeout_ms", std::to_string(vm["timeout"].as<int>()));
            config.set("discovery", "dashboard_discovery_timeout_ms", std::to_string(vm["timeout"].as<int>()));
        }
        if (vm.count("log_level"))
            config.set("log", "log_level", vm["log_level"].as<std::string>());

        set_data_dir(vm["datadir"].as<std::string>());
        if (vm.count("log_file"))
            set_log_path_and_level(vm["log_file"].as<std::string>(), config.log_level());
        else
            set_logging_level(config.log_level());
    } catch (const ConfigError &ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return EXIT_USAGE;
    } catch (const FileIOError &ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return EXIT_USAGE;
    }

    const std::string command = vm["command"].as<std::string>();
    BOOST_LOG_TRIVIAL(info) << FORGELINK_APP_NAME << " " << FORGELINK_VERSION << " " << command << ", log level " << get_string_logging_level(get_logging_level());

    int exit_code = EXIT_OK;
    try {
        exit_code = run_command(command, vm["argument"].as<std::string>(), vm["print"].as<bool>(), config);
    } catch (const DeviceSelectionError &ex) {
        std::cerr << ex.what() << "\n";
        exit_code = EXIT_NO_DEVICE;
    } catch (const UploadError &ex) {
        std::cerr << "Upload failed: " << ex.what() << "\n";
        exit_code = EXIT_UPLOAD;
    } catch (const FileIOError &ex) {
        std::cerr << ex.what() << "\n";
        exit_code = EXIT_UPLOAD;
    } catch (const IOError &ex) {
        std::cerr << "Connection failed: " << ex.what() << "\n";
        exit_code = EXIT_CONNECTION;
    } catch (const ProtocolError &ex) {
        std::cerr << "Unexpected reply: " << ex.what() << "\n";
        exit_code = EXIT_PROTOCOL;
    } catch (const RemoteRejectedError &ex) {
        std::cerr << "Printer refused: " << ex.what() << "\n";
        exit_code = EXIT_PROTOCOL;
    } catch (const LogicError &ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        std::cerr << desc << "\n";
        exit_code = EXIT_USAGE;
    }
    flush_logs();
    return exit_code;
}
