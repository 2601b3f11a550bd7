#include <spotalloc/core/error.hpp>
#include <spotalloc/core/garage_config.hpp>
#include <spotalloc/core/memory_store.hpp>

#include <spotalloc/algo/garage_availability.hpp>
#include <spotalloc/algo/lane_layout.hpp>
#include <spotalloc/algo/spot_assignment.hpp>

#include <spotalloc/io/audit_writers.hpp>
#include <spotalloc/io/config_loader.hpp>
#include <spotalloc/io/error.hpp>
#include <spotalloc/io/fleet_loader.hpp>
#include <spotalloc/io/report_writers.hpp>

#include <cxxopts.hpp>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {

namespace core = spotalloc::core;
namespace algo = spotalloc::algo;
namespace io = spotalloc::io;

struct Config {
    std::string command;
    std::optional<std::string> config_file;
    std::string fleet_file;
    std::optional<std::string> output_file;
    std::string audit{"text"};
    std::optional<double> length;
    std::optional<std::string> truck;
    std::optional<std::string> exclude;
    std::optional<std::string> garage;
    std::vector<std::pair<std::string, std::string>> assignments;
    std::vector<std::pair<std::string, std::string>> fields;
    std::optional<std::string> user;
    bool verbose{false};
};

std::pair<std::string, std::string> split_pair(const std::string& arg, const char* option) {
    auto eq = arg.find('=');
    if (eq == std::string::npos || eq == 0) {
        std::cerr << "Error: " << option << " must be key=value, got: " << arg << std::endl;
        std::exit(64);
    }
    return {arg.substr(0, eq), arg.substr(eq + 1)};
}

Config parse_args(int argc, char** argv) {
    cxxopts::Options options("spotalloc", "Garage spot allocation tool");

    // clang-format off
    options.add_options()
        ("c,command", "Command: availability|assign|update|layout",
            cxxopts::value<std::string>())
        ("config", "Garage configuration (JSON, default: reference deployment)",
            cxxopts::value<std::string>())
        ("f,fleet", "Fleet snapshot (JSON)", cxxopts::value<std::string>())
        ("o,output", "Write the resulting fleet to this file",
            cxxopts::value<std::string>())
        ("audit", "Audit output on stderr: none|text|json (default: text)",
            cxxopts::value<std::string>()->default_value("text"))
        ("l,length", "Candidate truck length (m)", cxxopts::value<double>())
        ("t,truck", "Truck id", cxxopts::value<std::string>())
        ("exclude", "Truck to leave out of the occupancy", cxxopts::value<std::string>())
        ("g,garage", "Garage id (or 'yard' for the layout command)",
            cxxopts::value<std::string>())
        ("a,assign", "Assignment ID=TOKEN, empty token unparks (repeatable)",
            cxxopts::value<std::vector<std::string>>())
        ("s,set", "Field update field=value, empty value clears (repeatable)",
            cxxopts::value<std::vector<std::string>>())
        ("u,user", "Acting user recorded in the audit trail",
            cxxopts::value<std::string>())
        ("v,verbose", "Verbose stderr output")
        ("h,help", "Show help");
    // clang-format on

    auto result = options.parse(argc, argv);

    if (result.count("help") != 0U) {
        std::cout << options.help() << std::endl;
        std::exit(0);
    }

    if (result.count("command") == 0U) {
        std::cerr << "Error: --command is required" << std::endl;
        std::exit(64);
    }
    if (result.count("fleet") == 0U) {
        std::cerr << "Error: --fleet is required" << std::endl;
        std::exit(64);
    }

    Config config;
    config.command = result["command"].as<std::string>();
    if (config.command != "availability" && config.command != "assign" &&
        config.command != "update" && config.command != "layout") {
        std::cerr << "Error: unknown command: " << config.command << std::endl;
        std::exit(64);
    }
    config.fleet_file = result["fleet"].as<std::string>();
    config.audit = result["audit"].as<std::string>();
    if (config.audit != "none" && config.audit != "text" && config.audit != "json") {
        std::cerr << "Error: --audit must be 'none', 'text' or 'json'" << std::endl;
        std::exit(64);
    }
    config.verbose = result.count("verbose") != 0U;

    if (result.count("config") != 0U) {
        config.config_file = result["config"].as<std::string>();
    }
    if (result.count("output") != 0U) {
        config.output_file = result["output"].as<std::string>();
    }
    if (result.count("length") != 0U) {
        config.length = result["length"].as<double>();
    }
    if (result.count("truck") != 0U) {
        config.truck = result["truck"].as<std::string>();
    }
    if (result.count("exclude") != 0U) {
        config.exclude = result["exclude"].as<std::string>();
    }
    if (result.count("garage") != 0U) {
        config.garage = result["garage"].as<std::string>();
    }
    if (result.count("user") != 0U) {
        config.user = result["user"].as<std::string>();
    }
    if (result.count("assign") != 0U) {
        for (const auto& arg : result["assign"].as<std::vector<std::string>>()) {
            config.assignments.push_back(split_pair(arg, "--assign"));
        }
    }
    if (result.count("set") != 0U) {
        for (const auto& arg : result["set"].as<std::vector<std::string>>()) {
            config.fields.push_back(split_pair(arg, "--set"));
        }
    }

    if (config.command == "availability" && !config.length && !config.truck) {
        std::cerr << "Error: availability needs --length or --truck" << std::endl;
        std::exit(64);
    }
    if (config.command == "assign" && config.assignments.empty()) {
        std::cerr << "Error: assign needs at least one --assign" << std::endl;
        std::exit(64);
    }
    if (config.command == "update" && !config.truck) {
        std::cerr << "Error: update needs --truck" << std::endl;
        std::exit(64);
    }
    if (config.command == "layout" && !config.garage) {
        std::cerr << "Error: layout needs --garage" << std::endl;
        std::exit(64);
    }

    return config;
}

std::unique_ptr<core::AuditRecorder> make_audit_writer(const Config& config) {
    if (config.audit == "json") {
        return std::make_unique<io::JsonAuditWriter>(std::cerr);
    }
    if (config.audit == "text") {
        return std::make_unique<io::TextualAuditWriter>(std::cerr);
    }
    return std::make_unique<io::NullAuditWriter>();
}

std::optional<std::string> nullable_text(const std::string& value) {
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

std::optional<double> nullable_number(const std::string& field, const std::string& value) {
    if (value.empty()) {
        return std::nullopt;
    }
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        std::cerr << "Error: --set " << field << " expects a number, got: " << value
                  << std::endl;
        std::exit(64);
    }
}

algo::TruckPatch make_patch(const Config& config) {
    algo::TruckPatch patch;
    for (const auto& [field, value] : config.fields) {
        if (field == "spot") {
            patch.spot = nullable_text(value);
        } else if (field == "plate") {
            patch.plate = nullable_text(value);
        } else if (field == "chassis") {
            patch.chassis_number = nullable_text(value);
        } else if (field == "category") {
            patch.category = nullable_text(value);
        } else if (field == "implement") {
            patch.implement_type = nullable_text(value);
        } else if (field == "x") {
            patch.x_position = nullable_number(field, value);
        } else if (field == "y") {
            patch.y_position = nullable_number(field, value);
        } else {
            std::cerr << "Error: unknown field for --set: " << field << std::endl;
            std::exit(64);
        }
    }
    return patch;
}

void run_availability(const Config& config, const core::EntityStore& store,
                      const core::GarageConfig& garages) {
    algo::AvailabilityService service(store, garages);

    double length = config.length ? *config.length : service.candidate_length_of(*config.truck);
    // A truck being moved does not count against its own lane
    std::optional<core::TruckId> exclude = config.exclude ? config.exclude : config.truck;

    if (config.verbose) {
        std::cerr << "Candidate length: " << length << " m" << std::endl;
    }

    if (config.garage) {
        io::write_garage_availability(service.garage_availability(*config.garage, length, exclude),
                                      std::cout);
    } else {
        auto all = service.all_garages(length, exclude);
        io::write_availability(all, std::cout);
    }
    std::cout << std::endl;
}

void run_assign(const Config& config, core::EntityStore& store,
                const core::GarageConfig& garages) {
    std::vector<algo::SpotRequest> requests;
    requests.reserve(config.assignments.size());
    for (const auto& [truck_id, token] : config.assignments) {
        requests.push_back(algo::SpotRequest{truck_id, nullable_text(token)});
    }

    algo::SpotAssignmentService service(store, garages);
    auto result = service.batch_update(requests, config.user);

    if (config.verbose) {
        std::cerr << "Updated " << result.updated_count << " trucks, skipped "
                  << result.skipped.size() << ", evicted " << result.evicted.size() << std::endl;
    }

    io::write_batch_result(result, std::cout);
    std::cout << std::endl;
}

void run_update(const Config& config, core::EntityStore& store,
                const core::GarageConfig& garages) {
    algo::SpotAssignmentService service(store, garages);
    auto truck = service.update_truck(*config.truck, make_patch(config), config.user);

    io::write_truck_to_stream(truck, std::cout);
    std::cout << std::endl;
}

void run_layout(const Config& config, const core::InMemoryEntityStore& store,
                const core::GarageConfig& garages) {
    auto trucks = store.trucks();
    if (*config.garage == "yard") {
        io::write_yard_layout(algo::layout_yard(trucks, garages), std::cout);
    } else {
        io::write_garage_layout(algo::layout_garage(*config.garage, trucks, garages), std::cout);
    }
    std::cout << std::endl;
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        auto config = parse_args(argc, argv);

        // 1. Load configuration
        if (config.verbose) {
            std::cerr << "Loading configuration from: "
                      << config.config_file.value_or("<reference>") << std::endl;
        }
        auto garages = config.config_file ? io::load_config(*config.config_file)
                                          : core::GarageConfig::reference();

        // 2. Set up audit output and load the fleet
        auto audit_writer = make_audit_writer(config);
        core::InMemoryEntityStore store(audit_writer.get());

        if (config.verbose) {
            std::cerr << "Loading fleet from: " << config.fleet_file << std::endl;
        }
        auto count = io::load_fleet(store, config.fleet_file, garages);
        if (config.verbose) {
            std::cerr << "Loaded " << count << " trucks" << std::endl;
        }

        // 3. Run the command
        if (config.command == "availability") {
            run_availability(config, store, garages);
        } else if (config.command == "assign") {
            run_assign(config, store, garages);
        } else if (config.command == "update") {
            run_update(config, store, garages);
        } else {
            run_layout(config, store, garages);
        }

        // 4. Write the resulting fleet
        if (config.output_file) {
            io::write_fleet(store, *config.output_file);
            if (config.verbose) {
                std::cerr << "Fleet written to: " << *config.output_file << std::endl;
            }
        }

        return 0;
    }
    catch (const io::LoaderError& e) {
        std::cerr << "Config error: " << e.what() << std::endl;
        return 1;
    }
    catch (const core::ConfigError& e) {
        std::cerr << "Config error: " << e.what() << std::endl;
        return 1;
    }
    catch (const core::NotFoundError& e) {
        std::cerr << "Not found: " << e.what() << std::endl;
        return 3;
    }
    catch (const core::InvalidSpotError& e) {
        std::cerr << "Invalid spot: " << e.what() << std::endl;
        return 4;
    }
    catch (const cxxopts::exceptions::parsing& e) {
        std::cerr << "Invalid args: " << e.what() << std::endl;
        return 64;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
