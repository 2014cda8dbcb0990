#include "application.hpp"
#include "network/real_transport.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <iostream> // Keep for CLI output and early errors before logger initialized

void print_usage(std::ostream &out, const char *program_name) {
  out << "bacnet-cli - BACnet/IP client\n\n"
      << "Usage:\n"
      << "  " << program_name << " [options] <ip:port> <object-type> <instance>\n"
      << "  " << program_name << " [options] discover <broadcast-ip:port>\n"
      << "  " << program_name << " [options] whois <ip:port>\n"
      << "\n"
      << "Object types: analog-input, analog-value, binary-output, device, ... or a number\n"
      << "\n"
      << "Property options:\n"
      << "  --property=<id>          Property identifier (default: 85, present-value)\n"
      << "  --write-value=<json>     Write this value instead of reading (true, 21.5, 3)\n"
      << "  --write-type=<type>      boolean, real, enumerated, enumerated-binary\n"
      << "  --priority=<1-16>        Write priority (requires --write-value)\n"
      << "  --priority-array         Print the priority array of the object\n"
      << "  --clear-priority=<1-16>  Relinquish present-value at this priority\n"
      << "  --timeout=<ms>           Reply timeout (default: 5000)\n"
      << "\n"
      << "Discovery options:\n"
      << "  --duration=<s>           Stop after no reply for this long (default: 120)\n"
      << "  --json                   Print one JSON object per device\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>       Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                           Default: warn\n"
      << "  --debug=<component>      Enable trace logging for specific component(s)\n"
      << "                           Components: network, discovery, codec, app, all\n"
      << "                           Can be comma-separated: --debug=network,codec\n"
      << "\n"
      << "Other:\n"
      << "  --version                Show version information\n"
      << "  --help                   Show this help message\n"
      << std::endl;
}

int main(int argc, char *argv[]) {
  try {
    std::vector<std::string> args(argv + 1, argv + argc);

    bacnet::app::ParseResult parsed;
    try {
      parsed = bacnet::app::ParseArguments(args);
    } catch (const bacnet::app::UsageError &e) {
      std::cerr << "Error: " << e.what() << "\n\n";
      print_usage(std::cerr, argv[0]);
      return 1;
    }

    if (parsed.action == bacnet::app::ParseResult::Action::Help) {
      print_usage(std::cout, argv[0]);
      return 0;
    }
    if (parsed.action == bacnet::app::ParseResult::Action::Version) {
      std::cout << bacnet::GetFullVersionString() << std::endl;
      std::cout << bacnet::GetCopyrightString() << std::endl;
      return 0;
    }

    const auto &config = parsed.config;
    bacnet::util::LogManager::Initialize(config.log_level);

    // Apply component-specific debug levels
    for (const auto &component : config.debug_components) {
      if (component == "all") {
        bacnet::util::LogManager::SetLogLevel("trace");
      } else if (component == "net") {
        bacnet::util::LogManager::SetComponentLevel("network", "trace");
      } else if (!bacnet::util::LogManager::SetComponentLevel(component, "trace")) {
        std::cerr << "WARNING: unknown debug component: " << component << std::endl;
      }
    }

    // IMPORTANT: Use nested scope so the factory joins its IO threads before
    // LogManager::Shutdown()
    {
      bacnet::network::UdpTransportFactory factory(1);
      factory.run();

      bacnet::app::Application app(config, factory, std::cout);
      app.run();
    }

    bacnet::util::LogManager::Shutdown();
    return 0;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Error: " << e.what() << std::endl;
    bacnet::util::LogManager::Shutdown();
    return 1;
  }
}
