#include "application.hpp"
#include "network/errors.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <iostream> // Keep for CLI output and early errors before logger initialized

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Options:\n"
      << "  --config=<path>      JSON configuration file (command line overrides it)\n"
      << "  --bind=<address>     Listen address (default: all interfaces)\n"
      << "  --port=<port>        Listen port (default: 2121)\n"
      << "  --cert=<path>        PEM certificate chain for TLS\n"
      << "  --key=<path>         PEM private key for TLS\n"
      << "  --implicit-tls       Encrypt every connection from the first byte\n"
      << "  --threads=<n>        I/O threads (1-64, default: 1)\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                       Default: info\n"
      << "  --logfile=<path>     Log to a rotating file instead of stdout\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: network, relay, tls, auth, app, all\n"
      << "                       Can be comma-separated: --debug=relay,tls\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << std::endl;
}

int main(int argc, char *argv[]) {
  try {
    ftpctl::app::AppConfig config;

    // The config file is applied first so that flags override it, wherever
    // --config appears on the command line
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg.find("--config=") == 0) {
        ftpctl::app::LoadConfigFile(arg.substr(9), config);
      }
    }

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << ftpctl::GetFullVersionString() << std::endl;
        std::cout << ftpctl::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--config=") == 0) {
        // Already applied
      } else if (arg.find("--bind=") == 0) {
        config.bind_address = arg.substr(7);
      } else if (arg.find("--port=") == 0) {
        auto port_opt = ftpctl::util::SafeParsePort(arg.substr(7));
        if (!port_opt) {
          std::cerr << "Error: Invalid port number: " << arg.substr(7) << std::endl;
          std::cerr << "Port must be a number between 1 and 65535" << std::endl;
          return 1;
        }
        config.port = *port_opt;
      } else if (arg.find("--cert=") == 0) {
        config.certificate_file = arg.substr(7);
      } else if (arg.find("--key=") == 0) {
        config.private_key_file = arg.substr(6);
      } else if (arg == "--implicit-tls") {
        config.implicit_tls = true;
      } else if (arg.find("--threads=") == 0) {
        auto threads_opt = ftpctl::util::SafeParseInt(arg.substr(10), 1,
                                                      ftpctl::app::MAX_IO_THREADS);
        if (!threads_opt) {
          std::cerr << "Error: Invalid thread count: " << arg.substr(10) << std::endl;
          std::cerr << "Thread count must be a number between 1 and "
                    << ftpctl::app::MAX_IO_THREADS << std::endl;
          return 1;
        }
        config.io_threads = static_cast<size_t>(*threads_opt);
      } else if (arg.find("--loglevel=") == 0) {
        std::string level = arg.substr(11);
        if (!ftpctl::util::IsValidLogLevel(level)) {
          std::cerr << "Error: Invalid log level: " << level << std::endl;
          return 1;
        }
        config.log_level = level;
      } else if (arg.find("--logfile=") == 0) {
        config.log_file = arg.substr(10);
      } else if (arg.find("--debug=") == 0) {
        for (const auto &component : ftpctl::util::SplitList(arg.substr(8))) {
          config.debug_components.push_back(component);
        }
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      }
    }

    ftpctl::util::LogManager::Initialize(config.log_level, !config.log_file.empty(),
                                         config.log_file.string());

    // Apply component-specific debug levels
    for (const auto &component : config.debug_components) {
      if (component == "all") {
        ftpctl::util::LogManager::SetLogLevel("trace");
      } else if (component == "net") {
        ftpctl::util::LogManager::SetComponentLevel("network", "trace");
      } else {
        ftpctl::util::LogManager::SetComponentLevel(component, "trace");
      }
    }

    // IMPORTANT: Use nested scope to ensure app destructor runs before LogManager::Shutdown()
    // so that no relay callback logs through a destroyed logger
    {
      ftpctl::app::Application app(config);

      if (!app.initialize()) {
        LOG_ERROR("Failed to initialize application");
        ftpctl::util::LogManager::Shutdown();
        return 1;
      }

      if (!app.start()) {
        LOG_ERROR("Failed to start application");
        ftpctl::util::LogManager::Shutdown();
        return 1;
      }

      app.wait_for_shutdown();
    }

    ftpctl::util::LogManager::Shutdown();
    return 0;

  } catch (const ftpctl::network::ConfigurationError &e) {
    std::cerr << "Configuration error: " << e.what() << std::endl;
    ftpctl::util::LogManager::Shutdown();
    return 1;
  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    ftpctl::util::LogManager::Shutdown();
    return 1;
  }
}
