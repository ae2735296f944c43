#include "cli/cli.hpp"
#include "logger/logger.hpp"
#include "node/local_network.hpp"
#include <iostream>
#include <string>
#include <unordered_set>

struct ProgramOptions {
  size_t nodes{8};
  size_t min_chunk_size{1024};
  size_t max_chunk_size{1024 * 1024};
  size_t k{20};
  size_t replication{5};
  std::string store_dir;
  std::string log_file{"xornet.log"};
  std::string log_level{"info"};
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " [options]\n"
        << "Options:\n"
        << "  -n, --nodes <count>        Nodes in the local network (default 8)\n"
        << "  --min-chunk <bytes>        Minimum chunk size (default 1024)\n"
        << "  --max-chunk <bytes>        Maximum chunk size (default 1048576)\n"
        << "  -k, --bucket-size <count>  Routing bucket capacity (default 20)\n"
        << "  -r, --replication <count>  Replicas per chunk (default 5)\n"
        << "  -s, --store-dir <path>     Keep replicas on disk under <path>\n"
        << "  -l, --log-file <path>      Log file (default xornet.log)\n"
        << "  --log-level <level>        trace, debug, info, warning, error or fatal\n"
        << "Example: " << program_name << " -n 12 -r 3 -s /tmp/xornet\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_set<std::string> flags = {
    "-n", "--nodes", "--min-chunk", "--max-chunk", "-k", "--bucket-size",
    "-r", "--replication", "-s", "--store-dir", "-l", "--log-file", "--log-level"
  };

  ProgramOptions options;
  if (argc % 2 == 0) {
    std::cerr << "Error: Every option needs a value\n";
    print_usage(argv[0]);
    return options;
  }

  for (int i = 1; i < argc - 1; i += 2) {
    const std::string flag(argv[i]);
    const std::string value(argv[i + 1]);

    if (flags.count(flag) == 0) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }

    try {
      if (flag == "-n" || flag == "--nodes") {
        options.nodes = std::stoul(value);
      } else if (flag == "--min-chunk") {
        options.min_chunk_size = std::stoul(value);
      } else if (flag == "--max-chunk") {
        options.max_chunk_size = std::stoul(value);
      } else if (flag == "-k" || flag == "--bucket-size") {
        options.k = std::stoul(value);
      } else if (flag == "-r" || flag == "--replication") {
        options.replication = std::stoul(value);
      } else if (flag == "-s" || flag == "--store-dir") {
        options.store_dir = value;
      } else if (flag == "-l" || flag == "--log-file") {
        options.log_file = value;
      } else if (flag == "--log-level") {
        options.log_level = value;
      }
    } catch (const std::exception&) {
      std::cerr << "Error: Invalid number for " << flag << ": " << value << '\n';
      print_usage(argv[0]);
      return options;
    }
  }

  if (options.nodes < 2) {
    std::cerr << "Error: At least two nodes are required\n";
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

bool run_network(const ProgramOptions& options) {
  try {
    xornet::logger::init_logging(options.log_file, xornet::logger::parse_severity(options.log_level));

    xornet::node::NodeConfig config;
    config.chunker.min_chunk_size = options.min_chunk_size;
    config.chunker.max_chunk_size = options.max_chunk_size;
    config.routing.k = options.k;
    config.replication = options.replication;

    xornet::node::LocalNetwork network(options.nodes, config, options.store_dir);
    xornet::cli::CLI cli(network);

    std::cout << "Started " << network.size() << " nodes, type 'help' for commands\n";
    cli.run();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start network: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (const auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else if (!run_network(options)) {
    return 1;
  }
  return 0;
}
