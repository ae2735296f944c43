#include "cli/cli.hpp"
#include "encrypt/data_map.hpp"
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>
#include <boost/algorithm/hex.hpp>
#include <boost/log/trivial.hpp>

namespace xornet {
namespace cli {

namespace {

crypto::Bytes read_file(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw std::runtime_error("cannot open " + path);
  }
  return crypto::Bytes(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

void write_file(const std::string& path, const crypto::Bytes& bytes) {
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file) {
    throw std::runtime_error("cannot create " + path);
  }
  file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  if (!file) {
    throw std::runtime_error("failed writing " + path);
  }
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(node::LocalNetwork& network, std::istream& input, std::ostream& output)
  : running_(false)
  , network_(network)
  , input_(input)
  , output_(output) {
  BOOST_LOG_TRIVIAL(info) << "CLI initialized over " << network_.size() << " nodes";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  output_ << "xornet> " << std::flush;

  while (running_ && std::getline(input_, line)) {
    running_ = execute(line);
    if (running_) {
      output_ << "xornet> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}

bool CLI::execute(const std::string& line) {
  std::istringstream iss(line);
  std::string command;
  if (!(iss >> command)) {
    return true;
  }
  if (command == "quit") {
    return false;
  }

  std::vector<std::string> args;
  std::string arg;
  while (iss >> arg) {
    args.push_back(arg);
  }

  process_command(command, args);
  return true;
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, const std::vector<std::string>& args) {
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command << " with " << args.size() << " arguments";

  if (command == "help" && args.empty()) {
    handle_help_command();
  }
  else if (command == "peers" && args.empty()) {
    handle_peers_command();
  }
  else if (command == "upload" && args.size() == 1) {
    handle_upload_command(args[0], false);
  }
  else if (command == "publish" && args.size() == 1) {
    handle_upload_command(args[0], true);
  }
  else if (command == "download" && args.size() == 2) {
    handle_download_command(args[0], args[1]);
  }
  else if (command == "fetch" && args.size() == 2) {
    handle_fetch_command(args[0], args[1]);
  }
  else if ((command == "offline" || command == "online") && args.size() == 1) {
    handle_online_command(args[0], command == "online");
  }
  else {
    output_ << "Unknown command or invalid arguments, try 'help'" << std::endl;
  }
}

void CLI::handle_upload_command(const std::string& filename, bool publish) {
  try {
    crypto::Bytes payload = read_file(filename);
    node::Node& client = network_.node(0);

    if (publish) {
      crypto::ContentAddress address = client.upload_public(payload);
      output_ << "Published " << payload.size() << " bytes at " << address.to_hex() << std::endl;
      return;
    }

    node::UploadResult result = client.upload(payload);
    crypto::Bytes map_bytes = result.data_map.serialize();
    std::string map_file = filename + ".datamap";
    std::ofstream file(map_file, std::ios::trunc);
    if (!file) {
      throw std::runtime_error("cannot create " + map_file);
    }
    boost::algorithm::hex_lower(map_bytes.begin(), map_bytes.end(), std::ostream_iterator<char>(file));

    output_ << "Uploaded " << payload.size() << " bytes in " << result.chunks << " chunks ("
            << result.stored << " replicas" << (result.degraded ? ", degraded" : "") << ")" << std::endl;
    output_ << "Data map written to " << map_file << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error uploading file", e.what());
  }
}

void CLI::handle_download_command(const std::string& map_file, const std::string& out_file) {
  try {
    std::ifstream file(map_file);
    if (!file) {
      throw std::runtime_error("cannot open " + map_file);
    }
    std::string hex;
    file >> hex;

    crypto::Bytes map_bytes;
    boost::algorithm::unhex(hex.begin(), hex.end(), std::back_inserter(map_bytes));
    encrypt::DataMap data_map = encrypt::DataMap::deserialize(map_bytes);

    crypto::Bytes payload = network_.node(0).download(data_map);
    write_file(out_file, payload);
    output_ << "Downloaded " << payload.size() << " bytes to " << out_file << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error downloading file", e.what());
  }
}

void CLI::handle_fetch_command(const std::string& address_hex, const std::string& out_file) {
  try {
    crypto::ContentAddress address = crypto::ContentAddress::from_hex(address_hex);
    crypto::Bytes payload = network_.node(0).download(address);
    write_file(out_file, payload);
    output_ << "Downloaded " << payload.size() << " bytes to " << out_file << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error fetching data map", e.what());
  }
}

void CLI::handle_peers_command() {
  for (size_t i = 0; i < network_.size(); ++i) {
    node::Node& node = network_.node(i);
    output_ << "[" << i << "] " << node.id().short_hex() << " " << node.endpoint()
            << (network_.transport().is_online(node.id()) ? "" : " (offline)")
            << ", " << node.replica_store().count() << " chunks" << std::endl;
  }

  output_ << "Routing table of node 0:" << std::endl;
  for (const auto& bucket : network_.node(0).routing_snapshot()) {
    output_ << "  bucket " << bucket.index << ":";
    for (const auto& peer : bucket.peers) {
      output_ << " " << peer.id.short_hex();
    }
    output_ << std::endl;
  }
}

void CLI::handle_online_command(const std::string& index, bool online) {
  try {
    size_t position = std::stoul(index);
    if (position == 0) {
      output_ << "Node 0 runs this shell and stays online" << std::endl;
      return;
    }
    network_.transport().set_online(network_.node(position).id(), online);
    output_ << "Node " << position << (online ? " is online" : " is offline") << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error changing node state", e.what());
  }
}

void CLI::handle_help_command() {
  output_ << "Available commands:" << std::endl;
  output_ << "  help                     Display this help message" << std::endl;
  output_ << "  peers                    List nodes and node 0's routing table" << std::endl;
  output_ << "  upload <file>            Store <file>, writing its data map to <file>.datamap" << std::endl;
  output_ << "  publish <file>           Store <file> and its data map, printing the map address" << std::endl;
  output_ << "  download <map> <out>     Rebuild the payload of data map file <map> into <out>" << std::endl;
  output_ << "  fetch <address> <out>    Rebuild the payload published at <address> into <out>" << std::endl;
  output_ << "  offline <n>, online <n>  Take node <n> off or back on the network" << std::endl;
  output_ << "  quit                     Exit the shell" << std::endl << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  output_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace xornet
