#include "seglink/checksum.hpp"
#include "seglink/logging.hpp"
#include "seglink/session.hpp"
#include "seglink/transport.hpp"
#include "seglink/util.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

using namespace seglink;

int main(int argc, char** argv) {
  if (argc < 4 || argc > 5) {
    std::cerr << "Usage: seglink-recv <bind_host> <port> <out_file> [checksum]\n";
    std::cerr << "checksum: crc32 (default), sha256, none\n\n";
    std::cerr << "Example:\n";
    std::cerr << "  seglink-recv 0.0.0.0 4444 received.bin crc32\n";
    return 1;
  }

  const std::string bind_host = argv[1];
  const std::uint16_t port = (std::uint16_t)std::stoi(argv[2]);
  const std::string out_path = argv[3];
  const std::string checksum_name = argc == 5 ? argv[4] : "crc32";

  if (const char* lvl = std::getenv("SEGLINK_LOG")) {
    LogLevel level = LogLevel::INFO;
    if (parse_log_level(lvl, level)) Logger::instance().set_level(level);
  }

  try {
    auto tp = std::make_unique<TcpTransport>();
    tp->listen_and_accept(bind_host, port);
    std::cerr << "[recv] accepted connection\n";

    Session sess(std::move(tp), LinkConfig{}, make_checksum(checksum_name));
    const Bytes& msg = sess.receive();
    ensure(write_file(out_path, msg), "failed to write output file");

    const Bytes digest = sha256(msg);
    std::cerr << "[recv] " << msg.size() << " bytes, sha256 " << to_hex(digest.data(), digest.size()) << "\n";
    std::cerr << "[recv] segments accepted: " << sess.stats().segments_accepted
              << ", integrity failures: " << sess.stats().integrity_failures << "\n";
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "[recv] error: " << e.what() << "\n";
    return 1;
  }
}
