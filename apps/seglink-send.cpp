#include "seglink/checksum.hpp"
#include "seglink/logging.hpp"
#include "seglink/session.hpp"
#include "seglink/util.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

using namespace seglink;

static void usage() {
  std::cerr << "Usage:\n";
  std::cerr << "  seglink-send <host> <port> <file> [checksum] [segment_size]\n\n";
  std::cerr << "checksum:\n";
  std::cerr << "  crc32   = IEEE CRC-32 (default)\n";
  std::cerr << "  sha256  = truncated SHA-256\n";
  std::cerr << "  none    = no integrity check\n\n";
  std::cerr << "Example:\n";
  std::cerr << "  seglink-send 127.0.0.1 4444 payload.bin crc32 1024\n";
}

int main(int argc, char** argv) {
  if (argc < 4 || argc > 6) {
    usage();
    return 1;
  }

  const std::string host = argv[1];
  const std::uint16_t port = (std::uint16_t)std::stoi(argv[2]);
  const std::string path = argv[3];
  const std::string checksum_name = argc >= 5 ? argv[4] : "crc32";

  if (const char* lvl = std::getenv("SEGLINK_LOG")) {
    LogLevel level = LogLevel::INFO;
    if (parse_log_level(lvl, level)) Logger::instance().set_level(level);
  }

  try {
    LinkConfig cfg;
    if (argc == 6) cfg.segment_size = (std::size_t)std::stoul(argv[5]);

    Bytes data;
    ensure(read_file(path, data), "failed to read input file");

    Session sess(cfg, make_checksum(checksum_name));
    sess.connect(host, port);
    std::cerr << "[send] connected\n";

    sess.send(data);

    std::cerr << "[send] " << data.size() << " bytes in " << sess.stats().segments_sent
              << " segments, " << sess.stats().retransmissions << " resent\n";
    sess.close();
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "[send] error: " << e.what() << "\n";
    return 1;
  }
}
