#pragma once
#include "seglink.hpp"
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace seglink {

// Root of every error the library throws.
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// I/O failure, timeout, or premature close on the underlying stream.
class TransportError : public Error {
public:
  using Error::Error;
};

// Operation attempted on a Session without an attached transport.
class NotConnectedError : public Error {
public:
  using Error::Error;
};

// Retry budget for a single segment exhausted.
class LinkUnreliableError : public Error {
public:
  using Error::Error;
};

// Peer sent a header that breaks the segment invariants.
class MalformedSegmentError : public Error {
public:
  using Error::Error;
};

void ensure(bool ok, const char* msg);
void ensure_io(bool ok, const char* msg);
void ensure_wire(bool ok, const char* msg);

void rand_bytes(std::uint8_t* out, std::size_t n);
Bytes rand_bytes(std::size_t n);

Bytes sha256(const std::uint8_t* data, std::size_t n);
Bytes sha256(const Bytes& data);

std::string to_hex(const std::uint8_t* data, std::size_t n);

bool parse_host_port(const std::string& s, std::string& host, std::uint16_t& port);

bool read_file(const std::string& path, Bytes& out);
bool write_file(const std::string& path, const Bytes& data);

} // namespace seglink
