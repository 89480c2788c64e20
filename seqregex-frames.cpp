#include "seqregex/seqregex.hpp"

#include <cstdint>
#include <cstdlib>
#include <format>
#include <fstream>
#include <iostream>
#include <iterator>
#include <print>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
using Byte = std::uint8_t;

auto read_bytes(std::string const &path) -> std::vector<Byte> {
  std::ifstream file{path, std::ios::binary};
  if (not file) {
    throw std::runtime_error(std::format("Cannot open '{}'", path));
  }
  return std::vector<Byte>(std::istreambuf_iterator<char>{file},
                           std::istreambuf_iterator<char>{});
}

auto to_hex(std::span<Byte const> payload) -> std::string {
  std::string result;
  for (auto byte : payload) {
    if (not result.empty()) {
      result += ' ';
    }
    result += std::format("{:02x}", byte);
  }
  return result;
}
} // namespace

int main(int argc, char *argv[]) {
  if (argc != 2) {
    std::println(std::cerr, "Usage: seqregex-frames <file>");
    return EXIT_FAILURE;
  }

  std::vector<Byte> bytes;
  try {
    bytes = read_bytes(argv[1]);
  } catch (std::runtime_error const &error) {
    std::println(std::cerr, "Error: {}", error.what());
    return EXIT_FAILURE;
  }

  // The first byte of each frame is the length of the payload after it
  seqregex::Pattern<Byte> const frame = [](seqregex::Match<Byte> const &m) {
    return m[0] + 1;
  };

  size_t covered = 0;
  for (auto const &match : seqregex::finditer(frame, bytes)) {
    if (match.start_index() != covered) {
      break;
    }
    std::println("{:>8} {:>3} {}", match.start_index(), match.size() - 1,
                 to_hex(match.matched().subspan(1)));
    covered = match.end_index();
  }

  if (covered != bytes.size()) {
    std::println(std::cerr,
                 "Error: truncated frame at offset {} (needs {} bytes, {} left)",
                 covered, bytes[covered] + 1, bytes.size() - covered);
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
