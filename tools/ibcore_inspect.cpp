// Decode hex-encoded wire objects, or print the canonical encoding of defaults.
//
//   ibcore_inspect decode <kind> <hex>
//   ibcore_inspect default <kind>
//
// kind: connection_end | channel_end | packet | packet_ack | proof_bundle |
//       version | connection_counterparty | channel_counterparty
//
// Exit status: 0 ok, 1 decode failure, 2 usage error.

#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "ibcore/objects.hpp"

using namespace ibcore;

namespace {

int usage() {
    std::cerr << "usage: ibcore_inspect decode <kind> <hex>\n"
              << "       ibcore_inspect default <kind>\n"
              << "kinds: connection_end channel_end packet packet_ack proof_bundle version\n"
              << "       connection_counterparty channel_counterparty\n";
    return 2;
}

std::optional<std::vector<std::uint8_t>> parse_hex(std::string_view s) {
    if (s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) s.remove_prefix(2);
    if (s.size() % 2 != 0) return std::nullopt;
    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };
    std::vector<std::uint8_t> out;
    out.reserve(s.size() / 2);
    for (std::size_t i = 0; i < s.size(); i += 2) {
        const int hi = nibble(s[i]);
        const int lo = nibble(s[i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    return out;
}

template <typename T>
int run(bool decode_mode, const std::vector<std::uint8_t>& bytes) {
    if (!decode_mode) {
        std::cout << "0x" << to_hex(object::encode(T{})) << "\n";
        return 0;
    }
    auto v = object::decode<T>(bytes);
    if (!v) {
        const auto& e = v.error();
        std::cerr << "error: " << core::to_string(e.code) << " (" << int(core::to_int(e.code)) << "): "
                  << e.component << ": " << e.message << "\n";
        return 1;
    }
    std::cout << *v << "\n";
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 3) return usage();
    const std::string_view mode = argv[1];
    const std::string_view kind = argv[2];

    bool decode_mode = false;
    std::vector<std::uint8_t> bytes;
    if (mode == "decode") {
        if (argc != 4) return usage();
        auto parsed = parse_hex(argv[3]);
        if (!parsed) {
            std::cerr << "invalid hex input\n";
            return 2;
        }
        bytes = std::move(*parsed);
        decode_mode = true;
    } else if (mode != "default" || argc != 3) {
        return usage();
    }

    if (kind == "connection_end") return run<object::ConnectionEnd>(decode_mode, bytes);
    if (kind == "channel_end") return run<object::ChannelEnd>(decode_mode, bytes);
    if (kind == "packet") return run<object::Packet>(decode_mode, bytes);
    if (kind == "packet_ack") return run<object::PacketAck>(decode_mode, bytes);
    if (kind == "proof_bundle") return run<object::ProofBundle>(decode_mode, bytes);
    if (kind == "version") return run<object::Version>(decode_mode, bytes);
    if (kind == "connection_counterparty") return run<object::ConnectionCounterparty>(decode_mode, bytes);
    if (kind == "channel_counterparty") return run<object::ChannelCounterparty>(decode_mode, bytes);
    return usage();
}
