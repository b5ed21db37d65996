#include "bech32.hpp"
#include "error.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace cosign {

namespace {

constexpr std::array<char, 32> CHARSET = {
    'q', 'p', 'z', 'r', 'y', '9', 'x', '8', 'g', 'f', '2', 't', 'v', 'd', 'w', '0',
    's', '3', 'j', 'n', '5', '4', 'k', 'h', 'c', 'e', '6', 'm', 'u', 'a', '7', 'l'};

constexpr std::array<int, 128> make_decode_map() {
    std::array<int, 128> map{};
    map.fill(-1);
    for (size_t i = 0; i < CHARSET.size(); ++i) {
        map[static_cast<unsigned>(CHARSET[i])] = static_cast<int>(i);
    }
    return map;
}

constexpr auto DECODE_MAP = make_decode_map();
constexpr uint32_t BECH32_CONST = 1;
constexpr uint32_t BECH32M_CONST = 0x2bc830a3;

uint32_t polymod(const std::vector<uint8_t>& values) {
    uint32_t chk = 1;
    for (uint8_t v : values) {
        uint8_t top = chk >> 25;
        chk = (chk & 0x1ffffff) << 5 ^ v;
        if (top & 0x01) chk ^= 0x3b6a57b2;
        if (top & 0x02) chk ^= 0x26508e6d;
        if (top & 0x04) chk ^= 0x1ea119fa;
        if (top & 0x08) chk ^= 0x3d4233dd;
        if (top & 0x10) chk ^= 0x2a1462b3;
    }
    return chk;
}

std::vector<uint8_t> hrp_expand(std::string_view hrp) {
    std::vector<uint8_t> ret;
    ret.reserve(hrp.size() * 2 + 1);
    for (char c : hrp) {
        ret.push_back(static_cast<uint8_t>(std::tolower(static_cast<unsigned char>(c)) >> 5));
    }
    ret.push_back(0);
    for (char c : hrp) {
        ret.push_back(static_cast<uint8_t>(std::tolower(static_cast<unsigned char>(c)) & 0x1f));
    }
    return ret;
}

bool convert_bits(std::vector<uint8_t>& out, int from_bits, int to_bits, bool pad,
                  std::span<const uint8_t> data) {
    uint32_t acc = 0;
    int bits = 0;
    const uint32_t maxv = (1u << to_bits) - 1;
    for (uint8_t value : data) {
        if (value >> from_bits) {
            return false;
        }
        acc = (acc << from_bits) | value;
        bits += from_bits;
        while (bits >= to_bits) {
            bits -= to_bits;
            out.push_back(static_cast<uint8_t>((acc >> bits) & maxv));
        }
    }
    if (pad) {
        if (bits) {
            out.push_back(static_cast<uint8_t>((acc << (to_bits - bits)) & maxv));
        }
    } else if (bits >= from_bits || ((acc << (to_bits - bits)) & maxv)) {
        return false;
    }
    return true;
}

bool iequals(std::string_view a, std::string_view b) {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(), [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) ==
               std::tolower(static_cast<unsigned char>(y));
    });
}

} // namespace

std::string Bech32::encode_segwit(std::string_view hrp, uint8_t witness_version,
                                  std::span<const uint8_t> program) {
    if (hrp.empty() || hrp.size() > 83) {
        throw CosignError(CosignError::ErrorType::Encoding, "Invalid bech32 HRP");
    }
    if (witness_version > 16) {
        throw CosignError(CosignError::ErrorType::Encoding, "Invalid witness version");
    }

    std::vector<uint8_t> data{witness_version};
    if (!convert_bits(data, 8, 5, true, program)) {
        throw CosignError(CosignError::ErrorType::Encoding, "Invalid witness program");
    }

    // Witness v0 keeps the original bech32 constant, later versions use bech32m
    const uint32_t constant = witness_version == 0 ? BECH32_CONST : BECH32M_CONST;

    std::vector<uint8_t> values = hrp_expand(hrp);
    values.insert(values.end(), data.begin(), data.end());
    values.insert(values.end(), 6, 0);
    uint32_t mod = polymod(values) ^ constant;

    std::string ret;
    ret.reserve(hrp.size() + data.size() + 7);
    for (char c : hrp) {
        ret.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    ret.push_back('1');
    for (uint8_t v : data) {
        ret.push_back(CHARSET[v]);
    }
    for (int i = 0; i < 6; ++i) {
        ret.push_back(CHARSET[(mod >> (5 * (5 - i))) & 31]);
    }
    return ret;
}

std::optional<WitnessProgram> Bech32::decode_segwit(std::string_view address,
                                                    std::string_view expected_hrp) {
    if (address.size() < 8 || address.size() > 90) {
        return std::nullopt;
    }
    bool lower = false;
    bool upper = false;
    for (char c : address) {
        if (std::isupper(static_cast<unsigned char>(c))) upper = true;
        if (std::islower(static_cast<unsigned char>(c))) lower = true;
    }
    if (upper && lower) {
        return std::nullopt;
    }

    auto pos = address.rfind('1');
    if (pos == std::string_view::npos || pos == 0 || pos + 7 > address.size()) {
        return std::nullopt;
    }
    std::string hrp;
    for (char c : address.substr(0, pos)) {
        hrp.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (!iequals(hrp, expected_hrp)) {
        return std::nullopt;
    }

    std::vector<uint8_t> data;
    data.reserve(address.size() - pos - 1);
    for (char c : address.substr(pos + 1)) {
        unsigned char uc = static_cast<unsigned char>(std::tolower(static_cast<unsigned char>(c)));
        if (uc > 127 || DECODE_MAP[uc] == -1) {
            return std::nullopt;
        }
        data.push_back(static_cast<uint8_t>(DECODE_MAP[uc]));
    }

    std::vector<uint8_t> values = hrp_expand(hrp);
    values.insert(values.end(), data.begin(), data.end());
    const uint32_t check = polymod(values);

    data.resize(data.size() - 6);
    if (data.empty()) {
        return std::nullopt;
    }

    WitnessProgram result;
    result.version = data.front();
    if (result.version > 16) {
        return std::nullopt;
    }
    const uint32_t expected = result.version == 0 ? BECH32_CONST : BECH32M_CONST;
    if (check != expected) {
        return std::nullopt;
    }

    if (!convert_bits(result.program, 5, 8, false,
                      std::span<const uint8_t>(data.begin() + 1, data.end()))) {
        return std::nullopt;
    }
    if (result.program.size() < 2 || result.program.size() > 40) {
        return std::nullopt;
    }
    if (result.version == 0 && result.program.size() != 20 && result.program.size() != 32) {
        return std::nullopt;
    }
    return result;
}

} // namespace cosign
