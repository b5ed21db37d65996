#include "psbt.hpp"
#include "consts.hpp"
#include "error.hpp"
#include "segwit.hpp"
#include "serialize.hpp"
#include <array>
#include <optional>

namespace cosign {

namespace {

constexpr std::array<uint8_t, 5> PSBT_MAGIC = {0x70, 0x73, 0x62, 0x74, 0xff};

constexpr uint8_t PSBT_GLOBAL_UNSIGNED_TX = 0x00;
constexpr uint8_t PSBT_GLOBAL_PROPRIETARY = 0xFC;
constexpr uint8_t PSBT_IN_WITNESS_UTXO = 0x01;
constexpr uint8_t PSBT_IN_PARTIAL_SIG = 0x02;
constexpr uint8_t PSBT_IN_WITNESS_SCRIPT = 0x05;

constexpr std::string_view PROPRIETARY_ID = "cosign";
constexpr uint8_t PROPRIETARY_WITNESS_SCRIPT = 0x00;

void write_record(std::vector<uint8_t>& out, std::span<const uint8_t> key, std::span<const uint8_t> value) {
    write_var_bytes(out, key);
    write_var_bytes(out, value);
}

std::vector<uint8_t> proprietary_key() {
    std::vector<uint8_t> key{PSBT_GLOBAL_PROPRIETARY};
    write_compact_size(key, PROPRIETARY_ID.size());
    key.insert(key.end(), PROPRIETARY_ID.begin(), PROPRIETARY_ID.end());
    key.push_back(PROPRIETARY_WITNESS_SCRIPT);
    return key;
}

[[noreturn]] void malformed(const std::string& what) {
    throw CosignError(CosignError::ErrorType::Encoding, "Malformed PSBT: " + what);
}

// Parse the legacy unsigned transaction of the global map into the template
void read_unsigned_transaction(std::span<const uint8_t> tx, TxTemplate& tmpl) {
    ByteReader reader(tx);
    if (reader.read_le32() != TX_VERSION) {
        malformed("unexpected transaction version");
    }

    uint64_t input_count = reader.read_compact_size();
    for (uint64_t i = 0; i < input_count; ++i) {
        TemplateInput input;
        input.outpoint.txid_vec = reader.read_bytes(32);
        input.outpoint.index = reader.read_le32();
        if (!reader.read_var_bytes().empty()) {
            malformed("unsigned transaction carries a scriptSig");
        }
        reader.read_le32(); // sequence
        input.amount = 0;
        tmpl.inputs.push_back(std::move(input));
    }

    uint64_t output_count = reader.read_compact_size();
    for (uint64_t i = 0; i < output_count; ++i) {
        TemplateOutput output;
        output.amount = reader.read_le64();
        output.script_pubkey = reader.read_var_bytes();
        tmpl.outputs.push_back(std::move(output));
    }

    reader.read_le32(); // locktime
    if (!reader.empty()) {
        malformed("trailing bytes after unsigned transaction");
    }
}

} // namespace

std::vector<uint8_t> Psbt::unsigned_transaction(const TxTemplate& tmpl) {
    std::vector<uint8_t> tx;
    write_le32(tx, TX_VERSION);

    write_compact_size(tx, tmpl.inputs.size());
    for (const auto& input : tmpl.inputs) {
        write_bytes(tx, Segwit::input_from_outpoint(input.outpoint));
    }

    write_compact_size(tx, tmpl.outputs.size());
    for (const auto& output : tmpl.outputs) {
        write_bytes(tx, Segwit::create_output(output.script_pubkey, output.amount));
    }

    write_le32(tx, TX_LOCKTIME);
    return tx;
}

std::vector<uint8_t> Psbt::serialize(const TxTemplate& tmpl) {
    std::vector<uint8_t> out(PSBT_MAGIC.begin(), PSBT_MAGIC.end());

    // Global map
    const std::vector<uint8_t> tx_key{PSBT_GLOBAL_UNSIGNED_TX};
    write_record(out, tx_key, unsigned_transaction(tmpl));
    write_record(out, proprietary_key(), tmpl.witness_script);
    write_u8(out, 0x00);

    // Input maps
    for (const auto& input : tmpl.inputs) {
        const std::vector<uint8_t> utxo_key{PSBT_IN_WITNESS_UTXO};
        write_record(out, utxo_key, Segwit::create_output(tmpl.script_pubkey, input.amount));

        // std::map keeps signatures sorted by public key, so equal templates
        // serialize to equal bytes
        for (const auto& [pubkey, sig] : input.partial_sigs) {
            std::vector<uint8_t> sig_key{PSBT_IN_PARTIAL_SIG};
            sig_key.insert(sig_key.end(), pubkey.begin(), pubkey.end());
            write_record(out, sig_key, sig);
        }

        const std::vector<uint8_t> script_key{PSBT_IN_WITNESS_SCRIPT};
        write_record(out, script_key, tmpl.witness_script);
        write_u8(out, 0x00);
    }

    // Output maps carry no records
    for (size_t i = 0; i < tmpl.outputs.size(); ++i) {
        write_u8(out, 0x00);
    }
    return out;
}

TxTemplate Psbt::deserialize(std::span<const uint8_t> data) {
    ByteReader reader(data);
    for (uint8_t byte : PSBT_MAGIC) {
        if (reader.read_u8() != byte) {
            malformed("bad magic");
        }
    }

    TxTemplate tmpl;
    bool have_tx = false;
    std::optional<std::vector<uint8_t>> witness_script;

    // Global map
    for (;;) {
        auto key = reader.read_var_bytes();
        if (key.empty()) {
            break;
        }
        auto value = reader.read_var_bytes();
        if (key[0] == PSBT_GLOBAL_UNSIGNED_TX && key.size() == 1) {
            read_unsigned_transaction(value, tmpl);
            have_tx = true;
        } else if (key == proprietary_key()) {
            witness_script = std::move(value);
        }
    }
    if (!have_tx) {
        malformed("missing unsigned transaction");
    }

    for (auto& input : tmpl.inputs) {
        bool have_utxo = false;
        for (;;) {
            auto key = reader.read_var_bytes();
            if (key.empty()) {
                break;
            }
            auto value = reader.read_var_bytes();
            if (key[0] == PSBT_IN_WITNESS_UTXO && key.size() == 1) {
                ByteReader utxo(value);
                input.amount = utxo.read_le64();
                auto script = utxo.read_var_bytes();
                if (tmpl.script_pubkey.empty()) {
                    tmpl.script_pubkey = script;
                } else if (tmpl.script_pubkey != script) {
                    malformed("inputs spend different scripts");
                }
                have_utxo = true;
            } else if (key[0] == PSBT_IN_PARTIAL_SIG && key.size() == 1 + COMPRESSED_PUBKEY_SIZE) {
                input.partial_sigs.emplace(std::vector<uint8_t>(key.begin() + 1, key.end()), std::move(value));
            } else if (key[0] == PSBT_IN_WITNESS_SCRIPT && key.size() == 1) {
                if (witness_script && *witness_script != value) {
                    malformed("inputs use different witness scripts");
                }
                witness_script = std::move(value);
            }
        }
        if (!have_utxo) {
            malformed("input without witness UTXO");
        }
    }

    for (size_t i = 0; i < tmpl.outputs.size(); ++i) {
        for (;;) {
            auto key = reader.read_var_bytes();
            if (key.empty()) {
                break;
            }
            reader.read_var_bytes();
        }
    }

    if (!witness_script) {
        malformed("missing witness script");
    }
    auto multisig = Segwit::parse_witness_script(*witness_script);
    if (!multisig) {
        malformed("witness script is not a multisig script");
    }

    tmpl.m = multisig->m;
    tmpl.public_keys = std::move(multisig->public_keys);
    tmpl.witness_script = std::move(*witness_script);
    auto expected_program = Segwit::get_p2wsh_program(tmpl.witness_script);
    if (!tmpl.script_pubkey.empty() && tmpl.script_pubkey != expected_program) {
        malformed("witness UTXO does not pay to the witness script");
    }
    tmpl.script_pubkey = std::move(expected_program);
    return tmpl;
}

} // namespace cosign
