/* This file is part of TPU Turbo project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <algorithm>
#include <limits>
#include <tt/base58.hpp>
#include <tt/solana/transaction.hpp>

namespace tpu_turbo::solana {
    uint8_t wire_decoder::u8()
    {
        if (_pos >= _data.size())
            throw error("unexpected end of transaction data at offset {}", _pos);
        return _data[_pos++];
    }

    uint16_t wire_decoder::short_vec()
    {
        uint32_t val = 0;
        for (size_t i = 0; i < 3; ++i) {
            const auto b = u8();
            if (i > 0 && b == 0)
                throw error("non-canonical compact-u16 encoding at offset {}", _pos - 1);
            if (i == 2 && b > 0x03)
                throw error("compact-u16 value overflow at offset {}", _pos - 1);
            val |= static_cast<uint32_t>(b & 0x7F) << (i * 7);
            if ((b & 0x80) == 0)
                return static_cast<uint16_t>(val);
        }
        throw error("compact-u16 value overflow at offset {}", _pos);
    }

    buffer wire_decoder::bytes(const size_t sz)
    {
        if (sz > _data.size() - std::min(_pos, _data.size()))
            throw error("transaction data is truncated: need {} bytes at offset {} but only {} remain", sz, _pos, _data.size() - _pos);
        const auto res = _data.subbuf(_pos, sz);
        _pos += sz;
        return res;
    }

    void encode_short_vec(uint8_vector &out, size_t len)
    {
        if (len > std::numeric_limits<uint16_t>::max())
            throw error("compact-u16 length is too large: {}", len);
        for (;;) {
            uint8_t b = len & 0x7F;
            len >>= 7;
            if (len == 0) {
                out << b;
                break;
            }
            out << static_cast<uint8_t>(b | 0x80);
        }
    }

    static uint8_vector read_byte_list(wire_decoder &dec)
    {
        const auto sz = dec.short_vec();
        return uint8_vector { dec.bytes(sz) };
    }

    static void write_byte_list(uint8_vector &out, const uint8_vector &bytes)
    {
        encode_short_vec(out, bytes.size());
        out << static_cast<buffer>(bytes);
    }

    message message::from_wire(wire_decoder &dec)
    {
        message msg {};
        const auto prefix = dec.u8();
        if (prefix & version_prefix_mask) {
            msg.version = prefix & ~version_prefix_mask;
            if (*msg.version != 0)
                throw error("unsupported transaction message version: {}", *msg.version);
            msg.header.num_required_signatures = dec.u8();
        } else {
            msg.header.num_required_signatures = prefix;
        }
        msg.header.num_readonly_signed_accounts = dec.u8();
        msg.header.num_readonly_unsigned_accounts = dec.u8();
        const auto num_keys = dec.short_vec();
        msg.account_keys.reserve(num_keys);
        for (size_t i = 0; i < num_keys; ++i)
            msg.account_keys.emplace_back(dec.array<32>());
        msg.recent_blockhash = dec.array<32>();
        const auto num_instrs = dec.short_vec();
        msg.instructions.reserve(num_instrs);
        for (size_t i = 0; i < num_instrs; ++i) {
            auto &instr = msg.instructions.emplace_back();
            instr.program_id_index = dec.u8();
            instr.accounts = read_byte_list(dec);
            instr.data = read_byte_list(dec);
        }
        if (msg.version) {
            const auto num_lookups = dec.short_vec();
            msg.address_table_lookups.reserve(num_lookups);
            for (size_t i = 0; i < num_lookups; ++i) {
                auto &lookup = msg.address_table_lookups.emplace_back();
                lookup.account_key = dec.array<32>();
                lookup.writable_indexes = read_byte_list(dec);
                lookup.readonly_indexes = read_byte_list(dec);
            }
        }
        return msg;
    }

    void message::serialize(uint8_vector &out) const
    {
        if (version)
            out << static_cast<uint8_t>(version_prefix_mask | *version);
        out << header.num_required_signatures << header.num_readonly_signed_accounts << header.num_readonly_unsigned_accounts;
        encode_short_vec(out, account_keys.size());
        for (const auto &key: account_keys)
            out << static_cast<buffer>(key);
        out << static_cast<buffer>(recent_blockhash);
        encode_short_vec(out, instructions.size());
        for (const auto &instr: instructions) {
            out << instr.program_id_index;
            write_byte_list(out, instr.accounts);
            write_byte_list(out, instr.data);
        }
        if (version) {
            encode_short_vec(out, address_table_lookups.size());
            for (const auto &lookup: address_table_lookups) {
                out << static_cast<buffer>(lookup.account_key);
                write_byte_list(out, lookup.writable_indexes);
                write_byte_list(out, lookup.readonly_indexes);
            }
        }
    }

    uint8_vector message::serialize() const
    {
        uint8_vector out {};
        serialize(out);
        return out;
    }

    std::optional<size_t> message::signer_index(const pubkey &key) const
    {
        const auto num_signers = std::min(static_cast<size_t>(header.num_required_signatures), account_keys.size());
        const auto end = account_keys.begin() + static_cast<std::ptrdiff_t>(num_signers);
        if (const auto it = std::find(account_keys.begin(), end, key); it != end)
            return static_cast<size_t>(it - account_keys.begin());
        return {};
    }

    uint8_t message::add_account(const pubkey &key, const bool signer, const bool writable)
    {
        const size_t num_keys = account_keys.size();
        const size_t num_signed = header.num_required_signatures;
        const size_t num_signed_ro = header.num_readonly_signed_accounts;
        const size_t num_unsigned_ro = header.num_readonly_unsigned_accounts;
        if (num_signed > num_keys || num_signed_ro > num_signed || num_unsigned_ro > num_keys - num_signed)
            throw error("the message header is inconsistent with its {} account keys", num_keys);
        if (const auto it = std::find(account_keys.begin(), account_keys.end(), key); it != account_keys.end()) {
            const auto idx = static_cast<size_t>(it - account_keys.begin());
            const bool is_signer = idx < num_signed;
            const bool is_writable = is_signer ? idx < num_signed - num_signed_ro : idx < num_keys - num_unsigned_ro;
            if ((signer && !is_signer) || (writable && !is_writable))
                throw error("account {} is already used without the required signer or writable role", base58::encode(key));
            return static_cast<uint8_t>(idx);
        }
        if (num_keys >= 256)
            throw error("a message cannot reference more than 256 accounts");
        size_t pos;
        if (signer) {
            pos = writable ? num_signed - num_signed_ro : num_signed;
            ++header.num_required_signatures;
            if (!writable)
                ++header.num_readonly_signed_accounts;
        } else {
            pos = writable ? num_keys - num_unsigned_ro : num_keys;
            if (!writable)
                ++header.num_readonly_unsigned_accounts;
        }
        account_keys.insert(account_keys.begin() + static_cast<std::ptrdiff_t>(pos), key);
        for (auto &instr: instructions) {
            if (instr.program_id_index >= pos)
                ++instr.program_id_index;
            for (auto &acc: instr.accounts) {
                if (acc >= pos)
                    ++acc;
            }
        }
        return static_cast<uint8_t>(pos);
    }

    static const pubkey &system_program()
    {
        static const pubkey id {};
        return id;
    }

    static const pubkey &recent_blockhashes_sysvar()
    {
        static const auto id = base58::decode_fixed<32>("SysvarRecentB1ockHashes11111111111111111111");
        return id;
    }

    // the system program's AdvanceNonceAccount instruction tag as a little-endian u32
    static const uint8_vector &advance_nonce_data()
    {
        static const auto data = uint8_vector::from_hex("04000000");
        return data;
    }

    static bool starts_with_advance_nonce(const message &msg, const pubkey &nonce_account)
    {
        if (msg.instructions.empty())
            return false;
        const auto &instr = msg.instructions.front();
        const auto &keys = msg.account_keys;
        return instr.program_id_index < keys.size() && keys[instr.program_id_index] == system_program()
            && instr.data == advance_nonce_data() && !instr.accounts.empty()
            && instr.accounts[0] < keys.size() && keys[instr.accounts[0]] == nonce_account;
    }

    static void prepend_advance_nonce(message &msg, const nonce_info &nonce)
    {
        if (starts_with_advance_nonce(msg, nonce.nonce_account))
            return;
        // indices shift with every insertion so they are looked up once all keys are present
        msg.add_account(nonce.authority, true, false);
        msg.add_account(nonce.nonce_account, false, true);
        msg.add_account(recent_blockhashes_sysvar(), false, false);
        msg.add_account(system_program(), false, false);
        compiled_instruction instr {};
        instr.program_id_index = msg.add_account(system_program(), false, false);
        instr.accounts << msg.add_account(nonce.nonce_account, false, true)
            << msg.add_account(recent_blockhashes_sysvar(), false, false)
            << msg.add_account(nonce.authority, true, false);
        instr.data = advance_nonce_data();
        msg.instructions.insert(msg.instructions.begin(), std::move(instr));
    }

    keypair keypair::from_seed(const buffer &seed)
    {
        auto [sk, vk] = ed25519::create_from_seed(seed);
        return keypair { sk, vk };
    }

    static void serialize_signed(uint8_vector &out, const std::vector<signature> &signatures, const message &msg)
    {
        encode_short_vec(out, signatures.size());
        for (const auto &sig: signatures)
            out << static_cast<buffer>(sig);
        msg.serialize(out);
    }

    void legacy_transaction::sign(const signer_list &signers)
    {
        if (msg.version)
            throw error("a legacy transaction cannot carry a versioned message");
        if (nonce) {
            prepend_advance_nonce(msg, *nonce);
            msg.recent_blockhash = nonce->nonce;
        }
        const auto msg_bytes = msg.serialize();
        signatures.resize(msg.header.num_required_signatures);
        for (const auto &kp: signers) {
            const auto idx = msg.signer_index(kp.public_key);
            if (!idx)
                throw error("unknown signer: {}", base58::encode(kp.public_key));
            signatures[*idx] = ed25519::sign(msg_bytes, kp.secret);
        }
        static const signature empty_sig {};
        for (size_t i = 0; i < signatures.size(); ++i) {
            if (signatures[i] == empty_sig)
                throw error("missing signature for a required signer: {}", base58::encode(msg.account_keys.at(i)));
        }
    }

    uint8_vector legacy_transaction::serialize() const
    {
        uint8_vector out {};
        serialize_signed(out, signatures, msg);
        return out;
    }

    uint8_vector versioned_transaction::serialize() const
    {
        uint8_vector out {};
        serialize_signed(out, signatures, msg);
        return out;
    }

    transaction parse_transaction(const buffer &bytes)
    {
        wire_decoder dec { bytes };
        std::vector<signature> signatures(dec.short_vec());
        for (auto &sig: signatures)
            sig = dec.array<64>();
        auto msg = message::from_wire(dec);
        if (!dec.eof())
            throw error("transaction has {} unexpected trailing bytes", bytes.size() - dec.pos());
        if (msg.version)
            return versioned_transaction { std::move(signatures), std::move(msg) };
        return legacy_transaction { std::move(signatures), std::move(msg) };
    }

    uint8_vector serialize(const transaction &tx)
    {
        return std::visit([](const auto &t) { return t.serialize(); }, tx);
    }

    const signature &first_signature(const transaction &tx)
    {
        const auto &sigs = std::visit([](const auto &t) -> const std::vector<signature> & { return t.signatures; }, tx);
        if (sigs.empty())
            throw error("transaction does not have any signatures");
        return sigs.front();
    }

    signature first_signature(const buffer &raw_tx)
    {
        return first_signature(parse_transaction(raw_tx));
    }
}
