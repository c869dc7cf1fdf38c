/* This file is part of TPU Turbo project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TPU_TURBO_SOLANA_TRANSACTION_HPP
#define TPU_TURBO_SOLANA_TRANSACTION_HPP

#include <variant>
#include <vector>
#include <tt/ed25519.hpp>
#include <tt/solana/types.hpp>

namespace tpu_turbo::solana {
    // Reads the binary transaction wire format; all reads are bounds-checked.
    struct wire_decoder {
        explicit wire_decoder(const buffer &data): _data { data }
        {
        }

        uint8_t u8();
        // compact-u16: up to three bytes, seven bits each, the high bit marks continuation
        uint16_t short_vec();
        buffer bytes(size_t sz);

        template<size_t SZ>
        byte_array<SZ> array()
        {
            return byte_array<SZ> { bytes(SZ) };
        }

        bool eof() const noexcept
        {
            return _pos >= _data.size();
        }

        size_t pos() const noexcept
        {
            return _pos;
        }
    private:
        buffer _data;
        size_t _pos = 0;
    };

    extern void encode_short_vec(uint8_vector &out, size_t len);

    struct message_header {
        uint8_t num_required_signatures = 0;
        uint8_t num_readonly_signed_accounts = 0;
        uint8_t num_readonly_unsigned_accounts = 0;
    };

    struct compiled_instruction {
        uint8_t program_id_index = 0;
        uint8_vector accounts {};
        uint8_vector data {};
    };

    struct address_table_lookup {
        pubkey account_key {};
        uint8_vector writable_indexes {};
        uint8_vector readonly_indexes {};
    };

    struct message {
        static constexpr uint8_t version_prefix_mask = 0x80;

        // empty for the legacy format
        std::optional<uint8_t> version {};
        message_header header {};
        std::vector<pubkey> account_keys {};
        blockhash recent_blockhash {};
        std::vector<compiled_instruction> instructions {};
        std::vector<address_table_lookup> address_table_lookups {};

        static message from_wire(wire_decoder &dec);
        void serialize(uint8_vector &out) const;
        uint8_vector serialize() const;
        std::optional<size_t> signer_index(const pubkey &key) const;
        // Returns the index of the key, inserting it into the section matching its role and remapping instruction indices.
        uint8_t add_account(const pubkey &key, bool signer, bool writable);
    };

    struct keypair {
        ed25519::skey secret {};
        pubkey public_key {};

        static keypair from_seed(const buffer &seed);
    };
    using signer_list = std::vector<keypair>;

    struct nonce_info {
        // the current value stored in the durable nonce account
        blockhash nonce {};
        pubkey nonce_account {};
        pubkey authority {};
    };

    struct legacy_transaction {
        std::vector<signature> signatures {};
        message msg {};
        std::optional<nonce_info> nonce {};

        // With a nonce, makes sure the message starts with the AdvanceNonceAccount instruction and uses the nonce as its blockhash.
        void sign(const signer_list &signers);
        uint8_vector serialize() const;
    };

    struct versioned_transaction {
        std::vector<signature> signatures {};
        message msg {};

        uint8_vector serialize() const;
    };

    using transaction = std::variant<legacy_transaction, versioned_transaction>;

    // Inspects the message prefix once to pick the format; throws on truncated or trailing data.
    extern transaction parse_transaction(const buffer &bytes);
    extern uint8_vector serialize(const transaction &tx);
    extern const signature &first_signature(const transaction &tx);
    extern signature first_signature(const buffer &raw_tx);
}

#endif // !TPU_TURBO_SOLANA_TRANSACTION_HPP
