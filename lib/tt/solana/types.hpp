/* This file is part of TPU Turbo project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TPU_TURBO_SOLANA_TYPES_HPP
#define TPU_TURBO_SOLANA_TYPES_HPP

#include <optional>
#include <string>
#include <unordered_map>
#include <tt/array.hpp>
#include <tt/base58.hpp>

namespace tpu_turbo::solana {
    using slot_t = uint64_t;
    using pubkey = byte_array<32>;
    using signature = byte_array<64>;
    using blockhash = byte_array<32>;

    enum class commitment {
        processed, confirmed, finalized
    };

    extern std::string_view commitment_name(commitment c);
    extern commitment commitment_from_name(std::string_view name);

    struct socket_address {
        std::string host {};
        uint16_t port = 0;

        static socket_address from_string(std::string_view text);

        bool operator==(const socket_address &o) const =default;

        std::string to_string() const;
    };

    struct epoch_info {
        uint64_t epoch = 0;
        uint64_t slot_index = 0;
        uint64_t slots_in_epoch = 0;
        slot_t absolute_slot = 0;
    };

    struct contact_info {
        pubkey identity {};
        std::optional<socket_address> tpu {};
    };
    using contact_info_list = std::vector<contact_info>;
    using contact_map = std::unordered_map<pubkey, std::optional<socket_address>>;

    enum class slot_update_type {
        first_shred_received, completed, created_bank, frozen, dead, optimistic_confirmation, root
    };

    extern slot_update_type slot_update_type_from_name(std::string_view name);

    struct slot_update {
        slot_t slot = 0;
        slot_update_type type = slot_update_type::first_shred_received;

        // a completed slot means that its successor is the one being produced
        slot_t current_slot() const
        {
            return type == slot_update_type::completed ? slot + 1 : slot;
        }
    };

    struct blockhash_info {
        blockhash hash {};
        uint64_t last_valid_block_height = 0;
    };

    struct signature_status {
        slot_t slot = 0;
        std::optional<commitment> confirmation_status {};
        std::optional<std::string> err {};
    };
    using signature_status_list = std::vector<std::optional<signature_status>>;
}

namespace fmt {
    template<>
    struct formatter<tpu_turbo::solana::socket_address>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return fmt::format_to(ctx.out(), "{}", v.to_string());
        }
    };

    template<>
    struct formatter<tpu_turbo::solana::commitment>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return fmt::format_to(ctx.out(), "{}", tpu_turbo::solana::commitment_name(v));
        }
    };
}

#endif // !TPU_TURBO_SOLANA_TYPES_HPP
