/* This file is part of TPU Turbo project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <charconv>
#include <tt/solana/types.hpp>

namespace tpu_turbo::solana {
    std::string_view commitment_name(const commitment c)
    {
        switch (c) {
            case commitment::processed: return "processed";
            case commitment::confirmed: return "confirmed";
            case commitment::finalized: return "finalized";
            default: throw error("unsupported commitment level: {}", static_cast<int>(c));
        }
    }

    commitment commitment_from_name(const std::string_view name)
    {
        if (name == "processed")
            return commitment::processed;
        if (name == "confirmed")
            return commitment::confirmed;
        if (name == "finalized")
            return commitment::finalized;
        throw error("unsupported commitment level: '{}'", name);
    }

    slot_update_type slot_update_type_from_name(const std::string_view name)
    {
        if (name == "firstShredReceived")
            return slot_update_type::first_shred_received;
        if (name == "completed")
            return slot_update_type::completed;
        if (name == "createdBank")
            return slot_update_type::created_bank;
        if (name == "frozen")
            return slot_update_type::frozen;
        if (name == "dead")
            return slot_update_type::dead;
        if (name == "optimisticConfirmation")
            return slot_update_type::optimistic_confirmation;
        if (name == "root")
            return slot_update_type::root;
        throw error("unsupported slot update type: '{}'", name);
    }

    socket_address socket_address::from_string(const std::string_view text)
    {
        const auto sep_pos = text.rfind(':');
        if (sep_pos == text.npos || sep_pos == 0 || sep_pos + 1 == text.size())
            throw error("socket address must have the host:port format but got '{}'", text);
        auto host = text.substr(0, sep_pos);
        if (host.front() == '[') {
            if (host.back() != ']')
                throw error("an IPv6 socket address must have the [addr]:port format but got '{}'", text);
            host = host.substr(1, host.size() - 2);
        }
        const auto port_str = text.substr(sep_pos + 1);
        uint16_t port = 0;
        const auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);
        if (ec != std::errc {} || ptr != port_str.data() + port_str.size() || port == 0)
            throw error("invalid port number in a socket address: '{}'", text);
        return { std::string { host }, port };
    }

    std::string socket_address::to_string() const
    {
        if (host.find(':') != host.npos)
            return fmt::format("[{}]:{}", host, port);
        return fmt::format("{}:{}", host, port);
    }
}
