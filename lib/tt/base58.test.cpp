/* This file is part of TPU Turbo project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <tt/base58.hpp>
#include <tt/test.hpp>

using namespace tpu_turbo;

suite base58_suite = [] {
    "base58"_test = [] {
        static const std::vector<std::pair<std::string, std::string_view>> test_vectors {
            { "", "" },
            { "61", "2g" },
            { "626262", "a3gV" },
            { "636363", "aPEr" },
            { "73696d706c792061206c6f6e6720737472696e67", "2cFupjhnEsSn59qHXstmK2ffpLv2" },
            { "00eb15231dfceb60925886b67d065299925915aeb172c06647", "1NS17iag9jJgTHD1VXjvLCEnZuQ3rJDE9L" },
            { "516b6fcd0f", "ABnLTmg" },
            { "bf4f89001e670274dd", "3SEo3LWLoPntC" },
            { "572e4794", "3EFU7m" },
            { "ecac89cad93923c02321", "EJDM8drfXA6uyA" },
            { "10c8511e", "Rt5zm" },
            { "00000000000000000000", "1111111111" }
        };
        "encode"_test = [] {
            for (const auto &[hex, exp]: test_vectors)
                test_same(std::string { exp }, base58::encode(uint8_vector::from_hex(hex)));
        };
        "decode"_test = [] {
            for (const auto &[hex, text]: test_vectors)
                test_same(uint8_vector::from_hex(hex), base58::decode(text));
        };
        "decode_fixed"_test = [] {
            // the address of the system program
            const auto sys_program = base58::decode_fixed<32>("11111111111111111111111111111111");
            test_same(byte_array<32> {}, sys_program);
            const auto id = base58::decode_fixed<32>("7Np41oeYqPefeNQEHSv1UDhYrehxin3NStELsSKCT4K2");
            test_same(std::string { "7Np41oeYqPefeNQEHSv1UDhYrehxin3NStELsSKCT4K2" }, base58::encode(id));
            expect(throws([] { base58::decode_fixed<32>("3EFU7m"); }));
        };
        "invalid characters"_test = [] {
            // 0, O, I and l are not part of the alphabet
            for (const auto *text: { "0", "O", "I", "l", "abc+" })
                expect(throws([&] { base58::decode(text); })) << text;
        };
    };
};
