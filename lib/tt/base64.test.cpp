/* This file is part of TPU Turbo project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <tt/base64.hpp>
#include <tt/test.hpp>

using namespace tpu_turbo;

suite base64_suite = [] {
    "base64"_test = [] {
        "decode"_test = [] {
            static std::vector<std::pair<std::string_view, uint8_vector>> test_vectors {
                { "6MA6A8Cy3b6kGVyvOfQeZp99JR7PIh+7LydcCl1+BdGQ3MJG9WyOM6wANwZuL2ZN2qmF6lKECCZDMI3eT1v+3w==", uint8_vector::from_hex("e8c03a03c0b2ddbea4195caf39f41e669f7d251ecf221fbb2f275c0a5d7e05d190dcc246f56c8e33ac0037066e2f664ddaa985ea5284082643308dde4f5bfedf") },
                { "Zm9vYg==", uint8_vector { std::string_view { "foob" } } },
                { "Zm9v\nYmFy", uint8_vector { std::string_view { "foobar" } } },
                { "", uint8_vector {} }
            };
            for (const auto &[in, exp]: test_vectors) {
                auto out = base64::decode(in);
                expect(out == exp) << out;
            }
            expect(throws([] { base64::decode("Zm9v*"); }));
        };
        "encode"_test = [] {
            test_same(std::string { "" }, base64::encode(std::string_view { "" }));
            test_same(std::string { "Zg==" }, base64::encode(std::string_view { "f" }));
            test_same(std::string { "Zm8=" }, base64::encode(std::string_view { "fo" }));
            test_same(std::string { "Zm9v" }, base64::encode(std::string_view { "foo" }));
            test_same(std::string { "Zm9vYmE=" }, base64::encode(std::string_view { "fooba" }));
            const auto bytes = uint8_vector::from_hex("0080ff10");
            test_same(bytes, base64::decode(base64::encode(bytes)));
        };
    };
};
