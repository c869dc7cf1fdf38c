/* This file is part of TPU Turbo project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <optional>
#include <tt/solana/types.hpp>
#include <tt/test.hpp>

using namespace tpu_turbo;

namespace {
    template<typename E=error, typename F>
    void expect_throws_msg(const F &f, const std::initializer_list<std::string> &matches, const std::source_location &src_loc=std::source_location::current())
    {
        std::optional<std::string> msg {};
        try {
            f();
        } catch (const E &ex) {
            msg = ex.what();
        }
        expect(static_cast<bool>(msg)) << "no exception of the expected type";
        if (msg) {
            for (const auto &match: matches)
                expect(msg->find(match) != msg->npos) << fmt::format("'{}' does not contain '{}' from {}:{}", *msg, match, src_loc.file_name(), src_loc.line());
        }
    }
}

suite error_suite = [] {
    "error"_test = [] {
        "no_args"_test = [] {
            expect_throws_msg([] { throw error("Hello!"); }, { "Hello!" });
        };
        "integers"_test = [] {
            expect_throws_msg([] { throw error("slot {} is behind {}", 1000, 999); }, { "slot 1000 is behind 999" });
        };
        "bytes"_test = [] {
            const solana::pubkey pk = solana::pubkey::from_hex("DEADBEEF00000000000000000000000000000000000000000000000000000000");
            expect_throws_msg([&] { throw error("leader {}", pk.span().subspan(0, 4)); }, { "leader DEADBEEF" });
        };
        "error_sys"_test = [] {
            expect_throws_msg([] { errno = 2; throw error_sys("open {}", "tt.json"); }, { "open tt.json, errno: 2, strerror: No such file or directory" });
        };
        "domain errors are errors"_test = [] {
            expect_throws_msg<empty_state_error>([] { throw empty_state_error("no slots observed"); }, { "no slots observed" });
            expect_throws_msg<invalid_arguments_error>([] { throw invalid_arguments_error("{} signers given but {} required", 1, 2); }, { "1 signers given but 2 required" });
            expect(throws<error>([] { throw transaction_failed_error("InstructionError"); }));
        };
    };
};
