/* This file is part of TPU Turbo project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <tt/error.hpp>
#include <tt/logger.hpp>

namespace tpu_turbo {
    error::error(formatted, const std::string &msg): std::runtime_error { msg }
    {
        logger::debug("an exception created: {}", msg);
    }
}
