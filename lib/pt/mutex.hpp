/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */
#ifndef PROGRAMMABLE_TOKENS_MUTEX_HPP
#define PROGRAMMABLE_TOKENS_MUTEX_HPP

#include <cstddef>
#include <mutex>

namespace programmable_tokens::mutex {
    // a typical cache line; mutexes shared between threads are aligned to it to avoid false sharing
    static constexpr size_t alignment = 64;

    using mutex_type = std::mutex;
    using scoped_lock = std::scoped_lock<mutex_type>;
}

#endif // !PROGRAMMABLE_TOKENS_MUTEX_HPP
