// BSD 3-Clause License
//
// Copyright (c) 2021-2025, 🍀☀🌕🌥 🌊
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

/**
 * @file index_cache.hpp
 * @brief Build-once cache of masked domains keyed by image/mask identity
 * @details Every distinct (image path, mask path) pair is loaded, resampled
 *          and indexed exactly once, however many jobs ask for it and however
 *          concurrently they ask. Waiters for a domain that is still being
 *          built block on the same shared future. A failed build is cached as
 *          well, so every job using a broken pair fails the same way without
 *          re-reading the files.
 *
 * Entries are never evicted; the caller releases a key once the last job
 * that needs it has finished.
 *
 * ## Thread Safety
 * All methods are thread-safe. The builder runs outside the cache lock.
 */

#pragma once

#include "core/pipeline_error.hpp"
#include "services/buffer_zone/masked_domain.hpp"

#include <compare>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>

namespace ibis::services {

/// Identity of a domain: the files it is built from
struct DomainKey {
    std::optional<std::filesystem::path> imagePath;
    std::optional<std::filesystem::path> maskPath;

    auto operator<=>(const DomainKey&) const = default;
    bool operator==(const DomainKey&) const = default;

    [[nodiscard]] std::string toString() const;
};

using DomainResult = std::expected<std::shared_ptr<const MaskedDomain>, PipelineError>;

class IndexCache {
public:
    using Builder = std::function<DomainResult(const DomainKey&)>;

    /**
     * @brief Return the cached domain for @p key, building it on first use
     *
     * Concurrent calls for the same key run @p builder once; the others wait
     * for its result. Anything thrown by the builder is converted to
     * InternalError and handed to every waiter.
     */
    [[nodiscard]] DomainResult getOrBuild(const DomainKey& key, const Builder& builder);

    /// Drop the entry for @p key; domains still held by callers stay alive
    void release(const DomainKey& key);

    [[nodiscard]] bool contains(const DomainKey& key) const;

    [[nodiscard]] size_t size() const;

    /// Number of times a builder has been invoked
    [[nodiscard]] size_t buildCount() const;

private:
    std::map<DomainKey, std::shared_future<DomainResult>> entries_;
    size_t buildCount_ = 0;
    mutable std::mutex mutex_;
};

}  // namespace ibis::services
