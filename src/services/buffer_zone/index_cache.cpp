#include "services/buffer_zone/index_cache.hpp"

#include <exception>
#include <string>

namespace ibis::services {

std::string DomainKey::toString() const {
    std::string image = imagePath ? imagePath->string() : "<none>";
    std::string mask = maskPath ? maskPath->string() : "<none>";
    return "image=" + image + " mask=" + mask;
}

DomainResult IndexCache::getOrBuild(const DomainKey& key, const Builder& builder) {
    std::promise<DomainResult> promise;
    std::shared_future<DomainResult> future;
    bool owner = false;

    {
        std::lock_guard lock(mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            future = it->second;
        } else {
            future = promise.get_future().share();
            entries_.emplace(key, future);
            ++buildCount_;
            owner = true;
        }
    }

    if (!owner) {
        return future.get();
    }

    // Build outside the lock; other keys proceed in parallel
    DomainResult result = [&]() -> DomainResult {
        try {
            return builder(key);
        } catch (const std::exception& e) {
            return std::unexpected(PipelineError{
                PipelineError::Code::InternalError,
                std::string("Domain build failed for ") + key.toString() + ": " + e.what()
            });
        } catch (...) {
            // Waiters must always receive a value, never a broken promise
            return std::unexpected(PipelineError{
                PipelineError::Code::InternalError,
                "Domain build failed for " + key.toString() + ": unknown exception"
            });
        }
    }();
    promise.set_value(result);
    return result;
}

void IndexCache::release(const DomainKey& key) {
    std::lock_guard lock(mutex_);
    entries_.erase(key);
}

bool IndexCache::contains(const DomainKey& key) const {
    std::lock_guard lock(mutex_);
    return entries_.contains(key);
}

size_t IndexCache::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

size_t IndexCache::buildCount() const {
    std::lock_guard lock(mutex_);
    return buildCount_;
}

}  // namespace ibis::services
