//
// Created by gregorian-rayne on 10/18/26.
//

#include "cie/cache/analysis_cache.hpp"

namespace cie::cache {

    std::shared_ptr<AnalysisCache::Entry> AnalysisCache::find_entry(const std::string& file_path) const {
        std::lock_guard lock(map_mutex_);
        const auto it = entries_.find(file_path);
        return it == entries_.end() ? nullptr : it->second;
    }

    std::shared_ptr<AnalysisCache::Entry> AnalysisCache::find_or_create_entry(const std::string& file_path) {
        std::lock_guard lock(map_mutex_);
        auto& entry = entries_[file_path];
        if (!entry) {
            entry = std::make_shared<Entry>();
            entry->file_path = file_path;
        }
        return entry;
    }

    Result<ArtifactsPtr, Error> AnalysisCache::lookup(const std::string& file_path) const {
        const auto entry = find_entry(file_path);
        if (!entry) {
            misses_.fetch_add(1, std::memory_order_relaxed);
            return Result<ArtifactsPtr, Error>::success(nullptr);
        }

        std::shared_lock lock(entry->mutex);
        if (!entry->artifacts) {
            misses_.fetch_add(1, std::memory_order_relaxed);
            return Result<ArtifactsPtr, Error>::success(nullptr);
        }
        if (entry->artifacts->file_path != entry->file_path ||
            entry->artifacts->content_hash != entry->content_hash) {
            return Result<ArtifactsPtr, Error>::failure(
                Error::cache_corrupted("Cached artifacts do not match their key", file_path)
            );
        }
        hits_.fetch_add(1, std::memory_order_relaxed);
        return Result<ArtifactsPtr, Error>::success(entry->artifacts);
    }

    Result<ArtifactsPtr, Error> AnalysisCache::lookup(const std::string& file_path,
                                                      const std::string& content_hash) const {
        auto result = lookup(file_path);
        if (result.is_ok() && result.value() && result.value()->content_hash != content_hash) {
            return Result<ArtifactsPtr, Error>::success(nullptr);
        }
        return result;
    }

    void AnalysisCache::store(ArtifactsPtr artifacts) {
        if (!artifacts) {
            return;
        }
        const std::string file_path = artifacts->file_path;
        const std::string content_hash = artifacts->content_hash;
        store(file_path, content_hash, std::move(artifacts));
    }

    void AnalysisCache::store(const std::string& file_path, const std::string& content_hash, ArtifactsPtr artifacts) {
        const auto entry = find_or_create_entry(file_path);

        std::unique_lock lock(entry->mutex);
        entry->content_hash = content_hash;
        entry->artifacts = std::move(artifacts);
    }

    bool AnalysisCache::erase(const std::string& file_path) {
        std::lock_guard lock(map_mutex_);
        return entries_.erase(file_path) > 0;
    }

    void AnalysisCache::clear() {
        std::lock_guard lock(map_mutex_);
        entries_.clear();
    }

    AnalysisCache::Stats AnalysisCache::get_stats() const {
        Stats stats;
        {
            std::lock_guard lock(map_mutex_);
            stats.total_entries = entries_.size();
        }
        stats.hits = hits_.load(std::memory_order_relaxed);
        stats.misses = misses_.load(std::memory_order_relaxed);
        return stats;
    }

}  // namespace cie::cache
