//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef CIE_ANALYSIS_CACHE_HPP
#define CIE_ANALYSIS_CACHE_HPP

/**
 * @file analysis_cache.hpp
 * @brief Per-file cache of Stage 1 artifacts keyed by content hash.
 *
 * Each file path owns one entry guarded by its own shared_mutex: a writer
 * replacing one file's artifacts never blocks readers of another file.
 * The map itself is only locked long enough to find or create an entry.
 * Stored artifacts are immutable and shared, so readers keep a consistent
 * view even while a newer version is published.
 */

#include "cie/error.hpp"
#include "cie/result.hpp"
#include "cie/types.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace cie::cache {

    using ArtifactsPtr = std::shared_ptr<const FileArtifacts>;

    class AnalysisCache {
    public:
        AnalysisCache() = default;

        AnalysisCache(const AnalysisCache&) = delete;
        AnalysisCache& operator=(const AnalysisCache&) = delete;

        /**
         * Returns the artifacts stored for path, or nullptr when there are
         * none.
         *
         * @return CacheCorrupted when the stored artifacts do not match the
         *         key they were stored under.
         */
        [[nodiscard]] Result<ArtifactsPtr, Error> lookup(const std::string& file_path) const;

        /**
         * Returns the artifacts only when they were computed from content
         * with the given hash.
         */
        [[nodiscard]] Result<ArtifactsPtr, Error> lookup(const std::string& file_path,
                                                         const std::string& content_hash) const;

        /**
         * Publishes artifacts under their own file path and hash.
         */
        void store(ArtifactsPtr artifacts);

        /**
         * Publishes artifacts under an explicit key. The key hash is the
         * hash of the content the caller handed to Stage 1; lookup()
         * rejects the entry if the artifacts disagree with it.
         */
        void store(const std::string& file_path, const std::string& content_hash, ArtifactsPtr artifacts);

        /**
         * Removes an entry. Returns false when none existed.
         */
        bool erase(const std::string& file_path);

        void clear();

        struct Stats {
            std::size_t total_entries = 0;
            std::size_t hits = 0;
            std::size_t misses = 0;
        };

        [[nodiscard]] Stats get_stats() const;

    private:
        struct Entry {
            mutable std::shared_mutex mutex;
            std::string file_path;
            std::string content_hash;
            ArtifactsPtr artifacts;
        };

        std::shared_ptr<Entry> find_entry(const std::string& file_path) const;
        std::shared_ptr<Entry> find_or_create_entry(const std::string& file_path);

        mutable std::mutex map_mutex_;
        std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
        mutable std::atomic<std::size_t> hits_{0};
        mutable std::atomic<std::size_t> misses_{0};
    };

}  // namespace cie::cache

#endif //CIE_ANALYSIS_CACHE_HPP
