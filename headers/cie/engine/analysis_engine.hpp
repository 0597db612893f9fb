//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef CIE_ANALYSIS_ENGINE_HPP
#define CIE_ANALYSIS_ENGINE_HPP

/**
 * @file analysis_engine.hpp
 * @brief Corpus registry, batch driver and query endpoints.
 *
 * Sources arrive through ingest() and are grouped into corpora. A batch
 * (refresh) re-runs Stage 1 only for files whose content hash changed,
 * waits for every task, then re-links the whole corpus. Queries refresh a
 * corpus on demand, so an unchanged corpus answers straight from the
 * published snapshot.
 *
 * Usage:
 * @code
 *     engine::AnalysisEngine engine(config);
 *     engine.ingest("kernel", "src/main.rs", text);
 *     auto graph = engine.call_graph("kernel");
 *     if (graph.is_ok() && graph.value().status == engine::ResponseStatus::Ok) {
 *         render(graph.value().data);
 *     }
 * @endcode
 */

#include "cie/cache/analysis_cache.hpp"
#include "cie/core/config.hpp"
#include "cie/engine/response.hpp"
#include "cie/error.hpp"
#include "cie/hotspots/hotspot_classifier.hpp"
#include "cie/linker/global_linker.hpp"
#include "cie/pipeline/file_analyzer.hpp"
#include "cie/result.hpp"
#include "cie/types.hpp"
#include "cie/utils/parallel.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace cie::engine {

    /**
     * Everything Stage 2 published for one corpus.
     */
    struct CorpusSnapshot {
        linker::LinkContext context;
        linker::LinkedProgram program;
        std::vector<PerformanceHotspot> hotspots;
    };

    class AnalysisEngine {
    public:
        explicit AnalysisEngine(core::Config config = core::Config::default_config());
        ~AnalysisEngine();

        AnalysisEngine(const AnalysisEngine&) = delete;
        AnalysisEngine& operator=(const AnalysisEngine&) = delete;

        // ========================================================================
        // Ingestion
        // ========================================================================

        /**
         * Records (path, content) for a corpus. A path belongs to one corpus;
         * ingesting it under another corpus moves it. Nothing is analysed
         * until a query or refresh().
         */
        void ingest(const std::string& corpus_id,
                    const std::string& file_path,
                    std::string content,
                    Language language = Language::Unknown);

        /**
         * Drops a file from its corpus and from the cache.
         */
        Result<void, Error> remove(const std::string& file_path);

        /**
         * Runs one batch: Stage 1 for changed files, barrier, cancellation
         * check, cache publish, Stage 2, snapshot publish.
         *
         * @return NotFound for an unknown corpus, Cancelled when the token
         *         fired before the barrier was passed. A fatal link error is
         *         reported in BatchReport::link_error; the previous snapshot
         *         stays published.
         */
        Result<BatchReport, Error> refresh(const std::string& corpus_id,
                                           const parallel::CancellationToken& cancellation = {});

        // ========================================================================
        // Queries
        // ========================================================================

        Result<Response<CodeAnalysis>, Error> analyze(const std::string& file_path);

        Result<Response<CallGraph>, Error> call_graph(const std::string& corpus_id);

        /**
         * Hotspots of a corpus, or of one file when target names a file.
         */
        Result<Response<std::vector<PerformanceHotspot>>, Error> hotspots(const std::string& target);

        Result<Response<std::vector<OptimizationSuggestion>>, Error> optimization_suggestions(
            const std::string& target);

        Result<Response<std::vector<VariableTrace>>, Error> data_flow(
            const std::string& file_path,
            const std::optional<std::string>& variable = std::nullopt);

        Result<Response<std::vector<CodeSuggestion>>, Error> suggestions(const std::string& file_path);

        /**
         * Case-insensitive substring search over symbol names, comments and
         * string literals.
         */
        Result<Response<std::vector<SearchResult>>, Error> search(const std::string& corpus_id,
                                                                  const std::string& query);

        /**
         * Finds the definition a symbol name refers to from file_path and
         * its references.
         *
         * @return NotFound when no function, variable or type has that name.
         */
        Result<Response<NavigationLocation>, Error> navigate(const std::string& file_path,
                                                             const std::string& symbol);

        // ========================================================================
        // Introspection
        // ========================================================================

        [[nodiscard]] std::vector<std::string> corpus_files(const std::string& corpus_id) const;

        [[nodiscard]] std::optional<std::string> corpus_of(const std::string& file_path) const;

        [[nodiscard]] const core::Config& config() const noexcept {
            return config_;
        }

        [[nodiscard]] cache::AnalysisCache& cache() noexcept {
            return cache_;
        }

    private:
        struct Corpus {
            std::map<std::string, pipeline::SourceFile> files;
            std::uint64_t generation = 0;
            std::uint64_t published_generation = 0;
            bool ever_refreshed = false;
            std::shared_ptr<const CorpusSnapshot> snapshot;
            std::optional<Error> link_error;
            std::unique_ptr<std::mutex> refresh_mutex = std::make_unique<std::mutex>();
        };

        struct CorpusView {
            std::shared_ptr<const CorpusSnapshot> snapshot;
            std::optional<Error> link_error;
        };

        /**
         * Refreshes the corpus when it changed since the last publish and
         * returns the published state.
         */
        Result<CorpusView, Error> ensure_fresh(const std::string& corpus_id);

        /**
         * Fresh artifacts for a file, refreshing its corpus first.
         */
        Result<cache::ArtifactsPtr, Error> artifacts_for(const std::string& file_path);

        std::mutex* refresh_mutex_for(const std::string& corpus_id);

        core::Config config_;
        pipeline::FileAnalyzer file_analyzer_;
        linker::GlobalLinker linker_;
        hotspots::HotspotClassifier classifier_;
        cache::AnalysisCache cache_;
        std::unique_ptr<parallel::ThreadPool> pool_;

        mutable std::mutex corpora_mutex_;
        std::unordered_map<std::string, Corpus> corpora_;
        std::unordered_map<std::string, std::string> file_corpus_;
    };

}  // namespace cie::engine

#endif //CIE_ANALYSIS_ENGINE_HPP
