//
// Created by gregorian-rayne on 10/18/26.
//

#include "cie/engine/analysis_engine.hpp"
#include "cie/utils/hash_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <ranges>

namespace cie::engine {

    namespace {
        Diagnostic failure_diagnostic(const FileArtifacts& file) {
            return Diagnostic{
                DiagnosticLevel::Error,
                error_code_to_key(ErrorCode::AnalysisError),
                file.failure_message.value_or("analysis failed"),
                CodeLocation{file.file_path, 0, 0}
            };
        }

        std::vector<Diagnostic> corpus_diagnostics(const CorpusSnapshot* snapshot) {
            std::vector<Diagnostic> diagnostics;
            if (snapshot) {
                for (const auto& file : snapshot->context.files) {
                    if (file->failed) {
                        diagnostics.push_back(failure_diagnostic(*file));
                    }
                }
            }
            return diagnostics;
        }

        /**
         * Status of a corpus-level payload given the published state.
         */
        template<typename T>
        void apply_corpus_status(Response<T>& response,
                                 const std::optional<Error>& link_error,
                                 const bool has_snapshot,
                                 const bool is_empty) {
            if (link_error) {
                response.status = has_snapshot ? ResponseStatus::Stale : ResponseStatus::Failed;
                response.error = link_error;
                return;
            }
            response.status = is_empty ? ResponseStatus::Empty : ResponseStatus::Ok;
        }

        template<typename T>
        bool mark_failed(Response<T>& response, const FileArtifacts& file) {
            if (!file.failed) {
                return false;
            }
            response.status = ResponseStatus::Failed;
            response.error = Error::analysis_error(file.failure_message.value_or("analysis failed"), file.file_path);
            return true;
        }
    }

    AnalysisEngine::AnalysisEngine(core::Config config)
        : config_(std::move(config))
        , file_analyzer_(config_.heuristics)
        , linker_(config_.heuristics)
        , classifier_(config_.heuristics)
        , pool_(std::make_unique<parallel::ThreadPool>(static_cast<unsigned int>(config_.analysis.worker_threads))) {
        spdlog::debug("Analysis engine started with {} workers", pool_->size());
    }

    AnalysisEngine::~AnalysisEngine() = default;

    // ============================================================================
    // Ingestion
    // ============================================================================

    void AnalysisEngine::ingest(const std::string& corpus_id,
                                const std::string& file_path,
                                std::string content,
                                Language language) {
        if (language == Language::Unknown && language_from_path(file_path) == Language::Unknown) {
            language = config_.analysis.default_language;
        }

        std::lock_guard lock(corpora_mutex_);
        if (const auto it = file_corpus_.find(file_path); it != file_corpus_.end() && it->second != corpus_id) {
            auto& previous = corpora_[it->second];
            previous.files.erase(file_path);
            ++previous.generation;
        }

        auto& corpus = corpora_[corpus_id];
        corpus.files[file_path] = pipeline::SourceFile{file_path, std::move(content), language};
        ++corpus.generation;
        file_corpus_[file_path] = corpus_id;
    }

    Result<void, Error> AnalysisEngine::remove(const std::string& file_path) {
        {
            std::lock_guard lock(corpora_mutex_);
            const auto it = file_corpus_.find(file_path);
            if (it == file_corpus_.end()) {
                return Result<void, Error>::failure(Error::not_found("Unknown file", file_path));
            }
            auto& corpus = corpora_[it->second];
            corpus.files.erase(file_path);
            ++corpus.generation;
            file_corpus_.erase(it);
        }
        cache_.erase(file_path);
        return Result<void, Error>::success();
    }

    std::vector<std::string> AnalysisEngine::corpus_files(const std::string& corpus_id) const {
        std::vector<std::string> files;
        std::lock_guard lock(corpora_mutex_);
        if (const auto it = corpora_.find(corpus_id); it != corpora_.end()) {
            for (const auto& path : it->second.files | std::views::keys) {
                files.push_back(path);
            }
        }
        return files;
    }

    std::optional<std::string> AnalysisEngine::corpus_of(const std::string& file_path) const {
        std::lock_guard lock(corpora_mutex_);
        if (const auto it = file_corpus_.find(file_path); it != file_corpus_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    // ============================================================================
    // Batches
    // ============================================================================

    std::mutex* AnalysisEngine::refresh_mutex_for(const std::string& corpus_id) {
        std::lock_guard lock(corpora_mutex_);
        const auto it = corpora_.find(corpus_id);
        return it == corpora_.end() ? nullptr : it->second.refresh_mutex.get();
    }

    Result<BatchReport, Error> AnalysisEngine::refresh(const std::string& corpus_id,
                                                       const parallel::CancellationToken& cancellation) {
        std::mutex* refresh_mutex = refresh_mutex_for(corpus_id);
        if (!refresh_mutex) {
            return Result<BatchReport, Error>::failure(Error::not_found("Unknown corpus", corpus_id));
        }
        std::lock_guard refresh_lock(*refresh_mutex);

        std::vector<pipeline::SourceFile> sources;
        std::uint64_t generation = 0;
        {
            std::lock_guard lock(corpora_mutex_);
            const auto& corpus = corpora_.at(corpus_id);
            for (const auto& source : corpus.files | std::views::values) {
                sources.push_back(source);
            }
            generation = corpus.generation;
        }

        BatchReport report;
        std::optional<Error> cache_error;
        std::vector<cache::ArtifactsPtr> artifacts(sources.size());
        std::vector<std::string> hashes(sources.size());
        std::vector<std::size_t> pending;

        for (std::size_t i = 0; i < sources.size(); ++i) {
            hashes[i] = utils::compute_sha256(sources[i].content);
            auto cached = cache_.lookup(sources[i].file_path, hashes[i]);
            if (cached.is_err()) {
                spdlog::error("Discarding corrupt cache entry for {}", sources[i].file_path);
                cache_.erase(sources[i].file_path);
                if (!cache_error) {
                    cache_error = cached.error();
                }
                pending.push_back(i);
            } else if (cached.value()) {
                artifacts[i] = cached.value();
                ++report.reused;
            } else {
                pending.push_back(i);
            }
        }

        spdlog::debug("Corpus {}: Stage 1 for {} of {} files", corpus_id, pending.size(), sources.size());

        auto analyzed = parallel::map(pending, [&](const std::size_t index) -> cache::ArtifactsPtr {
            if (cancellation.is_cancelled()) {
                return nullptr;
            }
            const auto& source = sources[index];
            try {
                return std::make_shared<const FileArtifacts>(file_analyzer_.analyze(source));
            } catch (const std::exception& e) {
                spdlog::warn("Analysis of {} failed: {}", source.file_path, e.what());
                return std::make_shared<const FileArtifacts>(
                    pipeline::failed_artifacts(source, hashes[index], Error::analysis_error(e.what(), source.file_path))
                );
            } catch (...) {
                spdlog::warn("Analysis of {} failed with a non-standard exception", source.file_path);
                return std::make_shared<const FileArtifacts>(
                    pipeline::failed_artifacts(source, hashes[index],
                                               Error::analysis_error("Unknown exception", source.file_path))
                );
            }
        }, *pool_);

        // Barrier passed: every Stage 1 task has finished.
        if (cancellation.is_cancelled()) {
            spdlog::info("Corpus {}: batch cancelled before linking", corpus_id);
            return Result<BatchReport, Error>::failure(Error::cancelled("Batch cancelled before linking"));
        }

        for (std::size_t k = 0; k < pending.size(); ++k) {
            const std::size_t index = pending[k];
            artifacts[index] = analyzed[k];
            cache_.store(sources[index].file_path, hashes[index], analyzed[k]);
            ++report.analyzed;
        }

        for (const auto& file : artifacts) {
            if (file->failed) {
                report.failed.push_back(FailedFile{
                    file->file_path,
                    Error::analysis_error(file->failure_message.value_or("analysis failed"), file->file_path)
                });
            }
        }

        auto context = linker::LinkContext::from(std::move(artifacts));
        std::shared_ptr<const CorpusSnapshot> snapshot;
        std::optional<Error> link_error = cache_error;

        spdlog::debug("Corpus {}: Stage 2 over {} files", corpus_id, context.files.size());
        if (!link_error) {
            if (auto linked = linker_.link(context); linked.is_ok()) {
                auto published = std::make_shared<CorpusSnapshot>();
                published->hotspots = classifier_.classify(context, linked.value());
                published->program = std::move(linked.value());
                published->context = std::move(context);
                snapshot = std::move(published);
            } else {
                link_error = linked.error();
            }
        }

        {
            std::lock_guard lock(corpora_mutex_);
            auto& corpus = corpora_.at(corpus_id);
            corpus.ever_refreshed = true;
            corpus.published_generation = generation;
            if (snapshot) {
                corpus.snapshot = snapshot;
                corpus.link_error.reset();
            } else {
                corpus.link_error = link_error;
            }
        }

        if (link_error) {
            spdlog::error("Corpus {}: link failed, keeping last-known-good graph: {}",
                          corpus_id, link_error->to_string());
            report.link_error = link_error;
        }
        spdlog::info("Corpus {}: {} analyzed, {} reused, {} failed",
                     corpus_id, report.analyzed, report.reused, report.failed.size());
        return Result<BatchReport, Error>::success(std::move(report));
    }

    Result<AnalysisEngine::CorpusView, Error> AnalysisEngine::ensure_fresh(const std::string& corpus_id) {
        const auto published = [&]() -> std::optional<CorpusView> {
            std::lock_guard lock(corpora_mutex_);
            const auto& corpus = corpora_.at(corpus_id);
            if (corpus.ever_refreshed && corpus.published_generation == corpus.generation && !corpus.link_error) {
                return CorpusView{corpus.snapshot, std::nullopt};
            }
            return std::nullopt;
        };

        {
            std::lock_guard lock(corpora_mutex_);
            if (!corpora_.contains(corpus_id)) {
                return Result<CorpusView, Error>::failure(Error::not_found("Unknown corpus", corpus_id));
            }
        }
        if (auto view = published()) {
            return Result<CorpusView, Error>::success(std::move(*view));
        }

        if (auto report = refresh(corpus_id); report.is_err()) {
            return Result<CorpusView, Error>::failure(report.error());
        }

        std::lock_guard lock(corpora_mutex_);
        const auto& corpus = corpora_.at(corpus_id);
        return Result<CorpusView, Error>::success(CorpusView{corpus.snapshot, corpus.link_error});
    }

    Result<cache::ArtifactsPtr, Error> AnalysisEngine::artifacts_for(const std::string& file_path) {
        const auto corpus_id = corpus_of(file_path);
        if (!corpus_id) {
            return Result<cache::ArtifactsPtr, Error>::failure(Error::not_found("Unknown file", file_path));
        }
        if (auto view = ensure_fresh(*corpus_id); view.is_err()) {
            return Result<cache::ArtifactsPtr, Error>::failure(view.error());
        }

        auto cached = cache_.lookup(file_path);
        if (cached.is_err()) {
            return cached;
        }
        if (!cached.value()) {
            return Result<cache::ArtifactsPtr, Error>::failure(
                Error::internal_error("No artifacts after refresh", file_path)
            );
        }
        return cached;
    }

    // ============================================================================
    // Per-file and corpus queries
    // ============================================================================

    Result<Response<CodeAnalysis>, Error> AnalysisEngine::analyze(const std::string& file_path) {
        auto artifacts = artifacts_for(file_path);
        if (artifacts.is_err()) {
            return Result<Response<CodeAnalysis>, Error>::failure(artifacts.error());
        }
        const FileArtifacts& file = *artifacts.value();

        Response<CodeAnalysis> response;
        response.diagnostics = file.diagnostics;
        if (mark_failed(response, file)) {
            response.data.file_path = file.file_path;
            response.data.language = file.analysis.language;
        } else {
            response.data = file.analysis;
            response.status = file.analysis.functions.empty() ? ResponseStatus::Empty : ResponseStatus::Ok;
        }
        return Result<Response<CodeAnalysis>, Error>::success(std::move(response));
    }

    Result<Response<CallGraph>, Error> AnalysisEngine::call_graph(const std::string& corpus_id) {
        auto view = ensure_fresh(corpus_id);
        if (view.is_err()) {
            return Result<Response<CallGraph>, Error>::failure(view.error());
        }
        const auto& snapshot = view.value().snapshot;

        Response<CallGraph> response;
        if (snapshot) {
            response.data = snapshot->program.graph;
        }
        response.diagnostics = corpus_diagnostics(snapshot.get());
        apply_corpus_status(response, view.value().link_error, snapshot != nullptr, response.data.nodes.empty());
        return Result<Response<CallGraph>, Error>::success(std::move(response));
    }

    Result<Response<std::vector<PerformanceHotspot>>, Error> AnalysisEngine::hotspots(const std::string& target) {
        using HotspotResponse = Response<std::vector<PerformanceHotspot>>;

        bool is_corpus = false;
        {
            std::lock_guard lock(corpora_mutex_);
            is_corpus = corpora_.contains(target);
        }

        if (is_corpus) {
            auto view = ensure_fresh(target);
            if (view.is_err()) {
                return Result<HotspotResponse, Error>::failure(view.error());
            }
            const auto& snapshot = view.value().snapshot;

            HotspotResponse response;
            if (snapshot) {
                response.data = snapshot->hotspots;
            }
            response.diagnostics = corpus_diagnostics(snapshot.get());
            apply_corpus_status(response, view.value().link_error, snapshot != nullptr, response.data.empty());
            return Result<HotspotResponse, Error>::success(std::move(response));
        }

        auto artifacts = artifacts_for(target);
        if (artifacts.is_err()) {
            return Result<HotspotResponse, Error>::failure(artifacts.error());
        }
        const FileArtifacts& file = *artifacts.value();

        HotspotResponse response;
        response.diagnostics = file.diagnostics;
        if (mark_failed(response, file)) {
            return Result<HotspotResponse, Error>::success(std::move(response));
        }

        auto view = ensure_fresh(*corpus_of(target));
        if (view.is_err()) {
            return Result<HotspotResponse, Error>::failure(view.error());
        }
        const auto& snapshot = view.value().snapshot;
        if (snapshot) {
            std::ranges::copy_if(snapshot->hotspots, std::back_inserter(response.data),
                                 [&](const PerformanceHotspot& hotspot) {
                                     return hotspot.location.file_path == target;
                                 });
        }
        apply_corpus_status(response, view.value().link_error, snapshot != nullptr, response.data.empty());
        return Result<HotspotResponse, Error>::success(std::move(response));
    }

    Result<Response<std::vector<OptimizationSuggestion>>, Error> AnalysisEngine::optimization_suggestions(
        const std::string& target) {
        using SuggestionResponse = Response<std::vector<OptimizationSuggestion>>;

        auto found = hotspots(target);
        if (found.is_err()) {
            return Result<SuggestionResponse, Error>::failure(found.error());
        }
        auto& hotspot_response = found.value();

        SuggestionResponse response;
        response.status = hotspot_response.status;
        response.data = hotspots::optimization_suggestions(hotspot_response.data);
        response.diagnostics = std::move(hotspot_response.diagnostics);
        response.error = std::move(hotspot_response.error);
        return Result<SuggestionResponse, Error>::success(std::move(response));
    }

    Result<Response<std::vector<VariableTrace>>, Error> AnalysisEngine::data_flow(
        const std::string& file_path,
        const std::optional<std::string>& variable) {
        using TraceResponse = Response<std::vector<VariableTrace>>;

        auto artifacts = artifacts_for(file_path);
        if (artifacts.is_err()) {
            return Result<TraceResponse, Error>::failure(artifacts.error());
        }
        const FileArtifacts& file = *artifacts.value();

        TraceResponse response;
        if (mark_failed(response, file)) {
            return Result<TraceResponse, Error>::success(std::move(response));
        }
        for (const auto& trace : file.data_flow) {
            if (!variable || trace.variable == *variable) {
                response.data.push_back(trace);
            }
        }
        response.status = response.data.empty() ? ResponseStatus::Empty : ResponseStatus::Ok;
        return Result<TraceResponse, Error>::success(std::move(response));
    }

    Result<Response<std::vector<CodeSuggestion>>, Error> AnalysisEngine::suggestions(const std::string& file_path) {
        using SuggestionResponse = Response<std::vector<CodeSuggestion>>;

        auto artifacts = artifacts_for(file_path);
        if (artifacts.is_err()) {
            return Result<SuggestionResponse, Error>::failure(artifacts.error());
        }
        const FileArtifacts& file = *artifacts.value();

        SuggestionResponse response;
        if (mark_failed(response, file)) {
            return Result<SuggestionResponse, Error>::success(std::move(response));
        }
        response.data = file.suggestions;
        response.status = response.data.empty() ? ResponseStatus::Empty : ResponseStatus::Ok;
        return Result<SuggestionResponse, Error>::success(std::move(response));
    }

}  // namespace cie::engine
