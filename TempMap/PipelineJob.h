// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// PipelineJob.h
// Runs one pipeline invocation on a worker thread.
// =================================================================
#pragma once

#include "Pipeline.h"
#include <deque>
#include <expected>
#include <filesystem>
#include <functional>
#include <future>
#include <mutex>
#include <optional>

namespace tempmap {

    struct PipelineRequest {
        std::filesystem::path logPath;
        std::filesystem::path templatePath;
        std::filesystem::path outputDir;
    };

    using PipelineResult = std::expected<std::filesystem::path, PipelineFailure>;

    // Progress events are queued by the worker and handed to the owning thread
    // through drain(); the pipeline itself never touches the caller's state.
    class PipelineJob {
    public:
        PipelineJob() = default;
        ~PipelineJob();

        PipelineJob(const PipelineJob&) = delete;
        PipelineJob& operator=(const PipelineJob&) = delete;

        // Returns false if a job is already running.
        bool start(PipelineRequest request);

        bool isRunning() const;
        bool isDone() const;

        // Delivers queued events on the calling thread. Returns how many were delivered.
        size_t drain(const std::function<void(const ProgressEvent&)>& handler);

        // Blocks until the run finishes. Events not yet drained stay queued.
        PipelineResult wait();

    private:
        void push(const ProgressEvent& event);

        mutable std::mutex queueMutex;
        std::deque<ProgressEvent> queue;
        std::future<PipelineResult> future;
        std::optional<PipelineResult> result;
    };

} // namespace tempmap
