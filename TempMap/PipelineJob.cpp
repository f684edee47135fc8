// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// PipelineJob.cpp
// =================================================================
#include "PipelineJob.h"
#include <chrono>

namespace tempmap {

    PipelineJob::~PipelineJob() {
        if (future.valid()) future.wait();
    }

    bool PipelineJob::start(PipelineRequest request) {
        if (isRunning()) return false;
        {
            std::lock_guard<std::mutex> lock(queueMutex);
            queue.clear();
        }
        result.reset();
        future = std::async(std::launch::async, [this, request = std::move(request)]() {
            return Pipeline::run(request.logPath, request.templatePath, request.outputDir,
                [this](const ProgressEvent& event) { push(event); });
        });
        return true;
    }

    bool PipelineJob::isRunning() const {
        return future.valid() &&
            future.wait_for(std::chrono::seconds(0)) != std::future_status::ready;
    }

    bool PipelineJob::isDone() const {
        if (result) return true;
        return future.valid() &&
            future.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }

    void PipelineJob::push(const ProgressEvent& event) {
        std::lock_guard<std::mutex> lock(queueMutex);
        queue.push_back(event);
    }

    size_t PipelineJob::drain(const std::function<void(const ProgressEvent&)>& handler) {
        std::deque<ProgressEvent> pending;
        {
            std::lock_guard<std::mutex> lock(queueMutex);
            pending.swap(queue);
        }
        // Handler runs unlocked so it may call back into the job.
        for (const auto& event : pending) {
            if (handler) handler(event);
        }
        return pending.size();
    }

    PipelineResult PipelineJob::wait() {
        if (!result) {
            if (!future.valid()) {
                return std::unexpected(PipelineFailure{ TempMapError::Unknown, "no job started" });
            }
            result = future.get();
        }
        return *result;
    }

} // namespace tempmap
