/**
 * @file pipelinecontext.h
 * @brief Explicitly constructed dependencies of the processing pipeline.
 */

#ifndef PIPELINECONTEXT_H
#define PIPELINECONTEXT_H

#include <memory>

class AppSettings;
class ConflictResolver;
class ErrorHandler;
class ExternalTools;
class IHttpClient;
class PauseStateStore;
class QueueStore;

/**
 * @brief Everything a pipeline run needs, built once in main() and passed
 *        down. There are no global instances.
 */
struct PipelineContext {
    std::shared_ptr<AppSettings> settings;
    std::shared_ptr<IHttpClient> http;
    std::shared_ptr<QueueStore> queue;
    std::shared_ptr<PauseStateStore> pauseStore;
    std::shared_ptr<ConflictResolver> resolver;
    std::shared_ptr<ErrorHandler> errorHandler;
    std::shared_ptr<ExternalTools> tools;

    [[nodiscard]] bool isComplete() const
    {
        return settings && http && queue && pauseStore && resolver && errorHandler && tools;
    }
};

#endif // PIPELINECONTEXT_H
