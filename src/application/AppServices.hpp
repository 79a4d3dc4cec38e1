/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/BatchScheduler.hpp"
#include "application/CostEstimator.hpp"
#include "application/TranscriptionPipeline.hpp"
#include "domain/CredentialBroker.hpp"
#include "domain/ProgressStateStore.hpp"
#include "domain/TranscriptionProvider.hpp"
#include "infrastructure/EventLoop.hpp"

namespace scribeline::application {

/**
 * @struct AppServices
 * @brief Owns the composition root. Members are destroyed in reverse order, so the services
 * holding references go before the adapters they reference.
 */
struct AppServices {
    std::unique_ptr<infrastructure::EventLoop> eventLoop;
    std::unique_ptr<domain::CredentialBroker> broker;
    std::unique_ptr<domain::TranscriptionProvider> provider;
    std::unique_ptr<domain::ProgressStateStore> stateStore;
    std::unique_ptr<TranscriptionPipeline> pipeline;
    std::unique_ptr<BatchScheduler> batchScheduler;
    std::unique_ptr<CostEstimator> costEstimator;
};

} // namespace scribeline::application
