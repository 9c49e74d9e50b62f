#pragma once

#include "scoring/Scorer.hpp"

#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <vector>

namespace scoring {

// Holds the registered scorers and runs them on a fixed-size worker pool.
// Every (unit, scorer) pair is one task with its own deadline; a task that
// misses the deadline or throws leaves its kinds unknown.
//
// A task past its deadline still holds a worker until the scorer returns.
// Once a scorer has half the pool (AbandonLimit()) tied up this way it gets no
// new work, and its kinds stay unknown, until one of those tasks finishes.
class ModelRegistry {
public:
    explicit ModelRegistry(std::size_t workerThreads);
    ~ModelRegistry();

    ModelRegistry(const ModelRegistry&) = delete;
    ModelRegistry& operator=(const ModelRegistry&) = delete;

    void Register(std::shared_ptr<const IScorer> scorer);

    // Blocks until every task has finished or passed its deadline.
    ScoreVector Score(const std::vector<ContentItem>& units, const std::set<policy::RuleKind>& kinds);

    std::size_t ScorerCount(Modality modality) const;

    // Tasks of this scorer that missed their deadline and are still running.
    std::size_t AbandonedTasks(const IScorer& scorer) const;

    std::size_t AbandonLimit() const { return abandonLimit_; }

private:
    struct Registration {
        std::shared_ptr<const IScorer> scorer;
        std::shared_ptr<std::atomic<std::size_t>> abandoned;
    };

    std::vector<Registration> ScorersFor(Modality modality) const;

    boost::asio::thread_pool pool_;
    std::size_t abandonLimit_;
    mutable std::mutex mutex_;
    std::vector<Registration> scorers_;
};

} // namespace scoring
