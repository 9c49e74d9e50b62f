#include "scoring/ModelRegistry.hpp"

#include "easylogging++.h"

#include <boost/asio/post.hpp>

#include <algorithm>
#include <chrono>
#include <future>
#include <iterator>
#include <stdexcept>

namespace scoring {

namespace {
// Shared by a posted task and the request waiting on it.
struct TaskState {
    std::mutex mutex;
    bool finished = false;
    bool abandoned = false;
};

struct PendingScore {
    std::shared_ptr<const IScorer> scorer;
    std::set<policy::RuleKind> kinds;
    std::future<ScoreVector> result;
    std::chrono::steady_clock::time_point deadline;
    std::shared_ptr<TaskState> state;
    std::shared_ptr<std::atomic<std::size_t>> abandoned;
};

bool IsAbandoned(TaskState& state) {
    std::lock_guard<std::mutex> lock(state.mutex);
    return state.abandoned;
}

void MarkAllUnknown(ScoreVector& scores, const std::set<policy::RuleKind>& kinds) {
    for (auto kind : kinds) {
        scores.MarkUnknown(kind);
    }
}
} // namespace

ModelRegistry::ModelRegistry(std::size_t workerThreads)
    : pool_{std::max<std::size_t>(workerThreads, 1)}
    , abandonLimit_{std::max<std::size_t>(workerThreads / 2, 1)} {}

ModelRegistry::~ModelRegistry() {
    pool_.join();
}

void ModelRegistry::Register(std::shared_ptr<const IScorer> scorer) {
    if (!scorer) {
        throw std::invalid_argument("cannot register a null scorer");
    }

    LOG(INFO) << "Registered scorer " << scorer->Name() << " for " << ToString(scorer->GetModality())
              << " (timeout " << scorer->Timeout().count() << " ms)";

    Registration registration;
    registration.scorer = std::move(scorer);
    registration.abandoned = std::make_shared<std::atomic<std::size_t>>(0);

    std::lock_guard<std::mutex> lock(mutex_);
    scorers_.push_back(std::move(registration));
}

ScoreVector ModelRegistry::Score(const std::vector<ContentItem>& units, const std::set<policy::RuleKind>& kinds) {
    std::vector<PendingScore> pending;
    ScoreVector merged;

    for (const auto& unit : units) {
        auto shared = std::make_shared<const ContentItem>(unit);

        for (const auto& registration : ScorersFor(unit.modality)) {
            const auto& scorer = registration.scorer;
            const auto supported = scorer->SupportedKinds();
            std::set<policy::RuleKind> wanted;
            std::set_intersection(supported.begin(), supported.end(), kinds.begin(), kinds.end(),
                std::inserter(wanted, wanted.end()));
            if (wanted.empty()) {
                continue;
            }

            if (registration.abandoned->load() >= abandonLimit_) {
                LOG(WARNING) << "Scorer " << scorer->Name() << " skipped: " << registration.abandoned->load()
                             << " timed out tasks still running";
                MarkAllUnknown(merged, wanted);
                continue;
            }

            auto task = std::make_shared<std::packaged_task<ScoreVector()>>(
                [scorer, shared, wanted]() { return scorer->Score(*shared, wanted); });

            PendingScore entry;
            entry.scorer = scorer;
            entry.kinds = wanted;
            entry.result = task->get_future();
            entry.deadline = std::chrono::steady_clock::now() + scorer->Timeout();
            entry.state = std::make_shared<TaskState>();
            entry.abandoned = registration.abandoned;

            auto state = entry.state;
            auto abandoned = registration.abandoned;
            pending.push_back(std::move(entry));

            boost::asio::post(pool_, [task, state, abandoned]() {
                // The request gave up while this task was queued.
                if (!IsAbandoned(*state)) {
                    (*task)();
                }

                std::lock_guard<std::mutex> lock(state->mutex);
                state->finished = true;
                if (state->abandoned) {
                    --*abandoned;
                }
            });
        }
    }

    for (auto& entry : pending) {
        if (entry.result.wait_until(entry.deadline) != std::future_status::ready) {
            LOG(WARNING) << "Scorer " << entry.scorer->Name() << " timed out after "
                         << entry.scorer->Timeout().count() << " ms";
            {
                std::lock_guard<std::mutex> lock(entry.state->mutex);
                if (!entry.state->finished) {
                    entry.state->abandoned = true;
                    ++*entry.abandoned;
                }
            }
            MarkAllUnknown(merged, entry.kinds);
            continue;
        }

        try {
            auto scores = entry.result.get();
            merged.Merge(scores);

            // Requested kinds the scorer did not answer for count as unknown.
            for (auto kind : entry.kinds) {
                if (!scores.Get(kind) && !scores.IsUnknown(kind)) {
                    merged.MarkUnknown(kind);
                }
            }
        } catch (const std::exception& e) {
            LOG(WARNING) << "Scorer " << entry.scorer->Name() << " failed: " << e.what();
            MarkAllUnknown(merged, entry.kinds);
        }
    }

    return merged;
}

std::size_t ModelRegistry::ScorerCount(Modality modality) const { return ScorersFor(modality).size(); }

std::size_t ModelRegistry::AbandonedTasks(const IScorer& scorer) const {
    std::lock_guard<std::mutex> lock(mutex_);

    for (const auto& registration : scorers_) {
        if (registration.scorer.get() == &scorer) {
            return registration.abandoned->load();
        }
    }
    return 0;
}

std::vector<ModelRegistry::Registration> ModelRegistry::ScorersFor(Modality modality) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<Registration> matching;
    std::copy_if(scorers_.begin(), scorers_.end(), std::back_inserter(matching),
        [modality](const Registration& registration) { return registration.scorer->GetModality() == modality; });
    return matching;
}

} // namespace scoring
