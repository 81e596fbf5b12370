#pragma once

#include <chrono>
#include "ingestor.hpp"
#include "job_queue.hpp"

namespace tessera::engine {

    /**
     * @brief Drains the job queue into the ingestor with at-least-once delivery.
     *
     * Retryable failures go back on the queue after attempt * backoff, until
     * max_attempts deliveries have been made or the queue is stopped. The
     * outcome of every job is recorded in the queue's status table.
     */
    class IngestWorker {
    public:
        IngestWorker(Ingestor& ingestor, JobQueue& queue, int max_attempts,
                     std::chrono::milliseconds backoff = std::chrono::milliseconds(500));

        // Returns once the queue is stopped and drained.
        void run();

        void process(IngestJob job);

    private:
        Ingestor& m_ingestor;
        JobQueue& m_queue;
        int m_max_attempts;
        std::chrono::milliseconds m_backoff;
    };

}
