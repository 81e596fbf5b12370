#include "ingest_worker.hpp"
#include "tessera/errors.hpp"
#include <iostream>
#include <thread>

namespace tessera::engine {

    IngestWorker::IngestWorker(Ingestor& ingestor, JobQueue& queue, int max_attempts, std::chrono::milliseconds backoff)
        : m_ingestor(ingestor), m_queue(queue), m_max_attempts(max_attempts), m_backoff(backoff) {}

    void IngestWorker::run() {
        IngestJob job;
        while (m_queue.pop(job)) {
            process(std::move(job));
        }
    }

    void IngestWorker::process(IngestJob job) {
        try {
            auto result = m_ingestor.ingest(job.request);
            std::cout << "[Worker] Job " << job.id << " (" << job.request.source_id << " v" << job.request.version
                      << "): " << result.message << " (" << result.chunk_count << " chunks)\n";
            m_queue.complete(job.id, std::move(result));
        } catch (const Error& e) {
            if (e.retryable() && job.attempt < m_max_attempts && !m_queue.stopped()) {
                std::cerr << "[Worker] Attempt " << job.attempt << " of job " << job.id << " failed ("
                          << e.type() << ": " << e.what() << "); retrying\n";
                std::this_thread::sleep_for(m_backoff * job.attempt);
                m_queue.retry(std::move(job));
                return;
            }
            std::cerr << "[Worker] Giving up on job " << job.id << " after " << job.attempt << " attempt(s): "
                      << e.type() << ": " << e.what() << "\n";
            m_queue.fail(job.id, e.type(), e.what());
        } catch (const std::exception& e) {
            std::cerr << "[Worker] Job " << job.id << " failed unexpectedly: " << e.what() << "\n";
            m_queue.fail(job.id, "InternalError", e.what());
        }
    }

}
