#pragma once

#include <queue>
#include <deque>
#include <map>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <optional>
#include <string>
#include <cstdint>
#include "tessera/types.hpp"

namespace tessera::engine {

    enum class JobState {
        Pending,
        Processing,
        Completed,
        Failed
    };

    inline const char* to_string(JobState state) {
        switch (state) {
            case JobState::Pending: return "pending";
            case JobState::Processing: return "processing";
            case JobState::Completed: return "completed";
            case JobState::Failed: return "failed";
        }
        return "pending";
    }

    /**
     * @brief An ingestion waiting for the worker. attempt counts deliveries so far.
     */
    struct IngestJob {
        uint64_t id = 0;
        IngestRequest request;
        int attempt = 0;
    };

    struct JobStatus {
        JobState state = JobState::Pending;
        int attempts = 0;
        std::optional<IngestResult> result; // set once completed
        std::string error_type;             // set once failed
        std::string error;
    };

    /**
     * @brief Work queue for the ingestion worker, with a status entry per job.
     *
     * Pending and processing jobs are always tracked. Finished jobs are kept
     * until more than max_finished have finished after them.
     */
    class JobQueue {
    public:
        static constexpr size_t kMaxFinished = 1024;

        explicit JobQueue(size_t max_finished = kMaxFinished) : m_max_finished(max_finished) {}

        /**
         * @brief Queues a new job and returns its id. Ids start at 1.
         */
        uint64_t submit(IngestRequest request) {
            uint64_t id;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                id = m_next_id++;
                m_statuses[id] = JobStatus{};
                m_queue.push(IngestJob{id, std::move(request), 0});
            }
            m_cv.notify_one();
            return id;
        }

        /**
         * @brief Puts a job back for another delivery, keeping its id and attempt count.
         */
        void retry(IngestJob job) {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                auto it = m_statuses.find(job.id);
                if (it != m_statuses.end()) it->second.state = JobState::Pending;
                m_queue.push(std::move(job));
            }
            m_cv.notify_one();
        }

        /**
         * @brief Blocks until a job is available. Returns false once stopped and drained.
         *
         * The job comes out with its attempt count raised and is marked processing.
         */
        bool pop(IngestJob& job) {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] { return !m_queue.empty() || m_stop; });

            if (m_stop && m_queue.empty()) return false;

            job = std::move(m_queue.front());
            m_queue.pop();
            job.attempt++;

            auto it = m_statuses.find(job.id);
            if (it != m_statuses.end()) {
                it->second.state = JobState::Processing;
                it->second.attempts = job.attempt;
            }
            return true;
        }

        void complete(uint64_t id, IngestResult result) {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_statuses.find(id);
            if (it == m_statuses.end()) return;
            it->second.state = JobState::Completed;
            it->second.result = std::move(result);
            finished(id);
        }

        void fail(uint64_t id, const std::string& error_type, const std::string& error) {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_statuses.find(id);
            if (it == m_statuses.end()) return;
            it->second.state = JobState::Failed;
            it->second.error_type = error_type;
            it->second.error = error;
            finished(id);
        }

        std::optional<JobStatus> status(uint64_t id) const {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_statuses.find(id);
            if (it == m_statuses.end()) return std::nullopt;
            return it->second;
        }

        void stop() {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_stop = true;
            }
            m_cv.notify_all();
        }

        bool stopped() const { return m_stop; }

        size_t size() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_queue.size();
        }

    private:
        std::queue<IngestJob> m_queue;
        std::map<uint64_t, JobStatus> m_statuses;
        std::deque<uint64_t> m_finished;
        size_t m_max_finished;
        uint64_t m_next_id = 1;
        mutable std::mutex m_mutex;
        std::condition_variable m_cv;
        std::atomic<bool> m_stop{false};

        // Caller holds m_mutex.
        void finished(uint64_t id) {
            m_finished.push_back(id);
            while (m_finished.size() > m_max_finished) {
                m_statuses.erase(m_finished.front());
                m_finished.pop_front();
            }
        }
    };

}
