#pragma once
#include <stdexcept>
#include <string>

namespace tessera {

    /**
     * @brief Root of the engine's error taxonomy.
     *
     * retryable() tells an execution facility whether re-running the same
     * call can succeed (ingestion is idempotent, so retries are safe).
     */
    class Error : public std::runtime_error {
    public:
        explicit Error(const std::string& message) : std::runtime_error(message) {}
        virtual bool retryable() const { return false; }
        virtual const char* type() const { return "Error"; }
    };

    /**
     * @brief Invalid chunk sizes, non-positive top_k, bad config values.
     */
    class ConfigurationError : public Error {
    public:
        using Error::Error;
        const char* type() const override { return "ConfigurationError"; }
    };

    /**
     * @brief Embedding or generation model could not initialise or respond.
     */
    class ModelUnavailableError : public Error {
    public:
        explicit ModelUnavailableError(const std::string& message, bool timed_out = false)
            : Error(message), m_timed_out(timed_out) {}

        bool retryable() const override { return true; }
        const char* type() const override { return "ModelUnavailableError"; }
        bool timed_out() const { return m_timed_out; }

    private:
        bool m_timed_out;
    };

    /**
     * @brief Persisted index file is unreadable. Recovered inside the index.
     */
    class IndexCorruptionError : public Error {
    public:
        using Error::Error;
        const char* type() const override { return "IndexCorruptionError"; }
    };

    /**
     * @brief The tenant index could not be persisted after a mutation.
     */
    class IndexWriteError : public Error {
    public:
        using Error::Error;
        bool retryable() const override { return true; }
        const char* type() const override { return "IndexWriteError"; }
    };

    class StoreError : public Error {
    public:
        explicit StoreError(const std::string& message, bool busy = false)
            : Error(message), m_busy(busy) {}

        bool retryable() const override { return m_busy; }
        const char* type() const override { return "StoreError"; }

    private:
        bool m_busy;
    };

    class ExtractionError : public Error {
    public:
        using Error::Error;
        const char* type() const override { return "ExtractionError"; }
    };

}
