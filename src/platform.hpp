#pragma once

#include <string>
#include <functional>
#include <memory>
#include <filesystem>

namespace tessera::platform {

    /**
     * @brief Abstract base class for the IPC server (the Bridge).
     * The Linux implementation uses a Unix domain socket under /tmp.
     *
     * One request per connection: the client writes its message and shuts
     * down its write side, the server answers and closes.
     */
    class Bridge {
    public:
        using MessageCallback = std::function<std::string(const std::string&)>;

        virtual ~Bridge() = default;

        /**
         * @brief Initializes the IPC endpoint.
         * @param name The name of the socket (e.g., "tessera.sock").
         * @return false if the socket could not be bound.
         */
        virtual bool listen(const std::string& name) = 0;

        /**
         * @brief Sets the handler for incoming messages.
         */
        virtual void set_handler(MessageCallback handler) = 0;

        /**
         * @brief Runs the IPC loop until stop() is called.
         */
        virtual void run() = 0;

        virtual void stop() = 0;

        static std::unique_ptr<Bridge> create();
    };

    /**
     * @brief Abstract base class for the IPC client.
     */
    class Client {
    public:
        virtual ~Client() = default;

        /**
         * @return true if connected successfully.
         */
        virtual bool connect(const std::string& name) = 0;

        /**
         * @brief Sends a message and waits for the complete response.
         * @return The response, empty if the exchange failed.
         */
        virtual std::string send(const std::string& message) = 0;

        static std::unique_ptr<Client> create();
    };

    /**
     * @brief System-level helper functions.
     */
    namespace system {
        std::filesystem::path get_config_dir();
        std::filesystem::path get_data_dir();
    }

}
