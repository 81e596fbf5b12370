#include <iostream>
#include <string>
#include <nlohmann/json.hpp>
#include "platform.hpp"

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: tessera <command> [json-params] [--socket name]\n";
        std::cerr << "Commands:\n";
        std::cerr << "  ping       - Test connection\n";
        std::cerr << "  status     - Queue size and per-tenant counts\n";
        std::cerr << "  ingest     - {\"tenant_id\":1,\"source_id\":\"faq\",\"version\":1,\"content\":\"...\",\"async\":false}\n";
        std::cerr << "  upload     - {\"tenant_id\":1,\"path\":\"/abs/file.pdf\",\"async\":false}\n";
        std::cerr << "  query      - {\"tenant_id\":1,\"query\":\"...\",\"top_k\":5}\n";
        std::cerr << "  deprecate  - {\"tenant_id\":1,\"source_id\":\"faq\",\"version\":1}\n";
        std::cerr << "  reconcile  - {\"tenant_id\":1} or {} for every tenant\n";
        std::cerr << "  task_status - {\"task_id\":1} for an async ingest or upload\n";
        std::cerr << "  shutdown   - Stop the daemon\n";
        return 1;
    }

    std::string command = argv[1];
    std::string socket_name = "tessera.sock";
    nlohmann::json params = nlohmann::json::object();

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--socket" && i + 1 < argc) {
            socket_name = argv[++i];
            continue;
        }
        try {
            params = nlohmann::json::parse(arg);
        } catch (const nlohmann::json::parse_error& e) {
            std::cerr << "Error: params must be a JSON object: " << e.what() << "\n";
            return 1;
        }
    }

    auto client = tessera::platform::Client::create();
    if (!client) {
        std::cerr << "Error: Failed to create client platform interface.\n";
        return 1;
    }

    if (!client->connect(socket_name)) {
        std::cerr << "Error: Could not connect to tesserad daemon. Is it running?\n";
        return 1;
    }

    nlohmann::json request = {{"method", command}, {"params", params}};
    std::string response = client->send(request.dump());
    if (response.empty()) {
        std::cerr << "Error: No response from daemon.\n";
        return 1;
    }

    auto reply = nlohmann::json::parse(response, nullptr, false);
    if (reply.is_discarded()) {
        std::cout << response << "\n";
        return 1;
    }
    std::cout << reply.dump(2) << "\n";
    return reply.contains("error") ? 1 : 0;
}
