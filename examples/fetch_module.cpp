/**
 * Private module download
 * Fetches one catalog module without revealing which one to the responder
 *
 * Usage: fetch_module <username> <password> <module_id> [output_dir]
 * Environment: GHOSTPIR_API_URL, GHOSTPIR_CHUNK_SIZE, GHOSTPIR_VERBOSE
 */

#include "ghostpir/core/config.hpp"
#include "ghostpir/retrieval/module_fetcher.hpp"
#include "ghostpir/retrieval/observer.hpp"
#include "ghostpir/session/ghost_id.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace ghostpir;
using namespace ghostpir::retrieval;

void print_header(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << "  " << title << "\n";
    std::cout << std::string(60, '=') << "\n";
}

void write_artifact(const ModuleArtifact& artifact, const std::filesystem::path& dir) {
    std::filesystem::create_directories(dir);
    auto path = dir / artifact.filename;

    std::ofstream out(path, std::ios::binary);
    if (!out) {
        throw std::runtime_error("Cannot open " + path.string() + " for writing");
    }
    out.write(reinterpret_cast<const char*>(artifact.content.data()),
              static_cast<std::streamsize>(artifact.content.size()));
    if (!out) {
        throw std::runtime_error("Failed writing " + path.string());
    }

    std::cout << "Saved " << artifact.content.size() << " bytes ("
              << artifact.mime_type << ") to " << path.string() << "\n";
}

int main(int argc, char** argv) {
    if (argc < 4) {
        std::cerr << "Usage: " << argv[0]
                  << " <username> <password> <module_id> [output_dir]\n";
        return 2;
    }

    try {
        ClientConfig config = ClientConfig::from_environment();
        config.identity = session::derive_ghost_id(argv[1], argv[2]);
        std::string module_id = argv[3];
        std::filesystem::path output_dir = argc > 4 ? argv[4] : ".";

        print_header("GhostPIR Module Retrieval");
        std::cout << "Service:    " << config.base_url << "\n";
        std::cout << "Chunk size: " << config.chunk_size << " bytes\n";
        std::cout << "Ghost id:   " << config.identity.substr(0, 16) << "...\n";
        std::cout << "Module:     " << module_id << "\n";

        auto traffic = std::make_shared<TrafficObserver>();
        auto observers = std::make_shared<ObserverGroup>();
        observers->add(traffic);
        observers->add(std::make_shared<ConsoleObserver>("fetch"));

        auto fetcher = ModuleFetcher::connect(config, nullptr, observers);
        FetchResult result = fetcher->fetch_module(module_id);

        traffic->print_statistics();

        if (!result.ok()) {
            const auto& err = *result.error;
            std::cerr << "Error [" << to_string(err.kind) << "]";
            if (!err.endpoint.empty()) std::cerr << " " << err.endpoint;
            if (err.status != 0) std::cerr << " status " << err.status;
            if (err.chunk_index) std::cerr << " chunk " << *err.chunk_index;
            std::cerr << ": " << err.message << "\n";
            if (err.retryable()) {
                std::cerr << "The download can be retried.\n";
            }
            return 1;
        }

        write_artifact(*result.artifact, output_dir);
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
