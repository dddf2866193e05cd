#pragma once

#include "ghostpir/core/types.hpp"
#include "ghostpir/network/transport.hpp"
#include "ghostpir/pir/artifact_decoder.hpp"
#include "ghostpir/pir/assembler.hpp"
#include "ghostpir/pir/reconstructor.hpp"
#include "ghostpir/pir/vector_generator.hpp"
#include "ghostpir/retrieval/observer.hpp"
#include "ghostpir/retrieval/state.hpp"
#include "ghostpir/session/session_manager.hpp"
#include <atomic>
#include <memory>
#include <optional>
#include <string>

namespace ghostpir::retrieval {

// ============================================================================
// Pinned Target
// ============================================================================

/// Catalog snapshot and target position fixed for one download.
/// The snapshot is never re-fetched while chunks are in flight.
struct PinnedTarget {
    std::shared_ptr<const Catalog> catalog;
    size_t index = 0;
    std::string module_id;

    const ModuleDescriptor& descriptor() const { return catalog->at(index); }

    /// Throws CatalogPinError if the snapshot no longer names module_id at index
    void verify() const;
};

// ============================================================================
// Chunk Retriever (protocol state machine)
// ============================================================================

/// Idle -> FetchingCatalog -> Downloading(i) -> Decompressing -> Ready | Error.
/// Each step() performs one transition. One logical download per instance;
/// step() must not be called concurrently.
class ChunkRetriever {
private:
    // Collaborators
    std::shared_ptr<network::PirTransport> transport_;
    std::shared_ptr<session::SessionManager> session_;
    pir::VectorGenerator generator_;
    pir::Reconstructor reconstructor_;
    pir::ArtifactDecoder decoder_;
    std::shared_ptr<RetrievalObserver> observer_;
    std::string identity_;

    // Download state
    RetrieverState state_;
    std::string module_id_;
    std::optional<PinnedTarget> target_;
    std::optional<pir::Assembler> assembler_;
    size_t next_chunk_;
    SessionToken token_;
    std::optional<ModuleArtifact> artifact_;
    std::optional<RetrievalError> error_;
    std::atomic<bool> cancel_requested_;

public:
    ChunkRetriever(std::shared_ptr<network::PirTransport> transport,
                   std::shared_ptr<session::SessionManager> session,
                   std::string identity,
                   size_t chunk_size,
                   std::shared_ptr<RetrievalObserver> observer = nullptr,
                   pir::VectorGenerator generator = pir::VectorGenerator(),
                   pir::ArtifactDecoder decoder = pir::ArtifactDecoder());

    ChunkRetriever(const ChunkRetriever&) = delete;
    ChunkRetriever& operator=(const ChunkRetriever&) = delete;

    /// Idle -> FetchingCatalog. Throws BusyError from any other state.
    void start(const std::string& module_id);

    /// Perform exactly one transition and return the new state.
    /// No-op in Idle, Ready and Error.
    RetrieverState step();

    /// Error -> Downloading(0). Re-fetches the catalog and re-pins the target
    /// before returning; all recovered chunks are discarded. A failing catalog
    /// fetch leaves the retriever in Error. Throws GhostPirError outside the
    /// Error state.
    void retry();

    /// Request cancellation; honoured at the next step(). A request made
    /// before start() applies to the download start() begins.
    void cancel() { cancel_requested_.store(true, std::memory_order_release); }

    /// Drop a pending cancellation request
    void clear_cancel() { cancel_requested_.store(false, std::memory_order_release); }

    /// Discard all download state and return to Idle
    void reset();

    // Status
    RetrieverState state() const { return state_; }
    bool finished() const {
        return state_ == RetrieverState::Ready || state_ == RetrieverState::Error;
    }
    const std::string& module_id() const { return module_id_; }
    size_t next_chunk() const { return next_chunk_; }
    size_t chunk_count() const { return target_ ? target_->descriptor().chunk_count : 0; }
    const std::optional<PinnedTarget>& target() const { return target_; }
    const std::optional<RetrievalError>& error() const { return error_; }
    const SessionToken& token() const { return token_; }

    /// Available in Ready
    const std::optional<ModuleArtifact>& artifact() const { return artifact_; }

    /// Move the artifact out; leaves the retriever in Idle
    std::optional<ModuleArtifact> take_artifact();

private:
    void transition(RetrieverState to);
    void fail(const GhostPirError& e, std::optional<size_t> chunk_index);

    void fetch_catalog();
    void fetch_chunk(size_t chunk_index);
    void decompress();
};

} // namespace ghostpir::retrieval
