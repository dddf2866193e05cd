#include "ghostpir/retrieval/chunk_retriever.hpp"
#include "ghostpir/network/connection.hpp"

namespace ghostpir::retrieval {

// ============================================================================
// PinnedTarget Implementation
// ============================================================================

void PinnedTarget::verify() const {
    if (!catalog || index >= catalog->size()) {
        throw CatalogPinError("Pinned index " + std::to_string(index) +
                              " outside pinned catalog");
    }
    if (catalog->at(index).id != module_id) {
        throw CatalogPinError("Pinned index " + std::to_string(index) + " names module " +
                              catalog->at(index).id + ", expected " + module_id);
    }
}

// ============================================================================
// ChunkRetriever Implementation
// ============================================================================

ChunkRetriever::ChunkRetriever(std::shared_ptr<network::PirTransport> transport,
                               std::shared_ptr<session::SessionManager> session,
                               std::string identity,
                               size_t chunk_size,
                               std::shared_ptr<RetrievalObserver> observer,
                               pir::VectorGenerator generator,
                               pir::ArtifactDecoder decoder)
    : transport_(std::move(transport)),
      session_(std::move(session)),
      generator_(std::move(generator)),
      reconstructor_(chunk_size),
      decoder_(decoder),
      observer_(observer ? std::move(observer) : std::make_shared<RetrievalObserver>()),
      identity_(std::move(identity)),
      state_(RetrieverState::Idle),
      next_chunk_(0),
      cancel_requested_(false) {
    if (!transport_ || !session_) {
        throw ConfigError("ChunkRetriever requires a transport and a session manager");
    }
    if (chunk_size == 0) {
        throw ConfigError("chunk_size must be positive");
    }
}

void ChunkRetriever::start(const std::string& module_id) {
    if (state_ != RetrieverState::Idle) {
        throw BusyError();
    }

    module_id_ = module_id;
    error_.reset();
    artifact_.reset();
    transition(RetrieverState::FetchingCatalog);
}

RetrieverState ChunkRetriever::step() {
    if (cancel_requested_.exchange(false, std::memory_order_acq_rel)) {
        reset();
        return state_;
    }

    switch (state_) {
        case RetrieverState::FetchingCatalog:
            try {
                fetch_catalog();
            } catch (const GhostPirError& e) {
                fail(e, std::nullopt);
            }
            break;

        case RetrieverState::Downloading:
            try {
                fetch_chunk(next_chunk_);
            } catch (const GhostPirError& e) {
                fail(e, next_chunk_);
            }
            break;

        case RetrieverState::Decompressing:
            try {
                decompress();
            } catch (const GhostPirError& e) {
                fail(e, std::nullopt);
            }
            break;

        case RetrieverState::Idle:
        case RetrieverState::Ready:
        case RetrieverState::Error:
            break;
    }

    return state_;
}

void ChunkRetriever::retry() {
    if (state_ != RetrieverState::Error) {
        throw GhostPirError(std::string("retry() requires the Error state, retriever is ") +
                            to_string(state_));
    }

    // A rejected token is never presented again
    if (error_ && error_->kind == ErrorKind::SessionExpired) {
        token_ = SessionToken{};
    }

    error_.reset();
    target_.reset();
    assembler_.reset();
    next_chunk_ = 0;

    // Fresh snapshot and pin; lands in Downloading(0) or back in Error
    try {
        fetch_catalog();
    } catch (const GhostPirError& e) {
        fail(e, std::nullopt);
    }
}

void ChunkRetriever::reset() {
    RetrieverState from = state_;

    module_id_.clear();
    target_.reset();
    assembler_.reset();
    next_chunk_ = 0;
    artifact_.reset();
    error_.reset();
    state_ = RetrieverState::Idle;

    if (from != RetrieverState::Idle) {
        observer_->on_state_change(from, RetrieverState::Idle);
    }
}

std::optional<ModuleArtifact> ChunkRetriever::take_artifact() {
    if (state_ != RetrieverState::Ready) {
        return std::nullopt;
    }
    auto artifact = std::move(artifact_);
    reset();
    return artifact;
}

void ChunkRetriever::transition(RetrieverState to) {
    RetrieverState from = state_;
    state_ = to;
    observer_->on_state_change(from, to);
}

void ChunkRetriever::fail(const GhostPirError& e, std::optional<size_t> chunk_index) {
    error_ = RetrievalError::from_exception(e, chunk_index);
    transition(RetrieverState::Error);
    observer_->on_error(*error_);
}

// ============================================================================
// Transitions
// ============================================================================

void ChunkRetriever::fetch_catalog() {
    auto catalog = std::make_shared<const Catalog>(transport_->fetch_catalog());

    auto position = catalog->position_of(module_id_);
    if (!position) {
        throw ModuleNotFound(module_id_);
    }

    PinnedTarget target;
    target.catalog = std::move(catalog);
    target.index = *position;
    target.module_id = module_id_;

    // Rejects descriptors violating the chunk/size invariant
    pir::Assembler assembler(target.descriptor(), reconstructor_.chunk_size());

    if (token_.empty()) {
        token_ = session_->create(identity_);
    }

    target_ = std::move(target);
    assembler_.emplace(std::move(assembler));
    next_chunk_ = 0;
    transition(RetrieverState::Downloading);
}

void ChunkRetriever::fetch_chunk(size_t chunk_index) {
    // (1) Pinned snapshot and index, never re-resolved
    target_->verify();
    const auto& descriptor = target_->descriptor();

    // (2) Session freshness, before the request is issued
    SessionToken refreshed = session_->refresh_if_needed(token_, identity_, session_->now());
    if (refreshed.value != token_.value || refreshed.issued_at != token_.issued_at) {
        token_ = std::move(refreshed);
        observer_->on_session_refresh();
    }

    // (3) Fresh shares for this request only
    QueryVectorSet vectors = generator_.generate(target_->index, target_->catalog->size());

    // (4)-(5) One request, three response shares
    ChunkResponse response = transport_->query(token_.value, std::move(vectors), chunk_index);

    // (6)-(7) Reconstruct and store by index
    assembler_->add(chunk_index, reconstructor_.recover(response));

    next_chunk_ = chunk_index + 1;
    observer_->on_progress(next_chunk_, descriptor.chunk_count);

    if (next_chunk_ == descriptor.chunk_count) {
        transition(RetrieverState::Decompressing);
    }
}

void ChunkRetriever::decompress() {
    std::vector<uint8_t> stream = assembler_->assemble();
    artifact_ = decoder_.decode(target_->descriptor(), stream);
    transition(RetrieverState::Ready);
}

} // namespace ghostpir::retrieval
