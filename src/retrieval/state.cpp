#include "ghostpir/retrieval/state.hpp"
#include "ghostpir/network/connection.hpp"

namespace ghostpir::retrieval {

const char* to_string(RetrieverState state) {
    switch (state) {
        case RetrieverState::Idle:            return "Idle";
        case RetrieverState::FetchingCatalog: return "FetchingCatalog";
        case RetrieverState::Downloading:     return "Downloading";
        case RetrieverState::Decompressing:   return "Decompressing";
        case RetrieverState::Ready:           return "Ready";
        case RetrieverState::Error:           return "Error";
    }
    return "Unknown";
}

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::IndexOutOfRange: return "IndexOutOfRange";
        case ErrorKind::Network:         return "NetworkError";
        case ErrorKind::SessionExpired:  return "SessionExpired";
        case ErrorKind::Protocol:        return "ProtocolError";
        case ErrorKind::Integrity:       return "IntegrityError";
        case ErrorKind::Decompression:   return "DecompressionError";
        case ErrorKind::ModuleNotFound:  return "ModuleNotFound";
        case ErrorKind::CatalogPin:      return "CatalogPinError";
        case ErrorKind::Randomness:      return "RandomnessError";
        case ErrorKind::Config:          return "ConfigError";
        case ErrorKind::Busy:            return "Busy";
        case ErrorKind::Cancelled:       return "Cancelled";
    }
    return "Unknown";
}

RetrievalError RetrievalError::from_exception(const GhostPirError& e,
                                              std::optional<size_t> chunk_index) {
    RetrievalError err;
    err.message = e.what();
    err.chunk_index = chunk_index;

    if (const auto* net = dynamic_cast<const network::NetworkError*>(&e)) {
        err.kind = dynamic_cast<const network::SessionExpired*>(&e)
                       ? ErrorKind::SessionExpired
                       : ErrorKind::Network;
        err.endpoint = net->endpoint();
        err.status = net->status();
        if (net->chunk_index()) {
            err.chunk_index = net->chunk_index();
        }
    } else if (dynamic_cast<const IndexOutOfRange*>(&e)) {
        err.kind = ErrorKind::IndexOutOfRange;
    } else if (dynamic_cast<const IntegrityError*>(&e)) {
        err.kind = ErrorKind::Integrity;
    } else if (dynamic_cast<const DecompressionError*>(&e)) {
        err.kind = ErrorKind::Decompression;
    } else if (dynamic_cast<const ModuleNotFound*>(&e)) {
        err.kind = ErrorKind::ModuleNotFound;
    } else if (dynamic_cast<const CatalogPinError*>(&e)) {
        err.kind = ErrorKind::CatalogPin;
    } else if (dynamic_cast<const RandomnessError*>(&e)) {
        err.kind = ErrorKind::Randomness;
    } else if (dynamic_cast<const ConfigError*>(&e)) {
        err.kind = ErrorKind::Config;
    } else if (dynamic_cast<const BusyError*>(&e)) {
        err.kind = ErrorKind::Busy;
    } else {
        err.kind = ErrorKind::Protocol;
    }

    return err;
}

} // namespace ghostpir::retrieval
