#include "ghostpir/network/message.hpp"
#include "ghostpir/wire.pb.h"
#include <google/protobuf/util/json_util.h>
#include <cmath>
#include <limits>

namespace ghostpir::network {

namespace {

namespace pb = google::protobuf;

template<typename M>
void parse_json(const std::string& json, M* message, const char* what) {
    pb::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;

    auto status = pb::util::JsonStringToMessage(json, message, options);
    if (!status.ok()) {
        throw ProtocolError(std::string("Malformed ") + what + " body: " + status.ToString());
    }
}

template<typename M>
std::string print_json(const M& message) {
    pb::util::JsonPrintOptions options;
    options.preserve_proto_field_names = true;
    options.always_print_primitive_fields = true;

    std::string json;
    auto status = pb::util::MessageToJsonString(message, &json, options);
    if (!status.ok()) {
        throw ProtocolError("Failed to encode JSON body: " + status.ToString());
    }
    return json;
}

/// Byte array -> JSON array of integers
void to_list(const ShareVector& vec, pb::ListValue* list) {
    list->mutable_values()->Reserve(static_cast<int>(vec.size()));
    for (size_t i = 0; i < vec.size(); ++i) {
        list->add_values()->set_number_value(vec[i]);
    }
}

/// JSON array of integers -> byte array, each entry checked to be in [0, 255]
ShareVector from_list(const pb::ListValue& list, const char* what, size_t which) {
    ShareVector vec(static_cast<size_t>(list.values_size()));
    for (int i = 0; i < list.values_size(); ++i) {
        const auto& v = list.values(i);
        if (v.kind_case() != pb::Value::kNumberValue) {
            throw ProtocolError(std::string(what) + " " + std::to_string(which) +
                                " entry " + std::to_string(i) + " is not a number");
        }
        double d = v.number_value();
        if (!(d >= 0.0 && d <= 255.0) || std::floor(d) != d) {
            throw ProtocolError(std::string(what) + " " + std::to_string(which) +
                                " entry " + std::to_string(i) + " is not a byte value");
        }
        vec[static_cast<size_t>(i)] = static_cast<uint8_t>(d);
    }
    return vec;
}

/// Catalog ids arrive as integers or strings
std::string id_to_string(const pb::Value& id) {
    switch (id.kind_case()) {
        case pb::Value::kStringValue:
            return id.string_value();
        case pb::Value::kNumberValue: {
            double d = id.number_value();
            if (std::floor(d) != d || std::fabs(d) > 9007199254740992.0) {
                throw ProtocolError("Catalog id is not an integer");
            }
            return std::to_string(static_cast<long long>(d));
        }
        default:
            throw ProtocolError("Catalog id must be a string or integer");
    }
}

void id_from_string(const std::string& id, pb::Value* out) {
    // Emit numeric ids as numbers to match the catalog service
    if (!id.empty() && id.size() < 16 &&
        id.find_first_not_of("0123456789") == std::string::npos) {
        out->set_number_value(static_cast<double>(std::stoll(id)));
    } else {
        out->set_string_value(id);
    }
}

} // anonymous namespace

// ============================================================================
// Session Messages
// ============================================================================

std::string SessionRequestMessage::to_json() const {
    wire::SessionRequest msg;
    msg.set_ghost_id(ghost_id);
    return print_json(msg);
}

SessionRequestMessage SessionRequestMessage::from_json(const std::string& json) {
    wire::SessionRequest msg;
    parse_json(json, &msg, "session request");

    SessionRequestMessage result;
    result.ghost_id = msg.ghost_id();
    return result;
}

std::string SessionResponseMessage::to_json() const {
    wire::SessionResponse msg;
    msg.set_token(token);
    return print_json(msg);
}

SessionResponseMessage SessionResponseMessage::from_json(const std::string& json) {
    wire::SessionResponse msg;
    parse_json(json, &msg, "session response");

    if (msg.token().empty()) {
        throw ProtocolError("Session response carries no token");
    }

    SessionResponseMessage result;
    result.token = msg.token();
    return result;
}

// ============================================================================
// Catalog Message
// ============================================================================

std::string CatalogMessage::to_json() const {
    wire::CatalogResponse msg;
    for (const auto& module : catalog.modules()) {
        auto* entry = msg.add_modules();
        id_from_string(module.id, entry->mutable_id());
        entry->set_title(module.title);
        entry->set_topic(module.topic);
        entry->set_tier(module.tier);
        entry->set_chunk_count(static_cast<int32_t>(module.chunk_count));
        entry->set_compressed_size(static_cast<int64_t>(module.compressed_size));
        if (module.filename) {
            entry->set_filename(*module.filename);
        }
    }
    return print_json(msg);
}

CatalogMessage CatalogMessage::from_json(const std::string& json) {
    wire::CatalogResponse msg;
    parse_json(json, &msg, "catalog");

    std::vector<ModuleDescriptor> modules;
    modules.reserve(static_cast<size_t>(msg.modules_size()));

    for (const auto& entry : msg.modules()) {
        ModuleDescriptor desc;
        desc.id = id_to_string(entry.id());
        desc.title = entry.title();
        desc.topic = entry.topic();
        desc.tier = entry.tier();

        if (entry.chunk_count() < 0 || entry.compressed_size() < 0) {
            throw ProtocolError("Catalog entry " + desc.id + " has negative sizes");
        }
        desc.chunk_count = static_cast<size_t>(entry.chunk_count());
        desc.compressed_size = static_cast<size_t>(entry.compressed_size());

        if (!entry.filename().empty()) {
            desc.filename = entry.filename();
        }
        modules.push_back(std::move(desc));
    }

    CatalogMessage result;
    result.catalog = Catalog(std::move(modules));
    return result;
}

// ============================================================================
// KPIR Messages
// ============================================================================

std::string KpirRequestMessage::to_json() const {
    wire::KpirRequest msg;
    msg.set_token(token);
    for (const auto& vec : vectors) {
        to_list(vec, msg.add_vectors());
    }
    if (chunk_index > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
        throw ProtocolError("Chunk index exceeds wire range");
    }
    msg.set_chunk_index(static_cast<int32_t>(chunk_index));
    return print_json(msg);
}

KpirRequestMessage KpirRequestMessage::from_json(const std::string& json,
                                                 std::optional<size_t> expected_length) {
    wire::KpirRequest msg;
    parse_json(json, &msg, "kpir request");

    if (msg.vectors_size() != static_cast<int>(kShareCount)) {
        throw ProtocolError("Expected " + std::to_string(kShareCount) + " query vectors, got " +
                            std::to_string(msg.vectors_size()));
    }
    if (msg.chunk_index() < 0) {
        throw ProtocolError("Negative chunk index");
    }

    KpirRequestMessage result;
    result.token = msg.token();
    result.chunk_index = static_cast<size_t>(msg.chunk_index());

    for (size_t k = 0; k < kShareCount; ++k) {
        result.vectors[k] = from_list(msg.vectors(static_cast<int>(k)), "vector", k);
        size_t expected = expected_length ? *expected_length : result.vectors[0].size();
        if (result.vectors[k].size() != expected) {
            throw ProtocolError("Query vector " + std::to_string(k) + " has length " +
                                std::to_string(result.vectors[k].size()) + ", expected " +
                                std::to_string(expected));
        }
    }
    return result;
}

std::string KpirResponseMessage::to_json() const {
    wire::KpirResponse msg;
    for (const auto& share : response.shares) {
        to_list(share, msg.add_responses());
    }
    return print_json(msg);
}

KpirResponseMessage KpirResponseMessage::from_json(const std::string& json,
                                                   size_t expected_length) {
    wire::KpirResponse msg;
    parse_json(json, &msg, "kpir response");

    if (msg.responses_size() != static_cast<int>(kShareCount)) {
        throw ProtocolError("Expected " + std::to_string(kShareCount) + " response shares, got " +
                            std::to_string(msg.responses_size()));
    }

    KpirResponseMessage result;
    for (size_t k = 0; k < kShareCount; ++k) {
        result.response.shares[k] = from_list(msg.responses(static_cast<int>(k)), "response", k);
        if (result.response.shares[k].size() != expected_length) {
            throw ProtocolError("Response share " + std::to_string(k) + " has length " +
                                std::to_string(result.response.shares[k].size()) +
                                ", expected chunk size " + std::to_string(expected_length));
        }
    }
    return result;
}

} // namespace ghostpir::network
