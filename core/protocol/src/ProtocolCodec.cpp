#include "ProtocolCodec.h"
#include <optional>

namespace FileCourier {

namespace {

    const char* ATOM_ALREADY_DOWNLOADED = "already_downloaded";
    const char* ATOM_OK = "ok";
    const char* ATOM_ERROR = "error";

    Term field(const char* name, Term value) {
        return Term::tuple({Term::atom(name), std::move(value)});
    }

    Error unrecognized(const Term& term) {
        return Error{ErrorCode::UnrecognizedResponse, "Unrecognized server response: " + term.describe()};
    }

} // namespace

std::vector<uint8_t> ProtocolCodec::encodeRequest(const OutboundMessage& message) {
    std::vector<Term> fields;
    fields.reserve(4);
    fields.push_back(field("filename", Term::string(message.filename)));
    fields.push_back(field(selectorTag(message.destination), Term::string(selectorValue(message.destination))));
    fields.push_back(field("size", Term::integer(message.size)));
    fields.push_back(field("checksum", Term::string(message.checksum)));
    return TermCodec::encode(Term::list(std::move(fields)));
}

Result<ServerResponse> ProtocolCodec::decodeResponse(const std::vector<uint8_t>& payload) {
    auto decoded = TermCodec::decode(payload);
    if (!decoded) {
        return decoded.error();
    }
    const Term& term = *decoded;

    if (term.isAtom(ATOM_ALREADY_DOWNLOADED)) {
        return ServerResponse::alreadyDownloaded();
    }

    if (term.kind != Term::Kind::TUPLE || term.elements.size() != 2) {
        return unrecognized(term);
    }

    const Term& tag = term.elements[0];
    const Term& body = term.elements[1];

    if (tag.isAtom(ATOM_OK)) {
        if (!body.isNonNegativeInteger()) {
            return unrecognized(term);
        }
        return ServerResponse::resumeAt(body.magnitude);
    }

    if (tag.isAtom(ATOM_ERROR)) {
        std::string reason;
        if (!body.asText(reason)) {
            // Structured reasons are kept in rendered form
            reason = body.describe();
        }
        return ServerResponse::error(std::move(reason));
    }

    return unrecognized(term);
}

std::vector<uint8_t> ProtocolCodec::encodeResponse(const ServerResponse& response) {
    switch (response.type) {
        case ServerResponse::Type::ALREADY_DOWNLOADED:
            return TermCodec::encode(Term::atom(ATOM_ALREADY_DOWNLOADED));
        case ServerResponse::Type::RESUME_AT:
            return TermCodec::encode(Term::tuple({Term::atom(ATOM_OK), Term::integer(response.existingSize)}));
        case ServerResponse::Type::ERROR:
        default:
            return TermCodec::encode(Term::tuple({Term::atom(ATOM_ERROR), Term::atom(response.errorReason)}));
    }
}

Result<OutboundMessage> ProtocolCodec::decodeRequest(const std::vector<uint8_t>& payload) {
    auto decoded = TermCodec::decode(payload);
    if (!decoded) {
        return decoded.error();
    }
    if (decoded->kind != Term::Kind::LIST) {
        return Error{ErrorCode::MalformedMessage, "Request is not a property list"};
    }

    std::optional<std::string> filename;
    std::optional<std::string> checksum;
    std::optional<uint64_t> size;
    std::optional<DestinationSelector> destination;
    int selectorCount = 0;

    for (const auto& entry : decoded->elements) {
        if (entry.kind != Term::Kind::TUPLE || entry.elements.size() != 2 ||
            entry.elements[0].kind != Term::Kind::ATOM) {
            return Error{ErrorCode::MalformedMessage, "Request entry is not {Key, Value}: " + entry.describe()};
        }
        const std::string& key = entry.elements[0].text;
        const Term& value = entry.elements[1];
        std::string text;

        if (key == "size") {
            if (!value.isNonNegativeInteger()) {
                return Error{ErrorCode::MalformedMessage, "Request size is not a non-negative integer"};
            }
            size = value.magnitude;
            continue;
        }
        if (!value.asText(text)) {
            return Error{ErrorCode::MalformedMessage, "Request field " + key + " is not text"};
        }
        if (key == "filename") {
            filename = text;
        } else if (key == "checksum") {
            checksum = text;
        } else if (key == "destination") {
            destination = DestinationPath{text};
            ++selectorCount;
        } else if (key == "uuid") {
            destination = DestinationUuid{text};
            ++selectorCount;
        } else if (key == "directory") {
            destination = DestinationDirectory{text};
            ++selectorCount;
        }
    }

    if (!filename || !checksum || !size || selectorCount != 1) {
        return Error{ErrorCode::MalformedMessage, "Request is missing fields or has multiple destinations"};
    }

    OutboundMessage message;
    message.filename = *filename;
    message.destination = *destination;
    message.size = *size;
    message.checksum = *checksum;
    return message;
}

} // namespace FileCourier
