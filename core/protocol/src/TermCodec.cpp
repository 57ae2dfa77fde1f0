#include "TermCodec.h"
#include <arpa/inet.h>
#include <cstring>
#include <limits>
#include <sstream>

namespace FileCourier {

namespace {

    constexpr uint8_t SMALL_INTEGER_EXT = 97;
    constexpr uint8_t INTEGER_EXT = 98;
    constexpr uint8_t ATOM_EXT = 100;
    constexpr uint8_t SMALL_TUPLE_EXT = 104;
    constexpr uint8_t LARGE_TUPLE_EXT = 105;
    constexpr uint8_t NIL_EXT = 106;
    constexpr uint8_t STRING_EXT = 107;
    constexpr uint8_t LIST_EXT = 108;
    constexpr uint8_t BINARY_EXT = 109;
    constexpr uint8_t SMALL_BIG_EXT = 110;
    constexpr uint8_t LARGE_BIG_EXT = 111;
    constexpr uint8_t SMALL_ATOM_EXT = 115;
    constexpr uint8_t ATOM_UTF8_EXT = 118;
    constexpr uint8_t SMALL_ATOM_UTF8_EXT = 119;

    constexpr uint64_t INT32_POSITIVE_LIMIT = static_cast<uint64_t>(std::numeric_limits<int32_t>::max());
    constexpr uint64_t INT32_NEGATIVE_LIMIT = INT32_POSITIVE_LIMIT + 1;

    void putU16(std::vector<uint8_t>& buffer, uint16_t value) {
        uint16_t net = htons(value);
        buffer.insert(buffer.end(), (uint8_t*)&net, (uint8_t*)&net + sizeof(net));
    }

    void putU32(std::vector<uint8_t>& buffer, uint32_t value) {
        uint32_t net = htonl(value);
        buffer.insert(buffer.end(), (uint8_t*)&net, (uint8_t*)&net + sizeof(net));
    }

    void encodeInteger(std::vector<uint8_t>& buffer, const Term& term) {
        if (!term.negative && term.magnitude <= 0xFF) {
            buffer.push_back(SMALL_INTEGER_EXT);
            buffer.push_back(static_cast<uint8_t>(term.magnitude));
            return;
        }

        if ((!term.negative && term.magnitude <= INT32_POSITIVE_LIMIT) ||
            (term.negative && term.magnitude <= INT32_NEGATIVE_LIMIT)) {
            int64_t signedValue = term.negative ? -static_cast<int64_t>(term.magnitude)
                                                : static_cast<int64_t>(term.magnitude);
            buffer.push_back(INTEGER_EXT);
            putU32(buffer, static_cast<uint32_t>(static_cast<int32_t>(signedValue)));
            return;
        }

        // SMALL_BIG_EXT: digit count, sign byte, little-endian magnitude
        std::vector<uint8_t> digits;
        uint64_t remaining = term.magnitude;
        while (remaining > 0) {
            digits.push_back(static_cast<uint8_t>(remaining & 0xFF));
            remaining >>= 8;
        }
        buffer.push_back(SMALL_BIG_EXT);
        buffer.push_back(static_cast<uint8_t>(digits.size()));
        buffer.push_back(term.negative ? 1 : 0);
        buffer.insert(buffer.end(), digits.begin(), digits.end());
    }

    void encodeTerm(std::vector<uint8_t>& buffer, const Term& term) {
        switch (term.kind) {
            case Term::Kind::INTEGER:
                encodeInteger(buffer, term);
                break;

            case Term::Kind::ATOM:
                if (term.text.size() <= 0xFF) {
                    buffer.push_back(SMALL_ATOM_UTF8_EXT);
                    buffer.push_back(static_cast<uint8_t>(term.text.size()));
                } else {
                    buffer.push_back(ATOM_UTF8_EXT);
                    putU16(buffer, static_cast<uint16_t>(term.text.size()));
                }
                buffer.insert(buffer.end(), term.text.begin(), term.text.end());
                break;

            case Term::Kind::STRING:
                if (term.text.empty()) {
                    buffer.push_back(NIL_EXT);
                } else if (term.text.size() <= 0xFFFF) {
                    buffer.push_back(STRING_EXT);
                    putU16(buffer, static_cast<uint16_t>(term.text.size()));
                    buffer.insert(buffer.end(), term.text.begin(), term.text.end());
                } else {
                    // Too long for STRING_EXT: a proper list of byte-sized integers
                    buffer.push_back(LIST_EXT);
                    putU32(buffer, static_cast<uint32_t>(term.text.size()));
                    for (unsigned char c : term.text) {
                        buffer.push_back(SMALL_INTEGER_EXT);
                        buffer.push_back(c);
                    }
                    buffer.push_back(NIL_EXT);
                }
                break;

            case Term::Kind::BINARY:
                buffer.push_back(BINARY_EXT);
                putU32(buffer, static_cast<uint32_t>(term.text.size()));
                buffer.insert(buffer.end(), term.text.begin(), term.text.end());
                break;

            case Term::Kind::TUPLE:
                if (term.elements.size() <= 0xFF) {
                    buffer.push_back(SMALL_TUPLE_EXT);
                    buffer.push_back(static_cast<uint8_t>(term.elements.size()));
                } else {
                    buffer.push_back(LARGE_TUPLE_EXT);
                    putU32(buffer, static_cast<uint32_t>(term.elements.size()));
                }
                for (const auto& element : term.elements) {
                    encodeTerm(buffer, element);
                }
                break;

            case Term::Kind::LIST:
                if (term.elements.empty()) {
                    buffer.push_back(NIL_EXT);
                    break;
                }
                buffer.push_back(LIST_EXT);
                putU32(buffer, static_cast<uint32_t>(term.elements.size()));
                for (const auto& element : term.elements) {
                    encodeTerm(buffer, element);
                }
                buffer.push_back(NIL_EXT);
                break;
        }
    }

    /**
     * @brief Bounds-checked cursor over an encoded term
     */
    class TermReader {
    public:
        explicit TermReader(const std::vector<uint8_t>& data) : data_(data) {}

        size_t remaining() const { return data_.size() - offset_; }
        bool atEnd() const { return offset_ == data_.size(); }

        bool readU8(uint8_t& out) {
            if (remaining() < 1) return false;
            out = data_[offset_++];
            return true;
        }

        bool readU16(uint16_t& out) {
            if (remaining() < 2) return false;
            uint16_t net;
            memcpy(&net, data_.data() + offset_, 2);
            out = ntohs(net);
            offset_ += 2;
            return true;
        }

        bool readU32(uint32_t& out) {
            if (remaining() < 4) return false;
            uint32_t net;
            memcpy(&net, data_.data() + offset_, 4);
            out = ntohl(net);
            offset_ += 4;
            return true;
        }

        bool readBytes(size_t count, std::string& out) {
            if (remaining() < count) return false;
            out.assign(reinterpret_cast<const char*>(data_.data() + offset_), count);
            offset_ += count;
            return true;
        }

        size_t offset() const { return offset_; }

    private:
        const std::vector<uint8_t>& data_;
        size_t offset_{0};
    };

    Error malformed(const std::string& what, size_t offset) {
        return Error{ErrorCode::MalformedMessage,
                     "Malformed term at byte " + std::to_string(offset) + ": " + what};
    }

    Result<Term> decodeTerm(TermReader& reader, size_t depth);

    Result<Term> decodeBig(TermReader& reader, uint32_t digitCount) {
        uint8_t sign;
        if (!reader.readU8(sign)) return malformed("truncated big integer", reader.offset());
        if (digitCount > sizeof(uint64_t)) {
            return malformed("integer wider than 64 bits", reader.offset());
        }
        std::string digits;
        if (!reader.readBytes(digitCount, digits)) {
            return malformed("truncated big integer", reader.offset());
        }
        uint64_t magnitude = 0;
        for (size_t i = digits.size(); i > 0; --i) {
            magnitude = (magnitude << 8) | static_cast<uint8_t>(digits[i - 1]);
        }
        return sign ? Term::negativeInteger(magnitude) : Term::integer(magnitude);
    }

    Result<Term> decodeElements(TermReader& reader, size_t depth, uint32_t count, Term::Kind kind) {
        // Every element occupies at least one byte
        if (count > reader.remaining()) {
            return malformed("element count exceeds payload", reader.offset());
        }
        std::vector<Term> elements;
        elements.reserve(count);
        for (uint32_t i = 0; i < count; ++i) {
            auto element = decodeTerm(reader, depth + 1);
            if (!element) return element.error();
            elements.push_back(std::move(*element));
        }
        return kind == Term::Kind::TUPLE ? Term::tuple(std::move(elements))
                                         : Term::list(std::move(elements));
    }

    Result<Term> decodeTerm(TermReader& reader, size_t depth) {
        if (depth > TermCodec::MAX_DEPTH) {
            return malformed("nesting too deep", reader.offset());
        }

        uint8_t tag;
        if (!reader.readU8(tag)) return malformed("unexpected end of data", reader.offset());

        switch (tag) {
            case SMALL_INTEGER_EXT: {
                uint8_t value;
                if (!reader.readU8(value)) return malformed("truncated small integer", reader.offset());
                return Term::integer(value);
            }

            case INTEGER_EXT: {
                uint32_t raw;
                if (!reader.readU32(raw)) return malformed("truncated integer", reader.offset());
                int32_t value = static_cast<int32_t>(raw);
                if (value < 0) {
                    return Term::negativeInteger(static_cast<uint64_t>(-static_cast<int64_t>(value)));
                }
                return Term::integer(static_cast<uint64_t>(value));
            }

            case SMALL_BIG_EXT: {
                uint8_t n;
                if (!reader.readU8(n)) return malformed("truncated big integer", reader.offset());
                return decodeBig(reader, n);
            }

            case LARGE_BIG_EXT: {
                uint32_t n;
                if (!reader.readU32(n)) return malformed("truncated big integer", reader.offset());
                return decodeBig(reader, n);
            }

            case ATOM_EXT:
            case ATOM_UTF8_EXT: {
                uint16_t len;
                std::string name;
                if (!reader.readU16(len) || !reader.readBytes(len, name)) {
                    return malformed("truncated atom", reader.offset());
                }
                return Term::atom(std::move(name));
            }

            case SMALL_ATOM_EXT:
            case SMALL_ATOM_UTF8_EXT: {
                uint8_t len;
                std::string name;
                if (!reader.readU8(len) || !reader.readBytes(len, name)) {
                    return malformed("truncated atom", reader.offset());
                }
                return Term::atom(std::move(name));
            }

            case SMALL_TUPLE_EXT: {
                uint8_t arity;
                if (!reader.readU8(arity)) return malformed("truncated tuple", reader.offset());
                return decodeElements(reader, depth, arity, Term::Kind::TUPLE);
            }

            case LARGE_TUPLE_EXT: {
                uint32_t arity;
                if (!reader.readU32(arity)) return malformed("truncated tuple", reader.offset());
                return decodeElements(reader, depth, arity, Term::Kind::TUPLE);
            }

            case NIL_EXT:
                return Term::list({});

            case STRING_EXT: {
                uint16_t len;
                std::string bytes;
                if (!reader.readU16(len) || !reader.readBytes(len, bytes)) {
                    return malformed("truncated string", reader.offset());
                }
                return Term::string(std::move(bytes));
            }

            case LIST_EXT: {
                uint32_t count;
                if (!reader.readU32(count)) return malformed("truncated list", reader.offset());
                auto list = decodeElements(reader, depth, count, Term::Kind::LIST);
                if (!list) return list;
                uint8_t tail;
                if (!reader.readU8(tail)) return malformed("missing list tail", reader.offset());
                if (tail != NIL_EXT) return malformed("improper list", reader.offset());
                return list;
            }

            case BINARY_EXT: {
                uint32_t len;
                std::string bytes;
                if (!reader.readU32(len) || !reader.readBytes(len, bytes)) {
                    return malformed("truncated binary", reader.offset());
                }
                return Term::binary(std::move(bytes));
            }

            default:
                return malformed("unsupported tag " + std::to_string(tag), reader.offset() - 1);
        }
    }

    void describeInto(std::ostringstream& out, const Term& term) {
        switch (term.kind) {
            case Term::Kind::INTEGER:
                if (term.negative && term.magnitude != 0) out << '-';
                out << term.magnitude;
                break;
            case Term::Kind::ATOM:
                out << term.text;
                break;
            case Term::Kind::STRING:
                out << '"' << term.text << '"';
                break;
            case Term::Kind::BINARY:
                out << "<<" << term.text.size() << " bytes>>";
                break;
            case Term::Kind::TUPLE:
            case Term::Kind::LIST: {
                out << (term.kind == Term::Kind::TUPLE ? '{' : '[');
                for (size_t i = 0; i < term.elements.size(); ++i) {
                    if (i > 0) out << ',';
                    describeInto(out, term.elements[i]);
                }
                out << (term.kind == Term::Kind::TUPLE ? '}' : ']');
                break;
            }
        }
    }

} // namespace

Term Term::integer(uint64_t value) {
    Term term;
    term.kind = Kind::INTEGER;
    term.magnitude = value;
    return term;
}

Term Term::negativeInteger(uint64_t magnitude) {
    Term term = integer(magnitude);
    term.negative = magnitude != 0;
    return term;
}

Term Term::atom(std::string name) {
    Term term;
    term.kind = Kind::ATOM;
    term.text = std::move(name);
    return term;
}

Term Term::string(std::string value) {
    Term term;
    term.kind = Kind::STRING;
    term.text = std::move(value);
    return term;
}

Term Term::binary(std::string bytes) {
    Term term;
    term.kind = Kind::BINARY;
    term.text = std::move(bytes);
    return term;
}

Term Term::tuple(std::vector<Term> elements) {
    Term term;
    term.kind = Kind::TUPLE;
    term.elements = std::move(elements);
    return term;
}

Term Term::list(std::vector<Term> elements) {
    Term term;
    term.kind = Kind::LIST;
    term.elements = std::move(elements);
    return term;
}

bool Term::isAtom(const std::string& name) const {
    return kind == Kind::ATOM && text == name;
}

bool Term::asText(std::string& out) const {
    switch (kind) {
        case Kind::ATOM:
        case Kind::STRING:
        case Kind::BINARY:
            out = text;
            return true;
        case Kind::LIST: {
            // NIL and lists of byte values are strings too
            std::string collected;
            collected.reserve(elements.size());
            for (const auto& element : elements) {
                if (element.kind != Kind::INTEGER || element.negative || element.magnitude > 0xFF) {
                    return false;
                }
                collected.push_back(static_cast<char>(element.magnitude));
            }
            out = std::move(collected);
            return true;
        }
        default:
            return false;
    }
}

std::string Term::describe() const {
    std::ostringstream out;
    describeInto(out, *this);
    return out.str();
}

std::vector<uint8_t> TermCodec::encode(const Term& term) {
    std::vector<uint8_t> buffer;
    buffer.push_back(VERSION);
    encodeTerm(buffer, term);
    return buffer;
}

Result<Term> TermCodec::decode(const std::vector<uint8_t>& data) {
    TermReader reader(data);

    uint8_t version;
    if (!reader.readU8(version)) {
        return malformed("empty payload", 0);
    }
    if (version != VERSION) {
        return malformed("unsupported format version " + std::to_string(version), 0);
    }

    auto term = decodeTerm(reader, 0);
    if (!term) {
        return term;
    }
    if (!reader.atEnd()) {
        return malformed(std::to_string(reader.remaining()) + " trailing bytes", reader.offset());
    }
    return term;
}

} // namespace FileCourier
