#pragma once

#include "Result.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace FileCourier {

/**
 * @brief A decoded value of the external term format
 *
 * Only the shapes the transfer protocol exchanges are representable:
 * integers, atoms, character strings, binaries, tuples and proper lists.
 */
struct Term {
    enum class Kind {
        INTEGER,
        ATOM,
        STRING,
        BINARY,
        TUPLE,
        LIST
    };

    Kind kind{Kind::LIST};
    bool negative{false};        // INTEGER sign
    uint64_t magnitude{0};       // INTEGER absolute value
    std::string text;            // ATOM name, STRING / BINARY bytes
    std::vector<Term> elements;  // TUPLE / LIST members

    static Term integer(uint64_t value);
    static Term negativeInteger(uint64_t magnitude);
    static Term atom(std::string name);
    static Term string(std::string value);
    static Term binary(std::string bytes);
    static Term tuple(std::vector<Term> elements);
    static Term list(std::vector<Term> elements);

    bool isAtom(const std::string& name) const;
    bool isNonNegativeInteger() const { return kind == Kind::INTEGER && (!negative || magnitude == 0); }

    /**
     * @brief Textual content of an atom, string, binary or list of bytes
     * @return false for any other shape
     */
    bool asText(std::string& out) const;

    /// Erlang-like rendering for log lines
    std::string describe() const;
};

/**
 * @brief Encoder/decoder for external term format version 131
 *
 * Encoding always picks the compact form (SMALL_ATOM_UTF8, STRING_EXT,
 * SMALL_INTEGER / INTEGER / SMALL_BIG). Decoding accepts every atom
 * encoding and big integers up to 64 bits.
 */
class TermCodec {
public:
    static constexpr uint8_t VERSION = 131;
    static constexpr size_t MAX_DEPTH = 64;

    static std::vector<uint8_t> encode(const Term& term);

    /**
     * @brief Decode one complete term
     * @return MalformedMessage on truncation, unknown tags, excessive
     *         nesting or trailing bytes
     */
    static Result<Term> decode(const std::vector<uint8_t>& data);
};

} // namespace FileCourier
