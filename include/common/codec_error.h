#pragma once

#include <stdexcept>
#include <string>

namespace ctlwire {

/**
 * Base class for every error raised by the wire codecs.
 *
 * Decoders and encoders throw synchronously at the point of violation and
 * never return a partially decoded message. Callers should discard the whole
 * input on any CodecError.
 */
class CodecError : public std::runtime_error {
public:
    explicit CodecError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Buffer is shorter than a required fixed-width field
 */
class NeedData : public CodecError {
public:
    explicit NeedData(const std::string& what) : CodecError(what) {}
};

/**
 * Input is long enough but its content is malformed
 * (bad label byte, forward compression pointer, truncated IE, unknown TV type, ...)
 */
class DecodeError : public CodecError {
public:
    explicit DecodeError(const std::string& what) : CodecError(what) {}
};

using UnpackError = DecodeError;

/**
 * A structured value cannot be serialized
 * (unsupported record or IE type, F-TEID without an address, oversized field)
 */
class PackError : public CodecError {
public:
    explicit PackError(const std::string& what) : CodecError(what) {}
};

}  // namespace ctlwire
