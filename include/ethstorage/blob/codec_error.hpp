#ifndef ETHSTORAGE_BLOB_CODEC_ERROR_HPP
#define ETHSTORAGE_BLOB_CODEC_ERROR_HPP

#include <stdexcept>
#include <string>

namespace ethstorage::blob {

class CodecError : public std::runtime_error {
public:
  explicit CodecError(const std::string& message)
    : std::runtime_error("Blob codec: " + message) {}
};

class EncodingError : public CodecError {
public:
  explicit EncodingError(const std::string& message)
    : CodecError("encoding error: " + message) {}
};

class DecodingError : public CodecError {
public:
  explicit DecodingError(const std::string& message)
    : CodecError("decoding error: " + message) {}
};

} // namespace ethstorage::blob

#endif // ETHSTORAGE_BLOB_CODEC_ERROR_HPP
