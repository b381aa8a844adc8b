#pragma once
#include <stdexcept>
#include <string>

namespace semsearch {

    /**
     * @brief Root of every failure raised by semsearch.
     */
    class Error : public std::runtime_error {
    public:
        explicit Error(const std::string& what) : std::runtime_error(what) {}
    };

    /// Malformed or empty caller input. Never retried.
    class InvalidArgument : public Error {
    public:
        using Error::Error;
    };

    /// Encoder model file absent or unloadable. Fatal at startup.
    class ModelArtifactMissing : public Error {
    public:
        using Error::Error;
    };

    /// Tokenizer vocabulary absent or corrupt. Fatal at startup.
    class TokenizerUnavailable : public Error {
    public:
        using Error::Error;
    };

    /// The inference runtime broke its contract (output rank, output count, backend failure).
    class InternalError : public Error {
    public:
        using Error::Error;
    };

    class StorageError : public Error {
    public:
        using Error::Error;
    };

    class ConfigError : public Error {
    public:
        using Error::Error;
    };

}
