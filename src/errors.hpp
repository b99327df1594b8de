#pragma once
#include <stdexcept>
#include <string>

namespace engram {

// Base for every error the engine surfaces to callers.
class EngineError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Embedding service unavailable, or it returned an empty, all-zero,
// mis-sized or non-finite vector.
class EmbeddingError : public EngineError {
public:
    using EngineError::EngineError;
};

// Non-positive top_k or a threshold outside the active metric range.
class InvalidQueryError : public EngineError {
public:
    using EngineError::EngineError;
};

// Tenant id is empty, too long, or contains characters outside
// [A-Za-z0-9-].
class InvalidTenantError : public EngineError {
public:
    using EngineError::EngineError;
};

// Authoritative record store failed. Always propagated.
class StoreError : public EngineError {
public:
    using EngineError::EngineError;
};

// Vector index call failed or timed out. The engine treats the index as
// unavailable for that call and never lets this escape.
class VectorIndexError : public EngineError {
public:
    using EngineError::EngineError;
};

// Caller raised the cancel flag of an in-flight query.
class QueryCancelled : public EngineError {
public:
    QueryCancelled() : EngineError("query cancelled") {}
};

} // namespace engram
