#pragma once

#include <stdexcept>
#include <string>

namespace graphsearch::core {

struct TypeError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct ValueError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct RuntimeError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Search requested before a graph was bound to the session.
struct UnboundGraphError : public RuntimeError {
  using RuntimeError::RuntimeError;
};

// Source or target identifier does not resolve in the bound graph.
struct NodeNotFoundError : public RuntimeError {
  using RuntimeError::RuntimeError;
};

// Euclidean costs asked for the position of a node that has none.
struct MissingPositionError : public RuntimeError {
  using RuntimeError::RuntimeError;
};

} // namespace graphsearch::core
