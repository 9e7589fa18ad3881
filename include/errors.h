//==============================================================================
//     File: errors.h
//  Created: 2025-06-02 09:12
//
//  Description: Exception types for the SparseDiff library.
//
//==============================================================================

#ifndef _SPARSEDIFF_ERRORS_H_
#define _SPARSEDIFF_ERRORS_H_

#include <stdexcept>
#include <string>

namespace sd {


/** Thrown when a traced function uses a primitive the tracers cannot
 * propagate, e.g. branching on a global tracer or converting it to a number.
 */
class UnsupportedOperation : public std::runtime_error
{
public:
    explicit UnsupportedOperation(const std::string& op)
        : std::runtime_error("Unsupported operation on tracer: " + op) {}
};


/** Thrown when a pattern does not have the structure the coloring problem
 * declares, e.g. a "symmetric" pattern that is not structurally symmetric.
 */
class InvalidStructure : public std::invalid_argument
{
public:
    explicit InvalidStructure(const std::string& msg)
        : std::invalid_argument(msg) {}
};


/** Thrown when the input violates a precondition of the requested algorithm,
 * e.g. a zero diagonal entry given to star or acyclic coloring.
 */
class PreconditionViolated : public std::invalid_argument
{
public:
    explicit PreconditionViolated(const std::string& msg)
        : std::invalid_argument(msg) {}
};


}  // namespace sd

#endif  // _SPARSEDIFF_ERRORS_H_

//==============================================================================
//==============================================================================
