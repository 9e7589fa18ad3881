//==============================================================================
//     File: types.h
//  Created: 2025-01-30 15:46
//
//  Description: Define types for the SparseDiff library.
//
//==============================================================================

#ifndef _SPARSEDIFF_TYPES_H_
#define _SPARSEDIFF_TYPES_H_

#include <array>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>


namespace sd {

using csint = std::int32_t;
using Shape = std::array<csint, 2>;

template <typename T>
using OptionalVectorRef = std::optional<std::reference_wrapper<std::vector<T>>>;

// Need full enum class definitions for default arguments

/// Structure of the matrix to be colored.
enum class Structure
{
    Nonsymmetric,  // general Jacobian, bipartite graph
    Symmetric      // Hessian, adjacency graph
};

/// Which dimension of a nonsymmetric matrix is partitioned into colors.
enum class Partition
{
    Column,  // forward mode, one JVP per color
    Row      // reverse mode, one VJP per color
};

/// How the compressed products are turned back into matrix entries.
enum class Decompression
{
    Direct,       // every entry read from a single compressed value
    Substitution  // entries solved for by peeling two-colored trees
};

/// Vertex ordering heuristic for greedy coloring.
enum class VertexOrder
{
    Natural,             // 0, 1, ..., n-1
    LargestFirst,        // static degree, decreasing
    SmallestLast,        // repeatedly remove a minimum-degree vertex
    IncidenceDegree,     // max number of already-ordered neighbors
    DynamicLargestFirst, // max degree among unordered vertices
    Random               // random permutation from a seed
};

/// Whether tracing uses the primal values of the input point.
enum class TracingMode
{
    Global,  // pattern valid for every input
    Local    // pattern valid for the control-flow path taken at x
};

// Forward declarations
struct ColoringProblem;
struct GreedyColoringAlgorithm;
struct DirectEntry;
struct SubstitutionStep;

class SparseMatrix;
class COOMatrix;
class CSCMatrix;
class IndexSet;
class GradientTracer;
class HessianTracer;
class AdjacencyGraph;
class BipartiteGraph;
class ColoringResult;

/// An external matrix-vector product (JVP, VJP or HVP) in a seed direction.
using ProductFunc = std::function<std::vector<double>(const std::vector<double>&)>;

}  // namespace sd

#endif  // _SPARSEDIFF_TYPES_H_

//==============================================================================
//==============================================================================
