//==============================================================================
//    File: sparsediff.h
// Created: 2024-10-09 21:01
//
//  Description: The header file for the SparseDiff package: sparsity
//    detection, coloring, and compressed differentiation of sparse
//    Jacobians and Hessians.
//
//==============================================================================

#ifndef _SPARSEDIFF_H_
#define _SPARSEDIFF_H_

#include "types.h"
#include "errors.h"
#include "utils.h"
#include "csc.h"
#include "coo.h"
#include "index_set.h"
#include "tracer.h"
#include "dual.h"
#include "detection.h"
#include "graph.h"
#include "ordering.h"
#include "verification.h"
#include "coloring.h"
#include "decompression.h"
#include "example_matrices.h"

#endif  // _SPARSEDIFF_H_

//==============================================================================
//==============================================================================
