/*==============================================================================
 *     File: pybind11_wrapper.cpp
 *  Created: 2025-02-05 14:05
 *
 *  Description: Wrap the SparseDiff coloring and decompression with pybind11.
 *
 *============================================================================*/

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/numpy.h>
#include <pybind11/functional.h>

#include <sstream>
#include <string>
#include <vector>

#include "sparsediff.h"

namespace py = pybind11;


/** Convert a vector to a NumPy array.
 *
 * @param vec  the vector to convert
 *
 * @return a NumPy array with the same data as the vector
 */
template <typename T>
inline py::array_t<T> vector_to_numpy(const std::vector<T>& vec)
{
    return py::array_t<T>(vec.size(), vec.data());
};


/** Convert a CSCMatrix to a SciPy CSC array.
 *
 * A symbolic matrix is returned with all stored values equal to 1.
 */
py::object csc_matrix_to_scipy_csc(const sd::CSCMatrix& A)
{
    py::module_ sparse = py::module_::import("scipy.sparse");

    std::vector<double> data = A.is_symbolic()
        ? std::vector<double>(A.nnz(), 1.0)
        : std::vector<double>(A.data().begin(), A.data().begin() + A.nnz());

    std::vector<sd::csint> indices(A.indices().begin(), A.indices().begin() + A.nnz());

    auto [M, N] = A.shape();

    return sparse.attr("csc_array")(
        py::make_tuple(
            vector_to_numpy(data),
            vector_to_numpy(indices),
            vector_to_numpy(A.indptr())
        ),
        py::arg("shape")=py::make_tuple(M, N)
    );
}


/** Convert a SciPy sparse matrix to a CSCMatrix.
 *
 * @param obj  any object with a `tocsc()` method
 *
 * @return a CSCMatrix
 */
sd::CSCMatrix scipy_sparse_to_sparsediff(const py::object& obj)
{
    if (!py::hasattr(obj, "tocsc")) {
        throw py::type_error("Input is not convertible to a SciPy CSC matrix.");
    }

    const py::object A = obj.attr("tocsc")();

    if (!py::hasattr(A, "data") ||
        !py::hasattr(A, "indices") ||
        !py::hasattr(A, "indptr")) {
        throw py::type_error("Input is not a SciPy CSC matrix.");
    }

    auto data = A.attr("data").cast<py::array_t<double, py::array::forcecast>>();
    auto indices = A.attr("indices").cast<py::array_t<sd::csint, py::array::forcecast>>();
    auto indptr = A.attr("indptr").cast<py::array_t<sd::csint, py::array::forcecast>>();

    std::vector<double> data_vec(data.data(), data.data() + data.size());
    std::vector<sd::csint> indices_vec(indices.data(), indices.data() + indices.size());
    std::vector<sd::csint> indptr_vec(indptr.data(), indptr.data() + indptr.size());

    auto shape = A.attr("shape").cast<std::tuple<sd::csint, sd::csint>>();
    sd::Shape A_shape = {std::get<0>(shape), std::get<1>(shape)};

    return sd::CSCMatrix(data_vec, indices_vec, indptr_vec, A_shape);
}


/*------------------------------------------------------------------------------
 *          String to enum conversions
 *----------------------------------------------------------------------------*/
sd::Structure string_to_structure(const std::string& s)
{
    if (s == "nonsymmetric") { return sd::Structure::Nonsymmetric; }
    if (s == "symmetric") { return sd::Structure::Symmetric; }
    throw std::invalid_argument("Invalid structure: " + s);
}


sd::Partition string_to_partition(const std::string& s)
{
    if (s == "column") { return sd::Partition::Column; }
    if (s == "row") { return sd::Partition::Row; }
    throw std::invalid_argument("Invalid partition: " + s);
}


sd::Decompression string_to_decompression(const std::string& s)
{
    if (s == "direct") { return sd::Decompression::Direct; }
    if (s == "substitution") { return sd::Decompression::Substitution; }
    throw std::invalid_argument("Invalid decompression: " + s);
}


sd::VertexOrder string_to_order(const std::string& s)
{
    if (s == "natural") { return sd::VertexOrder::Natural; }
    if (s == "largest_first") { return sd::VertexOrder::LargestFirst; }
    if (s == "smallest_last") { return sd::VertexOrder::SmallestLast; }
    if (s == "incidence_degree") { return sd::VertexOrder::IncidenceDegree; }
    if (s == "dynamic_largest_first") { return sd::VertexOrder::DynamicLargestFirst; }
    if (s == "random") { return sd::VertexOrder::Random; }
    throw std::invalid_argument("Invalid vertex order: " + s);
}


/** Wrap a Python callable `s -> A s` as a product function. */
sd::ProductFunc wrap_product(const py::function& f)
{
    return [f](const std::vector<double>& s) {
        return f(vector_to_numpy(s)).cast<std::vector<double>>();
    };
}


PYBIND11_MODULE(sparsediff, m) {
    m.doc() = "SparseDiff module for sparse Jacobian and Hessian coloring.";

    // Library exceptions map to Python ValueError
    py::register_exception<sd::InvalidStructure>(m, "InvalidStructure", PyExc_ValueError);
    py::register_exception<sd::PreconditionViolated>(m, "PreconditionViolated", PyExc_ValueError);
    py::register_exception<sd::UnsupportedOperation>(m, "UnsupportedOperation", PyExc_RuntimeError);

    //--------------------------------------------------------------------------
    //        ColoringResult class
    //--------------------------------------------------------------------------
    py::class_<sd::ColoringResult>(m, "ColoringResult")
        .def_property_readonly("colors", [](const sd::ColoringResult& res) {
            return vector_to_numpy(res.colors());
        })
        .def_property_readonly("ncolors", &sd::ColoringResult::ncolors)
        .def_property_readonly("pattern", [](const sd::ColoringResult& res) {
            return csc_matrix_to_scipy_csc(res.pattern());
        })
        .def_property_readonly("compressed_size", &sd::ColoringResult::compressed_size)
        .def("color_groups", &sd::ColoringResult::color_groups)
        .def("seeds", [](const sd::ColoringResult& res) {
            py::list out;
            for (const auto& s : res.seeds()) {
                out.append(vector_to_numpy(s));
            }
            return out;
        })
        .def("compress", [](const sd::ColoringResult& res, const py::object& A) {
            py::list out;
            for (const auto& b : sd::compress(scipy_sparse_to_sparsediff(A), res)) {
                out.append(vector_to_numpy(b));
            }
            return out;
        })
        .def("decompress",
            [](const sd::ColoringResult& res, const std::vector<std::vector<double>>& B) {
                return csc_matrix_to_scipy_csc(sd::decompress(B, res));
            }
        )
        .def("__repr__", [](const sd::ColoringResult& res) {
            return res.to_string();
        });

    //--------------------------------------------------------------------------
    //        Coloring and differentiation
    //--------------------------------------------------------------------------
    m.def("coloring",
        [](
            const py::object& S,
            const std::string& structure,
            const std::string& partition,
            const std::string& order,
            const std::string& decompression,
            unsigned seed
        ) {
            sd::ColoringProblem problem{
                string_to_structure(structure),
                string_to_partition(partition)
            };
            sd::GreedyColoringAlgorithm algorithm{
                string_to_order(order),
                string_to_decompression(decompression),
                seed
            };
            return sd::coloring(scipy_sparse_to_sparsediff(S), problem, algorithm);
        },
        py::arg("S"),
        py::arg("structure")="nonsymmetric",
        py::arg("partition")="column",
        py::arg("order")="natural",
        py::arg("decompression")="direct",
        py::arg("seed")=0
    );

    m.def("sparse_jacobian",
        [](const py::function& product, const sd::ColoringResult& res) {
            return csc_matrix_to_scipy_csc(sd::sparse_jacobian(wrap_product(product), res));
        },
        py::arg("product"),
        py::arg("result")
    );

    m.def("sparse_hessian",
        [](const py::function& product, const sd::ColoringResult& res) {
            return csc_matrix_to_scipy_csc(sd::sparse_hessian(wrap_product(product), res));
        },
        py::arg("product"),
        py::arg("result")
    );

    //--------------------------------------------------------------------------
    //        Structure checks
    //--------------------------------------------------------------------------
    m.def("structurally_orthogonal_columns",
        [](const py::object& S, const std::vector<sd::csint>& colors) {
            return sd::structurally_orthogonal_columns(scipy_sparse_to_sparsediff(S), colors);
        }
    );

    m.def("structurally_orthogonal_rows",
        [](const py::object& S, const std::vector<sd::csint>& colors) {
            return sd::structurally_orthogonal_rows(scipy_sparse_to_sparsediff(S), colors);
        }
    );

    m.def("is_star_coloring",
        [](const py::object& S, const std::vector<sd::csint>& colors) {
            return sd::is_star_coloring(sd::AdjacencyGraph(scipy_sparse_to_sparsediff(S)), colors);
        }
    );

    m.def("is_acyclic_coloring",
        [](const py::object& S, const std::vector<sd::csint>& colors) {
            return sd::is_acyclic_coloring(sd::AdjacencyGraph(scipy_sparse_to_sparsediff(S)), colors);
        }
    );
}

/*==============================================================================
 *============================================================================*/
