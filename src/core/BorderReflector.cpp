/**
 * @file BorderReflector.cpp
 * @brief Reflective padding and 3x3 mirror tiling
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "BorderReflector.hpp"
#include <string>

namespace shake {

namespace {

// Maps a coordinate relative to the input origin into [0, extent) by
// mirroring about the edges. Valid for offsets in [-extent, 2*extent).
inline Eigen::Index mirror_index(Eigen::Index offset, Eigen::Index extent) {
    if (offset < 0) {
        return -offset - 1;
    }
    if (offset >= extent) {
        return 2 * extent - offset - 1;
    }
    return offset;
}

template<typename A, typename B>
bool same_cells(const A& lhs, const B& rhs) {
    return ((lhs == rhs) || (lhs != lhs && rhs != rhs)).all();
}

} // namespace

template<typename Scalar>
PlaneArray<Scalar> BorderReflector::tile_and_reflect(const PlaneArray<Scalar>& input) {
    return reflect_pad<Scalar>(input, input.rows(), input.cols());
}

template<typename Scalar>
PlaneArray<Scalar> BorderReflector::reflect_pad(const PlaneArray<Scalar>& input,
                                                Eigen::Index pad_rows,
                                                Eigen::Index pad_cols) {
    const Eigen::Index rows = input.rows();
    const Eigen::Index cols = input.cols();

    if (pad_rows < 0 || pad_cols < 0) {
        throw InvalidInputError("Reflection pad must be non-negative");
    }
    // Only one reflection per side is available
    if (pad_rows > rows || pad_cols > cols) {
        throw InvalidInputError("Reflection pad (" + std::to_string(pad_rows) + ", " +
                                std::to_string(pad_cols) + ") exceeds input shape (" +
                                std::to_string(rows) + ", " + std::to_string(cols) + ")");
    }

    PlaneArray<Scalar> padded(rows + 2 * pad_rows, cols + 2 * pad_cols);

    for (Eigen::Index out_row = 0; out_row < padded.rows(); ++out_row) {
        const auto source = input.row(mirror_index(out_row - pad_rows, rows));

        padded.row(out_row).segment(pad_cols, cols) = source;
        if (pad_cols > 0) {
            padded.row(out_row).segment(0, pad_cols) = source.segment(0, pad_cols).reverse();
            padded.row(out_row).segment(pad_cols + cols, pad_cols) =
                source.segment(cols - pad_cols, pad_cols).reverse();
        }
    }

    if (!verify_seams<Scalar>(input, padded, pad_rows, pad_cols)) {
        throw InternalConsistencyError("Reflected border does not continue the input edges");
    }

    return padded;
}

template<typename Scalar>
bool BorderReflector::verify_seams(const PlaneArray<Scalar>& input,
                                   const PlaneArray<Scalar>& padded,
                                   Eigen::Index pad_rows,
                                   Eigen::Index pad_cols) {
    const Eigen::Index rows = input.rows();
    const Eigen::Index cols = input.cols();

    if (padded.rows() != rows + 2 * pad_rows || padded.cols() != cols + 2 * pad_cols) {
        return false;
    }
    if (rows == 0 || cols == 0) {
        return true;
    }

    if (!same_cells(padded.block(pad_rows, pad_cols, rows, cols), input)) {
        return false;
    }

    // Checked clockwise from the top
    if (pad_rows > 0) {
        if (!same_cells(padded.row(pad_rows - 1).segment(pad_cols, cols), input.row(0))) {
            return false;
        }
        if (!same_cells(padded.row(pad_rows + rows).segment(pad_cols, cols), input.row(rows - 1))) {
            return false;
        }
    }
    if (pad_cols > 0) {
        if (!same_cells(padded.col(pad_cols + cols).segment(pad_rows, rows), input.col(cols - 1))) {
            return false;
        }
        if (!same_cells(padded.col(pad_cols - 1).segment(pad_rows, rows), input.col(0))) {
            return false;
        }
    }

    return true;
}

template PlaneArray<double> BorderReflector::tile_and_reflect<double>(const PlaneArray<double>&);
template PlaneArray<bool> BorderReflector::tile_and_reflect<bool>(const PlaneArray<bool>&);

template PlaneArray<double> BorderReflector::reflect_pad<double>(
    const PlaneArray<double>&, Eigen::Index, Eigen::Index);
template PlaneArray<bool> BorderReflector::reflect_pad<bool>(
    const PlaneArray<bool>&, Eigen::Index, Eigen::Index);

template bool BorderReflector::verify_seams<double>(
    const PlaneArray<double>&, const PlaneArray<double>&, Eigen::Index, Eigen::Index);
template bool BorderReflector::verify_seams<bool>(
    const PlaneArray<bool>&, const PlaneArray<bool>&, Eigen::Index, Eigen::Index);

} // namespace shake
