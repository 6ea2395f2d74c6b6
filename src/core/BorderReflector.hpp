#pragma once

/**
 * @file BorderReflector.hpp
 * @brief Mirror-reflected border synthesis for grids and masks
 *
 * Reflection is about the edge, not the edge cell: the cell just outside
 * row 0 repeats row 0, the next one repeats row 1, and so on. Every
 * interior cell therefore sees a fully defined neighbourhood of up to one
 * grid size in each direction.
 */

#include "shake_contour.hpp"

namespace shake {

template<typename Scalar>
using PlaneArray = Eigen::Array<Scalar, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

class BorderReflector {
public:
    /**
     * @brief Full 3x3 tiling, centre tile is the input, the other eight mirrored
     *
     * Output shape is (3*rows, 3*cols). Equivalent to
     * reflect_pad(input, rows, cols).
     *
     * @throws InternalConsistencyError if a seam check fails
     */
    template<typename Scalar>
    static PlaneArray<Scalar> tile_and_reflect(const PlaneArray<Scalar>& input);

    /**
     * @brief Reflective border of pad_rows above/below and pad_cols left/right
     *
     * Output shape is (rows + 2*pad_rows, cols + 2*pad_cols); the input sits
     * at offset (pad_rows, pad_cols).
     *
     * @throws InvalidInputError if a pad is negative or exceeds the dimension
     * @throws InternalConsistencyError if a seam check fails
     */
    template<typename Scalar>
    static PlaneArray<Scalar> reflect_pad(const PlaneArray<Scalar>& input,
                                          Eigen::Index pad_rows,
                                          Eigen::Index pad_cols);

    /**
     * @brief Centre block equals input and all four seams repeat the edge
     *
     * NaN cells compare equal to NaN so nodata rasters pass.
     */
    template<typename Scalar>
    static bool verify_seams(const PlaneArray<Scalar>& input,
                             const PlaneArray<Scalar>& padded,
                             Eigen::Index pad_rows,
                             Eigen::Index pad_cols);
};

} // namespace shake
