#pragma once
#include "utils/eigen_types.hpp"

// target[l][index[l][i]] += src[l][i] for every lane l and cache slot i, in place.
// Repeated indices within a lane accumulate (a symbol cached k times gets k contributions).
//
// target: [lanes, vocab], index and src: [lanes, width].
// Every index must lie in [0, vocab); that is the caller's precondition and is only checked
// in debug builds.
//
// Works on the flat offset lane * vocab + index, so the loop runs over lanes * width and
// never over the vocabulary.
void scatter_add(RowMatrixXf& target, const RowMatrixXi& index, const RowMatrixXf& src);

// Same thing as an explicit (lane, slot) double loop. Kept as the reference scatter_add is
// checked against.
void scatter_add_naive(RowMatrixXf& target, const RowMatrixXi& index, const RowMatrixXf& src);
