#pragma once

#include <cstdint>
#include <fstream>

#include <fmt/core.h>
#include <glog/logging.h>

#include "arc/defines.h"

namespace arc {

/// @brief Write a parameter record: rank, dims, then row-major float data.
template <int Rank>
void save_tensor(std::ofstream &output, const FloatTensor<Rank> &t) {
    uint32_t rank = Rank;
    output.write(reinterpret_cast<const char *>(&rank), sizeof(uint32_t));
    for (int i = 0; i < Rank; ++i) {
        int64_t dim = t.dimension(i);
        output.write(reinterpret_cast<const char *>(&dim), sizeof(int64_t));
    }
    output.write(reinterpret_cast<const char *>(t.data()), sizeof(float) * t.size());
}

/// @brief Read a parameter record into an already shaped tensor.
///
/// Parameter shapes are fixed at construction, so the stored rank and
/// dims must match the live tensor exactly. On mismatch the tensor is left
/// untouched and false is returned.
template <int Rank>
bool load_tensor(std::ifstream &input, FloatTensor<Rank> &t) {
    uint32_t rank = 0;
    input.read(reinterpret_cast<char *>(&rank), sizeof(uint32_t));
    if (!input.good() || rank != static_cast<uint32_t>(Rank)) {
        LOG(ERROR) << fmt::format("Parameter rank mismatch: stored {}, expected {}", rank, Rank);
        return false;
    }
    for (int i = 0; i < Rank; ++i) {
        int64_t dim = 0;
        input.read(reinterpret_cast<char *>(&dim), sizeof(int64_t));
        if (!input.good() || dim != static_cast<int64_t>(t.dimension(i))) {
            LOG(ERROR) << fmt::format("Parameter shape mismatch at axis {}: stored {}, expected {}", i, dim,
                                      t.dimension(i));
            return false;
        }
    }
    input.read(reinterpret_cast<char *>(t.data()), sizeof(float) * t.size());
    if (!input.good()) {
        LOG(ERROR) << "Truncated parameter data";
        return false;
    }
    return true;
}

} // namespace arc
