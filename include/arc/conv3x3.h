#pragma once

/// @file conv3x3.h
/// @brief Common interface of the 3x3 convolutions a residual block can hold.

#include <fstream>
#include <memory>
#include <random>
#include <string>

#include "arc/config.h"
#include "arc/defines.h"
#include "arc/layers.h"

namespace arc {

/// @brief A 3x3 convolution with the calling convention of an ordinary
///        convolution: Forward(x) -> (B, Cout, H', W').
class Conv3x3 {
  public:
    virtual ~Conv3x3() {}

    virtual Tensor4 Forward(const Tensor4 &x) const = 0;

    virtual ConvKind Kind() const = 0;
    virtual int InChannels() const = 0;
    virtual int OutChannels() const = 0;

    /// @brief Switch dropout / batch-statistics behaviour. No-op by default.
    virtual void SetTraining(bool training) { (void)training; }

    /// @brief Layer description.
    virtual std::string toString() const = 0;

    /// @brief Serialize all parameters to a binary stream.
    virtual void save(std::ofstream &output) const = 0;

    /// @brief Restore parameters; false if the stream does not match the
    ///        parameter shapes of this module.
    virtual bool load(std::ifstream &input) = 0;

    /// @brief Convenience: save to a named file.
    void SaveToFile(const std::string &filename) const {
        std::ofstream output(filename, std::ios::binary);
        CHECK(output.is_open()) << "Failed to open file for writing: " << filename;
        save(output);
        output.close();
    }

    /// @brief Convenience: load from a named file.
    bool LoadFromFile(const std::string &filename) {
        std::ifstream input(filename, std::ios::binary);
        CHECK(input.is_open()) << "Failed to open file for reading: " << filename;
        const bool ok = load(input);
        input.close();
        return ok;
    }
};

using Conv3x3Ptr = std::unique_ptr<Conv3x3>;

/// @brief Plain 3x3 convolution without bias.
class StandardConv3x3 : public Conv3x3 {
  public:
    explicit StandardConv3x3(const ArcConvConfig &config);

    Tensor4 Forward(const Tensor4 &x) const override { return conv_.Forward(x); }

    ConvKind Kind() const override { return ConvKind::Standard; }
    int InChannels() const override { return conv_.InChannels(); }
    int OutChannels() const override { return conv_.OutChannels(); }

    std::string toString() const override;

    void save(std::ofstream &output) const override { conv_.save(output); }
    bool load(std::ifstream &input) override { return conv_.load(input); }

    const Tensor4 &Weight() const { return conv_.Weight(); }

  private:
    std::mt19937 rng_;
    Conv2d conv_;
};

} // namespace arc
