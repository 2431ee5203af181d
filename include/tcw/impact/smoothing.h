#pragma once
// tcw/impact/smoothing.h
//
// Raster smoothing capability.
//
// The warning service hands the probability grid to a smoothing collaborator
// together with the warning levels [0, probability_threshold] and an ordered
// list of morphological operations. It expects back a grid of the same shape
// holding only 0 and 1 (small connected regions already removed).
//
// ThresholdSmoother is the built-in implementation: it classifies each cell
// against the highest level and performs no morphology.

#include "tcw/core/config.h"
#include "tcw/core/types.h"
#include "tcw/impact/grid.h"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tcw {
namespace impact {

enum class SmoothingOperation : u8 {
  Erosion = 0,
  Dilation = 1,
  MedianFiltering = 2,
};

std::string_view ToString(SmoothingOperation op) noexcept;

struct SmoothingParameters {
  std::vector<double> levels;
  std::vector<std::pair<SmoothingOperation, i64>> operations;
  bool gradual_decrease = true;
  i64 small_region_threshold = 0;

  // levels = [0, probability_threshold]; operations erosion, dilation,
  // median filtering in that order.
  static SmoothingParameters FromSettings(const ImpactSettings& settings);

  bool Validate(std::string* err = nullptr) const;

  std::string ToJsonLite() const;
};

class IRasterSmoother {
 public:
  virtual ~IRasterSmoother() = default;

  virtual std::string_view Name() const noexcept = 0;

  // `out` must have the shape and coordinates of `grid` and only 0/1 values.
  virtual bool Smooth(const Grid& grid,
                      const SmoothingParameters& params,
                      Grid* out,
                      std::string* err) const = 0;
};

class ThresholdSmoother final : public IRasterSmoother {
 public:
  std::string_view Name() const noexcept override { return "threshold"; }

  bool Smooth(const Grid& grid,
              const SmoothingParameters& params,
              Grid* out,
              std::string* err) const override;
};

// Checks the postcondition of IRasterSmoother::Smooth.
bool CheckBinaryGrid(const Grid& input, const Grid& smoothed, std::string* err = nullptr);

}  // namespace impact
}  // namespace tcw
