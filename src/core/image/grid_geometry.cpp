#include "core/grid_geometry.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace ibis::core {

namespace {

constexpr double kSingularDeterminant = 1e-12;

/// RAS <-> LPS: both conventions differ by the sign of the first two axes
Affine flipXY(const Affine& affine) {
    Affine flipped = affine;
    for (size_t c = 0; c < 4; ++c) {
        flipped[0][c] = -affine[0][c];
        flipped[1][c] = -affine[1][c];
    }
    return flipped;
}

double determinant3x3(const Affine& a) {
    return a[0][0] * (a[1][1] * a[2][2] - a[1][2] * a[2][1])
         - a[0][1] * (a[1][0] * a[2][2] - a[1][2] * a[2][0])
         + a[0][2] * (a[1][0] * a[2][1] - a[1][1] * a[2][0]);
}

std::string describeShape(const GridShape& shape) {
    std::ostringstream oss;
    oss << shape[0] << "x" << shape[1] << "x" << shape[2];
    return oss.str();
}

}  // anonymous namespace

std::string toString(WorldConvention convention) {
    switch (convention) {
        case WorldConvention::RAS: return "RAS";
        case WorldConvention::LPS: return "LPS";
    }
    return "RAS";
}

std::optional<WorldConvention> parseWorldConvention(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "RAS") return WorldConvention::RAS;
    if (upper == "LPS") return WorldConvention::LPS;
    return std::nullopt;
}

Affine identityAffine() noexcept {
    Affine a{};
    for (size_t i = 0; i < 4; ++i) {
        a[i][i] = 1.0;
    }
    return a;
}

std::expected<Affine, PipelineError> affineFromValues(std::span<const double> values) {
    if (values.size() != 16) {
        return std::unexpected(PipelineError{
            PipelineError::Code::ConfigurationError,
            "Affine must have 16 values (4x4), got " + std::to_string(values.size())
        });
    }

    Affine affine{};
    for (size_t r = 0; r < 4; ++r) {
        for (size_t c = 0; c < 4; ++c) {
            const double v = values[r * 4 + c];
            if (!std::isfinite(v)) {
                return std::unexpected(PipelineError{
                    PipelineError::Code::ConfigurationError,
                    "Affine contains a non-finite value"
                });
            }
            affine[r][c] = v;
        }
    }

    if (affine[3][0] != 0.0 || affine[3][1] != 0.0 || affine[3][2] != 0.0 ||
        affine[3][3] != 1.0) {
        return std::unexpected(PipelineError{
            PipelineError::Code::ConfigurationError,
            "Affine last row must be (0, 0, 0, 1)"
        });
    }

    return affine;
}

std::expected<Affine, PipelineError> invertAffine(const Affine& affine) {
    const double det = determinant3x3(affine);
    if (!std::isfinite(det) || std::abs(det) < kSingularDeterminant) {
        return std::unexpected(PipelineError{
            PipelineError::Code::ConfigurationError,
            "Affine is not invertible (determinant " + std::to_string(det) + ")"
        });
    }

    const auto& a = affine;
    const double invDet = 1.0 / det;

    Affine inv{};
    inv[0][0] = (a[1][1] * a[2][2] - a[1][2] * a[2][1]) * invDet;
    inv[0][1] = (a[0][2] * a[2][1] - a[0][1] * a[2][2]) * invDet;
    inv[0][2] = (a[0][1] * a[1][2] - a[0][2] * a[1][1]) * invDet;
    inv[1][0] = (a[1][2] * a[2][0] - a[1][0] * a[2][2]) * invDet;
    inv[1][1] = (a[0][0] * a[2][2] - a[0][2] * a[2][0]) * invDet;
    inv[1][2] = (a[0][2] * a[1][0] - a[0][0] * a[1][2]) * invDet;
    inv[2][0] = (a[1][0] * a[2][1] - a[1][1] * a[2][0]) * invDet;
    inv[2][1] = (a[0][1] * a[2][0] - a[0][0] * a[2][1]) * invDet;
    inv[2][2] = (a[0][0] * a[1][1] - a[0][1] * a[1][0]) * invDet;

    // Translation: -R^-1 * t
    for (size_t r = 0; r < 3; ++r) {
        inv[r][3] = -(inv[r][0] * a[0][3] + inv[r][1] * a[1][3] + inv[r][2] * a[2][3]);
    }
    inv[3] = {0.0, 0.0, 0.0, 1.0};

    return inv;
}

WorldCoordinate toWorld(const VoxelIndex& index, const Affine& a) noexcept {
    const auto i = static_cast<double>(index.i);
    const auto j = static_cast<double>(index.j);
    const auto k = static_cast<double>(index.k);
    return {
        a[0][0] * i + a[0][1] * j + a[0][2] * k + a[0][3],
        a[1][0] * i + a[1][1] * j + a[1][2] * k + a[1][3],
        a[2][0] * i + a[2][1] * j + a[2][2] * k + a[2][3]
    };
}

std::vector<WorldCoordinate> toWorld(const std::vector<VoxelIndex>& indices,
                                     const Affine& affine) {
    std::vector<WorldCoordinate> world;
    world.reserve(indices.size());
    for (const auto& index : indices) {
        world.push_back(toWorld(index, affine));
    }
    return world;
}

// =============================================================================
// GridGeometry
// =============================================================================

std::expected<GridGeometry, PipelineError>
GridGeometry::create(const GridShape& shape, const Affine& affine,
                     WorldConvention convention) {
    if (shape[0] == 0 || shape[1] == 0 || shape[2] == 0) {
        return std::unexpected(PipelineError{
            PipelineError::Code::ConfigurationError,
            "Grid shape is empty (" + describeShape(shape) + ")"
        });
    }

    std::array<double, 16> flat{};
    for (size_t r = 0; r < 4; ++r) {
        for (size_t c = 0; c < 4; ++c) {
            flat[r * 4 + c] = affine[r][c];
        }
    }
    auto validated = affineFromValues(flat);
    if (!validated) {
        return std::unexpected(validated.error());
    }

    auto inverse = invertAffine(affine);
    if (!inverse) {
        return std::unexpected(inverse.error());
    }

    GridGeometry geometry;
    geometry.shape_ = shape;
    geometry.affine_ = affine;
    geometry.inverse_ = inverse.value();
    geometry.convention_ = convention;
    return geometry;
}

std::expected<GridGeometry, PipelineError>
GridGeometry::fromImage(const itk::ImageBase<3>* image, WorldConvention convention) {
    if (!image) {
        return std::unexpected(PipelineError{
            PipelineError::Code::InvalidInput,
            "Image is null"
        });
    }

    const auto region = image->GetLargestPossibleRegion();
    const auto size = region.GetSize();
    const auto spacing = image->GetSpacing();
    const auto direction = image->GetDirection();

    // Physical point of the first buffer voxel, so indices start at zero
    itk::ImageBase<3>::PointType origin;
    image->TransformIndexToPhysicalPoint(region.GetIndex(), origin);

    Affine lps = identityAffine();
    for (unsigned int r = 0; r < 3; ++r) {
        for (unsigned int c = 0; c < 3; ++c) {
            lps[r][c] = direction(r, c) * spacing[c];
        }
        lps[r][3] = origin[r];
    }

    const GridShape shape{size[0], size[1], size[2]};
    const Affine affine = (convention == WorldConvention::RAS) ? flipXY(lps) : lps;
    return create(shape, affine, convention);
}

std::array<double, 3> GridGeometry::spacing() const noexcept {
    std::array<double, 3> result{};
    for (size_t c = 0; c < 3; ++c) {
        result[c] = std::sqrt(affine_[0][c] * affine_[0][c] +
                              affine_[1][c] * affine_[1][c] +
                              affine_[2][c] * affine_[2][c]);
    }
    return result;
}

WorldCoordinate GridGeometry::toWorld(const VoxelIndex& index) const noexcept {
    return core::toWorld(index, affine_);
}

std::vector<WorldCoordinate>
GridGeometry::toWorld(const std::vector<VoxelIndex>& indices) const {
    return core::toWorld(indices, affine_);
}

std::array<double, 3> GridGeometry::toContinuousIndex(const WorldCoordinate& p) const noexcept {
    const auto& a = inverse_;
    return {
        a[0][0] * p.x + a[0][1] * p.y + a[0][2] * p.z + a[0][3],
        a[1][0] * p.x + a[1][1] * p.y + a[1][2] * p.z + a[1][3],
        a[2][0] * p.x + a[2][1] * p.y + a[2][2] * p.z + a[2][3]
    };
}

VoxelIndex GridGeometry::toNearestVoxel(const WorldCoordinate& point) const noexcept {
    const auto ci = toContinuousIndex(point);
    return {
        static_cast<int64_t>(std::llround(ci[0])),
        static_cast<int64_t>(std::llround(ci[1])),
        static_cast<int64_t>(std::llround(ci[2]))
    };
}

bool GridGeometry::sameGrid(const GridGeometry& other, double tolerance) const noexcept {
    if (shape_ != other.shape_) {
        return false;
    }

    const Affine otherAffine = (other.convention_ == convention_)
        ? other.affine_
        : flipXY(other.affine_);

    for (size_t r = 0; r < 4; ++r) {
        for (size_t c = 0; c < 4; ++c) {
            if (std::abs(affine_[r][c] - otherAffine[r][c]) > tolerance) {
                return false;
            }
        }
    }
    return true;
}

GridGeometry::ItkFrame GridGeometry::toItkFrame() const {
    const Affine lps = (convention_ == WorldConvention::RAS) ? flipXY(affine_) : affine_;
    const auto sp = spacing();

    ItkFrame frame;
    for (unsigned int r = 0; r < 3; ++r) {
        frame.origin[r] = lps[r][3];
        frame.spacing[r] = sp[r];
        frame.size[r] = static_cast<itk::SizeValueType>(shape_[r]);
        for (unsigned int c = 0; c < 3; ++c) {
            frame.direction(r, c) = lps[r][c] / sp[c];
        }
    }
    return frame;
}

}  // namespace ibis::core
