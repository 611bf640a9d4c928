#pragma once

#include <cstddef>
#include <format>
#include <string>

namespace morph {

/**
 * @brief Normalization was handed no variants, or a variant without any points
 */
struct NoGeometryError {
    std::string variant;  ///< Offending variant name, empty when the whole set was empty
    std::string message;

    [[nodiscard]] std::string describe() const {
        if (variant.empty())
            return std::format("No geometry: {}", message);
        return std::format("No geometry in variant '{}': {}", variant, message);
    }
};

/**
 * @brief morph_to() was called with an index outside [0, variant_count)
 */
struct InvalidVariantIndexError {
    std::size_t index;
    std::size_t variant_count;

    [[nodiscard]] std::string describe() const {
        return std::format("Invalid variant index {} (variant count is {})", index, variant_count);
    }
};

/**
 * @brief Slang failed to load, link or generate code, or Vulkan rejected the module
 */
struct ShaderCompileError {
    std::string shader;
    std::string diagnostics;

    [[nodiscard]] std::string describe() const {
        return std::format("Failed to compile shader '{}': {}", shader, diagnostics);
    }
};

} // namespace morph
