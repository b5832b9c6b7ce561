#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace ql::config {
struct QRConfig;
}

namespace ql::qr {

// Square module matrix, row-major, true = dark.
struct QRMatrix {
    int width = 0;
    std::vector<bool> modules;

    [[nodiscard]] bool dark(const int x, const int y) const { return modules[static_cast<size_t>(y) * width + x]; }
};

class QRRenderer {
public:
    explicit QRRenderer(const config::QRConfig& cfg);

    // Throws link::LinkError(RenderError).
    [[nodiscard]] QRMatrix encode(const std::string& text) const;

    // 8-bit grayscale PNG of `text`, `moduleScale` px per module plus the quiet zone.
    [[nodiscard]] std::vector<uint8_t> renderPng(const std::string& text) const;

    [[nodiscard]] int imageSize(const QRMatrix& matrix) const;

private:
    int moduleScale_;
    int border_;
    int ecLevel_; // QRecLevel
};

}
