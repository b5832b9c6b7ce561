#define STB_IMAGE_WRITE_IMPLEMENTATION

#include "qr/QRRenderer.hpp"
#include "config/Config.hpp"
#include "link/Errors.hpp"

#include <qrencode.h>
#include <stb/stb_image_write.h>

#include <cerrno>
#include <cstring>
#include <memory>

using namespace ql::qr;
using ql::link::ErrorCode;
using ql::link::LinkError;

namespace {

QRecLevel toQRecLevel(const std::string& level) {
    if (level == "L") return QR_ECLEVEL_L;
    if (level == "M") return QR_ECLEVEL_M;
    if (level == "Q") return QR_ECLEVEL_Q;
    if (level == "H") return QR_ECLEVEL_H;
    throw std::invalid_argument("Unknown QR error correction level: " + level);
}

struct QRcodeDeleter {
    void operator()(QRcode* q) const { QRcode_free(q); }
};

void appendToVector(void* context, void* data, const int size) {
    auto* out = static_cast<std::vector<uint8_t>*>(context);
    const auto* bytes = static_cast<const uint8_t*>(data);
    out->insert(out->end(), bytes, bytes + size);
}

}

QRRenderer::QRRenderer(const config::QRConfig& cfg)
    : moduleScale_(static_cast<int>(cfg.module_scale)),
      border_(static_cast<int>(cfg.border)),
      ecLevel_(toQRecLevel(cfg.error_correction)) {
    if (moduleScale_ < 1) throw std::invalid_argument("QR module scale must be at least 1");
}

QRMatrix QRRenderer::encode(const std::string& text) const {
    if (text.empty()) throw LinkError(ErrorCode::RenderError, "Cannot encode an empty QR payload");

    errno = 0;
    const std::unique_ptr<QRcode, QRcodeDeleter> code(
        QRcode_encodeString8bit(text.c_str(), 0, static_cast<QRecLevel>(ecLevel_)));
    if (!code) {
        const int err = errno;
        throw LinkError(ErrorCode::RenderError,
                        std::string("QR encoding failed: ") + (err ? std::strerror(err) : "unknown error"));
    }

    QRMatrix matrix;
    matrix.width = code->width;
    matrix.modules.resize(static_cast<size_t>(code->width) * code->width);
    for (size_t i = 0; i < matrix.modules.size(); ++i) matrix.modules[i] = (code->data[i] & 0x01) != 0;
    return matrix;
}

int QRRenderer::imageSize(const QRMatrix& matrix) const {
    return (matrix.width + 2 * border_) * moduleScale_;
}

std::vector<uint8_t> QRRenderer::renderPng(const std::string& text) const {
    const auto matrix = encode(text);
    const int size = imageSize(matrix);

    std::vector<uint8_t> pixels(static_cast<size_t>(size) * size, 0xFF);
    for (int y = 0; y < matrix.width; ++y) {
        for (int x = 0; x < matrix.width; ++x) {
            if (!matrix.dark(x, y)) continue;
            const int px = (x + border_) * moduleScale_;
            const int py = (y + border_) * moduleScale_;
            for (int dy = 0; dy < moduleScale_; ++dy)
                std::memset(&pixels[static_cast<size_t>(py + dy) * size + px], 0x00, static_cast<size_t>(moduleScale_));
        }
    }

    std::vector<uint8_t> png;
    if (!stbi_write_png_to_func(appendToVector, &png, size, size, 1, pixels.data(), size) || png.empty())
        throw LinkError(ErrorCode::RenderError, "PNG encoding failed");
    return png;
}
